#ifndef LEXER_HH
#define LEXER_HH

#ifndef yyFlexLexerOnce
#include <FlexLexer.h>
#endif

#include <istream>
#include <ostream>

#include "parser_yacc.hh"
#include "driver.hh"

using symbol_type = yy::parser::symbol_type;

#undef YY_NULL
#define YY_NULL yy::parser::make_END();

// Line scanner of stanza_lexer.ll; diagnostics of the scanner go to 'log'
class Lexer : public yyFlexLexer {
  public:
    Lexer(std::istream& input, std::ostream& log)
      : yyFlexLexer(input, log) {}

    // NOLINTNEXTLINE
    virtual symbol_type yylex(Driver& driver);
};

#undef YY_DECL
#define YY_DECL symbol_type Lexer::yylex(Driver& driver)

#define yyterminate() return( yy::parser::make_END() )

#define YY_NO_UNISTD_H

#endif // LEXER_HH
