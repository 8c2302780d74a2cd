#ifndef DRIVER_HH
#define DRIVER_HH

#include "tree/ParseTree.hh"

#include <cstdint>
#include <memory>
#include <string>

class Driver
{
  public:
    bool success = false;

    // Parser fields
    std::shared_ptr<ProfileBundle::Tree::ParseTree> ast;
    std::string error_message;

    // Lexer fields
    uint64_t current_lineno = 0;
};

#endif // DRIVER_HH
