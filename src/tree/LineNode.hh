#ifndef LINE_NODE_HH
#define LINE_NODE_HH

#include "RuleNode.hh"

#include <cstdint>
#include <string>

namespace ProfileBundle::Tree {
  // One physical line of a profile file, kept verbatim (without its line terminator)
  class LineNode : public RuleNode {
    public:
      enum class Kind { Blank, Comment, Text, Header, Property };

      LineNode() = default;
      LineNode(Kind kind, uint64_t lineno, const std::string &raw);

      Kind getKind() const;

      // Returns the line as it appeared in the source
      std::string getRaw() const;

      // True for lines that carry a '#' comment and are neither a header nor a property
      bool isComment() const;

      bool operator==(const LineNode &other) const;

    private:
      Kind kind = Kind::Blank;
  };
} // namespace ProfileBundle::Tree

#endif // LINE_NODE_HH
