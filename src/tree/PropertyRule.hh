#ifndef PROPERTY_RULE_HH
#define PROPERTY_RULE_HH

#include "LineNode.hh"

#include <cstdint>
#include <string>

namespace ProfileBundle::Tree {
  class PropertyRule : public LineNode {
    public:
      PropertyRule() = default;

      // Builds a property from a raw "key = value" source line
      PropertyRule(uint64_t lineno, const std::string &raw);

      // Builds a property that has no source line (written as "key = value")
      PropertyRule(const std::string &key, const std::string &value);

      std::string getKey() const;
      std::string getValue() const;

      // Checks key and value, not the source line
      bool almostEquals(const PropertyRule &other) const;

      explicit operator std::string() const;

      // Removes leading and trailing whitespace
      static std::string trim(const std::string &text);

      // Cuts a trailing comment from a line.
      // A '#' opens a comment at the start of the line, or when it follows whitespace and is
      // itself followed by whitespace or the end of the line. "#FF8000" stays value text.
      static std::string stripInlineComment(const std::string &line);

    private:
      std::string key;
      std::string value;
  };
} // namespace ProfileBundle::Tree

#endif // PROPERTY_RULE_HH
