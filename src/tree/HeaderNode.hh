#ifndef HEADER_NODE_HH
#define HEADER_NODE_HH

#include "LineNode.hh"

#include <cstdint>
#include <string>

namespace ProfileBundle::Tree {
  // A stanza header line such as "[print: 0.20mm QUALITY]" or "[vendor]"
  class HeaderNode : public LineNode {
    public:
      HeaderNode() = default;
      HeaderNode(uint64_t lineno, const std::string &raw);

      // Text between the brackets, trimmed
      std::string getTitle() const;

      // Part of the title before the first ':' ("print", "filament", "vendor", ...)
      std::string getSectionType() const;

      // Part of the title after the first ':', trimmed. Empty for untyped sections.
      std::string getSectionName() const;

      bool hasSectionName() const;

    private:
      std::string title;
  };
} // namespace ProfileBundle::Tree

#endif // HEADER_NODE_HH
