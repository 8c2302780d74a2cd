#ifndef SECTION_RULE_HH
#define SECTION_RULE_HH

#include "LineNode.hh"
#include "RuleNode.hh"

#include <list>
#include <optional>
#include <string>

namespace ProfileBundle::Tree {
  // A stanza that is not a print or filament profile ("[vendor]", "[printer:...]").
  // It is kept line for line so that rewriting a file never loses it.
  class SectionRule : public RuleNode {
    public:
      SectionRule() = default;
      SectionRule(const std::string &title, const std::list<LineNode> &lines);

      // Text between the brackets of the header
      std::string title() const;

      std::list<LineNode> getLines() const;

      // Looks up a "key = value" line of the section
      std::optional<std::string> getValue(const std::string &key) const;

      bool operator==(const SectionRule &other) const;

      // The section's lines, without trailing blank lines
      explicit operator std::string() const;

    private:
      std::list<LineNode> lines;
  };
} // namespace ProfileBundle::Tree

#endif // SECTION_RULE_HH
