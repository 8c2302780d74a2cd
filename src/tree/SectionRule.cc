#include "SectionRule.hh"
#include "LineNode.hh"
#include "PropertyRule.hh"
#include "RuleNode.hh"

#include <list>
#include <optional>
#include <sstream>
#include <string>

ProfileBundle::Tree::SectionRule::SectionRule(const std::string &title, const std::list<LineNode> &lines)
  : RuleNode(title,
             lines.empty()? 0 : lines.front().getStartPosition(),
             lines.empty()? 0 : lines.back().getEndPosition()),
    lines{lines}
{
  // Trailing blank lines belong to the separator, not to the section
  while(!this->lines.empty() && this->lines.back().getKind() == LineNode::Kind::Blank) {
    this->lines.pop_back();
  }
}

std::string ProfileBundle::Tree::SectionRule::title() const
{
  return getText();
}

std::list<ProfileBundle::Tree::LineNode> ProfileBundle::Tree::SectionRule::getLines() const
{
  return lines;
}

std::optional<std::string> ProfileBundle::Tree::SectionRule::getValue(const std::string &key) const
{
  for(const auto &line : lines) {
    if(line.getKind() != LineNode::Kind::Property) {
      continue;
    }

    PropertyRule property(line.getStartPosition(), line.getRaw());
    if(property.getKey() == key) {
      return property.getValue();
    }
  }

  return std::nullopt;
}

bool ProfileBundle::Tree::SectionRule::operator==(const SectionRule &other) const
{
  return this->title() == other.title() &&
         this->lines == other.lines;
}

ProfileBundle::Tree::SectionRule::operator std::string() const
{
  std::stringstream ss;
  for(const auto &line : lines) {
    ss << line.getRaw() << '\n';
  }

  return ss.str();
}
