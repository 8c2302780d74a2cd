#include "HeaderNode.hh"
#include "LineNode.hh"
#include "PropertyRule.hh"

#include <string>

ProfileBundle::Tree::HeaderNode::HeaderNode(uint64_t lineno, const std::string &raw)
  : LineNode(Kind::Header, lineno, raw)
{
  auto open = raw.find('[');
  auto close = raw.find(']', open);
  if(open != std::string::npos && close != std::string::npos) {
    title = PropertyRule::trim(raw.substr(open + 1, close - open - 1));
  }
}

std::string ProfileBundle::Tree::HeaderNode::getTitle() const
{
  return title;
}

std::string ProfileBundle::Tree::HeaderNode::getSectionType() const
{
  return PropertyRule::trim(title.substr(0, title.find(':')));
}

std::string ProfileBundle::Tree::HeaderNode::getSectionName() const
{
  auto colon = title.find(':');
  if(colon == std::string::npos) {
    return "";
  }

  return PropertyRule::trim(title.substr(colon + 1));
}

bool ProfileBundle::Tree::HeaderNode::hasSectionName() const
{
  return title.find(':') != std::string::npos;
}
