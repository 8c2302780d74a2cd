#include "LineNode.hh"
#include "RuleNode.hh"

#include <string>

ProfileBundle::Tree::LineNode::LineNode(Kind kind, uint64_t lineno, const std::string &raw)
  : RuleNode(raw, lineno, lineno),
    kind{kind}
{   }

ProfileBundle::Tree::LineNode::Kind ProfileBundle::Tree::LineNode::getKind() const
{
  return kind;
}

std::string ProfileBundle::Tree::LineNode::getRaw() const
{
  return getText();
}

bool ProfileBundle::Tree::LineNode::isComment() const
{
  if(kind == Kind::Comment) {
    return true;
  }

  return kind == Kind::Text && getText().find('#') != std::string::npos;
}

bool ProfileBundle::Tree::LineNode::operator==(const LineNode &other) const
{
  return this->kind == other.kind &&
         this->getText() == other.getText();
}
