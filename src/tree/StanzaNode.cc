#include "StanzaNode.hh"

#include <algorithm>
#include <list>

bool ProfileBundle::Tree::StanzaNode::hasHeader() const
{
  return has_header;
}

ProfileBundle::Tree::HeaderNode ProfileBundle::Tree::StanzaNode::getHeader() const
{
  return header;
}

void ProfileBundle::Tree::StanzaNode::setHeader(const HeaderNode &header)
{
  this->header = header;
  has_header = true;

  // The header line always precedes the body
  lines.push_front(header);
}

std::list<ProfileBundle::Tree::PropertyRule> ProfileBundle::Tree::StanzaNode::getProperties() const
{
  return properties;
}

std::list<ProfileBundle::Tree::LineNode> ProfileBundle::Tree::StanzaNode::getLines() const
{
  return lines;
}

void ProfileBundle::Tree::StanzaNode::appendProperty(const PropertyRule &property)
{
  properties.push_back(property);
  lines.push_back(property);
}

void ProfileBundle::Tree::StanzaNode::appendLine(const LineNode &line)
{
  lines.push_back(line);
}

bool ProfileBundle::Tree::StanzaNode::isBlank() const
{
  return std::all_of(lines.begin(), lines.end(), [](const LineNode &line) {
    return line.getKind() == LineNode::Kind::Blank;
  });
}
