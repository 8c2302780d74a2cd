#include "RuleNode.hh"
#include "TreeNode.hh"

#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace {
  void checkRange(uint64_t startPos, uint64_t stopPos)
  {
    if(startPos > stopPos) {
      std::stringstream message;
      message << "Invalid line range: " << startPos << " > " << stopPos;
      throw std::invalid_argument(message.str());
    }
  }
} // namespace

ProfileBundle::Tree::RuleNode::RuleNode(uint64_t startPos, uint64_t stopPos)
  : TreeNode("rule"),
    startPos{startPos},
    stopPos{stopPos}
{
  checkRange(startPos, stopPos);
}

ProfileBundle::Tree::RuleNode::RuleNode(const std::string &text, uint64_t startPos, uint64_t stopPos)
  : TreeNode(text),
    startPos{startPos},
    stopPos{stopPos}
{
  checkRange(startPos, stopPos);
}

void ProfileBundle::Tree::RuleNode::setStartPosition(const uint64_t &startPos)
{
  this->startPos = startPos;
}

void ProfileBundle::Tree::RuleNode::setStopPosition(const uint64_t &stopPos)
{
  this->stopPos = stopPos;
}

uint64_t ProfileBundle::Tree::RuleNode::getStartPosition() const
{
  return startPos;
}

uint64_t ProfileBundle::Tree::RuleNode::getEndPosition() const
{
  return stopPos;
}

bool ProfileBundle::Tree::RuleNode::operator==(const RuleNode &other) const
{
  return this->startPos == other.startPos &&
         this->stopPos == other.stopPos;
}

bool ProfileBundle::Tree::RuleNode::operator!=(const RuleNode &other) const
{
  return !(*this == other);
}
