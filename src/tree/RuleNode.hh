#ifndef RULE_NODE_HH
#define RULE_NODE_HH

#include "TreeNode.hh"

#include <cstdint>
#include <string>

namespace ProfileBundle::Tree {
  // A node that covers a range of source lines (one-based, inclusive)
  class RuleNode : public TreeNode {
    public:
      RuleNode() = default;
      RuleNode(uint64_t startPos, uint64_t stopPos);
      RuleNode(const std::string &text, uint64_t startPos, uint64_t stopPos);

      uint64_t getStartPosition() const;
      uint64_t getEndPosition() const;

      void setStartPosition(const uint64_t &startPos);
      void setStopPosition(const uint64_t &stopPos);

      bool operator==(const RuleNode &other) const;
      bool operator!=(const RuleNode &other) const;

    private:
      uint64_t startPos = 0;
      uint64_t stopPos = 0;
  };
} // namespace ProfileBundle::Tree

#endif // RULE_NODE_HH
