#ifndef PARSE_TREE_HH
#define PARSE_TREE_HH

#include "StanzaNode.hh"
#include "TreeNode.hh"

#include <list>

namespace ProfileBundle::Tree {
  // The root node of the syntax tree: everything before the first header, then each stanza
  class ParseTree : public TreeNode {
    public:
      ParseTree(const StanzaNode &preamble, const std::list<StanzaNode> &stanzas);

      StanzaNode preamble;
      std::list<StanzaNode> stanzas;
  };
} // namespace ProfileBundle::Tree

#endif // PARSE_TREE_HH
