#include "ParseTree.hh"

#include <list>

ProfileBundle::Tree::ParseTree::ParseTree(const StanzaNode &preamble, const std::list<StanzaNode> &stanzas)
  : preamble{preamble},
    stanzas{stanzas}
{   }
