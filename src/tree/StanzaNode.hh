#ifndef STANZA_NODE_HH
#define STANZA_NODE_HH

#include "HeaderNode.hh"
#include "LineNode.hh"
#include "PropertyRule.hh"
#include "TreeNode.hh"

#include <list>

namespace ProfileBundle::Tree {
  // Lines grouped under one header (or under no header, for the preamble of a file)
  class StanzaNode : public TreeNode {
    public:
      StanzaNode() = default;

      bool hasHeader() const;
      HeaderNode getHeader() const;
      void setHeader(const HeaderNode &header);

      // Properties in source order (a repeated key appears more than once)
      std::list<PropertyRule> getProperties() const;

      // Every line of the stanza in source order, including the header and property lines
      std::list<LineNode> getLines() const;

      void appendProperty(const PropertyRule &property);
      void appendLine(const LineNode &line);

      // True when every line of the stanza is blank
      bool isBlank() const;

    private:
      bool has_header = false;
      HeaderNode header;
      std::list<PropertyRule> properties;
      std::list<LineNode> lines;
  };
} // namespace ProfileBundle::Tree

#endif // STANZA_NODE_HH
