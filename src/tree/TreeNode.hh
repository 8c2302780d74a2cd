#ifndef TREE_NODE_HH
#define TREE_NODE_HH

#include <string>

namespace ProfileBundle::Tree {
  class TreeNode {
    public:
      explicit TreeNode(const std::string &text);

      // Default constructors and destructor
      TreeNode() = default;
      virtual ~TreeNode() = default;

      std::string getText() const;

      // Copy/Move assignment operator
      TreeNode& operator=(const TreeNode &) = default;
      TreeNode& operator=(TreeNode &&) = default;

      TreeNode(const TreeNode &) = default;
      TreeNode(TreeNode &&) = default;

    protected:
      void setText(const std::string &text);

    private:
      std::string text;
  };
} // namespace ProfileBundle::Tree

#endif // TREE_NODE_HH
