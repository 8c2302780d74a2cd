#include "TreeNode.hh"

#include <string>

ProfileBundle::Tree::TreeNode::TreeNode(const std::string &text)
  : text{text}
{   }

std::string ProfileBundle::Tree::TreeNode::getText() const
{
  return text;
}

void ProfileBundle::Tree::TreeNode::setText(const std::string &text)
{
  this->text = text;
}
