#ifndef PROFILEBUNDLE_INHERITANCE_GRAPH_HH
#define PROFILEBUNDLE_INHERITANCE_GRAPH_HH

#include <list>
#include <optional>
#include <string>

#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  using Profile = Tree::ProfileRule;

  // Child to parent edges over an arbitrary set of loaded profiles.
  // Every walk keeps a visited set on qualified names, so circular references terminate.
  class InheritanceGraph {
    public:
      // Profiles whose "inherits" refers to 'parent_name', in input order
      static std::list<Profile> directChildren(const std::list<Profile> &profiles, const std::string &parent_name);

      /**
      * @brief Breadth-first closure of directChildren() starting from 'seed_names'
      *
      * @details
      * Each profile is reported once (by qualified name), in order of first discovery.
      */
      static std::list<Profile> descendants(const std::list<Profile> &profiles, const std::list<std::string> &seed_names);

      // First profile (in input order) that 'profile' inherits from, other than itself
      static std::optional<Profile> findParent(const Profile &profile, const std::list<Profile> &profiles);

      /**
      * @brief Walks "inherits" upward one hop at a time
      *
      * @return the direct parent first and the root last; empty if the parent cannot be resolved
      */
      static std::list<Profile> ancestorChain(const Profile &profile, const std::list<Profile> &profiles);
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_INHERITANCE_GRAPH_HH
