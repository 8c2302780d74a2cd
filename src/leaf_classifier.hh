#ifndef PROFILEBUNDLE_LEAF_CLASSIFIER_HH
#define PROFILEBUNDLE_LEAF_CLASSIFIER_HH

#include <list>

#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  using Profile = Tree::ProfileRule;

  struct Classification {
    // Profiles without any child in the selection. They stay where they are.
    std::list<Profile> leaves;

    // Profiles that at least one other selected profile inherits from
    std::list<Profile> internal;
  };

  class LeafClassifier {
    public:
      // Partitions 'selection' by the inheritance edges between its own members, keeping input order
      static Classification classify(const std::list<Profile> &selection);

      // True if a profile of 'selection' other than 'profile' inherits from it. A reference is matched
      // by core name only when it names no selected profile exactly.
      static bool hasChildIn(const Profile &profile, const std::list<Profile> &selection);
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_LEAF_CLASSIFIER_HH
