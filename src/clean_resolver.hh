#ifndef PROFILEBUNDLE_CLEAN_RESOLVER_HH
#define PROFILEBUNDLE_CLEAN_RESOLVER_HH

#include <cstddef>
#include <list>
#include <ostream>
#include <set>
#include <string>

#include "engine_config.hh"
#include "operation_result.hh"
#include "profile_type.hh"
#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  using Profile = Tree::ProfileRule;
  using PropertyMap = Tree::PropertyMap;

  class CleanResolver {
    public:
      CleanResolver(const EngineConfig &config, std::ostream &log);

      /**
      * @brief Properties a profile receives from its ancestors
      *
      * @details
      * The ancestor chain is overlaid from the root down to the direct parent, so nearer
      * ancestors win. "inherits" itself is never part of the closure.
      */
      static PropertyMap inheritedClosure(const Profile &profile, const std::list<Profile> &all_profiles);

      // Removes the properties whose value the profile already inherits. Keeps "inherits".
      // Returns the number of removed properties.
      static size_t clean(Profile &profile, const std::list<Profile> &all_profiles);

      /**
      * @brief Cleans every profile of the profile directory of 'type'
      *
      * @details
      * Parents are resolved against the profile directory and the bundle directory. Only files
      * of the profile directory are rewritten, and only when they changed.
      *
      * @throws std::runtime_error if the profile directory does not exist
      */
      OperationResult cleanDirectory(ProfileType type);

      /**
      * @brief Cleans the bundle "<bundle dir>/<bundle_name>.ini" and the profiles depending on it
      *
      * @details
      * For each profile type found in the bundle:
      *   1. every bundled profile is cleaned against the bundle and the external profiles
      *   2. without a bundle parent, profiles sharing one "inherits" value and enough common
      *      properties get a new parent "*<bundle_name>*"
      *   3. properties still common to all children of the bundle parent move into the parent
      *   4. external profiles inheriting from a bundled profile are cleaned
      *
      * @throws std::runtime_error if the bundle file does not exist
      */
      OperationResult cleanBundle(const std::string &bundle_name);

      /**
      * @brief Moves properties shared by all children of 'parent' into it
      *
      * @details
      * Only keys the parent does not define yet are moved, and never the keys of
      * CommonPropertyExtractor::neverHoistKeys(). Requires at least two children.
      *
      * @return the number of properties removed from the children
      */
      static size_t hoistChildCommon(Profile &parent, std::list<Profile> &profiles, std::set<std::string> &changed);

    private:
      // Profiles of 'type' outside the bundle: the profile directory and the other bundle files
      std::list<Profile> externalProfiles(ProfileType type, const std::string &bundle_path);

      const EngineConfig &config;
      std::ostream &log;
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_CLEAN_RESOLVER_HH
