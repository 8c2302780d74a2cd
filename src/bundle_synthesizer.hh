#ifndef PROFILEBUNDLE_BUNDLE_SYNTHESIZER_HH
#define PROFILEBUNDLE_BUNDLE_SYNTHESIZER_HH

#include <list>
#include <map>
#include <ostream>
#include <string>

#include "engine_config.hh"
#include "operation_result.hh"
#include "profile_type.hh"
#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  using Profile = Tree::ProfileRule;
  using PropertyMap = Tree::PropertyMap;

  class BundleSynthesizer {
    public:
      BundleSynthesizer(const EngineConfig &config, std::ostream &log);

      /**
      * @brief Moves the internal profiles of 'selection' into the vendor bundle 'bundle_name'
      *
      * @details
      * Internal profiles (those another selected profile inherits from) are renamed to their
      * privatized form, stripped of the properties they share, re-parented onto "*<bundle_name>*"
      * and appended to "<bundle dir>/<bundle_name>.ini". Every reference to them in the profile
      * directory is rewritten, and they are removed from their original files. Files left
      * without content are deleted. Leaves stay where they are. The parent is only created
      * when a bundled profile ends up below it.
      *
      * References are resolved against the profile directory and the bundle directory together.
      *
      * Profiles already present in the bundle (by qualified name) are not added twice.
      *
      * @throws std::invalid_argument for an empty or unsafe bundle name or an empty selection
      * @throws std::runtime_error if the bundle file cannot be written
      */
      OperationResult bundle(const std::list<Profile> &selection, const std::string &bundle_name, ProfileType type);

      // Original display name to privatized display name, for every internal profile that is not yet privatized
      static std::map<std::string, std::string> renameMap(const std::list<Profile> &internal);

      /**
      * @brief Finds the privatized name an "inherits" value should be rewritten to
      *
      * @details
      * A reference that names a renamed profile (after prefix stripping and trimming) is always
      * rewritten. A reference matching a renamed profile only by core name is rewritten unless it
      * names another profile of 'corpus' exactly.
      *
      * @return the new value, or an empty string if the reference is left alone
      */
      static std::string rewrittenReference(const std::string &inherits,
                                            const std::map<std::string, std::string> &rename_map,
                                            const std::list<Profile> &corpus);

    private:
      // 'profile_files' followed by the bundle directory's files not already among them
      std::list<std::string> resolutionFiles(const std::list<std::string> &profile_files) const;

      // Rewrites references to renamed profiles in every file of 'files'
      void rewriteReferences(const std::list<std::string> &files,
                             ProfileType type,
                             const std::map<std::string, std::string> &rename_map,
                             const std::list<Profile> &corpus,
                             OperationResult &result);

      // Removes the moved profiles from their source files, deleting files left empty
      void removeOriginals(const std::list<Profile> &moved, ProfileType type, OperationResult &result);

      const EngineConfig &config;
      std::ostream &log;
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_BUNDLE_SYNTHESIZER_HH
