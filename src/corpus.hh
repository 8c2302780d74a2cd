#ifndef PROFILEBUNDLE_CORPUS_HH
#define PROFILEBUNDLE_CORPUS_HH

#include <list>
#include <ostream>
#include <string>

#include "profile_filter.hh"
#include "profile_type.hh"
#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  using Profile = Tree::ProfileRule;

  // Loading and selecting profiles across directories of profile files
  class Corpus {
    public:
      // The "*.ini" files of 'dir', sorted by path. Empty if 'dir' is not a directory.
      static std::list<std::string> listIniFiles(const std::string &dir);

      /**
      * @brief Parses every file and concatenates the profiles of 'type', in file order
      *
      * @details
      * A file that cannot be read or parsed is reported on 'log' and skipped.
      */
      static std::list<Profile> load(const std::list<std::string> &files, ProfileType type, std::ostream &log);

      // Same as load(listIniFiles(dir), type, log)
      static std::list<Profile> loadDirectory(const std::string &dir, ProfileType type, std::ostream &log);

      // The profiles accepted by 'filter', in corpus order
      static std::list<Profile> select(const std::list<Profile> &profiles, const ProfileFilter &filter);

      // Distinct source files of 'profiles', in order of first appearance
      static std::list<std::string> sourceFiles(const std::list<Profile> &profiles);

      static bool isDirectory(const std::string &path);
      static bool isFile(const std::string &path);
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_CORPUS_HH
