#ifndef PROFILEBUNDLE_COMBINER_HH
#define PROFILEBUNDLE_COMBINER_HH

#include <list>
#include <ostream>
#include <string>

#include "operation_result.hh"
#include "profile_type.hh"
#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  using Profile = Tree::ProfileRule;

  class ProfileCombiner {
    public:
      explicit ProfileCombiner(std::ostream &log);

      /**
      * @brief Factors the properties shared by 'selection' into a new parent file
      *
      * @details
      * The parent is written to "<dir of first profile>/<sanitized name>.ini" under a header
      * carrying the file's base name, so it is found by that name. It inherits the selection's "inherits" value when all
      * selected profiles share one. Each selected profile loses the hoisted properties and
      * inherits from the new parent. Nothing is renamed and no other profile is touched.
      *
      * @throws std::invalid_argument for an empty or unsafe parent name or an empty selection
      * @throws std::runtime_error if the parent file cannot be written
      */
      OperationResult combine(const std::list<Profile> &selection, const std::string &parent_name, ProfileType type);

      // "<sanitized name without type prefix>.ini" inside the directory of the first selected profile
      static std::string parentFilePath(const std::list<Profile> &selection, const std::string &parent_name);

    private:
      std::ostream &log;
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_COMBINER_HH
