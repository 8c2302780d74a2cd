#ifndef PROFILEBUNDLE_COMMON_PROPERTIES_HH
#define PROFILEBUNDLE_COMMON_PROPERTIES_HH

#include <list>
#include <optional>
#include <set>
#include <string>

#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  using Profile = Tree::ProfileRule;
  using PropertyMap = Tree::PropertyMap;

  class CommonPropertyExtractor {
    public:
      /**
      * @brief Key/value pairs that are identical in every profile of 'profiles'
      *
      * @details
      * Keys that are specific to a single profile (see neverHoistKeys()) are never part of the
      * result, even when every profile carries the same value. Empty input gives an empty map.
      */
      static PropertyMap commonProperties(const std::list<Profile> &profiles);

      // compatible_printers_condition, compatible_printers, filament_vendor, printer_model, nozzle_diameter, inherits
      static const std::set<std::string> &neverHoistKeys();

      static bool isHoistable(const std::string &key);

      // The trimmed "inherits" value shared by every profile, if they all have the same non-empty one
      static std::optional<std::string> sharedInherits(const std::list<Profile> &profiles);
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_COMMON_PROPERTIES_HH
