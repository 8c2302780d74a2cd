#ifndef PROFILEBUNDLE_PROFILE_FILTER_HH
#define PROFILEBUNDLE_PROFILE_FILTER_HH

#include <list>
#include <optional>
#include <string>
#include <variant>

#include "profile_type.hh"
#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  using Profile = Tree::ProfileRule;

  // Selection criteria of print profiles. Empty strings match everything.
  struct PrintCriteria {
    // Matched against "@tags" of the name and the comma separated "land_fm_tags" property
    std::string sub_profile;

    // "0.2" or "0.2mm"
    std::string layer_height;

    // Matched against "nozzle_diameter[0]==N" in "compatible_printers_condition"
    std::string nozzle;
  };

  // Selection criteria of filament profiles. Empty strings match everything.
  struct FilamentCriteria {
    std::string type;
    std::string vendor;
  };

  class ProfileFilter {
    public:
      // A filter that accepts every profile of 'type'
      explicit ProfileFilter(ProfileType type);

      explicit ProfileFilter(const PrintCriteria &criteria);
      explicit ProfileFilter(const FilamentCriteria &criteria);

      ProfileType type() const;

      // Profiles of another type never match
      bool matches(const Profile &profile) const;

      // True if no criterion is set
      bool acceptsAll() const;

      // Lowercased tags of a print profile, from "land_fm_tags" first and then from its name
      static std::list<std::string> subProfileTags(const Profile &profile);

      // Nozzle diameter from the "compatible_printers_condition" of a profile, as "<N>mm"
      static std::optional<std::string> nozzleDiameter(const Profile &profile);

      // Lowercases and trims 'value', appending 'default_unit' to bare numbers
      static std::optional<std::string> normalizeForComparison(const std::optional<std::string> &value,
                                                               const std::string &default_unit = "mm");

    private:
      bool matchesPrint(const PrintCriteria &print, const Profile &profile) const;
      bool matchesFilament(const FilamentCriteria &filament, const Profile &profile) const;

      ProfileType profile_type;
      std::variant<PrintCriteria, FilamentCriteria> criteria;
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_PROFILE_FILTER_HH
