#ifndef PROFILEBUNDLE_PROFILE_UPDATER_HH
#define PROFILEBUNDLE_PROFILE_UPDATER_HH

#include <list>
#include <optional>
#include <ostream>
#include <string>

#include "operation_result.hh"
#include "profile_type.hh"
#include "quantity.hh"
#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  using Profile = Tree::ProfileRule;

  // One "key=value" (absolute) or "key==+N[unit]" (relative) change
  class PropertyUpdate {
    public:
      enum class Kind { Absolute, Relative };

      // Throws std::invalid_argument for expressions of neither form
      static PropertyUpdate parse(const std::string &expression);

      static PropertyUpdate absolute(const std::string &key, const std::string &value);
      static PropertyUpdate relative(const std::string &key, const RelativeAdjustment &adjustment);

      Kind getKind() const;
      std::string getKey() const;

      /**
      * @brief Computes the new value of the property for 'profile'
      *
      * @return the new value, or nothing for a relative change of a property the profile lacks
      * @throws std::invalid_argument if the current value cannot be adjusted (format or unit mismatch)
      */
      std::optional<std::string> newValue(const Profile &profile) const;

      explicit operator std::string() const;

    private:
      PropertyUpdate(Kind kind, const std::string &key);

      Kind kind;
      std::string key;
      std::string value;
      RelativeAdjustment adjustment;
  };

  class ProfileUpdater {
    public:
      explicit ProfileUpdater(std::ostream &log);

      /**
      * @brief Applies 'updates' to every profile of 'selection'
      *
      * @details
      * Each touched file is rewritten once. A change that cannot be applied to a profile is
      * reported and skipped for that profile only.
      */
      OperationResult update(const std::list<Profile> &selection, const std::list<PropertyUpdate> &updates, ProfileType type);

      // Applies 'updates' in order and returns the number of properties whose value changed
      size_t apply(Profile &profile, const std::list<PropertyUpdate> &updates);

    private:
      std::ostream &log;
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_PROFILE_UPDATER_HH
