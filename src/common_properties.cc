#include "common_properties.hh"

#include <list>
#include <optional>
#include <set>
#include <string>

ProfileBundle::PropertyMap ProfileBundle::CommonPropertyExtractor::commonProperties(const std::list<Profile> &profiles)
{
  if(profiles.empty()) {
    return PropertyMap();
  }

  PropertyMap common = profiles.front().getProperties();
  for(const auto &profile : profiles) {
    for(auto it = common.begin(); it != common.end();) {
      auto value = profile.getProperty(it->first);
      if(!value.has_value() || *value != it->second) {
        it = common.erase(it);
      }
      else {
        it++;
      }
    }
  }

  for(const auto &key : neverHoistKeys()) {
    common.erase(key);
  }

  return common;
}

const std::set<std::string> &ProfileBundle::CommonPropertyExtractor::neverHoistKeys()
{
  static const std::set<std::string> keys = {
    "compatible_printers_condition",
    "compatible_printers",
    "filament_vendor",
    "printer_model",
    "nozzle_diameter",
    "inherits"
  };

  return keys;
}

bool ProfileBundle::CommonPropertyExtractor::isHoistable(const std::string &key)
{
  return neverHoistKeys().count(key) == 0;
}

std::optional<std::string> ProfileBundle::CommonPropertyExtractor::sharedInherits(const std::list<Profile> &profiles)
{
  if(profiles.empty()) {
    return std::nullopt;
  }

  auto shared = profiles.front().getInherits();
  for(const auto &profile : profiles) {
    if(profile.getInherits() != shared) {
      return std::nullopt;
    }
  }

  return shared;
}
