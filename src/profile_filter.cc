#include "profile_filter.hh"
#include "name_resolver.hh"
#include "tree/PropertyRule.hh"

#include <algorithm>
#include <cctype>
#include <list>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <variant>

namespace {
  std::string lowercase(std::string text)
  {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });

    return text;
  }

  // Trimmed and lowercased property value, if the profile has the property
  std::optional<std::string> lowercaseProperty(const ProfileBundle::Profile &profile, const std::string &key)
  {
    auto value = profile.getProperty(key);
    if(!value.has_value()) {
      return std::nullopt;
    }

    return lowercase(ProfileBundle::Tree::PropertyRule::trim(*value));
  }

  bool matchesExactly(const std::string &wanted, const std::optional<std::string> &value)
  {
    return wanted.empty() || value == lowercase(wanted);
  }

  bool matchesMeasure(const std::string &wanted, const std::optional<std::string> &value)
  {
    if(wanted.empty()) {
      return true;
    }

    using ProfileBundle::ProfileFilter;
    return ProfileFilter::normalizeForComparison(value) == ProfileFilter::normalizeForComparison(wanted);
  }
} // namespace

ProfileBundle::ProfileFilter::ProfileFilter(ProfileType type)
  : profile_type{type}
{
  if(type == ProfileType::Filament) {
    criteria = FilamentCriteria();
  }
  else {
    criteria = PrintCriteria();
  }
}

ProfileBundle::ProfileFilter::ProfileFilter(const PrintCriteria &criteria)
  : profile_type{ProfileType::Print},
    criteria{criteria}
{   }

ProfileBundle::ProfileFilter::ProfileFilter(const FilamentCriteria &criteria)
  : profile_type{ProfileType::Filament},
    criteria{criteria}
{   }

ProfileBundle::ProfileType ProfileBundle::ProfileFilter::type() const
{
  return profile_type;
}

bool ProfileBundle::ProfileFilter::matches(const Profile &profile) const
{
  if(profile.type() != profile_type) {
    return false;
  }

  if(const auto *print = std::get_if<PrintCriteria>(&criteria)) {
    return matchesPrint(*print, profile);
  }

  return matchesFilament(std::get<FilamentCriteria>(criteria), profile);
}

bool ProfileBundle::ProfileFilter::acceptsAll() const
{
  if(const auto *print = std::get_if<PrintCriteria>(&criteria)) {
    return print->sub_profile.empty() && print->layer_height.empty() && print->nozzle.empty();
  }

  const auto &filament = std::get<FilamentCriteria>(criteria);
  return filament.type.empty() && filament.vendor.empty();
}

bool ProfileBundle::ProfileFilter::matchesPrint(const PrintCriteria &print, const Profile &profile) const
{
  if(!print.sub_profile.empty()) {
    auto tags = subProfileTags(profile);
    if(std::find(tags.begin(), tags.end(), lowercase(print.sub_profile)) == tags.end()) {
      return false;
    }
  }

  return matchesMeasure(print.layer_height, lowercaseProperty(profile, "layer_height")) &&
         matchesMeasure(print.nozzle, nozzleDiameter(profile));
}

bool ProfileBundle::ProfileFilter::matchesFilament(const FilamentCriteria &filament, const Profile &profile) const
{
  return matchesExactly(filament.type, lowercaseProperty(profile, "filament_type")) &&
         matchesExactly(filament.vendor, lowercaseProperty(profile, "filament_vendor"));
}

std::list<std::string> ProfileBundle::ProfileFilter::subProfileTags(const Profile &profile)
{
  std::list<std::string> tags;
  auto add = [&tags](const std::string &tag) {
    if(std::find(tags.begin(), tags.end(), tag) == tags.end()) {
      tags.push_back(tag);
    }
  };

  auto property = profile.getProperty("land_fm_tags");
  if(property.has_value()) {
    std::stringstream stream(*property);
    std::string tag;
    while(std::getline(stream, tag, ',')) {
      add(lowercase(Tree::PropertyRule::trim(tag)));
    }
  }

  for(const auto &tag : NameResolver::normalize(profile.name()).tags) {
    add(lowercase(tag));
  }

  return tags;
}

std::optional<std::string> ProfileBundle::ProfileFilter::nozzleDiameter(const Profile &profile)
{
  static const std::regex nozzle_condition("nozzle_diameter\\[0\\]==(\\d*\\.?\\d+)");

  auto condition = profile.getProperty("compatible_printers_condition");
  if(!condition.has_value()) {
    return std::nullopt;
  }

  std::smatch match;
  if(!std::regex_search(*condition, match, nozzle_condition)) {
    return std::nullopt;
  }

  return match[1].str() + "mm";
}

std::optional<std::string> ProfileBundle::ProfileFilter::normalizeForComparison(const std::optional<std::string> &value,
                                                                                const std::string &default_unit)
{
  static const std::regex bare_number("^\\d*\\.?\\d+$");

  if(!value.has_value() || value->empty()) {
    return std::nullopt;
  }

  std::string normalized = lowercase(Tree::PropertyRule::trim(*value));

  // Values that already carry a unit and values that are not numbers are compared as they are
  if(std::regex_match(normalized, bare_number)) {
    normalized += default_unit;
  }

  return normalized;
}
