#include "profile_updater.hh"
#include "corpus.hh"
#include "profile_parser.hh"
#include "quantity.hh"

#include <glibmm/miscutils.h>
#include <list>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

ProfileBundle::PropertyUpdate::PropertyUpdate(Kind kind, const std::string &key)
  : kind{kind},
    key{key}
{   }

ProfileBundle::PropertyUpdate ProfileBundle::PropertyUpdate::parse(const std::string &expression)
{
  static const std::regex relative_form("^(\\w+)==([+-]\\d*\\.?\\d*(%|mm)?)$");
  static const std::regex absolute_form("^(\\w+)=([^=].*)$");

  std::smatch match;
  if(std::regex_match(expression, match, relative_form)) {
    return relative(match[1].str(), RelativeAdjustment::parse(match[2].str()));
  }

  if(std::regex_match(expression, match, absolute_form)) {
    return absolute(match[1].str(), match[2].str());
  }

  std::stringstream message;
  message << "Invalid update expression: " << expression << " (valid formats: property=value or property==+/-amount)";
  throw std::invalid_argument(message.str());
}

ProfileBundle::PropertyUpdate ProfileBundle::PropertyUpdate::absolute(const std::string &key, const std::string &value)
{
  PropertyUpdate update(Kind::Absolute, key);
  update.value = value;
  return update;
}

ProfileBundle::PropertyUpdate ProfileBundle::PropertyUpdate::relative(const std::string &key, const RelativeAdjustment &adjustment)
{
  PropertyUpdate update(Kind::Relative, key);
  update.adjustment = adjustment;
  return update;
}

ProfileBundle::PropertyUpdate::Kind ProfileBundle::PropertyUpdate::getKind() const
{
  return kind;
}

std::string ProfileBundle::PropertyUpdate::getKey() const
{
  return key;
}

std::optional<std::string> ProfileBundle::PropertyUpdate::newValue(const Profile &profile) const
{
  if(kind == Kind::Absolute) {
    return value;
  }

  auto current = profile.getProperty(key);
  if(!current.has_value()) {
    return std::nullopt;
  }

  return adjustment.apply(Quantity::parse(*current)).toString();
}

ProfileBundle::PropertyUpdate::operator std::string() const
{
  if(kind == Kind::Absolute) {
    return key + "=" + value;
  }

  return key + "==" + adjustment.toString();
}

ProfileBundle::ProfileUpdater::ProfileUpdater(std::ostream &log)
  : log{log}
{   }

size_t ProfileBundle::ProfileUpdater::apply(Profile &profile, const std::list<PropertyUpdate> &updates)
{
  size_t changed = 0;

  for(const auto &update : updates) {
    std::optional<std::string> new_value;
    try {
      new_value = update.newValue(profile);
    }
    catch(const std::invalid_argument &error) {
      log << "Warning: " << profile.qualifiedName() << ": " << update.getKey() << ": " << error.what() << std::endl;
      continue;
    }

    if(!new_value.has_value()) {
      log << "Warning: " << profile.qualifiedName() << ": " << update.getKey() << " is not set, cannot apply relative change" << std::endl;
      continue;
    }

    auto old_value = profile.getProperty(update.getKey());
    if(old_value == new_value) {
      continue;
    }

    log << "  " << profile.qualifiedName() << ": " << update.getKey() << ": "
        << old_value.value_or("(not set)") << " -> " << *new_value << std::endl;

    profile.setProperty(update.getKey(), *new_value);
    changed++;
  }

  return changed;
}

ProfileBundle::OperationResult ProfileBundle::ProfileUpdater::update(const std::list<Profile> &selection,
                                                                     const std::list<PropertyUpdate> &updates,
                                                                     ProfileType type)
{
  OperationResult result;

  for(const auto &file : Corpus::sourceFiles(selection)) {
    try {
      Parser parser(file, type);
      bool file_changed = false;

      for(auto profile : parser.getProfileList(type)) {
        bool selected = false;
        for(const auto &candidate : selection) {
          selected = selected || candidate.isSameProfile(profile);
        }

        if(!selected || apply(profile, updates) == 0) {
          continue;
        }

        parser.updateProfile(profile);
        result.profiles_changed++;
        file_changed = true;
      }

      if(file_changed) {
        parser.saveChanges();
        result.addWritten(file);
        log << "Updated " << Glib::path_get_basename(file) << std::endl;
      }
    }
    catch(const std::runtime_error &error) {
      log << "Warning: cannot update " << file << ": " << error.what() << std::endl;
    }
  }

  result.nothing_to_do = result.files_written.empty();
  return result;
}
