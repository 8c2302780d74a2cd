#include "clean_resolver.hh"
#include "bundle_file.hh"
#include "common_properties.hh"
#include "corpus.hh"
#include "inheritance_graph.hh"
#include "name_resolver.hh"
#include "profile_parser.hh"

#include <glibmm/miscutils.h>
#include <list>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace {
  bool inheritsFromAny(const ProfileBundle::Profile &profile, const std::list<ProfileBundle::Profile> &parents)
  {
    for(const auto &parent : parents) {
      if(ProfileBundle::NameResolver::inheritsFrom(profile, parent.qualifiedName())) {
        return true;
      }
    }

    return false;
  }

  // True if every profile has the same "inherits" value (or none at all)
  bool uniformInherits(const std::list<ProfileBundle::Profile> &profiles)
  {
    for(const auto &profile : profiles) {
      if(profile.getInherits() != profiles.front().getInherits()) {
        return false;
      }
    }

    return true;
  }
} // namespace

ProfileBundle::CleanResolver::CleanResolver(const EngineConfig &config, std::ostream &log)
  : config{config},
    log{log}
{   }

ProfileBundle::PropertyMap ProfileBundle::CleanResolver::inheritedClosure(const Profile &profile,
                                                                          const std::list<Profile> &all_profiles)
{
  PropertyMap closure;

  auto chain = InheritanceGraph::ancestorChain(profile, all_profiles);
  for(auto ancestor = chain.rbegin(); ancestor != chain.rend(); ancestor++) {
    for(const auto &[key, value] : ancestor->getProperties()) {
      if(key != "inherits") {
        closure[key] = value;
      }
    }
  }

  return closure;
}

size_t ProfileBundle::CleanResolver::clean(Profile &profile, const std::list<Profile> &all_profiles)
{
  PropertyMap closure = inheritedClosure(profile, all_profiles);

  size_t removed = 0;
  for(const auto &[key, value] : profile.getProperties()) {
    if(key == "inherits") {
      continue;
    }

    auto inherited = closure.find(key);
    if(inherited != closure.end() && inherited->second == value) {
      profile.removeProperty(key);
      removed++;
    }
  }

  return removed;
}

ProfileBundle::OperationResult ProfileBundle::CleanResolver::cleanDirectory(ProfileType type)
{
  const std::string profile_dir = config.profileDirFor(type);
  if(!Corpus::isDirectory(profile_dir)) {
    throw std::runtime_error("Directory '" + profile_dir + "' does not exist.");
  }

  OperationResult result;

  // Bundles are read for inheritance analysis only
  auto target_files = Corpus::listIniFiles(profile_dir);
  auto all_files = target_files;
  all_files.splice(all_files.end(), Corpus::listIniFiles(config.getBundleDir()));

  log << "Loading all " << toString(type) << " profiles..." << std::endl;
  const auto all_profiles = Corpus::load(all_files, type, log);
  log << "Loaded " << all_profiles.size() << " total profiles from " << all_files.size() << " files for inheritance analysis" << std::endl;

  size_t files_processed = 0;
  for(const auto &file : target_files) {
    try {
      Parser parser(file, type);
      files_processed++;

      size_t file_removed = 0;
      for(auto profile : parser.getProfileList(type)) {
        size_t removed = clean(profile, all_profiles);
        if(removed == 0) {
          continue;
        }

        log << "  " << profile.qualifiedName() << ": removed " << removed << " redundant properties" << std::endl;
        parser.updateProfile(profile);
        file_removed += removed;
        result.profiles_changed++;
      }

      if(file_removed == 0) {
        continue;
      }

      parser.saveChanges();
      result.addWritten(file);
      result.properties_removed += file_removed;
      log << "Cleaned " << Glib::path_get_basename(file) << ": removed " << file_removed << " properties" << std::endl;
    }
    catch(const std::runtime_error &error) {
      log << "Warning: cannot clean " << file << ": " << error.what() << std::endl;
    }
  }

  log << "Clean operation completed:" << std::endl
      << "  - Files processed: " << files_processed << std::endl
      << "  - Files changed: " << result.files_written.size() << std::endl
      << "  - Total properties removed: " << result.properties_removed << std::endl;

  result.nothing_to_do = result.files_written.empty();
  return result;
}

ProfileBundle::OperationResult ProfileBundle::CleanResolver::cleanBundle(const std::string &bundle_name)
{
  const std::string bundle_path = config.bundleFilePath(bundle_name);
  if(!Corpus::isFile(bundle_path)) {
    throw std::runtime_error("Bundle file not found: " + bundle_path);
  }

  log << "Cleaning bundle file: " << Glib::path_get_basename(bundle_path) << std::endl;

  OperationResult result;
  result.output_file = bundle_path;

  BundleFile bundle_file(bundle_path, bundle_name, ProfileType::Print, config);
  const auto types = bundle_file.profileTypes();
  const std::string parent_name = bundle_file.parentName();

  std::set<std::string> changed;

  for(ProfileType type : types) {
    log << "--- Optimizing " << toString(type) << " profiles ---" << std::endl;

    std::list<Profile> group = bundle_file.getProfiles(type);
    const std::list<Profile> external = externalProfiles(type, bundle_path);

    // Phase 1: drop what bundled profiles already inherit
    std::list<Profile> resolution_set = group;
    resolution_set.insert(resolution_set.end(), external.begin(), external.end());

    for(auto &profile : group) {
      size_t removed = clean(profile, resolution_set);
      if(removed > 0) {
        log << "  " << profile.qualifiedName() << ": removed " << removed << " redundant properties" << std::endl;
        result.properties_removed += removed;
        changed.insert(profile.qualifiedName());
      }
    }

    // Phase 2: give siblings without a bundle parent a common parent
    const std::string parent_qualified = bundle_file.parentQualifiedName(type);
    bool has_parent = false;
    for(const auto &profile : group) {
      has_parent = has_parent || profile.qualifiedName() == parent_qualified;
    }

    if(!has_parent && group.size() >= 2 && uniformInherits(group)) {
      PropertyMap common = CommonPropertyExtractor::commonProperties(group);
      log << "Found " << common.size() << " common properties among " << toString(type) << " profiles" << std::endl;

      if(common.size() >= static_cast<size_t>(config.getMinCommonProperties())) {
        Profile parent(type, parent_name);
        parent.setProperties(common);

        auto inherits = group.front().getInherits();
        if(inherits.has_value()) {
          parent.setProperty("inherits", *inherits);
        }

        for(auto &profile : group) {
          for(const auto &[key, value] : common) {
            profile.removeProperty(key);
          }

          profile.setProperty("inherits", parent_name);
          result.properties_removed += common.size();
          changed.insert(profile.qualifiedName());
        }

        group.push_front(parent);
        changed.insert(parent.qualifiedName());
        log << "Creating bundle parent: " << parent.qualifiedName() << std::endl;
      }
      else {
        log << "Too few common properties, skipping parent creation" << std::endl;
      }
    }

    // Phase 3: move what the children of the bundle parent still share into it
    for(auto &profile : group) {
      if(profile.qualifiedName() != parent_qualified) {
        continue;
      }

      size_t removed = hoistChildCommon(profile, group, changed);
      if(removed > 0) {
        log << "Moved " << removed << " additional properties from " << toString(type) << " children to " << parent_qualified << std::endl;
        result.properties_removed += removed;
      }
      else {
        log << "No additional common properties found among " << toString(type) << " children" << std::endl;
      }
    }

    bundle_file.setProfiles(type, group);

    // Phase 4: clean the profiles outside the bundle that inherit from it
    std::list<Profile> cleaning_set = group;
    cleaning_set.insert(cleaning_set.end(), external.begin(), external.end());

    for(const auto &file : Corpus::listIniFiles(config.profileDirFor(type))) {
      try {
        Parser parser(file, type);
        size_t file_removed = 0;

        for(auto profile : parser.getProfileList(type)) {
          if(!inheritsFromAny(profile, group)) {
            continue;
          }

          size_t removed = clean(profile, cleaning_set);
          if(removed == 0) {
            continue;
          }

          log << "  " << profile.qualifiedName() << ": removed " << removed << " redundant properties" << std::endl;
          parser.updateProfile(profile);
          file_removed += removed;
          changed.insert(file + "|" + profile.qualifiedName());
        }

        if(file_removed > 0) {
          parser.saveChanges();
          result.addWritten(file);
          result.properties_removed += file_removed;
          log << "Cleaned external file: " << Glib::path_get_basename(file) << std::endl;
        }
      }
      catch(const std::runtime_error &error) {
        log << "Warning: cannot clean " << file << ": " << error.what() << std::endl;
      }
    }
  }

  result.profiles_changed = changed.size();

  if(changed.empty()) {
    log << "No optimization opportunities found in " << Glib::path_get_basename(bundle_path) << std::endl;
    result.nothing_to_do = true;
    return result;
  }

  bundle_file.save();
  result.files_written.push_front(bundle_path);

  log << "Cleaned " << Glib::path_get_basename(bundle_path) << ":" << std::endl
      << "  - Removed " << result.properties_removed << " total redundant properties" << std::endl
      << "  - Modified " << result.profiles_changed << " profiles" << std::endl;

  return result;
}

size_t ProfileBundle::CleanResolver::hoistChildCommon(Profile &parent, std::list<Profile> &profiles, std::set<std::string> &changed)
{
  std::list<Profile *> children;
  std::list<Profile> snapshot;
  for(auto &profile : profiles) {
    if(profile.isSameProfile(parent)) {
      continue;
    }

    auto inherits = profile.getInherits();
    if(inherits.has_value() && NameResolver::inheritsValueMatches(*inherits, parent.name())) {
      children.push_back(&profile);
      snapshot.push_back(profile);
    }
  }

  if(children.size() < 2) {
    return 0;
  }

  PropertyMap additional;
  for(const auto &[key, value] : CommonPropertyExtractor::commonProperties(snapshot)) {
    if(!parent.hasProperty(key)) {
      additional[key] = value;
    }
  }

  if(additional.empty()) {
    return 0;
  }

  for(const auto &[key, value] : additional) {
    parent.setProperty(key, value);
  }

  changed.insert(parent.qualifiedName());

  size_t removed = 0;
  for(Profile *child : children) {
    for(const auto &[key, value] : additional) {
      if(child->removeProperty(key)) {
        removed++;
      }
    }

    changed.insert(child->qualifiedName());
  }

  return removed;
}

std::list<ProfileBundle::Profile> ProfileBundle::CleanResolver::externalProfiles(ProfileType type, const std::string &bundle_path)
{
  auto files = Corpus::listIniFiles(config.profileDirFor(type));
  for(const auto &file : Corpus::listIniFiles(config.getBundleDir())) {
    if(file != bundle_path) {
      files.push_back(file);
    }
  }

  auto profiles = Corpus::load(files, type, log);
  log << "Loaded " << profiles.size() << " external " << toString(type) << " profiles for inheritance analysis" << std::endl;
  return profiles;
}
