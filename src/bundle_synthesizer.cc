#include "bundle_synthesizer.hh"
#include "bundle_file.hh"
#include "common_properties.hh"
#include "corpus.hh"
#include "inheritance_graph.hh"
#include "leaf_classifier.hh"
#include "name_resolver.hh"
#include "profile_parser.hh"
#include "tree/PropertyRule.hh"

#include <cstdio>
#include <glib.h>
#include <glibmm/miscutils.h>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {
  // Creates the bundle directory if it does not exist yet
  void makeDirectory(const std::string &dir, std::ostream &log)
  {
    if(ProfileBundle::Corpus::isDirectory(dir)) {
      return;
    }

    if(g_mkdir_with_parents(dir.c_str(), 0755) != 0) {
      throw std::runtime_error("cannot create bundle directory '" + dir + "'");
    }

    log << "Created bundle directory: " << dir << std::endl;
  }

  // Qualified names of profiles that end up below the bundle parent once bundled:
  // those re-parented onto it, and those inheriting from one of them
  std::set<std::string> reachingParent(const std::list<ProfileBundle::Profile> &internal,
                                       const std::optional<std::string> &parent_inherits)
  {
    std::set<std::string> reaching;
    for(const auto &profile : internal) {
      if(profile.getInherits() == parent_inherits) {
        reaching.insert(profile.qualifiedName());
      }
    }

    bool changed = true;
    while(changed) {
      changed = false;
      for(const auto &profile : internal) {
        auto inherits = profile.getInherits();
        if(reaching.count(profile.qualifiedName()) != 0 || !inherits.has_value()) {
          continue;
        }

        for(const auto &parent : internal) {
          if(reaching.count(parent.qualifiedName()) != 0 &&
             ProfileBundle::NameResolver::referencesProfile(*inherits, parent.qualifiedName())) {
            reaching.insert(profile.qualifiedName());
            changed = true;
            break;
          }
        }
      }
    }

    return reaching;
  }
} // namespace

ProfileBundle::BundleSynthesizer::BundleSynthesizer(const EngineConfig &config, std::ostream &log)
  : config{config},
    log{log}
{   }

ProfileBundle::OperationResult ProfileBundle::BundleSynthesizer::bundle(const std::list<Profile> &selection,
                                                                        const std::string &bundle_name,
                                                                        ProfileType type)
{
  if(Tree::PropertyRule::trim(bundle_name).empty()) {
    throw std::invalid_argument("Bundle name is required");
  }

  if(NameResolver::containsUnsafeFilesystemChars(bundle_name)) {
    std::stringstream message;
    message << "Bundle name contains unsafe characters: " << NameResolver::unsafeFilesystemChars(bundle_name);
    throw std::invalid_argument(message.str());
  }

  if(selection.empty()) {
    throw std::invalid_argument("No profiles to bundle");
  }

  OperationResult result;

  // Load every profile of the directory and of the bundles to see the complete inheritance graph.
  // Only the directory's files are rewritten.
  const std::string profile_dir = config.profileDirFor(type);
  log << "Loading all " << toString(type) << " profiles to analyze inheritance..." << std::endl;
  const auto corpus_files = Corpus::listIniFiles(profile_dir);
  const auto resolution_files = resolutionFiles(corpus_files);
  const auto corpus = Corpus::load(resolution_files, type, log);
  log << "Loaded " << corpus.size() << " total profiles from " << resolution_files.size() << " files" << std::endl;

  auto classification = LeafClassifier::classify(selection);
  result.leaves_kept = classification.leaves.size();

  for(const auto &profile : classification.internal) {
    log << "Non-leaf profile (will be moved to bundle): " << profile.qualifiedName() << std::endl;
  }

  for(const auto &profile : classification.leaves) {
    log << "Leaf profile (will stay in original location): " << profile.qualifiedName() << std::endl;
  }

  if(classification.internal.empty()) {
    log << "No parent profiles found in selection - nothing to move to bundle" << std::endl;
    result.nothing_to_do = true;
    return result;
  }

  const auto &internal = classification.internal;

  makeDirectory(config.getBundleDir(), log);
  BundleFile bundle_file(config.bundleFilePath(bundle_name), bundle_name, type, config);
  result.output_file = bundle_file.getPath();

  if(bundle_file.existed()) {
    log << "Bundle file already exists: " << bundle_file.getPath() << std::endl;
  }
  else {
    log << "Creating new bundle file: " << bundle_file.getPath() << std::endl;
  }

  const auto rename_map = renameMap(internal);
  for(const auto &[original, privatized] : rename_map) {
    log << "Will privatize: " << original << " -> " << privatized << std::endl;
  }

  // A single internal profile keeps its own values
  PropertyMap common;
  if(internal.size() > 1) {
    common = CommonPropertyExtractor::commonProperties(internal);
  }

  PropertyMap hoisted;

  const std::string parent_name = bundle_file.parentName();
  auto existing_parent = bundle_file.findProfile(bundle_file.parentQualifiedName(type));
  bool has_parent = existing_parent.has_value();

  std::optional<std::string> parent_inherits = has_parent? existing_parent->getInherits()
                                                         : CommonPropertyExtractor::sharedInherits(internal);
  const auto reaching = reachingParent(internal, parent_inherits);

  if(has_parent) {
    // Only values the parent already carries can be dropped from the children
    for(const auto &[key, value] : common) {
      if(!reaching.empty() && existing_parent->getProperty(key) == value) {
        hoisted[key] = value;
      }
    }

    log << "Bundle parent already exists: " << existing_parent->qualifiedName() << std::endl;
  }
  else if(reaching.empty()) {
    // Nothing would inherit from a new parent, so none is created and no value moves
    log << "No bundled profile would inherit from " << bundle_file.parentQualifiedName(type)
        << ", skipping bundle parent" << std::endl;
  }
  else {
    hoisted = common;

    Profile parent(type, parent_name);
    parent.setProperties(hoisted);
    if(parent_inherits.has_value()) {
      parent.setProperty("inherits", *parent_inherits);
    }

    bundle_file.appendProfile(parent);
    has_parent = true;
    log << "Created bundle parent: " << parent.qualifiedName() << " with " << hoisted.size() << " common properties" << std::endl;
  }

  for(const auto &profile : internal) {
    Profile moved(profile);

    auto renamed = rename_map.find(profile.name());
    if(renamed != rename_map.end()) {
      moved.rename(renamed->second);
    }

    if(reaching.count(profile.qualifiedName()) != 0) {
      for(const auto &[key, value] : hoisted) {
        moved.removeProperty(key);
      }
    }

    auto inherits = profile.getInherits();
    if(inherits == parent_inherits) {
      moved.setProperty("inherits", parent_name);
    }
    else if(inherits.has_value()) {
      std::string reference = rewrittenReference(*inherits, rename_map, corpus);
      if(!reference.empty()) {
        moved.setProperty("inherits", reference);
      }
    }

    result.profiles_moved.push_back(profile.qualifiedName());

    if(bundle_file.hasProfile(moved.qualifiedName())) {
      log << "Skipping duplicate in bundle: " << moved.qualifiedName() << std::endl;
      continue;
    }

    bundle_file.appendProfile(moved);
    log << "Bundled profile: " << moved.name() << " (inherits from " << moved.getInherits().value_or("nothing") << ")" << std::endl;
  }

  bundle_file.save();
  result.addWritten(bundle_file.getPath());

  // Count the profiles below the relocated ones that stay in the directory
  std::set<std::string> moved_names(result.profiles_moved.begin(), result.profiles_moved.end());
  for(const auto &descendant : InheritanceGraph::descendants(corpus, result.profiles_moved)) {
    if(moved_names.count(descendant.qualifiedName()) == 0) {
      result.descendants++;
    }
  }

  log << "Updating inheritance references across all " << toString(type) << " files..." << std::endl;
  rewriteReferences(corpus_files, type, rename_map, corpus, result);

  log << "Removing privatized profiles from original files..." << std::endl;
  removeOriginals(internal, type, result);

  log << "Bundle operation completed:" << std::endl;
  if(has_parent) {
    log << "  - Bundle parent: " << parent_name << " with " << hoisted.size() << " common properties" << std::endl;
  }

  log << "  - Moved " << internal.size() << " non-leaf profile(s) to bundle (privatized)" << std::endl
      << "  - Left " << result.leaves_kept << " leaf profile(s) in original locations" << std::endl
      << "  - Found " << result.descendants << " descendant profile(s)" << std::endl;

  if(!result.files_deleted.empty()) {
    log << "  - Deleted " << result.files_deleted.size() << " empty file(s)" << std::endl;
  }

  return result;
}

std::list<std::string> ProfileBundle::BundleSynthesizer::resolutionFiles(const std::list<std::string> &profile_files) const
{
  std::list<std::string> files = profile_files;
  std::set<std::string> seen(profile_files.begin(), profile_files.end());

  for(const auto &file : Corpus::listIniFiles(config.getBundleDir())) {
    if(seen.insert(file).second) {
      files.push_back(file);
    }
  }

  return files;
}

std::map<std::string, std::string> ProfileBundle::BundleSynthesizer::renameMap(const std::list<Profile> &internal)
{
  std::map<std::string, std::string> rename_map;
  for(const auto &profile : internal) {
    if(!NameResolver::isPrivatized(profile.name())) {
      rename_map[profile.name()] = NameResolver::privatize(profile.name());
    }
  }

  return rename_map;
}

std::string ProfileBundle::BundleSynthesizer::rewrittenReference(const std::string &inherits,
                                                                 const std::map<std::string, std::string> &rename_map,
                                                                 const std::list<Profile> &corpus)
{
  for(const auto &[original, privatized] : rename_map) {
    if(NameResolver::inheritsValueMatches(inherits, original)) {
      return privatized;
    }
  }

  // An exact reference to a profile that is not renamed stays as it is
  for(const auto &profile : corpus) {
    if(rename_map.count(profile.name()) == 0 && NameResolver::inheritsValueMatches(inherits, profile.qualifiedName())) {
      return "";
    }
  }

  for(const auto &[original, privatized] : rename_map) {
    if(NameResolver::referencesProfile(inherits, original)) {
      return privatized;
    }
  }

  return "";
}

void ProfileBundle::BundleSynthesizer::rewriteReferences(const std::list<std::string> &files,
                                                         ProfileType type,
                                                         const std::map<std::string, std::string> &rename_map,
                                                         const std::list<Profile> &corpus,
                                                         OperationResult &result)
{
  size_t files_updated = 0;

  for(const auto &file : files) {
    try {
      Parser parser(file, type);
      bool changed = false;

      for(auto profile : parser.getProfileList(type)) {
        auto inherits = profile.getInherits();
        if(!inherits.has_value()) {
          continue;
        }

        std::string reference = rewrittenReference(*inherits, rename_map, corpus);
        if(reference.empty() || reference == *inherits) {
          continue;
        }

        profile.setProperty("inherits", reference);
        parser.updateProfile(profile);
        changed = true;

        log << "Updated " << Glib::path_get_basename(file) << ": " << profile.qualifiedName()
            << " inherits: " << *inherits << " -> " << reference << std::endl;
      }

      if(changed) {
        parser.saveChanges();
        result.addWritten(file);
        files_updated++;
      }
    }
    catch(const std::runtime_error &error) {
      log << "Warning: cannot update references in " << file << ": " << error.what() << std::endl;
    }
  }

  log << "Updated inheritance in " << files_updated << " file(s)" << std::endl;
}

void ProfileBundle::BundleSynthesizer::removeOriginals(const std::list<Profile> &moved,
                                                       ProfileType type,
                                                       OperationResult &result)
{
  for(const auto &file : Corpus::sourceFiles(moved)) {
    if(!Corpus::isFile(file)) {
      log << "Warning: " << file << " no longer exists, nothing to remove" << std::endl;
      continue;
    }

    try {
      Parser parser(file, type);

      size_t removed = 0;
      for(const auto &profile : moved) {
        if(profile.getSourcePath() == file) {
          removed += parser.removeProfile(profile.qualifiedName());
        }
      }

      if(removed == 0) {
        continue;
      }

      if(parser.empty()) {
        if(std::remove(file.c_str()) != 0) {
          throw std::runtime_error("cannot delete file");
        }

        result.files_deleted.push_back(file);
        log << "Deleted empty file: " << Glib::path_get_basename(file) << std::endl;
      }
      else {
        parser.saveChanges();
        result.addWritten(file);
        log << "Removed " << removed << " profile(s) from " << Glib::path_get_basename(file) << std::endl;
      }
    }
    catch(const std::runtime_error &error) {
      log << "Warning: cannot remove bundled profiles from " << file << ": " << error.what() << std::endl;
    }
  }
}
