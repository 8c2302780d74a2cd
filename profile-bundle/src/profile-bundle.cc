#include "profile-bundle.h"

#include "bundle_synthesizer.hh"
#include "clean_resolver.hh"
#include "combiner.hh"
#include "corpus.hh"
#include "name_resolver.hh"
#include "profile_filter.hh"
#include "profile_updater.hh"

#include <glibmm/error.h>
#include <glibmm/miscutils.h>
#include <list>
#include <stdexcept>
#include <string>

ProfileBundleTool::ProfileBundleTool(std::ostream &out, std::ostream &err)
  : out{out},
    err{err}
{   }

ProfileBundle::EngineConfig ProfileBundleTool::make_config(const CommandLineOptions &options)
{
  ProfileBundle::EngineConfig config;

  std::string config_file = options.config_file;
  if(config_file.empty()) {
    std::string default_file = Glib::build_filename(config.getRoot(), ProfileBundle::EngineConfig::default_file_name);
    if(ProfileBundle::Corpus::isFile(default_file)) {
      config_file = default_file;
    }
  }

  if(!config_file.empty()) {
    config.loadFromFile(config_file);
  }

  if(!options.profile_dir.empty()) {
    config.setProfileDir(options.profile_dir);
  }

  if(!options.bundle_dir.empty()) {
    config.setBundleDir(options.bundle_dir);
  }

  return config;
}

int ProfileBundleTool::run(const CommandLineOptions &options)
{
  try {
    auto config = make_config(options);

    if(options.mode == "clean") {
      return run_clean(options, config);
    }

    return run_selection(options, config);
  }
  catch(const std::invalid_argument &error) {
    err << "Error: " << error.what() << std::endl;
  }
  catch(const std::runtime_error &error) {
    err << "Error: " << error.what() << std::endl;
  }
  catch(const Glib::Error &error) {
    std::string reason = error.what();
    err << "Error: " << reason << std::endl;
  }

  return 1;
}

int ProfileBundleTool::run_clean(const CommandLineOptions &options, const ProfileBundle::EngineConfig &config)
{
  ProfileBundle::CleanResolver resolver(config, out);

  if(options.profile_type == "bundle") {
    out << "Cleaning bundle: " << options.bundle_name << std::endl;
    print_result(resolver.cleanBundle(options.bundle_name));
    return 0;
  }

  std::list<ProfileBundle::ProfileType> types;
  if(options.profile_type == "all") {
    types = ProfileBundle::allProfileTypes();
  }
  else {
    types.push_back(ProfileBundle::profileTypeFromString(options.profile_type));
  }

  int status = 0;
  for(auto type : types) {
    out << "--- Cleaning " << ProfileBundle::toString(type) << " profiles ---" << std::endl;
    try {
      print_result(resolver.cleanDirectory(type));
    }
    catch(const std::runtime_error &error) {
      err << "Error: " << error.what() << std::endl;
      status = 1;
    }
  }

  return status;
}

int ProfileBundleTool::run_selection(const CommandLineOptions &options, const ProfileBundle::EngineConfig &config)
{
  auto type = ProfileBundle::profileTypeFromString(options.profile_type);
  const std::string dir = config.profileDirFor(type);

  if(!ProfileBundle::Corpus::isDirectory(dir)) {
    err << "Directory '" << dir << "' does not exist." << std::endl;
    return 1;
  }

  auto files = ProfileBundle::Corpus::listIniFiles(dir);
  if(files.empty()) {
    err << "No .ini files found in '" << dir << "'." << std::endl;
    return 1;
  }

  auto selection = ProfileBundle::Corpus::select(ProfileBundle::Corpus::load(files, type, err), CommandLine::toFilter(options));
  if(selection.empty()) {
    err << "No profiles match the specified filters in '" << dir << "'." << std::endl;
    return 1;
  }

  out << "Matching " << options.profile_type << " profiles:" << std::endl;
  for(const auto &profile : selection) {
    out << Glib::path_get_basename(profile.getSourcePath()) << ": " << profile.qualifiedName();

    auto tags = ProfileBundle::NameResolver::normalize(profile.name()).tags;
    if(!tags.empty()) {
      out << " (tags:";
      for(const auto &tag : tags) {
        out << ' ' << tag;
      }
      out << ')';
    }

    out << std::endl;
  }

  if(options.mode == "combine") {
    ProfileBundle::ProfileCombiner combiner(out);
    print_result(combiner.combine(selection, options.into, type));
  }
  else if(options.mode == "bundle") {
    ProfileBundle::BundleSynthesizer synthesizer(config, out);
    print_result(synthesizer.bundle(selection, options.into, type));
  }
  else {
    std::list<ProfileBundle::PropertyUpdate> updates;
    for(const auto &expression : options.updates) {
      updates.push_back(ProfileBundle::PropertyUpdate::parse(expression));
    }

    ProfileBundle::ProfileUpdater updater(out);
    print_result(updater.update(selection, updates, type));
  }

  return 0;
}

void ProfileBundleTool::print_result(const ProfileBundle::OperationResult &result)
{
  if(result.nothing_to_do) {
    out << "Nothing to do." << std::endl;
    return;
  }

  if(!result.output_file.empty()) {
    out << "Output file: " << result.output_file << std::endl;
  }

  out << "Files written: " << result.files_written.size() << std::endl;
  if(!result.files_deleted.empty()) {
    out << "Files deleted: " << result.files_deleted.size() << std::endl;
  }

  if(!result.profiles_moved.empty()) {
    out << "Profiles moved: " << result.profiles_moved.size()
        << " (leaves kept: " << result.leaves_kept
        << ", descendants: " << result.descendants << ")" << std::endl;
  }

  if(result.profiles_changed > 0) {
    out << "Profiles changed: " << result.profiles_changed << std::endl;
  }

  if(result.properties_removed > 0) {
    out << "Properties removed: " << result.properties_removed << std::endl;
  }
}
