#include "engine_config.hh"
#include "profile_type.hh"

#include <glibmm/error.h>
#include <glibmm/keyfile.h>
#include <glibmm/miscutils.h>
#include <sstream>
#include <stdexcept>
#include <string>

ProfileBundle::EngineConfig::EngineConfig()
  : root{Glib::get_current_dir()}
{   }

ProfileBundle::EngineConfig::EngineConfig(const std::string &root)
  : root{root}
{   }

void ProfileBundle::EngineConfig::loadFromFile(const std::string &path)
{
  Glib::KeyFile keyfile;

  try {
    keyfile.load_from_file(path);

    if(keyfile.has_group("paths")) {
      if(keyfile.has_key("paths", "root")) {
        root = keyfile.get_string("paths", "root").raw();
      }

      if(keyfile.has_key("paths", "profile_dir")) {
        profile_dir = keyfile.get_string("paths", "profile_dir").raw();
      }

      if(keyfile.has_key("paths", "bundle_dir")) {
        bundle_dir = keyfile.get_string("paths", "bundle_dir").raw();
      }
    }

    if(keyfile.has_group("vendor")) {
      if(keyfile.has_key("vendor", "repo_id")) {
        repo_id = keyfile.get_string("vendor", "repo_id").raw();
      }

      if(keyfile.has_key("vendor", "config_version")) {
        config_version = keyfile.get_string("vendor", "config_version").raw();
      }
    }

    if(keyfile.has_group("clean") && keyfile.has_key("clean", "min_common_properties")) {
      int count = keyfile.get_integer("clean", "min_common_properties");
      if(count < 1) {
        std::stringstream message;
        message << "Invalid configuration file '" << path << "': min_common_properties must be at least 1";
        throw std::runtime_error(message.str());
      }

      min_common_properties = count;
    }
  }
  catch(const Glib::Error &error) {
    std::string reason = error.what();
    std::stringstream message;
    message << "Invalid configuration file '" << path << "': " << reason;
    throw std::runtime_error(message.str());
  }
}

std::string ProfileBundle::EngineConfig::getRoot() const
{
  return root;
}

void ProfileBundle::EngineConfig::setRoot(const std::string &root)
{
  this->root = root;
}

std::string ProfileBundle::EngineConfig::profileDirFor(ProfileType type) const
{
  if(hasProfileDir()) {
    return profile_dir;
  }

  return Glib::build_filename(root, toString(type));
}

void ProfileBundle::EngineConfig::setProfileDir(const std::string &dir)
{
  profile_dir = dir;
}

bool ProfileBundle::EngineConfig::hasProfileDir() const
{
  return !profile_dir.empty();
}

std::string ProfileBundle::EngineConfig::getBundleDir() const
{
  if(!bundle_dir.empty()) {
    return bundle_dir;
  }

  return Glib::build_filename(root, "vendor");
}

void ProfileBundle::EngineConfig::setBundleDir(const std::string &dir)
{
  bundle_dir = dir;
}

std::string ProfileBundle::EngineConfig::bundleFilePath(const std::string &bundle_name) const
{
  return Glib::build_filename(getBundleDir(), bundle_name + ".ini");
}

std::string ProfileBundle::EngineConfig::getRepoId() const
{
  return repo_id;
}

void ProfileBundle::EngineConfig::setRepoId(const std::string &repo_id)
{
  this->repo_id = repo_id;
}

std::string ProfileBundle::EngineConfig::getConfigVersion() const
{
  return config_version;
}

void ProfileBundle::EngineConfig::setConfigVersion(const std::string &version)
{
  config_version = version;
}

int ProfileBundle::EngineConfig::getMinCommonProperties() const
{
  return min_common_properties;
}

void ProfileBundle::EngineConfig::setMinCommonProperties(int count)
{
  if(count < 1) {
    std::stringstream message;
    message << "min_common_properties must be at least 1, got " << count;
    throw std::invalid_argument(message.str());
  }

  min_common_properties = count;
}
