#include "bundle_file.hh"
#include "corpus.hh"
#include "name_resolver.hh"
#include "tree/LineNode.hh"

#include <list>
#include <optional>
#include <sstream>
#include <string>

namespace {
  ProfileBundle::Parser openParser(const std::string &path, ProfileBundle::ProfileType type, bool exists)
  {
    if(exists) {
      return ProfileBundle::Parser(path, type);
    }

    std::stringstream empty;
    return ProfileBundle::Parser(path, type, empty);
  }
} // namespace

ProfileBundle::BundleFile::BundleFile(const std::string &path,
                                      const std::string &bundle_name,
                                      ProfileType type,
                                      const EngineConfig &config)
  : path{path},
    bundle_name{bundle_name},
    config{config},
    file_existed{Corpus::isFile(path)},
    parser{openParser(path, type, file_existed)}
{
  // A bundle has no headerless profile; drop the empty placeholder of a new or blank file
  std::list<Profile> profiles = parser.getProfileList();
  profiles.remove_if([](const Profile &profile) {
    return profile.isImplicit() && profile.isEmpty();
  });

  parser.setProfileList(profiles);
}

std::string ProfileBundle::BundleFile::getPath() const
{
  return path;
}

std::string ProfileBundle::BundleFile::getBundleName() const
{
  return bundle_name;
}

bool ProfileBundle::BundleFile::existed() const
{
  return file_existed;
}

std::string ProfileBundle::BundleFile::parentName() const
{
  return NameResolver::privatize(bundle_name);
}

std::string ProfileBundle::BundleFile::parentQualifiedName(ProfileType type) const
{
  return NameResolver::qualify(type, parentName());
}

std::list<ProfileBundle::Profile> ProfileBundle::BundleFile::getProfiles() const
{
  return parser.getProfileList();
}

std::list<ProfileBundle::Profile> ProfileBundle::BundleFile::getProfiles(ProfileType type) const
{
  return parser.getProfileList(type);
}

std::list<ProfileBundle::ProfileType> ProfileBundle::BundleFile::profileTypes() const
{
  std::list<ProfileType> types;
  for(ProfileType type : allProfileTypes()) {
    if(!parser.getProfileList(type).empty()) {
      types.push_back(type);
    }
  }

  return types;
}

bool ProfileBundle::BundleFile::hasProfile(const std::string &qualified_name) const
{
  return parser.hasProfile(qualified_name);
}

std::optional<ProfileBundle::Profile> ProfileBundle::BundleFile::findProfile(const std::string &qualified_name) const
{
  for(const auto &profile : parser.getProfileList()) {
    if(profile.qualifiedName() == qualified_name) {
      return profile;
    }
  }

  return std::nullopt;
}

void ProfileBundle::BundleFile::appendProfile(const Profile &profile)
{
  parser.appendProfile(profile);
}

void ProfileBundle::BundleFile::updateProfile(const Profile &profile)
{
  parser.updateProfile(profile);
}

void ProfileBundle::BundleFile::setProfiles(ProfileType type, const std::list<Profile> &profiles)
{
  std::list<Profile> result;
  for(const auto &profile : parser.getProfileList()) {
    if(profile.type() != type) {
      result.push_back(profile);
    }
  }

  for(const auto &profile : profiles) {
    Profile owned(profile);
    owned.setImplicit(false);
    result.push_back(owned);
  }

  parser.setProfileList(result);
}

void ProfileBundle::BundleFile::save()
{
  ensureVendorSection();
  parser.saveChanges();
  file_existed = true;
}

ProfileBundle::BundleFile::operator std::string() const
{
  BundleFile copy(*this);
  copy.ensureVendorSection();
  return copy.parser.operator std::string();
}

void ProfileBundle::BundleFile::ensureVendorSection()
{
  std::list<Section> sections = parser.getSectionList();
  std::list<Section> leading;
  std::list<Section> vendor;
  std::list<Section> others;

  for(const auto &section : sections) {
    if(section.title().empty()) {
      // Text ahead of the first header
      leading.push_back(section);
    }
    else if(section.title() == "vendor") {
      vendor.push_back(section);
    }
    else {
      others.push_back(section);
    }
  }

  if(vendor.empty()) {
    vendor.push_back(vendorSection(bundle_name, config));
  }
  else if(vendor.size() > 1) {
    // One vendor stanza per file
    vendor.resize(1);
  }

  std::list<Section> ordered(leading);
  ordered.splice(ordered.end(), vendor);
  ordered.splice(ordered.end(), others);
  parser.setSectionList(ordered);
}

ProfileBundle::Section ProfileBundle::BundleFile::vendorSection(const std::string &bundle_name, const EngineConfig &config)
{
  using Tree::LineNode;
  using Kind = Tree::LineNode::Kind;

  std::list<LineNode> lines = {
    LineNode(Kind::Header, 1, "[vendor]"),
    LineNode(Kind::Property, 2, "repo_id = " + config.getRepoId()),
    LineNode(Kind::Comment, 3, "# Vendor name will be shown by the Config Wizard."),
    LineNode(Kind::Property, 4, "name = " + bundle_name),
    LineNode(Kind::Comment, 5, "# Configuration version of this file. Config file will only be installed, if the config_version differs."),
    LineNode(Kind::Comment, 6, "# This means, the server may force the PrusaSlicer configuration to be downgraded."),
    LineNode(Kind::Property, 7, "config_version = " + config.getConfigVersion())
  };

  return Section("vendor", lines);
}
