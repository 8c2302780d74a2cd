#include "workspace.hh"
#include "corpus.hh"

#include <filesystem>
#include <fstream>
#include <list>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

void ProfileWorkspace::SetUp()
{
  // One directory per test, so suites can run in parallel
  const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
  std::string name = std::string("profile_bundle_") + info->test_suite_name() + "_" + info->name();
  for(char &c : name) {
    if(c == '/') {
      c = '_';
    }
  }

  root = (fs::temp_directory_path() / name).string();
  fs::remove_all(root);

  fs::create_directories(printDir());
  fs::create_directories(filamentDir());
  fs::create_directories(vendorDir());
}

void ProfileWorkspace::TearDown()
{
  std::error_code ignored;
  fs::remove_all(root, ignored);
}

std::string ProfileWorkspace::printDir() const
{
  return (fs::path(root) / "print").string();
}

std::string ProfileWorkspace::filamentDir() const
{
  return (fs::path(root) / "filament").string();
}

std::string ProfileWorkspace::vendorDir() const
{
  return (fs::path(root) / "vendor").string();
}

ProfileBundle::EngineConfig ProfileWorkspace::config() const
{
  return ProfileBundle::EngineConfig(root);
}

std::string ProfileWorkspace::writeProfile(const std::string &dir,
                                           const std::string &file_name,
                                           const std::string &qualified_name,
                                           const std::list<std::pair<std::string, std::string>> &properties)
{
  std::stringstream contents;
  contents << "[" << qualified_name << "]\n";
  for(const auto &[key, value] : properties) {
    contents << key << " = " << value << "\n";
  }

  std::string path = (fs::path(dir) / file_name).string();
  writeFile(path, contents.str());
  return path;
}

void ProfileWorkspace::writeFile(const std::string &path, const std::string &contents) const
{
  std::ofstream file(path);
  file << contents;
}

std::string ProfileWorkspace::readFile(const std::string &path) const
{
  std::ifstream file(path);
  std::stringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

bool ProfileWorkspace::exists(const std::string &path) const
{
  return fs::exists(path);
}

void ProfileWorkspace::copyFixture(const std::string &fixture, const std::string &dir) const
{
  for(const auto &entry : fs::directory_iterator(fs::path(PROFILE_SOURCE_DIR) / fixture)) {
    fs::copy_file(entry.path(), fs::path(dir) / entry.path().filename(), fs::copy_options::overwrite_existing);
  }
}

ProfileBundle::PropertyMap ProfileWorkspace::readProperties(const std::string &path,
                                                            const std::string &qualified_name,
                                                            ProfileBundle::ProfileType type) const
{
  if(!exists(path)) {
    return ProfileBundle::PropertyMap();
  }

  ProfileBundle::Parser parser(path, type);
  for(const auto &profile : parser.getProfileList()) {
    if(profile.qualifiedName() == qualified_name) {
      return profile.getProperties();
    }
  }

  return ProfileBundle::PropertyMap();
}

std::list<ProfileBundle::Profile> ProfileWorkspace::loadAll(ProfileBundle::ProfileType type)
{
  return ProfileBundle::Corpus::loadDirectory(config().profileDirFor(type), type, log);
}

size_t ProfileWorkspace::countOccurrences(const std::string &haystack, const std::string &needle)
{
  size_t count = 0;
  for(size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
    count++;
  }

  return count;
}
