#include "corpus.hh"
#include "profile_parser.hh"

#include <algorithm>
#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>
#include <iterator>
#include <list>
#include <stdexcept>
#include <string>
#include <vector>

std::list<std::string> ProfileBundle::Corpus::listIniFiles(const std::string &dir)
{
  if(!isDirectory(dir)) {
    return std::list<std::string>();
  }

  const std::string extension = ".ini";
  std::vector<std::string> files;

  Glib::Dir directory(dir);
  for(const std::string &name : directory) {
    if(name.size() <= extension.size() ||
       name.compare(name.size() - extension.size(), extension.size(), extension) != 0) {
      continue;
    }

    std::string path = Glib::build_filename(dir, name);
    if(isFile(path)) {
      files.push_back(path);
    }
  }

  // Directory order is not stable across platforms
  std::sort(files.begin(), files.end());
  return std::list<std::string>(files.begin(), files.end());
}

std::list<ProfileBundle::Profile> ProfileBundle::Corpus::load(const std::list<std::string> &files,
                                                             ProfileType type,
                                                             std::ostream &log)
{
  std::list<Profile> profiles;
  for(const auto &file : files) {
    try {
      Parser parser(file, type);
      profiles.splice(profiles.end(), parser.getProfileList(type));
    }
    catch(const std::runtime_error &error) {
      log << "Warning: skipping " << file << ": " << error.what() << std::endl;
    }
  }

  return profiles;
}

std::list<ProfileBundle::Profile> ProfileBundle::Corpus::loadDirectory(const std::string &dir,
                                                                      ProfileType type,
                                                                      std::ostream &log)
{
  return load(listIniFiles(dir), type, log);
}

std::list<ProfileBundle::Profile> ProfileBundle::Corpus::select(const std::list<Profile> &profiles,
                                                               const ProfileFilter &filter)
{
  std::list<Profile> selection;
  std::copy_if(profiles.begin(), profiles.end(), std::back_inserter(selection), [&filter](const Profile &profile) {
    return filter.matches(profile);
  });

  return selection;
}

std::list<std::string> ProfileBundle::Corpus::sourceFiles(const std::list<Profile> &profiles)
{
  std::list<std::string> files;
  for(const auto &profile : profiles) {
    const std::string path = profile.getSourcePath();
    if(std::find(files.begin(), files.end(), path) == files.end()) {
      files.push_back(path);
    }
  }

  return files;
}

bool ProfileBundle::Corpus::isDirectory(const std::string &path)
{
  return Glib::file_test(path, Glib::FILE_TEST_IS_DIR);
}

bool ProfileBundle::Corpus::isFile(const std::string &path)
{
  return Glib::file_test(path, Glib::FILE_TEST_IS_REGULAR);
}
