#ifndef COMMON_INL
#define COMMON_INL

#include <gtest/gtest.h>

#include <list>
#include <optional>
#include <sstream>
#include <string>

#include "profile_parser.hh"
#include "profile_type.hh"
#include "tree/ProfileRule.hh"

namespace Common {

  // Builds an in-memory profile with the given properties
  [[maybe_unused]]
  static ProfileBundle::Profile makeProfile(ProfileBundle::ProfileType type,
                                            const std::string &name,
                                            const ProfileBundle::PropertyMap &properties = {},
                                            const std::string &source_path = "")
  {
    ProfileBundle::Profile profile(type, name);
    profile.setProperties(properties);
    profile.setSourcePath(source_path);
    return profile;
  }

  [[maybe_unused]]
  static ProfileBundle::Profile makePrint(const std::string &name,
                                          const ProfileBundle::PropertyMap &properties = {},
                                          const std::string &source_path = "")
  {
    return makeProfile(ProfileBundle::ProfileType::Print, name, properties, source_path);
  }

  // Parses 'text' as the content of 'path' without touching the file system
  [[maybe_unused]]
  static ProfileBundle::Parser parseText(const std::string &text,
                                         ProfileBundle::ProfileType type = ProfileBundle::ProfileType::Print,
                                         const std::string &path = "/tmp/test.ini")
  {
    std::stringstream stream(text);
    return ProfileBundle::Parser(path, type, stream);
  }

  // Looks a profile up by its display name
  [[maybe_unused]]
  static std::optional<ProfileBundle::Profile> findByName(const std::list<ProfileBundle::Profile> &profiles,
                                                          const std::string &name)
  {
    for(const auto &profile : profiles) {
      if(profile.name() == name) {
        return profile;
      }
    }

    return std::nullopt;
  }

  // Checks that two lists hold profiles with the same names, in the same order
  inline void checkProfileNames(const std::list<std::string> &expected, const std::list<ProfileBundle::Profile> &observed)
  {
    EXPECT_EQ(expected.size(), observed.size()) << "There should be the same number of profiles";

    auto it1 = expected.begin();
    auto it2 = observed.begin();
    while(it1 != expected.end() &&
          it2 != observed.end())
    {
      EXPECT_EQ(*it1, it2->name()) << "These two profiles should be equal";

      it1++;
      it2++;
    }
  }
} // namespace Common

#endif // COMMON_INL
