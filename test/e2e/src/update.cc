#include <gtest/gtest.h>

#include <list>
#include <string>

#include "corpus.hh"
#include "profile_filter.hh"
#include "profile_updater.hh"
#include "workspace.hh"

using ProfileBundle::Corpus;
using ProfileBundle::Profile;
using ProfileBundle::ProfileFilter;
using ProfileBundle::ProfileType;
using ProfileBundle::ProfileUpdater;
using ProfileBundle::PropertyMap;
using ProfileBundle::PropertyUpdate;

class UpdateCheck : public ProfileWorkspace {
protected:
  ProfileBundle::OperationResult update(const std::list<Profile> &selection,
                                        const std::list<std::string> &expressions,
                                        ProfileType type = ProfileType::Print)
  {
    std::list<PropertyUpdate> updates;
    for(const auto &expression : expressions) {
      updates.push_back(PropertyUpdate::parse(expression));
    }

    ProfileUpdater updater(log);
    return updater.update(selection, updates, type);
  }
};

TEST_F(UpdateCheck, absolute_and_relative) // NOLINT
{
  auto path = writeProfile(printDir(), "a.ini", "print: A", {{"layer_height", "0.2"}, {"fill_density", "20%"}, {"perimeters", "2"}});

  auto result = update(loadAll(ProfileType::Print), {"layer_height==+0.05", "fill_density=40%", "perimeters==-1"});

  EXPECT_FALSE(result.nothing_to_do);
  EXPECT_EQ(result.profiles_changed, 1u);
  EXPECT_EQ(result.files_written, std::list<std::string>({path}));
  EXPECT_EQ(readProperties(path, "print: A"), PropertyMap({{"fill_density", "40%"}, {"layer_height", "0.25"}, {"perimeters", "1"}}));
}

TEST_F(UpdateCheck, filtered_selection) // NOLINT
{
  auto mk4 = writeProfile(printDir(), "mk4.ini", "print: 0.20mm SPEED @MK4", {{"perimeters", "2"}});
  auto mini = writeProfile(printDir(), "mini.ini", "print: 0.20mm SPEED @MINI", {{"perimeters", "2"}});
  auto mini_before = readFile(mini);

  ProfileBundle::PrintCriteria criteria;
  criteria.sub_profile = "MK4";
  auto selection = Corpus::select(loadAll(ProfileType::Print), ProfileFilter(criteria));

  auto result = update(selection, {"perimeters==+1"});

  EXPECT_EQ(result.files_written, std::list<std::string>({mk4}));
  EXPECT_EQ(readProperties(mk4, "print: 0.20mm SPEED @MK4").at("perimeters"), "3");
  EXPECT_EQ(readFile(mini), mini_before);
}

TEST_F(UpdateCheck, other_profiles_of_file_untouched) // NOLINT
{
  auto path = printDir() + "/shared.ini";
  writeFile(path, "[print: A]\nperimeters = 2\n\n[print: B]\nperimeters = 2\n");

  std::list<Profile> selection;
  for(const auto &profile : loadAll(ProfileType::Print)) {
    if(profile.name() == "A") {
      selection.push_back(profile);
    }
  }

  update(selection, {"perimeters=5"});

  EXPECT_EQ(readFile(path), "[print: A]\nperimeters = 5\n\n[print: B]\nperimeters = 2\n");
}

TEST_F(UpdateCheck, missing_property_is_reported) // NOLINT
{
  auto path = writeProfile(printDir(), "a.ini", "print: A", {{"layer_height", "0.2"}});
  auto before = readFile(path);

  auto result = update(loadAll(ProfileType::Print), {"perimeters==+1"});

  EXPECT_TRUE(result.nothing_to_do);
  EXPECT_EQ(readFile(path), before);
  EXPECT_NE(log.str().find("perimeters is not set"), std::string::npos);
}

TEST_F(UpdateCheck, unit_mismatch_skips_only_that_profile) // NOLINT
{
  auto a = writeProfile(printDir(), "a.ini", "print: A", {{"fill_density", "20%"}});
  auto b = writeProfile(printDir(), "b.ini", "print: B", {{"fill_density", "0.2"}});
  auto b_before = readFile(b);

  auto result = update(loadAll(ProfileType::Print), {"fill_density==+5%"});

  EXPECT_EQ(result.profiles_changed, 1u);
  EXPECT_EQ(readProperties(a, "print: A").at("fill_density"), "25%");
  EXPECT_EQ(readFile(b), b_before);
  EXPECT_NE(log.str().find("Unit mismatch"), std::string::npos);
}

TEST_F(UpdateCheck, headerless_profile) // NOLINT
{
  auto path = printDir() + "/My Preset.ini";
  writeFile(path, "inherits = 0.20mm QUALITY @MK4\nlayer_height = 0.2\n");

  update(loadAll(ProfileType::Print), {"layer_height=0.15"});

  EXPECT_EQ(readFile(path), "[print: My Preset]\ninherits = 0.20mm QUALITY @MK4\nlayer_height = 0.15\n");
}

TEST_F(UpdateCheck, filament_temperature) // NOLINT
{
  auto path = writeProfile(filamentDir(), "pla.ini", "filament: PLA", {{"temperature", "215"}, {"filament_type", "PLA"}});

  ProfileBundle::FilamentCriteria criteria;
  criteria.type = "PLA";
  auto selection = Corpus::select(loadAll(ProfileType::Filament), ProfileFilter(criteria));

  update(selection, {"temperature==-10"}, ProfileType::Filament);

  EXPECT_EQ(readProperties(path, "filament: PLA", ProfileType::Filament).at("temperature"), "205");
}
