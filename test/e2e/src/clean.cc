#include <gtest/gtest.h>

#include <list>
#include <stdexcept>
#include <string>

#include "clean_resolver.hh"
#include "workspace.hh"

using ProfileBundle::CleanResolver;
using ProfileBundle::EngineConfig;
using ProfileBundle::ProfileType;
using ProfileBundle::PropertyMap;

class CleanCheck : public ProfileWorkspace {
protected:
  ProfileBundle::OperationResult cleanDirectory(ProfileType type = ProfileType::Print)
  {
    auto engine_config = config();
    CleanResolver resolver(engine_config, log);
    return resolver.cleanDirectory(type);
  }

  ProfileBundle::OperationResult cleanBundle(const std::string &name, int min_common_properties = 3)
  {
    auto engine_config = config();
    engine_config.setMinCommonProperties(min_common_properties);
    CleanResolver resolver(engine_config, log);
    return resolver.cleanBundle(name);
  }

  // Writes "<vendor dir>/<name>.ini" with a vendor stanza followed by 'profiles'
  std::string writeBundle(const std::string &name, const std::string &profiles)
  {
    std::string path = vendorDir() + "/" + name + ".ini";
    writeFile(path, "[vendor]\nrepo_id = non-prusa-fff\nname = " + name + "\nconfig_version = 2.1.0\n\n" + profiles);
    return path;
  }
};

TEST_F(CleanCheck, directory_removes_inherited_values) // NOLINT
{
  auto parent = writeProfile(printDir(), "parent.ini", "print: Parent", {{"layer_height", "0.2"}, {"perimeters", "3"}});
  auto child = writeProfile(printDir(), "child.ini", "print: Child", {{"inherits", "Parent"}, {"layer_height", "0.2"},
                                                                      {"perimeters", "4"}, {"fill_density", "20%"}});
  auto parent_before = readFile(parent);

  auto result = cleanDirectory();

  EXPECT_FALSE(result.nothing_to_do);
  EXPECT_EQ(result.properties_removed, 1u);
  EXPECT_EQ(result.profiles_changed, 1u);
  EXPECT_EQ(result.files_written, std::list<std::string>({child}));

  EXPECT_EQ(readProperties(child, "print: Child"), PropertyMap({{"fill_density", "20%"}, {"inherits", "Parent"}, {"perimeters", "4"}}));
  EXPECT_EQ(readFile(parent), parent_before);
}

TEST_F(CleanCheck, nearest_ancestor_wins) // NOLINT
{
  writeProfile(printDir(), "a.ini", "print: GrandParent", {{"layer_height", "0.2"}, {"perimeters", "2"}});
  writeProfile(printDir(), "b.ini", "print: Parent", {{"inherits", "GrandParent"}, {"layer_height", "0.3"}});
  auto child = writeProfile(printDir(), "c.ini", "print: Child", {{"inherits", "Parent"}, {"layer_height", "0.2"}, {"perimeters", "2"}});

  cleanDirectory();

  EXPECT_EQ(readProperties(child, "print: Child"), PropertyMap({{"inherits", "Parent"}, {"layer_height", "0.2"}}));
}

TEST_F(CleanCheck, directory_resolves_bundle_parents) // NOLINT
{
  auto bundle = writeBundle("B", "[print:*Base*]\nlayer_height = 0.2\n");
  auto child = writeProfile(printDir(), "child.ini", "print: Child", {{"inherits", "*Base*"}, {"layer_height", "0.2"}, {"perimeters", "3"}});
  auto bundle_before = readFile(bundle);

  cleanDirectory();

  EXPECT_EQ(readProperties(child, "print: Child"), PropertyMap({{"inherits", "*Base*"}, {"perimeters", "3"}}));
  EXPECT_EQ(readFile(bundle), bundle_before) << "Bundles are only read when cleaning a directory";
}

TEST_F(CleanCheck, clean_directory_leaves_unchanged_files_alone) // NOLINT
{
  // Not in canonical order; rewriting it would sort the keys
  auto path = printDir() + "/unsorted.ini";
  writeFile(path, "[print: Standalone]\nperimeters = 3\nlayer_height = 0.2\n");

  auto result = cleanDirectory();

  EXPECT_TRUE(result.nothing_to_do);
  EXPECT_TRUE(result.files_written.empty());
  EXPECT_EQ(readFile(path), "[print: Standalone]\nperimeters = 3\nlayer_height = 0.2\n");
}

TEST_F(CleanCheck, clean_filament_directory) // NOLINT
{
  writeProfile(filamentDir(), "base.ini", "filament: Base PLA", {{"temperature", "215"}});
  auto child = writeProfile(filamentDir(), "red.ini", "filament: Red PLA", {{"inherits", "Base PLA"}, {"temperature", "215"}});

  auto result = cleanDirectory(ProfileType::Filament);

  EXPECT_EQ(result.properties_removed, 1u);
  EXPECT_EQ(readProperties(child, "filament: Red PLA", ProfileType::Filament), PropertyMap({{"inherits", "Base PLA"}}));
}

TEST_F(CleanCheck, missing_directory) // NOLINT
{
  auto engine_config = config();
  engine_config.setProfileDir(root + "/does_not_exist");
  CleanResolver resolver(engine_config, log);

  EXPECT_THROW(resolver.cleanDirectory(ProfileType::Print), std::runtime_error);
}

TEST_F(CleanCheck, bundle_removes_inherited_values) // NOLINT
{
  auto bundle = writeBundle("B", "[print:*B*]\nlayer_height = 0.2\n\n"
                                 "[print:*Child*]\ninherits = *B*\nlayer_height = 0.2\nperimeters = 3\n");

  auto result = cleanBundle("B");

  EXPECT_FALSE(result.nothing_to_do);
  EXPECT_EQ(result.properties_removed, 1u);
  EXPECT_EQ(result.profiles_changed, 1u);
  EXPECT_EQ(result.files_written, std::list<std::string>({bundle}));
  EXPECT_EQ(readProperties(bundle, "print: *Child*"), PropertyMap({{"inherits", "*B*"}, {"perimeters", "3"}}));

  // The existing vendor stanza is kept as it is
  EXPECT_EQ(readFile(bundle).rfind("[vendor]\nrepo_id = non-prusa-fff\nname = B\nconfig_version = 2.1.0\n\n", 0), 0u);
}

TEST_F(CleanCheck, bundle_parent_created_for_siblings) // NOLINT
{
  auto bundle = writeBundle("B", "[print:*A*]\ninherits = 0.20mm QUALITY @MK4\ninfill_speed = 200\nlayer_height = 0.2\n"
                                 "perimeters = 2\ntop_solid_layers = 5\n\n"
                                 "[print:*C*]\ninherits = 0.20mm QUALITY @MK4\ninfill_speed = 200\nlayer_height = 0.3\n"
                                 "perimeters = 2\ntop_solid_layers = 5\n");

  auto result = cleanBundle("B");

  EXPECT_EQ(result.properties_removed, 6u);
  EXPECT_EQ(readProperties(bundle, "print: *B*"), PropertyMap({{"infill_speed", "200"}, {"inherits", "0.20mm QUALITY @MK4"},
                                                               {"perimeters", "2"}, {"top_solid_layers", "5"}}));
  EXPECT_EQ(readProperties(bundle, "print: *A*"), PropertyMap({{"inherits", "*B*"}, {"layer_height", "0.2"}}));
  EXPECT_EQ(readProperties(bundle, "print: *C*"), PropertyMap({{"inherits", "*B*"}, {"layer_height", "0.3"}}));

  auto content = readFile(bundle);
  EXPECT_LT(content.find("[print:*B*]"), content.find("[print:*A*]")) << "The new parent comes first";
}

TEST_F(CleanCheck, leading_comment_of_bundle_is_not_a_profile) // NOLINT
{
  auto bundle = vendorDir() + "/B.ini";
  writeFile(bundle, "# Generated for the workshop printers\n\n"
                    "[vendor]\nrepo_id = non-prusa-fff\nname = B\nconfig_version = 2.1.0\n\n"
                    "[print:*A*]\ninherits = X\nlayer_height = 0.2\nperimeters = 2\n\n"
                    "[print:*C*]\ninherits = X\nlayer_height = 0.3\nperimeters = 2\n");

  cleanBundle("B", 1);

  EXPECT_EQ(readProperties(bundle, "print: *B*"), PropertyMap({{"inherits", "X"}, {"perimeters", "2"}}));
  EXPECT_EQ(readProperties(bundle, "print: *A*"), PropertyMap({{"inherits", "*B*"}, {"layer_height", "0.2"}}));

  auto content = readFile(bundle);
  EXPECT_EQ(content.find("# Generated for the workshop printers\n\n[vendor]\n"), 0u);
  EXPECT_EQ(content.find("[print: B]"), std::string::npos);
}

TEST_F(CleanCheck, too_few_common_properties) // NOLINT
{
  auto bundle = writeBundle("B", "[print:*A*]\ninherits = X\nlayer_height = 0.2\nperimeters = 2\n\n"
                                 "[print:*C*]\ninherits = X\nlayer_height = 0.3\nperimeters = 2\n");
  auto before = readFile(bundle);

  auto result = cleanBundle("B");

  EXPECT_TRUE(result.nothing_to_do);
  EXPECT_TRUE(result.files_written.empty());
  EXPECT_EQ(readFile(bundle), before);
  EXPECT_NE(log.str().find("Too few common properties"), std::string::npos);

  // A lower threshold accepts the single shared property
  cleanBundle("B", 1);
  EXPECT_EQ(readProperties(bundle, "print: *B*"), PropertyMap({{"inherits", "X"}, {"perimeters", "2"}}));
}

TEST_F(CleanCheck, children_common_moves_into_parent) // NOLINT
{
  auto bundle = writeBundle("B", "[print:*B*]\ninherits = X\nperimeters = 2\n\n"
                                 "[print:*A*]\ninfill_speed = 200\ninherits = *B*\nlayer_height = 0.2\n\n"
                                 "[print:*C*]\ninfill_speed = 200\ninherits = *B*\nlayer_height = 0.3\n");

  auto result = cleanBundle("B");

  EXPECT_EQ(result.properties_removed, 2u);
  EXPECT_EQ(result.profiles_changed, 3u);
  EXPECT_EQ(readProperties(bundle, "print: *B*"), PropertyMap({{"infill_speed", "200"}, {"inherits", "X"}, {"perimeters", "2"}}));
  EXPECT_EQ(readProperties(bundle, "print: *A*"), PropertyMap({{"inherits", "*B*"}, {"layer_height", "0.2"}}));
}

TEST_F(CleanCheck, dependent_profiles_are_cleaned) // NOLINT
{
  auto bundle = writeBundle("B", "[print:*B*]\ninherits = X\nperimeters = 2\n\n"
                                 "[print:*A*]\ninfill_speed = 200\ninherits = *B*\nlayer_height = 0.2\n\n"
                                 "[print:*C*]\ninfill_speed = 200\ninherits = *B*\nlayer_height = 0.3\n");
  auto leaf = writeProfile(printDir(), "leaf.ini", "print: Leaf", {{"inherits", "*A*"}, {"layer_height", "0.2"},
                                                                   {"infill_speed", "200"}, {"fill_density", "10%"}});
  auto unrelated = writeProfile(printDir(), "unrelated.ini", "print: Unrelated", {{"inherits", "Other"}, {"perimeters", "2"}});
  auto unrelated_before = readFile(unrelated);

  auto result = cleanBundle("B");

  EXPECT_EQ(result.files_written, std::list<std::string>({bundle, leaf}));
  EXPECT_EQ(readProperties(leaf, "print: Leaf"), PropertyMap({{"fill_density", "10%"}, {"inherits", "*A*"}}));
  EXPECT_EQ(readFile(unrelated), unrelated_before);
}

TEST_F(CleanCheck, filament_section_of_bundle) // NOLINT
{
  auto bundle = writeBundle("B", "[print:*P*]\nlayer_height = 0.2\n\n"
                                 "[filament:*Base*]\ntemperature = 215\n\n"
                                 "[filament:*Red*]\ninherits = *Base*\ntemperature = 215\nfilament_colour = #FF0000\n");

  auto result = cleanBundle("B");

  EXPECT_EQ(result.properties_removed, 1u);
  EXPECT_EQ(readProperties(bundle, "filament: *Red*", ProfileType::Filament),
            PropertyMap({{"filament_colour", "#FF0000"}, {"inherits", "*Base*"}}));
  EXPECT_EQ(readProperties(bundle, "print: *P*"), PropertyMap({{"layer_height", "0.2"}}));
}

TEST_F(CleanCheck, missing_bundle) // NOLINT
{
  EXPECT_THROW(cleanBundle("NoSuchBundle"), std::runtime_error);
}
