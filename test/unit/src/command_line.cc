#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "command_line.h"
#include "common.inl"

using Common::makePrint;

namespace CommandLineCheck {
  TEST(CommandLineCheck, bundle_with_filters)
  {
    auto options = CommandLine::parse({"bundle", "print", "--into", "MyBundle", "--tag", "MK4", "--nozzle=0.4"});

    EXPECT_EQ(options.mode, "bundle");
    EXPECT_EQ(options.profile_type, "print");
    EXPECT_EQ(options.into, "MyBundle");
    EXPECT_EQ(options.tag, "MK4");
    EXPECT_EQ(options.nozzle, "0.4");
  }

  TEST(CommandLineCheck, directories_and_config)
  {
    auto options = CommandLine::parse({"--profile-dir", "/p", "combine", "filament", "--into", "Base PLA",
                                       "--bundle-dir", "/b", "--config", "/c.conf", "--type", "PLA"});

    EXPECT_EQ(options.mode, "combine");
    EXPECT_EQ(options.profile_type, "filament");
    EXPECT_EQ(options.into, "Base PLA");
    EXPECT_EQ(options.profile_dir, "/p");
    EXPECT_EQ(options.bundle_dir, "/b");
    EXPECT_EQ(options.config_file, "/c.conf");
    EXPECT_EQ(options.type, "PLA");
  }

  TEST(CommandLineCheck, update_expressions)
  {
    auto options = CommandLine::parse({"update", "print", "layer_height==+0.05", "fill_density=40%", "--layer-height", "0.2"});

    EXPECT_EQ(options.mode, "update");
    EXPECT_EQ(options.updates, std::vector<std::string>({"layer_height==+0.05", "fill_density=40%"}));
    EXPECT_EQ(options.layer_height, "0.2");
  }

  TEST(CommandLineCheck, clean_arguments)
  {
    EXPECT_EQ(CommandLine::parse({"clean"}).profile_type, "all");
    EXPECT_EQ(CommandLine::parse({"clean", "print"}).profile_type, "print");
    EXPECT_EQ(CommandLine::parse({"clean", "filament"}).profile_type, "filament");

    auto bundle = CommandLine::parse({"clean", "bundle", "MyBundle"});
    EXPECT_EQ(bundle.profile_type, "bundle");
    EXPECT_EQ(bundle.bundle_name, "MyBundle");

    auto shorthand = CommandLine::parse({"clean", "MyBundle"});
    EXPECT_EQ(shorthand.profile_type, "bundle");
    EXPECT_EQ(shorthand.bundle_name, "MyBundle");
  }

  TEST(CommandLineCheck, usage_errors)
  {
    EXPECT_THROW(CommandLine::parse(std::vector<std::string>()), std::invalid_argument);
    EXPECT_THROW(CommandLine::parse({"frobnicate", "print"}), std::invalid_argument);
    EXPECT_THROW(CommandLine::parse({"bundle"}), std::invalid_argument);
    EXPECT_THROW(CommandLine::parse({"bundle", "print"}), std::invalid_argument);
    EXPECT_THROW(CommandLine::parse({"combine", "printer", "--into", "X"}), std::invalid_argument);
    EXPECT_THROW(CommandLine::parse({"bundle", "print", "--into", "B", "extra"}), std::invalid_argument);
    EXPECT_THROW(CommandLine::parse({"update", "print"}), std::invalid_argument);
    EXPECT_THROW(CommandLine::parse({"clean", "bundle"}), std::invalid_argument);
    EXPECT_THROW(CommandLine::parse({"clean", "bundle", "a", "b"}), std::invalid_argument);
    EXPECT_THROW(CommandLine::parse({"bundle", "print", "--into", "B", "--bogus"}), std::invalid_argument);
  }

  TEST(CommandLineCheck, print_filter)
  {
    auto options = CommandLine::parse({"bundle", "print", "--into", "B", "--sub-profile", "mk4", "--layer-height", "0.2mm"});
    auto filter = CommandLine::toFilter(options);

    EXPECT_EQ(filter.type(), ProfileBundle::ProfileType::Print);
    EXPECT_TRUE(filter.matches(makePrint("0.20mm SPEED @MK4", {{"layer_height", "0.2"}})));
    EXPECT_FALSE(filter.matches(makePrint("0.20mm SPEED @MINI", {{"layer_height", "0.2"}})));
  }

  TEST(CommandLineCheck, filament_filter)
  {
    auto options = CommandLine::parse({"combine", "filament", "--into", "Base", "--vendor", "prusa"});
    auto filter = CommandLine::toFilter(options);

    EXPECT_EQ(filter.type(), ProfileBundle::ProfileType::Filament);
    EXPECT_TRUE(filter.matches(Common::makeProfile(ProfileBundle::ProfileType::Filament, "X", {{"filament_vendor", "Prusa"}})));
    EXPECT_FALSE(filter.matches(Common::makeProfile(ProfileBundle::ProfileType::Filament, "Y", {{"filament_vendor", "Other"}})));
  }

  TEST(CommandLineCheck, usage_lists_commands)
  {
    auto usage = CommandLine::usage();

    for(const std::string command : {"combine", "bundle", "update", "clean"}) {
      EXPECT_NE(usage.find("  " + command + " "), std::string::npos) << command;
    }
  }
} // namespace CommandLineCheck
