#ifndef PROFILE_BUNDLE_COMMAND_LINE_H
#define PROFILE_BUNDLE_COMMAND_LINE_H

#include <string>
#include <vector>

#include "profile_filter.hh"
#include "profile_type.hh"

/**
 * Arguments of the profile-bundle tool after option parsing.
 * The engine only ever sees the validated values.
 **/
struct CommandLineOptions
{
  std::string mode;

  // "print", "filament", "all" or "bundle" (the last two only for clean)
  std::string profile_type;
  std::string bundle_name;
  std::vector<std::string> updates;

  std::string tag;
  std::string sub_profile;
  std::string nozzle;
  std::string layer_height;
  std::string type;
  std::string vendor;

  std::string into;
  std::string profile_dir;
  std::string bundle_dir;
  std::string config_file;
};

class CommandLine
{
public:
  // Throws std::invalid_argument with a message for the user
  static CommandLineOptions parse(int argc, char **argv);

  // Same as parse(), for arguments that do not come from main()
  static CommandLineOptions parse(const std::vector<std::string> &arguments);

  // Builds the selection filter of combine, bundle and update
  static ProfileBundle::ProfileFilter toFilter(const CommandLineOptions &options);

  static std::string usage();

protected:
  // Assigns the positional arguments that follow the options
  static void parse_positional(CommandLineOptions &options, std::vector<std::string> positional);
};

#endif // PROFILE_BUNDLE_COMMAND_LINE_H
