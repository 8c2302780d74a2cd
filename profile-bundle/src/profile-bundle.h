#ifndef PROFILE_BUNDLE_TOOL_H
#define PROFILE_BUNDLE_TOOL_H

#include <iostream>
#include <ostream>

#include "command_line.h"
#include "engine_config.hh"
#include "operation_result.hh"

/**
 * Runs one profile-bundle command against the profile directories.
 * Progress goes to 'out', problems to 'err'.
 **/
class ProfileBundleTool
{
public:
  explicit ProfileBundleTool(std::ostream &out = std::cout, std::ostream &err = std::cerr);

  // Returns the exit status of the command
  int run(const CommandLineOptions &options);

  // Reads the configuration file (when present) and applies the directory options
  static ProfileBundle::EngineConfig make_config(const CommandLineOptions &options);

protected:
  int run_clean(const CommandLineOptions &options, const ProfileBundle::EngineConfig &config);
  int run_selection(const CommandLineOptions &options, const ProfileBundle::EngineConfig &config);

  void print_result(const ProfileBundle::OperationResult &result);

private:
  std::ostream &out;
  std::ostream &err;
};

#endif // PROFILE_BUNDLE_TOOL_H
