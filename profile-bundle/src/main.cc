#include "command_line.h"
#include "profile-bundle.h"

#include <glibmm/init.h>
#include <iostream>
#include <stdexcept>

int main(int argc, char **argv)
{
  Glib::init();

  CommandLineOptions options;
  try {
    options = CommandLine::parse(argc, argv);
  }
  catch(const std::invalid_argument &error) {
    std::cerr << "Error: " << error.what() << std::endl << std::endl;
    std::cerr << "Usage: profile-bundle <command> [arguments...] [options]" << std::endl;
    std::cerr << CommandLine::usage() << std::endl;
    return 1;
  }

  ProfileBundleTool tool;
  return tool.run(options);
}
