#include "command_line.h"

#include <glibmm/optioncontext.h>
#include <glibmm/optionentry.h>
#include <glibmm/optiongroup.h>
#include <glibmm/ustring.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
  class BundleOptionGroup : public Glib::OptionGroup
  {
  public:
    BundleOptionGroup()
      : Glib::OptionGroup("profile-bundle", "Profile bundling options", "Show profile bundling options")
    {
      add("tag", "Filter print profiles by tag", "TAG", tag);
      add("sub-profile", "Filter print profiles by sub-profile", "PROFILE", sub_profile);
      add("nozzle", "Filter print profiles by nozzle diameter (e.g., 0.4 or 0.4mm)", "DIAMETER", nozzle);
      add("layer-height", "Filter print profiles by layer height (e.g., 0.3 or 0.3mm)", "HEIGHT", layer_height);
      add("type", "Filter filament profiles by type (e.g., ASA)", "TYPE", type);
      add("vendor", "Filter filament profiles by vendor (e.g., Prusa)", "VENDOR", vendor);
      add("into", "Name of the combined parent or of the bundle", "NAME", into);

      add_filename("profile-dir", "Custom profile directory (default: ./print or ./filament)", "DIR", profile_dir);
      add_filename("bundle-dir", "Custom bundle directory (default: ./vendor)", "DIR", bundle_dir);
      add_filename("config", "Configuration file (default: ./profile-bundle.conf)", "FILE", config_file);
    }

    Glib::ustring tag;
    Glib::ustring sub_profile;
    Glib::ustring nozzle;
    Glib::ustring layer_height;
    Glib::ustring type;
    Glib::ustring vendor;
    Glib::ustring into;
    std::string profile_dir;
    std::string bundle_dir;
    std::string config_file;

  private:
    void add(const char *name, const char *description, const char *argument, Glib::ustring &value)
    {
      Glib::OptionEntry entry;
      entry.set_long_name(name);
      entry.set_description(description);
      entry.set_arg_description(argument);
      add_entry(entry, value);
    }

    void add_filename(const char *name, const char *description, const char *argument, std::string &value)
    {
      Glib::OptionEntry entry;
      entry.set_long_name(name);
      entry.set_description(description);
      entry.set_arg_description(argument);
      add_entry_filename(entry, value);
    }
  };
} // namespace

CommandLineOptions CommandLine::parse(int argc, char **argv)
{
  Glib::OptionContext context("<command> [arguments...]");
  context.set_summary(usage());

  BundleOptionGroup group;
  context.set_main_group(group);

  try {
    context.parse(argc, argv);
  }
  catch(const Glib::OptionError &error) {
    std::string reason = error.what();
    throw std::invalid_argument(reason);
  }

  CommandLineOptions options;
  options.tag = group.tag.raw();
  options.sub_profile = group.sub_profile.raw();
  options.nozzle = group.nozzle.raw();
  options.layer_height = group.layer_height.raw();
  options.type = group.type.raw();
  options.vendor = group.vendor.raw();
  options.into = group.into.raw();
  options.profile_dir = group.profile_dir;
  options.bundle_dir = group.bundle_dir;
  options.config_file = group.config_file;

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  std::vector<std::string> positional;
  for(int i = 1; i < argc; i++) {
    positional.emplace_back(argv[i]);
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  parse_positional(options, positional);
  return options;
}

CommandLineOptions CommandLine::parse(const std::vector<std::string> &arguments)
{
  std::vector<std::string> storage = arguments;
  storage.insert(storage.begin(), "profile-bundle");

  std::vector<char *> argv;
  for(auto &argument : storage) {
    argv.push_back(argument.data());
  }
  argv.push_back(nullptr);

  return parse(static_cast<int>(storage.size()), argv.data());
}

void CommandLine::parse_positional(CommandLineOptions &options, std::vector<std::string> positional)
{
  if(positional.empty()) {
    throw std::invalid_argument("No command specified");
  }

  options.mode = positional.front();
  positional.erase(positional.begin());

  if(options.mode != "combine" && options.mode != "bundle" && options.mode != "update" && options.mode != "clean") {
    throw std::invalid_argument("Invalid command '" + options.mode + "'. Use 'combine', 'bundle', 'update', or 'clean'");
  }

  // clean [print|filament|all|bundle NAME|NAME]
  if(options.mode == "clean") {
    if(positional.empty()) {
      options.profile_type = "all";
    }
    else if(positional.size() == 1 && positional[0] == "bundle") {
      throw std::invalid_argument("Bundle name is required for bundle cleaning");
    }
    else if(positional.size() == 1) {
      const std::string &argument = positional[0];
      if(argument == "print" || argument == "filament" || argument == "all") {
        options.profile_type = argument;
      }
      else {
        options.profile_type = "bundle";
        options.bundle_name = argument;
      }
    }
    else if(positional.size() == 2 && positional[0] == "bundle") {
      options.profile_type = "bundle";
      options.bundle_name = positional[1];
    }
    else {
      throw std::invalid_argument("Invalid arguments for clean command. Usage: clean [print|filament|all|bundle] [bundle_name]");
    }

    return;
  }

  if(positional.empty()) {
    throw std::invalid_argument("No profile type specified");
  }

  options.profile_type = positional.front();
  positional.erase(positional.begin());

  // Throws for anything but print and filament
  ProfileBundle::profileTypeFromString(options.profile_type);

  if((options.mode == "combine" || options.mode == "bundle") && options.into.empty()) {
    throw std::invalid_argument("--into option is required for " + options.mode + " mode");
  }

  if(options.mode == "update") {
    options.updates = positional;
    if(options.updates.empty()) {
      throw std::invalid_argument("No update expressions provided for update mode (example: layer_height==+0.05 fill_density=40%)");
    }
  }
  else if(!positional.empty()) {
    throw std::invalid_argument("Unexpected argument '" + positional.front() + "'");
  }
}

ProfileBundle::ProfileFilter CommandLine::toFilter(const CommandLineOptions &options)
{
  if(ProfileBundle::profileTypeFromString(options.profile_type) == ProfileBundle::ProfileType::Filament) {
    ProfileBundle::FilamentCriteria criteria;
    criteria.type = options.type;
    criteria.vendor = options.vendor;
    return ProfileBundle::ProfileFilter(criteria);
  }

  // --tag and --sub-profile select the same thing
  ProfileBundle::PrintCriteria criteria;
  criteria.sub_profile = options.tag.empty()? options.sub_profile : options.tag;
  criteria.layer_height = options.layer_height;
  criteria.nozzle = options.nozzle;
  return ProfileBundle::ProfileFilter(criteria);
}

std::string CommandLine::usage()
{
  std::stringstream ss;
  ss << "Commands:" << std::endl;
  ss << "  combine <profile_type> --into <name>   Combine matching profiles into a new parent profile" << std::endl;
  ss << "  bundle <profile_type> --into <name>    Bundle matching profiles into a single file in the bundle folder" << std::endl;
  ss << "  update <profile_type> [expressions]    Update properties in matching profiles" << std::endl;
  ss << "  clean [print|filament|all|bundle] [name]   Remove redundant properties that match inherited values" << std::endl;
  ss << std::endl;
  ss << "Profile types: print, filament" << std::endl;
  ss << std::endl;
  ss << "Update expressions:" << std::endl;
  ss << "  key=value        Set a property" << std::endl;
  ss << "  key==+N[unit]    Increase a numeric property (unit: % or mm)" << std::endl;
  ss << "  key==-N[unit]    Decrease a numeric property";
  return ss.str();
}
