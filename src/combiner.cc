#include "combiner.hh"
#include "common_properties.hh"
#include "corpus.hh"
#include "name_resolver.hh"
#include "profile_parser.hh"
#include "tree/PropertyRule.hh"

#include <algorithm>
#include <fstream>
#include <glibmm/miscutils.h>
#include <list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

ProfileBundle::ProfileCombiner::ProfileCombiner(std::ostream &log)
  : log{log}
{   }

ProfileBundle::OperationResult ProfileBundle::ProfileCombiner::combine(const std::list<Profile> &selection,
                                                                       const std::string &parent_name,
                                                                       ProfileType type)
{
  if(Tree::PropertyRule::trim(parent_name).empty()) {
    throw std::invalid_argument("Parent profile name is required");
  }

  if(NameResolver::containsUnsafeFilesystemChars(NameResolver::stripTypePrefix(parent_name))) {
    std::stringstream message;
    message << "Profile name contains unsafe characters: " << NameResolver::unsafeFilesystemChars(parent_name);
    throw std::invalid_argument(message.str());
  }

  if(selection.empty()) {
    throw std::invalid_argument("No profiles to combine");
  }

  OperationResult result;

  PropertyMap parent_properties = CommonPropertyExtractor::commonProperties(selection);
  auto shared_inherits = CommonPropertyExtractor::sharedInherits(selection);

  const std::string parent_file = parentFilePath(selection, parent_name);
  const std::string parent_profile_name = Parser::defaultNameFor(parent_file);
  result.output_file = parent_file;

  if(shared_inherits.has_value()) {
    log << "Parent profile will inherit from: " << *shared_inherits << std::endl;
  }
  else if(std::none_of(selection.begin(), selection.end(), [](const Profile &profile) { return profile.getInherits().has_value(); })) {
    log << "Parent profile will not inherit from any other profile" << std::endl;
  }
  else {
    log << "Warning: Profiles inherit from different parents - inheritance will be flattened" << std::endl;
  }

  // The header repeats the file name, so the parent keeps the name it has when read without one
  Profile parent(type, parent_profile_name);
  parent.setProperties(parent_properties);
  if(shared_inherits.has_value()) {
    parent.setProperty("inherits", *shared_inherits);
  }

  std::ofstream output_file(parent_file);
  output_file << parent.operator std::string();
  output_file.close();

  if(output_file.fail()) {
    throw std::runtime_error("cannot write parent profile file '" + parent_file + "'");
  }

  result.addWritten(parent_file);
  log << "Created parent profile file: " << Glib::path_get_basename(parent_file) << std::endl;

  for(const auto &file : Corpus::sourceFiles(selection)) {
    try {
      Parser parser(file, type);

      for(auto profile : parser.getProfileList(type)) {
        bool selected = false;
        for(const auto &candidate : selection) {
          selected = selected || candidate.isSameProfile(profile);
        }

        if(!selected) {
          continue;
        }

        for(const auto &[key, value] : parent_properties) {
          profile.removeProperty(key);
        }

        profile.setProperty("inherits", parent_profile_name);
        parser.updateProfile(profile);
        result.profiles_changed++;
      }

      parser.saveChanges();
      result.addWritten(file);
      log << "Updated profiles in: " << Glib::path_get_basename(file) << std::endl;
    }
    catch(const std::runtime_error &error) {
      log << "Warning: cannot update " << file << ": " << error.what() << std::endl;
    }
  }

  return result;
}

std::string ProfileBundle::ProfileCombiner::parentFilePath(const std::list<Profile> &selection, const std::string &parent_name)
{
  if(selection.empty()) {
    throw std::invalid_argument("No profiles to combine");
  }

  std::string file_name = NameResolver::sanitizeFilename(NameResolver::stripTypePrefix(parent_name));
  std::string dir = Glib::path_get_dirname(selection.front().getSourcePath());
  return Glib::build_filename(dir, file_name + ".ini");
}
