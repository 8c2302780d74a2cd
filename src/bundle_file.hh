#ifndef PROFILEBUNDLE_BUNDLE_FILE_HH
#define PROFILEBUNDLE_BUNDLE_FILE_HH

#include <list>
#include <optional>
#include <string>

#include "engine_config.hh"
#include "profile_parser.hh"
#include "profile_type.hh"

namespace ProfileBundle {
  /**
  * @brief A vendor bundle: a "[vendor]" stanza followed by bundled profiles
  *
  * @details
  * The file does not have to exist yet. Saving always writes the vendor stanza first,
  * keeping the existing one verbatim or creating it from the configuration.
  */
  class BundleFile {
    public:
      BundleFile(const std::string &path, const std::string &bundle_name, ProfileType type, const EngineConfig &config);

      std::string getPath() const;
      std::string getBundleName() const;

      // True if the file existed when it was opened
      bool existed() const;

      // "*<bundle name>*"
      std::string parentName() const;

      // "<type>: *<bundle name>*"
      std::string parentQualifiedName(ProfileType type) const;

      std::list<Profile> getProfiles() const;
      std::list<Profile> getProfiles(ProfileType type) const;

      // Profile types that have at least one profile in the bundle, print first
      std::list<ProfileType> profileTypes() const;

      bool hasProfile(const std::string &qualified_name) const;
      std::optional<Profile> findProfile(const std::string &qualified_name) const;

      void appendProfile(const Profile &profile);

      // Replaces the profile with the same qualified name
      void updateProfile(const Profile &profile);

      // Replaces every profile of 'type', keeping profiles of other types
      void setProfiles(ProfileType type, const std::list<Profile> &profiles);

      // Writes the file. Throws std::runtime_error if it cannot be written.
      void save();

      // The file content save() would write
      explicit operator std::string() const;

      // The "[vendor]" stanza written at the top of a new bundle
      static Section vendorSection(const std::string &bundle_name, const EngineConfig &config);

    private:
      // Puts the vendor stanza after any leading text and in front of all other sections, creating it if needed
      void ensureVendorSection();

      std::string path;
      std::string bundle_name;
      const EngineConfig &config;
      bool file_existed;
      Parser parser;
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_BUNDLE_FILE_HH
