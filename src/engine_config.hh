#ifndef PROFILEBUNDLE_ENGINE_CONFIG_HH
#define PROFILEBUNDLE_ENGINE_CONFIG_HH

#include <string>

#include "profile_type.hh"

namespace ProfileBundle {
  // Directories and vendor metadata shared by all operations
  class EngineConfig {
    public:
      static constexpr const char *default_file_name = "profile-bundle.conf";
      static constexpr const char *default_repo_id = "non-prusa-fff";
      static constexpr const char *default_config_version = "2.1.0";
      static constexpr int default_min_common_properties = 3;

      // Uses the current working directory as root
      EngineConfig();
      explicit EngineConfig(const std::string &root);

      /**
      * @brief Reads settings from a key file
      *
      * @details
      * Known groups are [paths] (root, profile_dir, bundle_dir), [vendor] (repo_id, config_version)
      * and [clean] (min_common_properties). Missing groups and keys keep their current values.
      *
      * @throws std::runtime_error if the file cannot be read or is malformed
      */
      void loadFromFile(const std::string &path);

      std::string getRoot() const;
      void setRoot(const std::string &root);

      // The explicit profile directory, or "<root>/<type>"
      std::string profileDirFor(ProfileType type) const;
      void setProfileDir(const std::string &dir);
      bool hasProfileDir() const;

      // The explicit bundle directory, or "<root>/vendor"
      std::string getBundleDir() const;
      void setBundleDir(const std::string &dir);

      // "<bundle dir>/<name>.ini"
      std::string bundleFilePath(const std::string &bundle_name) const;

      std::string getRepoId() const;
      void setRepoId(const std::string &repo_id);

      std::string getConfigVersion() const;
      void setConfigVersion(const std::string &version);

      int getMinCommonProperties() const;
      void setMinCommonProperties(int count);

    private:
      std::string root;
      std::string profile_dir;
      std::string bundle_dir;
      std::string repo_id = default_repo_id;
      std::string config_version = default_config_version;
      int min_common_properties = default_min_common_properties;
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_ENGINE_CONFIG_HH
