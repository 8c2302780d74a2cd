#ifndef PROFILEBUNDLE_NAME_RESOLVER_HH
#define PROFILEBUNDLE_NAME_RESOLVER_HH

#include <list>
#include <string>

#include "profile_type.hh"
#include "tree/ProfileRule.hh"

namespace ProfileBundle {
  // A profile name split into the text users read and its "@tag" tokens
  struct NormalizedName {
    std::string base_name;
    std::list<std::string> tags;
  };

  class NameResolver {
    public:
      /**
      * @brief Splits a profile name into its base name and tags
      *
      * @details
      * A leading "print:" or "filament:" prefix is dropped. Every "@token" (no whitespace or '*')
      * is a tag. The base name is what remains, trimmed, with runs of whitespace collapsed.
      */
      static NormalizedName normalize(const std::string &name);

      // Removes a leading "print:" / "filament:" prefix and the whitespace after it
      static std::string stripTypePrefix(const std::string &name);

      // Base name of 'name' without tags (see normalize)
      static std::string coreName(const std::string &name);

      static bool coreNameEquals(const std::string &first, const std::string &second);

      /**
      * @brief Checks whether a profile's "inherits" value refers to 'parent_name'
      *
      * @details
      * Accepts an exact match, a match after trimming, a match after stripping the type prefix
      * from both sides, and a match after stripping prefixes and trimming.
      */
      static bool inheritsFrom(const Tree::ProfileRule &child, const std::string &parent_name);

      // Same graduated comparison, applied to a raw "inherits" value
      static bool inheritsValueMatches(const std::string &inherits, const std::string &parent_name);

      /**
      * @brief Looser reference test used when privatizing and rewriting references
      *
      * @details
      * True if the prefix-stripped reference equals the prefix-stripped name, or if both have
      * the same core name. A child that names "Parent" still finds "Parent @test".
      */
      static bool referencesProfile(const std::string &inherits, const std::string &name);

      // Wraps a name in asterisks. Names that are already wrapped are returned unchanged.
      static std::string privatize(const std::string &name);
      static bool isPrivatized(const std::string &name);

      // "print: name"
      static std::string qualify(ProfileType type, const std::string &name);

      // Replaces runs of characters outside [A-Za-z0-9_ @.()-] with '_' and trims the result
      static std::string sanitizeFilename(const std::string &name);

      // Characters that are not allowed in file names on NTFS or macOS: < > : " | ? * \ / and control characters
      static bool containsUnsafeFilesystemChars(const std::string &name);

      // Each unsafe character of 'name' once, in order of appearance
      static std::string unsafeFilesystemChars(const std::string &name);
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_NAME_RESOLVER_HH
