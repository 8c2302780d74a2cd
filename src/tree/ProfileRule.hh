#ifndef PROFILE_RULE_HH
#define PROFILE_RULE_HH

#include "LineNode.hh"
#include "PropertyRule.hh"
#include "RuleNode.hh"
#include "profile_type.hh"

#include <list>
#include <map>
#include <optional>
#include <string>

namespace ProfileBundle::Tree {
  // Properties keyed by name, always iterated in ascending key order
  using PropertyMap = std::map<std::string, std::string>;

  class ProfileRule : public RuleNode {
    public:
      ProfileRule() = default;
      ProfileRule(ProfileType type, const std::string &name, uint64_t startPos = 0, uint64_t stopPos = 0);

      // Returns the display name of this profile, without the type prefix ("*Parent @test*")
      std::string name() const;

      // Returns the type-qualified name ("print: *Parent @test*")
      std::string qualifiedName() const;

      ProfileType type() const;

      void rename(const std::string &name);

      // File the profile was read from (or will be written to)
      std::string getSourcePath() const;
      void setSourcePath(const std::string &path);

      // True for the profile made from content that appeared before any stanza header
      bool isImplicit() const;
      void setImplicit(bool implicit);

      PropertyMap getProperties() const;
      void setProperties(const PropertyMap &properties);

      bool hasProperty(const std::string &key) const;
      std::optional<std::string> getProperty(const std::string &key) const;
      void setProperty(const std::string &key, const std::string &value);

      // Returns true if the key was present
      bool removeProperty(const std::string &key);

      // Returns the trimmed 'inherits' value, or nothing when it is absent or blank
      std::optional<std::string> getInherits() const;

      // Comment lines in source order
      std::list<std::string> getComments() const;

      // Source lines in order, including header and property lines
      std::list<LineNode> getLines() const;

      void appendLine(const LineNode &line);
      void appendProperty(const PropertyRule &property);

      // True when the profile has neither properties nor comments
      bool isEmpty() const;

      // Checks whether two profiles are the same profile of the same file
      bool isSameProfile(const ProfileRule &other) const;

      // "[print: name]", or "[print:*name*]" for privatized names
      std::string headerLine() const;

      // Comment lines followed by alphabetized "key = value" lines, one per line
      std::string body() const;

      bool operator==(const ProfileRule &other) const;
      bool operator!=(const ProfileRule &other) const;

      // The full stanza: header line followed by the body
      explicit operator std::string() const;

    private:
      ProfileType profile_type = ProfileType::Print;
      std::string source_path;
      bool implicit = false;
      PropertyMap properties;
      std::list<LineNode> lines;
  };
} // namespace ProfileBundle::Tree

#endif // PROFILE_RULE_HH
