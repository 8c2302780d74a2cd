#ifndef PROFILEBUNDLE_PROFILE_PARSER_HH
#define PROFILEBUNDLE_PROFILE_PARSER_HH

#include <istream>
#include <list>
#include <memory>
#include <ostream>
#include <string>

#include "profile_type.hh"
#include "tree/ProfileRule.hh"
#include "tree/SectionRule.hh"

namespace ProfileBundle {
  namespace Tree {
    class ParseTree;
  } // namespace Tree

  using Profile = Tree::ProfileRule;
  using Section = Tree::SectionRule;
  using PropertyMap = Tree::PropertyMap;

  class Parser {
    public:
      /**
      * @brief Reads and parses a profile file
      *
      * @param path the file to read; its base name (without ".ini") names the implicit default profile
      * @param type the profile type used for the implicit default profile
      *
      * @throws std::runtime_error if the file cannot be read or does not parse
      */
      Parser(const std::string &path, ProfileType type);

      // Parses 'stream' as if it were the content of 'path'. Nothing is read from 'path'.
      Parser(const std::string &path, ProfileType type, std::istream &stream);

      /**
      * @brief Parses profile text without raising
      *
      * @details
      * Returns the profiles of the given type found in 'text'. Content before the first header
      * becomes a profile named 'default_name' when it has properties or no header follows;
      * empty text yields one empty default profile.
      * If the text does not parse, a diagnostic is written to 'log' and the result is empty.
      */
      static std::list<Profile> parse(const std::string &text,
                                      ProfileType type,
                                      const std::string &default_name,
                                      std::ostream &log);

      // Base name of a profile file without its ".ini" extension
      static std::string defaultNameFor(const std::string &path);

      // Returns the path that was used to create the constructor
      std::string getPath() const;

      ProfileType getType() const;

      // Profiles of every type, in file order
      std::list<Profile> getProfileList() const;

      // Profiles of one type, in file order
      std::list<Profile> getProfileList(ProfileType type) const;

      // Stanzas that are not profiles ("[vendor]", "[printer:...]")
      std::list<Section> getSectionList() const;

      void setProfileList(const std::list<Profile> &profiles);
      void setSectionList(const std::list<Section> &sections);

      // Replaces the profile with the same qualified name. Throws std::domain_error if there is none.
      void updateProfile(const Profile &profile);

      // Appends a profile, which will be owned by this parser's file
      void appendProfile(const Profile &profile);

      // Removes every profile with the given qualified name, returning how many were removed
      size_t removeProfile(const std::string &qualified_name);

      bool hasProfile(const std::string &qualified_name) const;

      // True when the file would be written without any stanza
      bool empty() const;

      /**
      * @brief Attempts to parse a user-supplied string, and replace the content of this parser with it
      *
      * @details
      * If the string does not parse successfully, there are no changes.
      *
      * @throws std::runtime_error if the string did not parse correctly
      */
      void updateFromString(const std::string &new_file_contents);

      // Returns whether the serialized profiles differ from the content that was parsed
      bool hasChanges() const;

      // Replaces the file content with the serialized profiles
      // Throws std::runtime_error if the file cannot be written
      void saveChanges();
      void saveChanges(std::ostream &output);

      // Converts class to std::string: sections first, then profiles separated by a blank line
      explicit operator std::string() const;

    private:
      void update_from_stream(std::istream &stream);
      void initializeProfileList(const std::shared_ptr<Tree::ParseTree> &ast);

      // Checks whether a profile with this qualified name is in the profile_list
      // Throws an exception if it is not
      void checkProfileValid(const Profile &profile) const;

      std::string path;
      ProfileType type;
      std::string default_name;
      std::string old_file_contents;

      std::list<Profile> profile_list;
      std::list<Section> section_list;
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_PROFILE_PARSER_HH
