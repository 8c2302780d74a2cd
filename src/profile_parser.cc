#include "profile_parser.hh"
#include "parser/driver.hh"
#include "parser/lexer.hh"
#include "profile_type.hh"
#include "tree/HeaderNode.hh"
#include "tree/LineNode.hh"
#include "tree/ParseTree.hh"
#include "tree/PropertyRule.hh"
#include "tree/StanzaNode.hh"

#include <fstream>
#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>
#include <memory>
#include <parser_yacc.hh>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {
    // Runs the scanner and grammar over 'stream'
    // Throws std::runtime_error if the grammar rejects the input
    std::shared_ptr<ProfileBundle::Tree::ParseTree> parseStream(std::istream &stream, std::ostream &log)
    {
        // Perform lexical analysis
        Lexer lexer(stream, log);

        // Parse the file
        Driver driver;
        yy::parser parse(lexer, driver);
        parse();

        // If parsing was not successful, throw an exception
        if(!driver.success || driver.ast == nullptr) {
            std::stringstream message;
            message << "error occured when parsing profile file";
            if(!driver.error_message.empty()) {
                message << " (" << driver.error_message << ")";
            }

            throw std::runtime_error(message.str());
        }

        return driver.ast;
    }

    // Fills a profile from the body lines of a stanza
    void appendBody(ProfileBundle::Profile &profile, const ProfileBundle::Tree::StanzaNode &stanza)
    {
        using ProfileBundle::Tree::LineNode;
        using ProfileBundle::Tree::PropertyRule;

        for(const LineNode &line : stanza.getLines()) {
            switch(line.getKind()) {
                case LineNode::Kind::Header:
                    break;
                case LineNode::Kind::Property:
                    profile.appendProperty(PropertyRule(line.getStartPosition(), line.getRaw()));
                    break;
                default:
                    profile.appendLine(line);
                    break;
            }
        }
    }

    void buildLists(const std::shared_ptr<ProfileBundle::Tree::ParseTree> &ast,
                    ProfileBundle::ProfileType type,
                    const std::string &default_name,
                    const std::string &path,
                    std::list<ProfileBundle::Profile> &profiles,
                    std::list<ProfileBundle::Section> &sections)
    {
        profiles = std::list<ProfileBundle::Profile>();
        sections = std::list<ProfileBundle::Section>();

        // Content before the first header belongs to a profile named after the file.
        // A file without any stanza still yields one (empty) default profile.
        // Without properties, text ahead of the first header is only leading text.
        if(!ast->preamble.getProperties().empty() || ast->stanzas.empty()) {
            ProfileBundle::Profile profile(type, default_name, 1, 1);
            profile.setSourcePath(path);
            profile.setImplicit(true);
            appendBody(profile, ast->preamble);
            profiles.push_back(profile);
        }
        else if(!ast->preamble.isBlank()) {
            sections.emplace_back("", ast->preamble.getLines());
        }

        for(const auto &stanza : ast->stanzas) {
            auto header = stanza.getHeader();

            if(ProfileBundle::isProfileTypeName(header.getSectionType()) && header.hasSectionName()) {
                ProfileBundle::Profile profile(ProfileBundle::profileTypeFromString(header.getSectionType()),
                                               header.getSectionName(),
                                               header.getStartPosition(),
                                               header.getEndPosition());
                profile.setSourcePath(path);
                appendBody(profile, stanza);
                profiles.push_back(profile);
            }
            else {
                sections.emplace_back(header.getTitle(), stanza.getLines());
            }
        }
    }
} // namespace

ProfileBundle::Parser::Parser(const std::string &path, ProfileType type)
  : path{path},
    type{type},
    default_name{defaultNameFor(path)}
{
    // Read entire file into string and store it for later
    try {
        old_file_contents = Glib::file_get_contents(path);
    }
    catch(const Glib::FileError &error) {
        std::string reason = error.what();
        throw std::runtime_error("cannot read profile file '" + path + "': " + reason);
    }

    std::stringstream stream(old_file_contents);
    update_from_stream(stream);
}

ProfileBundle::Parser::Parser(const std::string &path, ProfileType type, std::istream &stream)
  : path{path},
    type{type},
    default_name{defaultNameFor(path)}
{
    std::stringstream ss;
    ss << stream.rdbuf();
    old_file_contents = ss.str();

    std::stringstream contents(old_file_contents);
    update_from_stream(contents);
}

std::list<ProfileBundle::Profile> ProfileBundle::Parser::parse(const std::string &text,
                                                               ProfileType type,
                                                               const std::string &default_name,
                                                               std::ostream &log)
{
    std::list<Profile> profiles;
    std::list<Section> sections;

    try {
        std::stringstream stream(text);
        buildLists(parseStream(stream, log), type, default_name, "", profiles, sections);
    }
    catch(const std::runtime_error &error) {
        log << "Warning: " << error.what() << std::endl;
        return std::list<Profile>();
    }

    std::list<Profile> result;
    for(const auto &profile : profiles) {
        if(profile.type() == type) {
            result.push_back(profile);
        }
    }

    return result;
}

std::string ProfileBundle::Parser::defaultNameFor(const std::string &path)
{
    std::string name = Glib::path_get_basename(path);

    const std::string extension = ".ini";
    if(name.size() > extension.size() &&
       name.compare(name.size() - extension.size(), extension.size(), extension) == 0) {
        name.erase(name.size() - extension.size());
    }

    return name;
}

void ProfileBundle::Parser::update_from_stream(std::istream &stream)
{
    // Parse the file contents
    auto ast = parseStream(stream, std::cerr);

    // Create or update the list of profiles
    initializeProfileList(ast);
}

void ProfileBundle::Parser::initializeProfileList(const std::shared_ptr<Tree::ParseTree> &ast)
{
    buildLists(ast, type, default_name, path, profile_list, section_list);
}

std::string ProfileBundle::Parser::getPath() const
{
    return path;
}

ProfileBundle::ProfileType ProfileBundle::Parser::getType() const
{
    return type;
}

std::list<ProfileBundle::Profile> ProfileBundle::Parser::getProfileList() const
{
    return profile_list;
}

std::list<ProfileBundle::Profile> ProfileBundle::Parser::getProfileList(ProfileType type) const
{
    std::list<Profile> result;
    for(const auto &profile : profile_list) {
        if(profile.type() == type) {
            result.push_back(profile);
        }
    }

    return result;
}

std::list<ProfileBundle::Section> ProfileBundle::Parser::getSectionList() const
{
    return section_list;
}

void ProfileBundle::Parser::setProfileList(const std::list<Profile> &profiles)
{
    profile_list = profiles;
    for(auto &profile : profile_list) {
        profile.setSourcePath(path);
    }
}

void ProfileBundle::Parser::setSectionList(const std::list<Section> &sections)
{
    section_list = sections;
}

void ProfileBundle::Parser::checkProfileValid(const Profile &profile) const
{
    // Attempt to find profile from the list and return on success
    if(hasProfile(profile.qualifiedName())) {
        return;
    }

    // Profile was not found so throw an exception
    std::stringstream message;
    message << "Invalid profile \"" << profile.qualifiedName() << "\" was given as argument. This profile does not exist in '" << path << "'.";
    throw std::domain_error(message.str());
}

void ProfileBundle::Parser::updateProfile(const Profile &profile)
{
    checkProfileValid(profile);

    for(auto &existing : profile_list) {
        if(existing.qualifiedName() == profile.qualifiedName()) {
            bool implicit = existing.isImplicit();
            existing = profile;
            existing.setSourcePath(path);
            existing.setImplicit(implicit);
        }
    }
}

void ProfileBundle::Parser::appendProfile(const Profile &profile)
{
    Profile owned(profile);
    owned.setSourcePath(path);
    owned.setImplicit(false);
    profile_list.push_back(owned);
}

size_t ProfileBundle::Parser::removeProfile(const std::string &qualified_name)
{
    size_t before = profile_list.size();
    profile_list.remove_if([&qualified_name](const Profile &profile) {
        return profile.qualifiedName() == qualified_name;
    });

    return before - profile_list.size();
}

bool ProfileBundle::Parser::hasProfile(const std::string &qualified_name) const
{
    for(const auto &profile : profile_list) {
        if(profile.qualifiedName() == qualified_name) {
            return true;
        }
    }

    return false;
}

bool ProfileBundle::Parser::empty() const
{
    // Leading text is not a stanza
    for(const auto &section : section_list) {
        if(!section.title().empty()) {
            return false;
        }
    }

    for(const auto &profile : profile_list) {
        // An emptied default profile is never written
        if(!profile.isImplicit() || !profile.isEmpty()) {
            return false;
        }
    }

    return true;
}

void ProfileBundle::Parser::updateFromString(const std::string &new_file_contents)
{
    std::stringstream stream(new_file_contents);
    auto ast = parseStream(stream, std::cerr);

    // Only replace the content once the new text parsed
    initializeProfileList(ast);
}

bool ProfileBundle::Parser::hasChanges() const
{
    return this->operator std::string() != old_file_contents;
}

void ProfileBundle::Parser::saveChanges()
{
    std::ofstream output_file(path);
    if(!output_file) {
        throw std::runtime_error("cannot write profile file '" + path + "'");
    }

    saveChanges(output_file);
    output_file.close();

    if(output_file.fail()) {
        throw std::runtime_error("cannot write profile file '" + path + "'");
    }
}

void ProfileBundle::Parser::saveChanges(std::ostream &output)
{
    std::string contents = this->operator std::string();
    output << contents;
    old_file_contents = contents;
}

ProfileBundle::Parser::operator std::string() const
{
    std::list<std::string> blocks;

    for(const auto &section : section_list) {
        blocks.push_back(section.operator std::string());
    }

    for(const auto &profile : profile_list) {
        // A default profile without content is dropped; any other gets its header
        if(profile.isImplicit() && profile.isEmpty()) {
            continue;
        }

        blocks.push_back(profile.operator std::string());
    }

    // Separate stanzas with exactly one blank line
    std::stringstream ss;
    bool first = true;
    for(const auto &block : blocks) {
        if(!first) {
            ss << '\n';
        }

        ss << block;
        first = false;
    }

    return ss.str();
}
