#include "ProfileRule.hh"
#include "LineNode.hh"
#include "PropertyRule.hh"
#include "RuleNode.hh"
#include "profile_type.hh"

#include <list>
#include <optional>
#include <sstream>
#include <string>

ProfileBundle::Tree::ProfileRule::ProfileRule(ProfileType type, const std::string &name, uint64_t startPos, uint64_t stopPos)
  : RuleNode(name, startPos, stopPos),
    profile_type{type}
{   }

std::string ProfileBundle::Tree::ProfileRule::name() const
{
  return this->getText();
}

std::string ProfileBundle::Tree::ProfileRule::qualifiedName() const
{
  return toString(profile_type) + ": " + name();
}

ProfileBundle::ProfileType ProfileBundle::Tree::ProfileRule::type() const
{
  return profile_type;
}

void ProfileBundle::Tree::ProfileRule::rename(const std::string &name)
{
  setText(name);
}

std::string ProfileBundle::Tree::ProfileRule::getSourcePath() const
{
  return source_path;
}

void ProfileBundle::Tree::ProfileRule::setSourcePath(const std::string &path)
{
  source_path = path;
}

bool ProfileBundle::Tree::ProfileRule::isImplicit() const
{
  return implicit;
}

void ProfileBundle::Tree::ProfileRule::setImplicit(bool implicit)
{
  this->implicit = implicit;
}

ProfileBundle::Tree::PropertyMap ProfileBundle::Tree::ProfileRule::getProperties() const
{
  return properties;
}

void ProfileBundle::Tree::ProfileRule::setProperties(const PropertyMap &properties)
{
  this->properties = properties;
}

bool ProfileBundle::Tree::ProfileRule::hasProperty(const std::string &key) const
{
  return properties.find(key) != properties.end();
}

std::optional<std::string> ProfileBundle::Tree::ProfileRule::getProperty(const std::string &key) const
{
  auto found = properties.find(key);
  if(found == properties.end()) {
    return std::nullopt;
  }

  return found->second;
}

void ProfileBundle::Tree::ProfileRule::setProperty(const std::string &key, const std::string &value)
{
  properties[key] = value;
}

bool ProfileBundle::Tree::ProfileRule::removeProperty(const std::string &key)
{
  return properties.erase(key) > 0;
}

std::optional<std::string> ProfileBundle::Tree::ProfileRule::getInherits() const
{
  auto inherits = getProperty("inherits");
  if(!inherits.has_value() || PropertyRule::trim(*inherits).empty()) {
    return std::nullopt;
  }

  return PropertyRule::trim(*inherits);
}

std::list<std::string> ProfileBundle::Tree::ProfileRule::getComments() const
{
  std::list<std::string> comments;
  for(const auto &line : lines) {
    if(line.isComment()) {
      comments.push_back(line.getRaw());
    }
  }

  return comments;
}

std::list<ProfileBundle::Tree::LineNode> ProfileBundle::Tree::ProfileRule::getLines() const
{
  return lines;
}

void ProfileBundle::Tree::ProfileRule::appendLine(const LineNode &line)
{
  lines.push_back(line);
  setStopPosition(line.getEndPosition());
}

void ProfileBundle::Tree::ProfileRule::appendProperty(const PropertyRule &property)
{
  // A repeated key keeps its last value
  properties[property.getKey()] = property.getValue();
  appendLine(property);
}

bool ProfileBundle::Tree::ProfileRule::isEmpty() const
{
  return properties.empty() && getComments().empty();
}

bool ProfileBundle::Tree::ProfileRule::isSameProfile(const ProfileRule &other) const
{
  return this->profile_type == other.profile_type &&
         this->name() == other.name() &&
         this->source_path == other.source_path;
}

std::string ProfileBundle::Tree::ProfileRule::headerLine() const
{
  std::stringstream ss;
  ss << '[' << toString(profile_type) << ':';

  // Bundled (privatized) names are written without a space after the colon
  if(name().find('*') == std::string::npos) {
    ss << ' ';
  }

  ss << name() << ']';
  return ss.str();
}

std::string ProfileBundle::Tree::ProfileRule::body() const
{
  std::stringstream ss;
  for(const auto &comment : getComments()) {
    ss << comment << '\n';
  }

  for(const auto &[key, value] : properties) {
    ss << PropertyRule(key, value).operator std::string() << '\n';
  }

  return ss.str();
}

bool ProfileBundle::Tree::ProfileRule::operator==(const ProfileRule &other) const
{
  return isSameProfile(other) &&
         this->properties == other.properties;
}

bool ProfileBundle::Tree::ProfileRule::operator!=(const ProfileRule &other) const
{
  return !(*this == other);
}

ProfileBundle::Tree::ProfileRule::operator std::string() const
{
  return headerLine() + '\n' + body();
}
