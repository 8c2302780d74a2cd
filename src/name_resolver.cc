#include "name_resolver.hh"
#include "profile_type.hh"
#include "tree/PropertyRule.hh"

#include <cctype>
#include <regex>
#include <string>

namespace {
  const std::regex type_prefix("^(print|filament):\\s*");
  const std::regex tag_token("@([^\\s*]+)");
  const std::regex whitespace_run("\\s+");

  bool isUnsafe(char c)
  {
    auto code = static_cast<unsigned char>(c);
    if(code < 0x20 || code == 0x7f) {
      return true;
    }

    return std::string("<>:\"|?*\\/").find(c) != std::string::npos;
  }

  bool isFilenameChar(char c)
  {
    auto code = static_cast<unsigned char>(c);
    return std::isalnum(code) || std::isspace(code) ||
           std::string("_@.-()").find(c) != std::string::npos;
  }
} // namespace

ProfileBundle::NormalizedName ProfileBundle::NameResolver::normalize(const std::string &name)
{
  NormalizedName result;
  std::string name_part = stripTypePrefix(name);

  for(auto it = std::sregex_iterator(name_part.begin(), name_part.end(), tag_token); it != std::sregex_iterator(); it++) {
    result.tags.push_back((*it)[1].str());
  }

  std::string without_tags = std::regex_replace(name_part, tag_token, "");
  result.base_name = std::regex_replace(Tree::PropertyRule::trim(without_tags), whitespace_run, " ");
  return result;
}

std::string ProfileBundle::NameResolver::stripTypePrefix(const std::string &name)
{
  return std::regex_replace(name, type_prefix, "", std::regex_constants::format_first_only);
}

std::string ProfileBundle::NameResolver::coreName(const std::string &name)
{
  return normalize(name).base_name;
}

bool ProfileBundle::NameResolver::coreNameEquals(const std::string &first, const std::string &second)
{
  return coreName(first) == coreName(second);
}

bool ProfileBundle::NameResolver::inheritsFrom(const Tree::ProfileRule &child, const std::string &parent_name)
{
  auto inherits = child.getProperty("inherits");
  if(!inherits.has_value() || inherits->empty()) {
    return false;
  }

  return inheritsValueMatches(*inherits, parent_name);
}

bool ProfileBundle::NameResolver::inheritsValueMatches(const std::string &inherits, const std::string &parent_name)
{
  using Tree::PropertyRule;

  if(inherits == parent_name) {
    return true;
  }

  if(PropertyRule::trim(inherits) == PropertyRule::trim(parent_name)) {
    return true;
  }

  std::string inherits_bare = stripTypePrefix(inherits);
  std::string parent_bare = stripTypePrefix(parent_name);
  if(inherits_bare == parent_bare) {
    return true;
  }

  return PropertyRule::trim(inherits_bare) == PropertyRule::trim(parent_bare);
}

bool ProfileBundle::NameResolver::referencesProfile(const std::string &inherits, const std::string &name)
{
  if(Tree::PropertyRule::trim(inherits).empty()) {
    return false;
  }

  return stripTypePrefix(inherits) == stripTypePrefix(name) ||
         coreNameEquals(inherits, name);
}

std::string ProfileBundle::NameResolver::privatize(const std::string &name)
{
  if(isPrivatized(name)) {
    return name;
  }

  return "*" + name + "*";
}

bool ProfileBundle::NameResolver::isPrivatized(const std::string &name)
{
  return name.size() >= 2 && name.front() == '*' && name.back() == '*';
}

std::string ProfileBundle::NameResolver::qualify(ProfileType type, const std::string &name)
{
  return toString(type) + ": " + name;
}

std::string ProfileBundle::NameResolver::sanitizeFilename(const std::string &name)
{
  std::string result;
  bool in_run = false;

  for(char c : name) {
    if(isFilenameChar(c)) {
      result += c;
      in_run = false;
    }
    else if(!in_run) {
      result += '_';
      in_run = true;
    }
  }

  return Tree::PropertyRule::trim(result);
}

bool ProfileBundle::NameResolver::containsUnsafeFilesystemChars(const std::string &name)
{
  for(char c : name) {
    if(isUnsafe(c)) {
      return true;
    }
  }

  return false;
}

std::string ProfileBundle::NameResolver::unsafeFilesystemChars(const std::string &name)
{
  std::string found;
  for(char c : name) {
    if(isUnsafe(c) && found.find(c) == std::string::npos) {
      found += c;
    }
  }

  return found;
}
