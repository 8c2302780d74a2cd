#include "PropertyRule.hh"
#include "LineNode.hh"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>

ProfileBundle::Tree::PropertyRule::PropertyRule(uint64_t lineno, const std::string &raw)
  : LineNode(Kind::Property, lineno, raw)
{
  auto clean = stripInlineComment(raw);
  auto equals = clean.find('=');
  if(equals == std::string::npos) {
    std::stringstream message;
    message << "Line " << lineno << " is not a property: " << raw;
    throw std::invalid_argument(message.str());
  }

  key = trim(clean.substr(0, equals));
  value = trim(clean.substr(equals + 1));
}

ProfileBundle::Tree::PropertyRule::PropertyRule(const std::string &key, const std::string &value)
  : LineNode(Kind::Property, 0, key + " = " + value),
    key{key},
    value{value}
{   }

std::string ProfileBundle::Tree::PropertyRule::getKey() const
{
  return key;
}

std::string ProfileBundle::Tree::PropertyRule::getValue() const
{
  return value;
}

bool ProfileBundle::Tree::PropertyRule::almostEquals(const PropertyRule &other) const
{
  return this->key == other.key &&
         this->value == other.value;
}

ProfileBundle::Tree::PropertyRule::operator std::string() const
{
  std::stringstream ss;
  ss << key << " = " << value;
  return ss.str();
}

std::string ProfileBundle::Tree::PropertyRule::trim(const std::string &text)
{
  size_t first = 0;
  while(first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
    first++;
  }

  size_t last = text.size();
  while(last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
    last--;
  }

  return text.substr(first, last - first);
}

std::string ProfileBundle::Tree::PropertyRule::stripInlineComment(const std::string &line)
{
  for(size_t pos = 0; pos < line.size(); pos++) {
    if(line[pos] != '#') {
      continue;
    }

    bool at_start = trim(line.substr(0, pos)).empty();
    bool after_space = pos > 0 && std::isspace(static_cast<unsigned char>(line[pos - 1]));
    bool before_space = pos + 1 == line.size() || std::isspace(static_cast<unsigned char>(line[pos + 1]));

    if(at_start || (after_space && before_space)) {
      return line.substr(0, pos);
    }
  }

  return line;
}
