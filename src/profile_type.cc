#include "profile_type.hh"

#include <list>
#include <sstream>
#include <stdexcept>
#include <string>

std::string ProfileBundle::toString(ProfileType type)
{
  switch(type) {
    case ProfileType::Print:
      return "print";

    case ProfileType::Filament:
      return "filament";
  }

  throw std::logic_error("unhandled profile type");
}

ProfileBundle::ProfileType ProfileBundle::profileTypeFromString(const std::string &name)
{
  if(name == "print") {
    return ProfileType::Print;
  }

  if(name == "filament") {
    return ProfileType::Filament;
  }

  std::stringstream message;
  message << "Invalid profile type '" << name << "'. Use 'print' or 'filament'";
  throw std::invalid_argument(message.str());
}

bool ProfileBundle::isProfileTypeName(const std::string &name)
{
  return name == "print" || name == "filament";
}

std::list<ProfileBundle::ProfileType> ProfileBundle::allProfileTypes()
{
  return { ProfileType::Print, ProfileType::Filament };
}
