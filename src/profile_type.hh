#ifndef PROFILEBUNDLE_PROFILE_TYPE_HH
#define PROFILEBUNDLE_PROFILE_TYPE_HH

#include <list>
#include <string>

namespace ProfileBundle {
  enum class ProfileType { Print, Filament };

  // Returns the stanza tag for a profile type ("print" or "filament")
  std::string toString(ProfileType type);

  // Throws std::invalid_argument for anything other than "print" or "filament"
  ProfileType profileTypeFromString(const std::string &name);

  bool isProfileTypeName(const std::string &name);

  std::list<ProfileType> allProfileTypes();
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_PROFILE_TYPE_HH
