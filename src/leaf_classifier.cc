#include "leaf_classifier.hh"
#include "name_resolver.hh"

#include <algorithm>
#include <list>

namespace {
  // True when 'candidate' names one of the selected profiles without relying on tag-stripping
  bool inheritsFromSelected(const ProfileBundle::Profile &candidate, const std::list<ProfileBundle::Profile> &selection)
  {
    return std::any_of(selection.begin(), selection.end(), [&candidate](const ProfileBundle::Profile &other) {
      return ProfileBundle::NameResolver::inheritsFrom(candidate, other.qualifiedName());
    });
  }
} // namespace

ProfileBundle::Classification ProfileBundle::LeafClassifier::classify(const std::list<Profile> &selection)
{
  Classification result;
  for(const auto &profile : selection) {
    if(hasChildIn(profile, selection)) {
      result.internal.push_back(profile);
    }
    else {
      result.leaves.push_back(profile);
    }
  }

  return result;
}

bool ProfileBundle::LeafClassifier::hasChildIn(const Profile &profile, const std::list<Profile> &selection)
{
  for(const auto &candidate : selection) {
    if(candidate.isSameProfile(profile)) {
      continue;
    }

    auto inherits = candidate.getProperty("inherits");
    if(!inherits.has_value()) {
      continue;
    }

    if(NameResolver::inheritsFrom(candidate, profile.qualifiedName())) {
      return true;
    }

    // Tags may be missing from the reference, so the core name is compared as well,
    // unless the reference already names another selected profile
    if(NameResolver::referencesProfile(*inherits, profile.qualifiedName()) &&
       !inheritsFromSelected(candidate, selection)) {
      return true;
    }
  }

  return false;
}
