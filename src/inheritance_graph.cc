#include "inheritance_graph.hh"
#include "name_resolver.hh"

#include <deque>
#include <list>
#include <optional>
#include <set>
#include <string>

std::list<ProfileBundle::Profile> ProfileBundle::InheritanceGraph::directChildren(const std::list<Profile> &profiles,
                                                                                 const std::string &parent_name)
{
  std::list<Profile> children;
  for(const auto &profile : profiles) {
    if(NameResolver::inheritsFrom(profile, parent_name)) {
      children.push_back(profile);
    }
  }

  return children;
}

std::list<ProfileBundle::Profile> ProfileBundle::InheritanceGraph::descendants(const std::list<Profile> &profiles,
                                                                              const std::list<std::string> &seed_names)
{
  std::list<Profile> result;
  std::set<std::string> found;
  std::set<std::string> visited;
  std::deque<std::string> queue(seed_names.begin(), seed_names.end());

  while(!queue.empty()) {
    std::string current = queue.front();
    queue.pop_front();

    if(!visited.insert(current).second) {
      continue;
    }

    for(const auto &child : directChildren(profiles, current)) {
      if(!found.insert(child.qualifiedName()).second) {
        continue;
      }

      result.push_back(child);
      queue.push_back(child.qualifiedName());
    }
  }

  return result;
}

std::optional<ProfileBundle::Profile> ProfileBundle::InheritanceGraph::findParent(const Profile &profile,
                                                                                 const std::list<Profile> &profiles)
{
  if(!profile.getInherits().has_value()) {
    return std::nullopt;
  }

  for(const auto &candidate : profiles) {
    if(candidate.isSameProfile(profile)) {
      continue;
    }

    if(NameResolver::inheritsFrom(profile, candidate.qualifiedName())) {
      return candidate;
    }
  }

  return std::nullopt;
}

std::list<ProfileBundle::Profile> ProfileBundle::InheritanceGraph::ancestorChain(const Profile &profile,
                                                                                const std::list<Profile> &profiles)
{
  std::list<Profile> chain;
  std::set<std::string> visited = { profile.qualifiedName() };

  auto parent = findParent(profile, profiles);
  while(parent.has_value()) {
    if(!visited.insert(parent->qualifiedName()).second) {
      break;
    }

    chain.push_back(*parent);
    parent = findParent(*parent, profiles);
  }

  return chain;
}
