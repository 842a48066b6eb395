// sysml/sema/relationships/relationship_graph.cpp - Typed relationship edges
#include "sysml/sema/relationships/relationship_graph.hpp"

#include <algorithm>
#include <set>

namespace sysml
{

namespace
{

std::vector<std::string> lookup(const RelationshipGraph::EdgeMap & map, std::string_view key)
{
  auto it = map.find(key);
  return it != map.end() ? it->second : std::vector<std::string>{};
}

}  // namespace

bool RelationshipGraph::add_edge(RelationshipKind kind, std::string_view from, std::string_view to)
{
  if (from.empty() || to.empty()) {
    return false;
  }

  if (from == to) {
    const auto existing = std::find_if(self_edges_.begin(), self_edges_.end(), [&](const auto & e) {
      return e.first == kind && e.second == from;
    });
    if (existing == self_edges_.end()) {
      self_edges_.emplace_back(kind, std::string(from));
    }
    return false;
  }

  auto & forward = forward_[static_cast<size_t>(kind)];
  auto it = forward.find(from);
  if (it == forward.end()) {
    it = forward.emplace(std::string(from), std::vector<std::string>{}).first;
  }

  auto & targets = it->second;
  if (kind == RelationshipKind::Typing && !targets.empty()) {
    return false;
  }
  if (std::find(targets.begin(), targets.end(), to) != targets.end()) {
    return false;
  }
  targets.emplace_back(to);

  auto & reverse = reverse_[static_cast<size_t>(kind)];
  auto rit = reverse.find(to);
  if (rit == reverse.end()) {
    rit = reverse.emplace(std::string(to), std::vector<std::string>{}).first;
  }
  rit->second.emplace_back(from);

  ++edge_count_;
  return true;
}

std::vector<std::string> RelationshipGraph::targets(
  RelationshipKind kind, std::string_view from) const
{
  return lookup(forward_[static_cast<size_t>(kind)], from);
}

std::vector<std::string> RelationshipGraph::sources(RelationshipKind kind, std::string_view to) const
{
  return lookup(reverse_[static_cast<size_t>(kind)], to);
}

bool RelationshipGraph::has_edge(
  RelationshipKind kind, std::string_view from, std::string_view to) const
{
  const auto & map = forward_[static_cast<size_t>(kind)];
  auto it = map.find(from);
  return it != map.end() && std::find(it->second.begin(), it->second.end(), to) != it->second.end();
}

std::vector<std::string> RelationshipGraph::specializations_of(std::string_view name) const
{
  return targets(RelationshipKind::Specialization, name);
}

bool RelationshipGraph::is_specialization(std::string_view a, std::string_view b) const
{
  if (a == b) {
    return false;
  }

  // Depth-first walk; the visited set keeps cyclic graphs finite.
  std::set<std::string, std::less<>> visited;
  std::vector<std::pair<std::string, size_t>> stack;
  stack.emplace_back(std::string(a), 0);

  while (!stack.empty()) {
    auto [current, depth] = std::move(stack.back());
    stack.pop_back();
    if (!visited.insert(current).second || depth >= k_max_walk_depth) {
      continue;
    }

    for (const auto kind : k_specialization_kinds) {
      const auto & map = forward_[static_cast<size_t>(kind)];
      auto it = map.find(current);
      if (it == map.end()) {
        continue;
      }
      for (const auto & next : it->second) {
        if (next == b) {
          return true;
        }
        if (visited.find(next) == visited.end()) {
          stack.emplace_back(next, depth + 1);
        }
      }
    }
  }
  return false;
}

std::vector<std::string> RelationshipGraph::satisfactions_of(std::string_view requirement) const
{
  return sources(RelationshipKind::Satisfy, requirement);
}

std::optional<std::string> RelationshipGraph::type_of(std::string_view usage) const
{
  const auto & map = forward_[static_cast<size_t>(RelationshipKind::Typing)];
  auto it = map.find(usage);
  if (it == map.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.front();
}

void RelationshipGraph::clear()
{
  for (auto & map : forward_) {
    map.clear();
  }
  for (auto & map : reverse_) {
    map.clear();
  }
  self_edges_.clear();
  edge_count_ = 0;
}

}  // namespace sysml
