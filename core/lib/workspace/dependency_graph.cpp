// sysml/workspace/dependency_graph.cpp - File-level dependencies
#include "sysml/workspace/dependency_graph.hpp"

#include <deque>

namespace sysml
{

void DependencyGraph::add_dependency(FileId from, FileId to)
{
  if (from == to || !from.is_valid() || !to.is_valid()) {
    return;
  }
  forward_[from].insert(to);
  reverse_[to].insert(from);
}

std::vector<FileId> DependencyGraph::dependencies_of(FileId file) const
{
  auto it = forward_.find(file);
  if (it == forward_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

std::vector<FileId> DependencyGraph::dependents_of(FileId file) const
{
  auto it = reverse_.find(file);
  if (it == reverse_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

std::vector<FileId> DependencyGraph::affected_files(FileId file) const
{
  std::set<FileId> seen;
  std::deque<FileId> queue{file};

  while (!queue.empty()) {
    const FileId current = queue.front();
    queue.pop_front();
    auto it = reverse_.find(current);
    if (it == reverse_.end()) {
      continue;
    }
    for (const FileId dependent : it->second) {
      if (dependent != file && seen.insert(dependent).second) {
        queue.push_back(dependent);
      }
    }
  }
  return {seen.begin(), seen.end()};
}

void DependencyGraph::clear() noexcept
{
  forward_.clear();
  reverse_.clear();
}

}  // namespace sysml
