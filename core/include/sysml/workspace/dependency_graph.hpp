// sysml/workspace/dependency_graph.hpp - File-level dependencies
#pragma once

#include <map>
#include <set>
#include <vector>

#include "sysml/basic/source_manager.hpp"

namespace sysml
{

/**
 * Which files reference symbols declared in which other files.
 *
 * `a` depends on `b` when a reference or import in `a` resolved to a symbol
 * declared in `b`. Rebuilt with every model.
 */
class DependencyGraph
{
public:
  void add_dependency(FileId from, FileId to);

  [[nodiscard]] std::vector<FileId> dependencies_of(FileId file) const;
  [[nodiscard]] std::vector<FileId> dependents_of(FileId file) const;

  /// Every file that transitively depends on `file`, sorted, excluding itself.
  [[nodiscard]] std::vector<FileId> affected_files(FileId file) const;

  [[nodiscard]] bool empty() const noexcept { return forward_.empty(); }
  void clear() noexcept;

private:
  std::map<FileId, std::set<FileId>> forward_;
  std::map<FileId, std::set<FileId>> reverse_;
};

}  // namespace sysml
