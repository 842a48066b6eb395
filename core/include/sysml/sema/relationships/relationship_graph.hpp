// sysml/sema/relationships/relationship_graph.hpp - Typed relationship edges
//
// Edges connect qualified names. A target that did not resolve is stored as
// written; the Analyzer reports it as dangling. Insertion never rejects an
// edge because of a cycle: cycles are data, found and reported later.
//
#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sysml/ast/ast_enums.hpp"

namespace sysml
{

class RelationshipGraph
{
public:
  using EdgeMap = std::map<std::string, std::vector<std::string>, std::less<>>;

  /// Specialization-like kinds followed by is_specialization().
  static constexpr std::array<RelationshipKind, 3> k_specialization_kinds = {
    RelationshipKind::Specialization,
    RelationshipKind::Subsetting,
    RelationshipKind::Redefinition,
  };

  /// Upper bound on the depth of a specialization walk.
  static constexpr size_t k_max_walk_depth = 1024;

  /**
   * Add an edge `from -> to`.
   *
   * Returns false when nothing was added: a duplicate edge, a second typing
   * of the same source, or a self-edge. Self-edges are remembered separately
   * so they can be reported as one-element cycles.
   */
  bool add_edge(RelationshipKind kind, std::string_view from, std::string_view to);

  // Queries
  [[nodiscard]] std::vector<std::string> targets(RelationshipKind kind, std::string_view from) const;
  [[nodiscard]] std::vector<std::string> sources(RelationshipKind kind, std::string_view to) const;
  [[nodiscard]] bool has_edge(
    RelationshipKind kind, std::string_view from, std::string_view to) const;

  /// Direct supertypes named by specialization edges of `name`.
  [[nodiscard]] std::vector<std::string> specializations_of(std::string_view name) const;

  /// True if `a` reaches `b` through specialization-like edges (a != b).
  [[nodiscard]] bool is_specialization(std::string_view a, std::string_view b) const;

  /// Elements that satisfy `requirement`.
  [[nodiscard]] std::vector<std::string> satisfactions_of(std::string_view requirement) const;

  /// Type of a usage, if it has one.
  [[nodiscard]] std::optional<std::string> type_of(std::string_view usage) const;

  [[nodiscard]] const EdgeMap & edges(RelationshipKind kind) const
  {
    return forward_[static_cast<size_t>(kind)];
  }
  [[nodiscard]] const std::vector<std::pair<RelationshipKind, std::string>> & self_edges() const
  {
    return self_edges_;
  }

  [[nodiscard]] size_t edge_count() const noexcept { return edge_count_; }
  void clear();

private:
  std::array<EdgeMap, k_relationship_kind_count> forward_;
  std::array<EdgeMap, k_relationship_kind_count> reverse_;
  std::vector<std::pair<RelationshipKind, std::string>> self_edges_;
  size_t edge_count_ = 0;
};

}  // namespace sysml
