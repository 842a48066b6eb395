// sysml/sema/analysis/analyzer.cpp - Whole-model validation
#include "sysml/sema/analysis/analyzer.hpp"

#include <array>
#include <unordered_set>
#include <utility>

#include "sysml/basic/diagnostic_codes.hpp"

namespace sysml
{

namespace
{

struct RoleRule
{
  RelationshipKind kind;
  SemanticRole expected;
};

constexpr std::array<RoleRule, 4> k_role_rules = {{
  {RelationshipKind::Satisfy, SemanticRole::Requirement},
  {RelationshipKind::Perform, SemanticRole::Action},
  {RelationshipKind::Exhibit, SemanticRole::State},
  {RelationshipKind::Include, SemanticRole::UseCase},
}};

std::string_view cycle_noun(RelationshipKind k)
{
  switch (k) {
    case RelationshipKind::Subsetting:
      return "subsetting";
    case RelationshipKind::Redefinition:
      return "redefinition";
    default:
      return "specialization";
  }
}

}  // namespace

Analyzer::Analyzer(
  SymbolTable & symbols, const RelationshipGraph & graph,
  const std::vector<ReferenceOccurrence> & references, DiagnosticBag & diags)
: symbols_(symbols), graph_(graph), references_(references), diags_(diags)
{
  for (const auto & ref : references) {
    if (ref.edge_target.empty()) {
      continue;
    }
    occurrences_.emplace(EdgeKey{ref.kind, ref.edge_source, ref.edge_target}, &ref);
  }
}

bool Analyzer::run_all(const CancellationToken & cancel)
{
  using Pass = void (Analyzer::*)();
  static constexpr std::array<Pass, 5> k_passes = {
    &Analyzer::check_duplicates,        &Analyzer::check_cycles,
    &Analyzer::check_dangling_references, &Analyzer::extract_flags,
    &Analyzer::check_relationship_roles,
  };

  for (const Pass pass : k_passes) {
    if (cancel.is_cancelled()) {
      return false;
    }
    (this->*pass)();
  }
  return true;
}

// ============================================================================
// Passes
// ============================================================================

void Analyzer::check_duplicates()
{
  std::unordered_set<std::string_view> seen;
  for (const auto & sym : symbols_.all_symbols()) {
    if (!seen.insert(sym.qualified_name).second) {
      diags_.report_error(sym.source_span, "duplicate definition of '" + sym.qualified_name + "'")
        .with_code(diag_codes::k_duplicate_definition);
    }
  }
}

void Analyzer::check_cycles()
{
  for (const auto kind : RelationshipGraph::k_specialization_kinds) {
    for (const auto & [edge_kind, name] : graph_.self_edges()) {
      if (edge_kind == kind) {
        report_cycle(kind, {name});
      }
    }

    // Iterative depth-first search; a back edge closes exactly one cycle.
    const auto & edges = graph_.edges(kind);
    std::map<std::string, int, std::less<>> color;  // 0 = new, 1 = on stack, 2 = done

    for (const auto & entry : edges) {
      if (color[entry.first] != 0) {
        continue;
      }

      std::vector<std::pair<std::string, size_t>> stack;
      stack.emplace_back(entry.first, 0);
      color[entry.first] = 1;

      while (!stack.empty()) {
        auto & [node, index] = stack.back();
        auto it = edges.find(node);
        if (it == edges.end() || index >= it->second.size()) {
          color[node] = 2;
          stack.pop_back();
          continue;
        }

        const std::string next = it->second[index++];
        const int c = color[next];
        if (c == 0) {
          color[next] = 1;
          stack.emplace_back(next, 0);
        } else if (c == 1) {
          std::vector<std::string> path;
          bool on_cycle = false;
          for (const auto & frame : stack) {
            on_cycle = on_cycle || frame.first == next;
            if (on_cycle) {
              path.push_back(frame.first);
            }
          }
          report_cycle(kind, path);
        }
      }
    }
  }
}

void Analyzer::check_dangling_references()
{
  // Walk the occurrences rather than the graph: a second typing target is
  // refused by the graph but must still name a declared symbol.
  for (const auto & ref : references_) {
    if (ref.edge_target.empty()) {
      continue;
    }
    if (ref.resolved == k_invalid_symbol && symbols_.lookup_qualified(ref.edge_target) == nullptr) {
      diags_.report_error(ref.range, "cannot find symbol '" + ref.target_text + "'", "not found")
        .with_code(diag_codes::k_undefined_symbol);
    }
    if (
      ref.has_subject() && ref.resolved_subject == k_invalid_symbol &&
      symbols_.lookup_qualified(ref.edge_source) == nullptr) {
      diags_
        .report_error(ref.subject_range, "cannot find symbol '" + ref.subject_text + "'", "not found")
        .with_code(diag_codes::k_undefined_symbol);
    }
  }
}

void Analyzer::extract_flags()
{
  for (SymbolId id = 0; id < symbols_.size(); ++id) {
    const Symbol & sym = symbols_.get(id);
    if (sym.flags_extracted) {
      continue;
    }
    // Variations are implicitly abstract
    const bool variation = sym.has_variation_prefix;
    symbols_.set_derived_flags(id, sym.has_abstract_prefix || variation, variation);
  }
}

void Analyzer::check_relationship_roles()
{
  for (const auto & rule : k_role_rules) {
    for (const auto & [from, targets] : graph_.edges(rule.kind)) {
      for (const auto & to : targets) {
        const Symbol * target = symbols_.lookup_qualified(to);
        if (target == nullptr) {
          continue;
        }
        const SemanticRole role = effective_role(*target);
        if (role == rule.expected || role == SemanticRole::Unknown) {
          continue;
        }

        const ReferenceOccurrence * occ = occurrence_of(rule.kind, from, to);
        const SourceRange range = occ != nullptr ? occ->range : range_of_symbol(from);
        diags_
          .report_error(
            range, std::string(to_string(rule.kind)) + " target '" + to + "' is " +
                     std::string(to_string(role)) + ", expected " +
                     std::string(to_string(rule.expected)))
          .with_code(diag_codes::k_invalid_relationship_target)
          .with_secondary_label(target->source_span, "declared here");
      }
    }
  }
}

// ============================================================================
// Helpers
// ============================================================================

const ReferenceOccurrence * Analyzer::occurrence_of(
  RelationshipKind kind, const std::string & from, const std::string & to) const
{
  auto it = occurrences_.find(EdgeKey{kind, from, to});
  return it != occurrences_.end() ? it->second : nullptr;
}

SourceRange Analyzer::range_of_symbol(std::string_view qualified_name) const
{
  const Symbol * sym = symbols_.lookup_qualified(qualified_name);
  return sym != nullptr ? sym->source_span : SourceRange{};
}

SemanticRole Analyzer::effective_role(const Symbol & sym) const
{
  if (sym.semantic_role != SemanticRole::Unknown) {
    return sym.semantic_role;
  }
  // `ref r : Req;` takes the role of its type
  if (auto type = graph_.type_of(sym.qualified_name)) {
    if (const Symbol * t = symbols_.lookup_qualified(*type)) {
      return t->semantic_role;
    }
  }
  return SemanticRole::Unknown;
}

void Analyzer::report_cycle(RelationshipKind kind, const std::vector<std::string> & path)
{
  if (path.empty()) {
    return;
  }

  std::string chain;
  for (const auto & name : path) {
    chain += name;
    chain += " -> ";
  }
  chain += path.front();

  const ReferenceOccurrence * occ = occurrence_of(kind, path.back(), path.front());
  const SourceRange range = occ != nullptr ? occ->range : range_of_symbol(path.front());
  diags_
    .report_error(range, "circular " + std::string(cycle_noun(kind)) + ": " + chain)
    .with_code(diag_codes::k_circular_relationship);
}

}  // namespace sysml
