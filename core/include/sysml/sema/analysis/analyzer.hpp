// sysml/sema/analysis/analyzer.hpp - Whole-model validation
//
// Runs after population, import resolution and linking. Each pass is
// independent and only adds diagnostics, except flag extraction, which
// writes the derived flags of every symbol once.
//
#pragma once

#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "sysml/basic/cancellation.hpp"
#include "sysml/basic/diagnostic.hpp"
#include "sysml/sema/relationships/relationship_graph.hpp"
#include "sysml/sema/resolution/references.hpp"
#include "sysml/sema/symbols/symbol_table.hpp"

namespace sysml
{

class Analyzer
{
public:
  Analyzer(
    SymbolTable & symbols, const RelationshipGraph & graph,
    const std::vector<ReferenceOccurrence> & references, DiagnosticBag & diags);

  /// Run every pass. Returns false if cancelled between passes.
  bool run_all(const CancellationToken & cancel = {});

  /// E001 for qualified names declared more than once.
  void check_duplicates();

  /// E005, once per cycle in the specialization, subsetting and redefinition graphs.
  void check_cycles();

  /// E002 for linked references whose target or subject names no declared symbol.
  void check_dangling_references();

  /// Derive is_abstract / is_variation from the syntactic prefixes.
  void extract_flags();

  /// E004 for satisfy / perform / exhibit / include targets of the wrong role.
  void check_relationship_roles();

private:
  using EdgeKey = std::tuple<RelationshipKind, std::string, std::string>;

  [[nodiscard]] const ReferenceOccurrence * occurrence_of(
    RelationshipKind kind, const std::string & from, const std::string & to) const;
  [[nodiscard]] SourceRange range_of_symbol(std::string_view qualified_name) const;
  [[nodiscard]] SemanticRole effective_role(const Symbol & sym) const;

  void report_cycle(RelationshipKind kind, const std::vector<std::string> & path);

  SymbolTable & symbols_;
  const RelationshipGraph & graph_;
  const std::vector<ReferenceOccurrence> & references_;
  DiagnosticBag & diags_;
  std::map<EdgeKey, const ReferenceOccurrence *> occurrences_;
};

}  // namespace sysml
