// sysml/sema/semantic_model.hpp - One complete semantic model
#pragma once

#include <vector>

#include "sysml/ast/ast.hpp"
#include "sysml/basic/cancellation.hpp"
#include "sysml/basic/diagnostic.hpp"
#include "sysml/sema/relationships/relationship_graph.hpp"
#include "sysml/sema/resolution/references.hpp"
#include "sysml/sema/symbols/symbol_table.hpp"

namespace sysml
{

/**
 * Symbols, relationships and semantic diagnostics of a set of files.
 *
 * Built from scratch by one population cycle and never modified after it is
 * published.
 */
struct SemanticModel
{
  SymbolTable symbols;
  RelationshipGraph graph;
  std::vector<ImportDirective> imports;
  std::vector<ReferenceOccurrence> references;
  DiagnosticBag diagnostics;
};

/// Declare the contents of one parsed file. Returns the number of symbols declared.
size_t populate_file(SemanticModel & model, const SourceUnit & unit, FileId file);

/**
 * Resolve imports, link references and run the Analyzer.
 *
 * @return false if cancelled; the model is then incomplete.
 */
[[nodiscard]] bool resolve_and_analyze(
  SemanticModel & model, const CancellationToken & cancel = {});

}  // namespace sysml
