// sysml/sema/semantic_model.cpp - Population and analysis pipeline
#include "sysml/sema/semantic_model.hpp"

#include "sysml/sema/analysis/analyzer.hpp"
#include "sysml/sema/population/populator.hpp"
#include "sysml/sema/resolution/import_resolver.hpp"
#include "sysml/sema/resolution/linker.hpp"

namespace sysml
{

size_t populate_file(SemanticModel & model, const SourceUnit & unit, FileId file)
{
  Populator populator(model.symbols, model.diagnostics, model.imports, model.references);
  return populator.populate(unit, file);
}

bool resolve_and_analyze(SemanticModel & model, const CancellationToken & cancel)
{
  ImportResolver imports(model.symbols, model.diagnostics, cancel);
  if (!imports.resolve_all(model.imports)) {
    return false;
  }

  Linker linker(model.symbols, model.graph, model.diagnostics, cancel);
  if (!linker.link(model.references)) {
    return false;
  }

  Analyzer analyzer(model.symbols, model.graph, model.references, model.diagnostics);
  return analyzer.run_all(cancel);
}

}  // namespace sysml
