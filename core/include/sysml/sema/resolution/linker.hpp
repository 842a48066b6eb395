// sysml/sema/resolution/linker.hpp - Reference linking
//
// Resolves every recorded reference and writes the relationship graph.
// Specializations and typings are linked first so that feature chains and
// redefinitions can see inherited members.
//
#pragma once

#include <vector>

#include "sysml/basic/cancellation.hpp"
#include "sysml/basic/diagnostic.hpp"
#include "sysml/sema/relationships/relationship_graph.hpp"
#include "sysml/sema/resolution/references.hpp"
#include "sysml/sema/resolution/resolver.hpp"
#include "sysml/sema/symbols/symbol_table.hpp"

namespace sysml
{

class Linker
{
public:
  Linker(
    const SymbolTable & symbols, RelationshipGraph & graph, DiagnosticBag & diags,
    CancellationToken cancel = {})
  : symbols_(symbols), graph_(graph), diags_(diags), cancel_(cancel)
  {
  }

  /**
   * Link all references.
   *
   * An unresolved target is still added to the graph, as written, so the
   * Analyzer can report it. Ambiguous names (E013) and alias cycles (E014)
   * are reported here and add no edge.
   *
   * @return false if cancelled.
   */
  [[nodiscard]] bool link(std::vector<ReferenceOccurrence> & references);

private:
  void link_one(ReferenceOccurrence & ref, const Resolver & resolver);
  [[nodiscard]] ResolveResult resolve_target(
    const ReferenceOccurrence & ref, const Resolver & resolver) const;
  void report(const ResolveResult & result, std::string_view text, SourceRange range);

  const SymbolTable & symbols_;
  RelationshipGraph & graph_;
  DiagnosticBag & diags_;
  CancellationToken cancel_;
};

}  // namespace sysml
