// sysml/sema/resolution/import_resolver.hpp - Three-pass import resolution
//
// Pass order is fixed:
//   1. namespace imports   (`import P::*;`)   snapshot the direct members of P
//   2. member imports      (`import P::m;`)   may use names made visible by pass 1
//   3. recursive imports   (`import P::**;`)  walk P and every nested namespace,
//                                             including those P imports publicly
//
// Each pass runs to completion over every directive before the next starts.
//
#pragma once

#include <optional>
#include <vector>

#include "sysml/basic/cancellation.hpp"
#include "sysml/basic/diagnostic.hpp"
#include "sysml/sema/resolution/references.hpp"
#include "sysml/sema/symbols/symbol_table.hpp"

namespace sysml
{

class ImportResolver
{
public:
  ImportResolver(SymbolTable & symbols, DiagnosticBag & diags, CancellationToken cancel = {})
  : symbols_(symbols), diags_(diags), cancel_(cancel)
  {
  }

  /**
   * Run all three passes.
   *
   * @return false if cancelled; bindings made before cancellation remain in
   *         the table, so the caller must discard it.
   */
  [[nodiscard]] bool resolve_all(std::vector<ImportDirective> & directives);

  bool run_namespace_pass(std::vector<ImportDirective> & directives);
  bool run_member_pass(std::vector<ImportDirective> & directives);
  bool run_recursive_pass(std::vector<ImportDirective> & directives);

  [[nodiscard]] size_t bindings_added() const noexcept { return bindings_added_; }

private:
  /// Owner of the namespace named by `target`, resolved from `from`.
  [[nodiscard]] std::optional<SymbolId> resolve_namespace(
    std::string_view target, ScopeId from) const;
  [[nodiscard]] std::optional<SymbolId> resolve_member(std::string_view target, ScopeId from) const;

  /// Bind everything reachable from `root` into the importing scope. False if cancelled.
  [[nodiscard]] bool walk_recursive(ScopeId root, const ImportDirective & d);
  void bind_members_of(ScopeId source, const ImportDirective & d, bool include_public_imports);
  void bind(const ImportDirective & d, std::string_view name, SymbolId symbol, bool wildcard);
  void report_unresolved(const ImportDirective & d);

  SymbolTable & symbols_;
  DiagnosticBag & diags_;
  CancellationToken cancel_;
  size_t bindings_added_ = 0;
};

}  // namespace sysml
