// sysml/sema/resolution/resolver.hpp - Name resolution
//
// Turns a reference as written (simple name, qualified name or feature
// chain) into a symbol, following aliases.
//
#pragma once

#include <string_view>
#include <vector>

#include "sysml/sema/relationships/relationship_graph.hpp"
#include "sysml/sema/symbols/symbol_table.hpp"

namespace sysml
{

enum class ResolveStatus : uint8_t {
  Resolved,
  NotFound,
  Ambiguous,
  AliasCycle,
};

struct ResolveResult
{
  ResolveStatus status = ResolveStatus::NotFound;
  SymbolId symbol = k_invalid_symbol;

  /// Ambiguous: the competing symbols. AliasCycle: the aliases on the cycle.
  std::vector<SymbolId> candidates;

  [[nodiscard]] bool resolved() const noexcept { return status == ResolveStatus::Resolved; }

  static ResolveResult found(SymbolId id)
  {
    ResolveResult r;
    r.status = ResolveStatus::Resolved;
    r.symbol = id;
    return r;
  }
};

/**
 * Stateless resolver over a populated symbol table.
 *
 * The relationship graph is optional. Without it, feature chains and
 * inherited members only see members declared directly in a namespace.
 */
class Resolver
{
public:
  explicit Resolver(const SymbolTable & symbols, const RelationshipGraph * graph = nullptr)
  : symbols_(symbols), graph_(graph)
  {
  }

  /// Resolve a reference as seen from `scope`, following aliases.
  [[nodiscard]] ResolveResult resolve(std::string_view reference, ScopeId scope) const;

  /// Look `name` up among the members inherited by the owner of `scope`.
  [[nodiscard]] ResolveResult resolve_inherited(std::string_view name, ScopeId scope) const;

  /// Follow an alias chain to the aliased element.
  [[nodiscard]] ResolveResult follow_alias(SymbolId id) const;

private:
  [[nodiscard]] ResolveResult resolve_name(std::string_view name, ScopeId scope) const;
  [[nodiscard]] ResolveResult resolve_qualified(std::string_view name, ScopeId scope) const;
  [[nodiscard]] ResolveResult resolve_chain(std::string_view chain, ScopeId scope) const;

  /// Member `name` of `owner`: declared, publicly imported, or inherited.
  [[nodiscard]] SymbolId member_of(SymbolId owner, std::string_view name) const;
  [[nodiscard]] SymbolId inherited_member(SymbolId owner, std::string_view name) const;

  const SymbolTable & symbols_;
  const RelationshipGraph * graph_;
};

}  // namespace sysml
