// sysml/sema/symbols/symbol_table.hpp - Cross-file symbol table
//
// Owns every Symbol and every Scope of one semantic model. Scopes form a
// tree rooted at k_root_scope; each non-alias symbol opens a scope for its
// members. Qualified names are derived from the scope chain on insertion.
//
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sysml/ast/ast_enums.hpp"
#include "sysml/basic/source_manager.hpp"
#include "sysml/sema/symbols/symbol.hpp"

namespace sysml
{

// ============================================================================
// Heterogeneous lookup helpers
// ============================================================================

struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

template <typename V>
using StringMap = std::unordered_map<std::string, V, StringViewHash, StringViewEqual>;

// ============================================================================
// Scope
// ============================================================================

/**
 * A name made visible in a scope by an import directive.
 *
 * Wildcard imports that bring two different symbols under one name leave
 * the binding ambiguous; the ambiguity is reported where the name is used.
 */
struct ImportBinding
{
  SymbolId symbol = k_invalid_symbol;
  ImportKind via = ImportKind::Member;
  bool is_public = false;
  bool ambiguous = false;
  std::vector<SymbolId> candidates;
};

struct Scope
{
  ScopeId id = k_root_scope;
  ScopeId parent = k_invalid_scope;
  SymbolId owner = k_invalid_symbol;  ///< Symbol that opened the scope
  std::string qualified_name;         ///< Empty for the root scope

  FileId file;
  SourceRange range;  ///< Declaration that opened the scope

  std::vector<ScopeId> children;
  StringMap<SymbolId> members;
  std::map<std::string, ImportBinding, std::less<>> imports;
};

// ============================================================================
// Lookup results
// ============================================================================

enum class LookupStatus : uint8_t {
  Found,
  NotFound,
  Ambiguous,
};

struct SimpleLookup
{
  LookupStatus status = LookupStatus::NotFound;
  SymbolId symbol = k_invalid_symbol;
  std::vector<SymbolId> candidates;  ///< Set when Ambiguous

  [[nodiscard]] bool found() const noexcept { return status == LookupStatus::Found; }
};

/// Outcome of SymbolTable::declare().
struct DeclareResult
{
  SymbolId id = k_invalid_symbol;
  SymbolId conflict = k_invalid_symbol;  ///< Existing symbol on a duplicate

  [[nodiscard]] bool ok() const noexcept { return conflict == k_invalid_symbol; }
};

/// Outcome of SymbolTable::bind_import().
enum class BindResult : uint8_t {
  Added,
  Shadowed,      ///< A local declaration of the same name wins
  AlreadyBound,  ///< Same symbol, or an existing binding that is kept
  Ambiguous,     ///< Wildcard collision; the binding is now ambiguous
};

// ============================================================================
// SymbolTable
// ============================================================================

class SymbolTable
{
public:
  SymbolTable();

  // ----------------------------------------------------------------------
  // Declaration
  // ----------------------------------------------------------------------

  /**
   * Insert a symbol into `symbol.scope`.
   *
   * The qualified name is computed from the scope chain. When a symbol with
   * the same qualified name exists, the existing one is kept and its id is
   * returned in `conflict`, except that an Alias yields to a genuine
   * declaration.
   */
  [[nodiscard]] DeclareResult declare(Symbol symbol);

  /// Set the derived flags of a symbol. Returns false if already set.
  bool set_derived_flags(SymbolId id, bool is_abstract, bool is_variation);

  /**
   * Make `symbol` visible in `scope` under `name`.
   *
   * Existing bindings are never overwritten. A collision with a different
   * symbol marks the binding ambiguous only when `wildcard` is set.
   */
  BindResult bind_import(
    ScopeId scope, std::string_view name, SymbolId symbol, ImportKind via, bool is_public,
    bool wildcard);

  // ----------------------------------------------------------------------
  // Lookup
  // ----------------------------------------------------------------------

  [[nodiscard]] const Symbol * lookup_qualified(std::string_view qualified_name) const;
  [[nodiscard]] std::optional<SymbolId> find_qualified(std::string_view qualified_name) const;

  /**
   * Resolve a simple name as seen from `scope`.
   *
   * Order: the scope and its ancestors, then import bindings of the scope and
   * its ancestors, then a workspace-wide search that succeeds only when the
   * name is unique.
   */
  [[nodiscard]] SimpleLookup lookup_simple(std::string_view name, ScopeId scope) const;

  /// Member declared directly in a scope, or made visible by a public import.
  [[nodiscard]] std::optional<SymbolId> find_member(
    ScopeId scope, std::string_view name, bool include_public_imports = true) const;

  /// Scope of the namespace with the given qualified name ("" is the root).
  [[nodiscard]] std::optional<ScopeId> find_namespace(std::string_view qualified_name) const;

  /// Innermost scope of `file` whose declaration contains `offset`.
  [[nodiscard]] ScopeId scope_at(FileId file, uint32_t offset) const;

  // ----------------------------------------------------------------------
  // Accessors
  // ----------------------------------------------------------------------

  [[nodiscard]] const Symbol & get(SymbolId id) const { return symbols_.at(id); }
  [[nodiscard]] const Scope & get_scope(ScopeId id) const { return scopes_.at(id); }

  [[nodiscard]] const std::vector<Symbol> & all_symbols() const noexcept { return symbols_; }
  [[nodiscard]] const std::vector<Scope> & all_scopes() const noexcept { return scopes_; }
  [[nodiscard]] std::vector<SymbolId> symbols_in_file(FileId file) const;

  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }
  [[nodiscard]] bool empty() const noexcept { return symbols_.empty(); }

private:
  ScopeId create_scope(ScopeId parent, SymbolId owner, const Symbol & sym);
  [[nodiscard]] std::string qualify(ScopeId scope, std::string_view name) const;

  std::vector<Symbol> symbols_;
  std::vector<Scope> scopes_;
  StringMap<SymbolId> by_qualified_name_;
  StringMap<std::vector<SymbolId>> by_simple_name_;
};

}  // namespace sysml
