// sysml/sema/symbols/symbol.hpp - Semantic entities of the model
//
// A Symbol is a named element of the cross-file model. Symbols are owned by
// the SymbolTable and addressed by SymbolId; scopes are addressed by ScopeId.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "sysml/ast/ast_enums.hpp"
#include "sysml/basic/source_manager.hpp"

namespace sysml
{

// ============================================================================
// Identifiers
// ============================================================================

using SymbolId = uint32_t;
using ScopeId = uint32_t;

inline constexpr SymbolId k_invalid_symbol = UINT32_MAX;
inline constexpr ScopeId k_invalid_scope = UINT32_MAX;
inline constexpr ScopeId k_root_scope = 0;

// ============================================================================
// SymbolKind / SemanticRole
// ============================================================================

enum class SymbolKind : uint8_t {
  Package,
  Classifier,  ///< KerML class, datatype, behavior, ...
  Feature,     ///< KerML feature
  Definition,  ///< SysML `<kind> def`
  Usage,       ///< SysML usage
  Alias,
};

/**
 * What an element means in the modeling domain, independent of whether it
 * is a definition or a usage. Used to validate domain relationships
 * (a `satisfy` must point at a Requirement, ...).
 */
enum class SemanticRole : uint8_t {
  Requirement,
  Action,
  State,
  UseCase,
  Component,
  Interface,
  Port,
  Attribute,
  Connection,
  Constraint,
  AnalysisCase,
  VerificationCase,
  View,
  Metadata,
  Item,
  Flow,
  Allocation,
  Classifier,
  Feature,
  Package,
  Unknown,
};

[[nodiscard]] std::string_view to_string(SymbolKind k) noexcept;
[[nodiscard]] std::string_view to_string(SemanticRole r) noexcept;

/// Role implied by the keyword that introduced an element.
[[nodiscard]] SemanticRole role_for(ElementKind k) noexcept;

// ============================================================================
// Symbol
// ============================================================================

/**
 * A named semantic entity.
 *
 * `qualified_name` is assigned by the SymbolTable from the owning scope chain
 * and never changes afterwards. The only fields written after insertion are
 * the derived flags, which the Analyzer sets once through
 * SymbolTable::set_derived_flags().
 */
struct Symbol
{
  SymbolKind kind = SymbolKind::Usage;
  std::string simple_name;
  std::string qualified_name;

  ScopeId scope = k_root_scope;          ///< Owning scope
  ScopeId body_scope = k_invalid_scope;  ///< Scope opened by this symbol (members)

  FileId source_file;
  SourceRange source_span;  ///< Name (or the whole element when unnamed)
  SourceRange decl_range;   ///< Whole declaration

  Visibility visibility = Visibility::Public;
  SemanticRole semantic_role = SemanticRole::Unknown;
  Direction direction = Direction::None;
  ElementKind element_kind = ElementKind::Part;  ///< Meaningful for element symbols

  // Syntactic prefixes as written
  bool has_abstract_prefix = false;
  bool has_variation_prefix = false;

  // Derived flags (Analyzer, exactly once)
  bool is_abstract = false;
  bool is_variation = false;
  bool flags_extracted = false;

  std::string alias_target;  ///< Alias only: target as written, resolved lazily
  std::string documentation;

  [[nodiscard]] bool is_alias() const noexcept { return kind == SymbolKind::Alias; }

  /// "part def", "attribute", "package", ...
  [[nodiscard]] std::string keyword() const;
};

}  // namespace sysml
