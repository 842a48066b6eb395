// sysml/sema/resolution/references.hpp - Recorded import directives and references
//
// Population records these from the syntax tree; resolution fills in the
// results. Both outlive the tree they were read from.
//
#pragma once

#include <string>

#include "sysml/ast/ast_enums.hpp"
#include "sysml/basic/source_manager.hpp"
#include "sysml/sema/symbols/symbol.hpp"

namespace sysml
{

/**
 * An `import` directive, kept until every file has been populated.
 */
struct ImportDirective
{
  ImportKind kind = ImportKind::Member;
  std::string target;  ///< Qualified name without `::*` / `::**`
  ScopeId importing_scope = k_root_scope;
  Visibility visibility = Visibility::Private;
  FileId file;
  SourceRange range;

  // Filled by the ImportResolver
  SymbolId resolved = k_invalid_symbol;  ///< Imported member, or the namespace owner
};

/**
 * A reference written in a relationship clause or relationship member.
 *
 * `source` is the qualified name of the element that owns the clause. For
 * `satisfy R by S`, the subject `S` is itself a reference and replaces the
 * owner as the edge source once resolved.
 */
struct ReferenceOccurrence
{
  RelationshipKind kind = RelationshipKind::Typing;
  std::string source;
  SymbolId source_symbol = k_invalid_symbol;

  std::string target_text;  ///< As written
  SourceRange range;        ///< Range of the target text
  ScopeId scope = k_root_scope;
  FileId file;

  std::string subject_text;  ///< `by` subject, empty if absent
  SourceRange subject_range;

  // Filled by the Linker
  SymbolId resolved = k_invalid_symbol;
  SymbolId resolved_subject = k_invalid_symbol;
  std::string edge_source;  ///< Source of the linked edge
  std::string edge_target;  ///< Target of the linked edge; empty if linking stopped at E013/E014

  [[nodiscard]] bool has_subject() const noexcept { return !subject_text.empty(); }
};

}  // namespace sysml
