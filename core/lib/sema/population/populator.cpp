// sysml/sema/population/populator.cpp - Syntax tree to symbol table
#include "sysml/sema/population/populator.hpp"

#include <string>

#include "sysml/basic/casting.hpp"
#include "sysml/basic/diagnostic_codes.hpp"

namespace sysml
{

namespace
{

SymbolKind symbol_kind_for(NodeKind k)
{
  switch (k) {
    case NodeKind::Definition:
      return SymbolKind::Definition;
    case NodeKind::Classifier:
      return SymbolKind::Classifier;
    case NodeKind::Feature:
      return SymbolKind::Feature;
    default:
      return SymbolKind::Usage;
  }
}

}  // namespace

size_t Populator::populate(const SourceUnit & unit, FileId file)
{
  file_ = file;
  declared_ = 0;
  visit_members(unit.members, k_root_scope, k_invalid_symbol);
  return declared_;
}

void Populator::visit_members(gsl::span<AstNode * const> members, ScopeId scope, SymbolId owner)
{
  for (const AstNode * member : members) {
    if (member != nullptr) {
      visit(*member, scope, owner);
    }
  }
}

void Populator::visit(const AstNode & node, ScopeId scope, SymbolId owner)
{
  switch (node.get_kind()) {
    case NodeKind::SourceUnit:
      visit_members(cast<SourceUnit>(&node)->members, scope, owner);
      break;
    case NodeKind::Package:
      declare_package(*cast<PackageDecl>(&node), scope);
      break;
    case NodeKind::Import:
      record_import(*cast<ImportDecl>(&node), scope);
      break;
    case NodeKind::Alias:
      declare_alias(*cast<AliasDecl>(&node), scope);
      break;
    case NodeKind::Definition:
    case NodeKind::Usage:
    case NodeKind::Classifier:
    case NodeKind::Feature:
      declare_element(*cast<ElementDecl>(&node), scope);
      break;
    case NodeKind::RelationshipPart:
      record_relationship(*cast<RelationshipPart>(&node), scope, owner);
      break;
    case NodeKind::ValueExpression:
      // Values are never declarations
      break;
  }
}

// ============================================================================
// Declarations
// ============================================================================

SymbolId Populator::declare(Symbol symbol)
{
  const SourceRange span = symbol.source_span;
  const DeclareResult result = symbols_.declare(std::move(symbol));

  if (!result.ok()) {
    const Symbol & existing = symbols_.get(result.conflict);
    diags_
      .report_error(
        span, "duplicate definition of '" + existing.qualified_name + "'", "redefined here")
      .with_code(diag_codes::k_duplicate_definition)
      .with_secondary_label(existing.source_span, "previous definition is here");
    return k_invalid_symbol;
  }

  ++declared_;
  return result.id;
}

void Populator::declare_package(const PackageDecl & decl, ScopeId scope)
{
  Symbol sym;
  sym.kind = SymbolKind::Package;
  sym.simple_name = std::string(decl.name);
  sym.scope = scope;
  sym.source_file = file_;
  sym.source_span = decl.name_range.is_valid() ? decl.name_range : decl.get_range();
  sym.decl_range = decl.get_range();
  sym.visibility = decl.visibility;
  sym.semantic_role = SemanticRole::Package;
  sym.documentation = std::string(decl.doc);

  const SymbolId id = declare(std::move(sym));
  if (id == k_invalid_symbol) {
    return;
  }
  visit_members(decl.members, symbols_.get(id).body_scope, id);
}

void Populator::declare_element(const ElementDecl & decl, ScopeId scope)
{
  std::string name(decl.name);
  SourceRange span = decl.name_range;

  if (name.empty()) {
    // An unnamed usage takes the name of the feature it redefines, when that
    // is a plain name not already declared here. Otherwise it has no symbol.
    const RelationshipPart * redef = decl.first_relationship(RelationshipKind::Redefinition);
    if (
      redef == nullptr || redef->is_qualified_target() ||
      redef->target.find('.') != std::string_view::npos) {
      return;
    }
    if (symbols_.find_member(scope, redef->target, false)) {
      return;
    }
    name = std::string(redef->target);
    span = redef->target_range;
  }

  Symbol sym;
  sym.kind = symbol_kind_for(decl.get_kind());
  sym.simple_name = std::move(name);
  sym.scope = scope;
  sym.source_file = file_;
  sym.source_span = span.is_valid() ? span : decl.get_range();
  sym.decl_range = decl.get_range();
  sym.visibility = decl.visibility;
  sym.semantic_role = role_for(decl.element_kind);
  sym.direction = decl.direction;
  sym.element_kind = decl.element_kind;
  sym.has_abstract_prefix = decl.is_abstract;
  sym.has_variation_prefix = decl.is_variation;
  sym.documentation = std::string(decl.doc);

  const SymbolId id = declare(std::move(sym));
  if (id == k_invalid_symbol) {
    return;
  }

  const ScopeId body = symbols_.get(id).body_scope;
  for (const RelationshipPart * rel : decl.relationships) {
    ReferenceOccurrence ref;
    ref.kind = rel->rel_kind;
    ref.source = symbols_.get(id).qualified_name;
    ref.source_symbol = id;
    ref.target_text = std::string(rel->target);
    ref.range = rel->target_range;
    ref.scope = scope;
    ref.file = file_;
    references_.push_back(std::move(ref));
  }

  visit_members(decl.members, body, id);
}

void Populator::declare_alias(const AliasDecl & decl, ScopeId scope)
{
  Symbol sym;
  sym.kind = SymbolKind::Alias;
  sym.simple_name = std::string(decl.name);
  sym.scope = scope;
  sym.source_file = file_;
  sym.source_span = decl.name_range.is_valid() ? decl.name_range : decl.get_range();
  sym.decl_range = decl.get_range();
  sym.visibility = decl.visibility;
  sym.alias_target = std::string(decl.target);
  sym.documentation = std::string(decl.doc);

  (void)declare(std::move(sym));
}

// ============================================================================
// Directives and references
// ============================================================================

void Populator::record_import(const ImportDecl & decl, ScopeId scope)
{
  ImportDirective d;
  d.kind = decl.import_kind;
  d.target = std::string(decl.target);
  d.importing_scope = scope;
  d.visibility = decl.visibility;
  d.file = file_;
  d.range = decl.get_range();
  imports_.push_back(std::move(d));
}

void Populator::record_relationship(const RelationshipPart & rel, ScopeId scope, SymbolId owner)
{
  ReferenceOccurrence ref;
  ref.kind = rel.rel_kind;
  if (owner != k_invalid_symbol) {
    ref.source = symbols_.get(owner).qualified_name;
    ref.source_symbol = owner;
  }
  ref.target_text = std::string(rel.target);
  ref.range = rel.target_range;
  ref.scope = scope;
  ref.file = file_;
  ref.subject_text = std::string(rel.subject);
  ref.subject_range = rel.subject_range;
  references_.push_back(std::move(ref));
}

}  // namespace sysml
