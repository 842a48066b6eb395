// sysml/workspace/workspace_view.cpp - Read-only queries over a published model
#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <string_view>

#include "sysml/sema/resolution/resolver.hpp"
#include "sysml/workspace/workspace.hpp"

namespace sysml
{

SymbolView WorkspaceView::make_view(const Symbol & sym) const
{
  SymbolView v;
  v.kind = sym.kind;
  v.qualified_name = sym.qualified_name;
  v.simple_name = sym.simple_name;
  v.keyword = sym.keyword();
  v.file = sym.source_file;
  v.span = sym.source_span;
  v.decl_range = sym.decl_range;
  v.visibility = sym.visibility;
  v.role = sym.semantic_role;
  v.direction = sym.direction;
  v.is_abstract = sym.is_abstract;
  v.is_variation = sym.is_variation;
  v.type = snapshot_->model.graph.type_of(sym.qualified_name);
  v.alias_target = sym.alias_target;
  v.documentation = sym.documentation;
  return v;
}

// ============================================================================
// Symbols
// ============================================================================

std::optional<SymbolView> WorkspaceView::lookup_qualified(std::string_view name) const
{
  const Symbol * sym = snapshot_->model.symbols.lookup_qualified(name);
  if (sym == nullptr) {
    return std::nullopt;
  }
  return make_view(*sym);
}

std::optional<SymbolView> WorkspaceView::lookup_simple(
  std::string_view name, FileId file, uint32_t offset) const
{
  const SymbolTable & symbols = snapshot_->model.symbols;
  const Resolver resolver(symbols, &snapshot_->model.graph);
  const ResolveResult r = resolver.resolve(name, symbols.scope_at(file, offset));
  if (!r.resolved()) {
    return std::nullopt;
  }
  return make_view(symbols.get(r.symbol));
}

std::vector<SymbolView> WorkspaceView::visible_at(FileId file, uint32_t offset) const
{
  const SymbolTable & symbols = snapshot_->model.symbols;
  std::set<std::string, std::less<>> seen;
  std::vector<SymbolView> out;

  for (ScopeId s = symbols.scope_at(file, offset); s != k_invalid_scope;
       s = symbols.get_scope(s).parent) {
    const Scope & scope = symbols.get_scope(s);

    // Local declarations shadow import bindings of the same scope
    std::map<std::string_view, SymbolId> names;
    for (const auto & [name, id] : scope.members) {
      names.emplace(name, id);
    }
    for (const auto & [name, binding] : scope.imports) {
      if (!binding.ambiguous && binding.symbol != k_invalid_symbol) {
        names.emplace(name, binding.symbol);
      }
    }

    for (const auto & [name, id] : names) {
      if (!name.empty() && seen.insert(std::string(name)).second) {
        out.push_back(make_view(symbols.get(id)));
      }
    }
  }
  return out;
}

std::vector<SymbolView> WorkspaceView::members_of(
  std::string_view reference, FileId file, uint32_t offset) const
{
  const SymbolTable & symbols = snapshot_->model.symbols;
  const Resolver resolver(symbols, &snapshot_->model.graph);
  const ResolveResult r = resolver.resolve(reference, symbols.scope_at(file, offset));
  if (!r.resolved() || symbols.get(r.symbol).body_scope == k_invalid_scope) {
    return {};
  }

  const Scope & scope = symbols.get_scope(symbols.get(r.symbol).body_scope);
  std::map<std::string_view, SymbolId> names;
  for (const auto & [name, id] : scope.members) {
    if (!name.empty() && symbols.get(id).visibility != Visibility::Private) {
      names.emplace(name, id);
    }
  }
  for (const auto & [name, binding] : scope.imports) {
    if (binding.is_public && !binding.ambiguous && binding.symbol != k_invalid_symbol) {
      names.emplace(name, binding.symbol);
    }
  }

  std::vector<SymbolView> out;
  out.reserve(names.size());
  for (const auto & [name, id] : names) {
    out.push_back(make_view(symbols.get(id)));
  }
  return out;
}

std::vector<SymbolView> WorkspaceView::symbols_in_file(FileId file) const
{
  const SymbolTable & symbols = snapshot_->model.symbols;
  std::vector<SymbolView> out;
  for (const SymbolId id : symbols.symbols_in_file(file)) {
    out.push_back(make_view(symbols.get(id)));
  }
  return out;
}

std::vector<SymbolView> WorkspaceView::all_symbols() const
{
  std::vector<SymbolView> out;
  out.reserve(snapshot_->model.symbols.size());
  for (const Symbol & sym : snapshot_->model.symbols.all_symbols()) {
    out.push_back(make_view(sym));
  }
  return out;
}

size_t WorkspaceView::symbol_count() const noexcept { return snapshot_->model.symbols.size(); }

std::optional<SymbolView> WorkspaceView::symbol_at(FileId file, uint32_t offset) const
{
  auto hit = hit_at(file, offset);
  if (!hit) {
    return std::nullopt;
  }
  return std::move(hit->symbol);
}

std::optional<SymbolHit> WorkspaceView::hit_at(FileId file, uint32_t offset) const
{
  const SymbolTable & symbols = snapshot_->model.symbols;

  // A reference under the cursor wins over a declaration: an anonymous
  // redefinition is declared on the very name it redefines.
  for (const auto & ref : snapshot_->model.references) {
    if (ref.file != file) {
      continue;
    }
    if (ref.resolved != k_invalid_symbol && ref.range.touches(offset)) {
      return SymbolHit{make_view(symbols.get(ref.resolved)), ref.range, true};
    }
    if (ref.resolved_subject != k_invalid_symbol && ref.subject_range.touches(offset)) {
      return SymbolHit{make_view(symbols.get(ref.resolved_subject)), ref.subject_range, true};
    }
  }

  const Symbol * best = nullptr;
  for (const SymbolId id : symbols.symbols_in_file(file)) {
    const Symbol & sym = symbols.get(id);
    if (!sym.source_span.touches(offset)) {
      continue;
    }
    if (best == nullptr || sym.source_span.size() < best->source_span.size()) {
      best = &sym;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return SymbolHit{make_view(*best), best->source_span, false};
}

// ============================================================================
// Relationships
// ============================================================================

std::vector<std::string> WorkspaceView::specializations_of(std::string_view name) const
{
  return snapshot_->model.graph.specializations_of(name);
}

bool WorkspaceView::is_specialization(std::string_view a, std::string_view b) const
{
  return snapshot_->model.graph.is_specialization(a, b);
}

std::vector<std::string> WorkspaceView::satisfactions_of(std::string_view requirement) const
{
  return snapshot_->model.graph.satisfactions_of(requirement);
}

std::vector<ReferenceLocation> WorkspaceView::references_to(std::string_view name) const
{
  const SymbolTable & symbols = snapshot_->model.symbols;
  const auto target = symbols.find_qualified(name);
  if (!target) {
    return {};
  }

  std::vector<ReferenceLocation> out;
  for (const auto & ref : snapshot_->model.references) {
    if (ref.resolved == *target) {
      out.push_back(ReferenceLocation{ref.file, ref.range, ref.kind, ref.source});
    }
    if (ref.resolved_subject == *target) {
      out.push_back(ReferenceLocation{ref.file, ref.subject_range, ref.kind, ref.source});
    }
  }
  return out;
}

// ============================================================================
// Files
// ============================================================================

std::vector<Diagnostic> WorkspaceView::diagnostics(FileId file) const
{
  std::vector<Diagnostic> out;
  if (auto it = snapshot_->parsed.find(file); it != snapshot_->parsed.end()) {
    const auto & parse_diags = it->second->diags.all();
    out.insert(out.end(), parse_diags.begin(), parse_diags.end());
  }
  auto semantic = snapshot_->model.diagnostics.for_file(file);
  out.insert(out.end(), semantic.begin(), semantic.end());
  return out;
}

std::vector<Diagnostic> WorkspaceView::all_diagnostics() const
{
  std::vector<Diagnostic> out;
  for (const auto & [id, parsed] : snapshot_->parsed) {
    const auto & parse_diags = parsed->diags.all();
    out.insert(out.end(), parse_diags.begin(), parse_diags.end());
  }
  const auto & semantic = snapshot_->model.diagnostics.all();
  out.insert(out.end(), semantic.begin(), semantic.end());
  return out;
}

std::vector<FileId> WorkspaceView::affected_files(FileId file) const
{
  return snapshot_->dependencies.affected_files(file);
}

}  // namespace sysml
