// sysml/sema/symbols/symbol_table.cpp - Cross-file symbol table
#include "sysml/sema/symbols/symbol_table.hpp"

#include <algorithm>

namespace sysml
{

SymbolTable::SymbolTable()
{
  Scope root;
  root.id = k_root_scope;
  scopes_.push_back(std::move(root));
}

// ============================================================================
// Declaration
// ============================================================================

std::string SymbolTable::qualify(ScopeId scope, std::string_view name) const
{
  const std::string & prefix = scopes_[scope].qualified_name;
  if (prefix.empty()) {
    return std::string(name);
  }
  std::string out;
  out.reserve(prefix.size() + 2 + name.size());
  out += prefix;
  out += "::";
  out += name;
  return out;
}

ScopeId SymbolTable::create_scope(ScopeId parent, SymbolId owner, const Symbol & sym)
{
  const auto id = static_cast<ScopeId>(scopes_.size());

  Scope scope;
  scope.id = id;
  scope.parent = parent;
  scope.owner = owner;
  scope.qualified_name = sym.qualified_name;
  scope.file = sym.source_file;
  scope.range = sym.decl_range;

  scopes_.push_back(std::move(scope));
  scopes_[parent].children.push_back(id);
  return id;
}

DeclareResult SymbolTable::declare(Symbol symbol)
{
  DeclareResult result;

  if (symbol.scope >= scopes_.size()) {
    symbol.scope = k_root_scope;
  }
  symbol.qualified_name = qualify(symbol.scope, symbol.simple_name);

  if (auto it = by_qualified_name_.find(symbol.qualified_name); it != by_qualified_name_.end()) {
    const SymbolId existing_id = it->second;
    if (!symbols_[existing_id].is_alias() || symbol.is_alias()) {
      result.conflict = existing_id;
      return result;
    }

    // A genuine declaration supersedes an alias of the same name.
    symbol.body_scope = create_scope(symbol.scope, existing_id, symbol);
    symbols_[existing_id] = std::move(symbol);
    result.id = existing_id;
    return result;
  }

  const auto id = static_cast<SymbolId>(symbols_.size());
  if (!symbol.is_alias()) {
    symbol.body_scope = create_scope(symbol.scope, id, symbol);
  }

  scopes_[symbol.scope].members.emplace(symbol.simple_name, id);
  by_qualified_name_.emplace(symbol.qualified_name, id);
  by_simple_name_[symbol.simple_name].push_back(id);
  symbols_.push_back(std::move(symbol));

  result.id = id;
  return result;
}

bool SymbolTable::set_derived_flags(SymbolId id, bool is_abstract, bool is_variation)
{
  if (id >= symbols_.size()) {
    return false;
  }
  Symbol & sym = symbols_[id];
  if (sym.flags_extracted) {
    return false;
  }
  sym.is_abstract = is_abstract;
  sym.is_variation = is_variation;
  sym.flags_extracted = true;
  return true;
}

BindResult SymbolTable::bind_import(
  ScopeId scope, std::string_view name, SymbolId symbol, ImportKind via, bool is_public,
  bool wildcard)
{
  if (scope >= scopes_.size() || symbol >= symbols_.size()) {
    return BindResult::AlreadyBound;
  }

  Scope & target = scopes_[scope];
  if (target.members.find(name) != target.members.end()) {
    return BindResult::Shadowed;
  }

  auto it = target.imports.find(name);
  if (it == target.imports.end()) {
    ImportBinding binding;
    binding.symbol = symbol;
    binding.via = via;
    binding.is_public = is_public;
    target.imports.emplace(std::string(name), std::move(binding));
    return BindResult::Added;
  }

  ImportBinding & binding = it->second;
  const bool known =
    binding.symbol == symbol ||
    std::find(binding.candidates.begin(), binding.candidates.end(), symbol) !=
      binding.candidates.end();
  if (known || !wildcard || binding.via == ImportKind::Member) {
    return BindResult::AlreadyBound;
  }

  if (binding.candidates.empty()) {
    binding.candidates.push_back(binding.symbol);
  }
  binding.candidates.push_back(symbol);
  binding.ambiguous = true;
  return BindResult::Ambiguous;
}

// ============================================================================
// Lookup
// ============================================================================

const Symbol * SymbolTable::lookup_qualified(std::string_view qualified_name) const
{
  auto it = by_qualified_name_.find(qualified_name);
  return it != by_qualified_name_.end() ? &symbols_[it->second] : nullptr;
}

std::optional<SymbolId> SymbolTable::find_qualified(std::string_view qualified_name) const
{
  auto it = by_qualified_name_.find(qualified_name);
  if (it == by_qualified_name_.end()) {
    return std::nullopt;
  }
  return it->second;
}

SimpleLookup SymbolTable::lookup_simple(std::string_view name, ScopeId scope) const
{
  SimpleLookup result;
  if (scope >= scopes_.size()) {
    scope = k_root_scope;
  }

  for (ScopeId s = scope; s != k_invalid_scope; s = scopes_[s].parent) {
    const auto & members = scopes_[s].members;
    if (auto it = members.find(name); it != members.end()) {
      result.status = LookupStatus::Found;
      result.symbol = it->second;
      return result;
    }
  }

  for (ScopeId s = scope; s != k_invalid_scope; s = scopes_[s].parent) {
    const auto & imports = scopes_[s].imports;
    auto it = imports.find(name);
    if (it == imports.end()) {
      continue;
    }
    if (it->second.ambiguous) {
      result.status = LookupStatus::Ambiguous;
      result.candidates = it->second.candidates;
    } else {
      result.status = LookupStatus::Found;
      result.symbol = it->second.symbol;
    }
    return result;
  }

  auto it = by_simple_name_.find(name);
  if (it == by_simple_name_.end() || it->second.empty()) {
    return result;
  }
  if (it->second.size() == 1) {
    result.status = LookupStatus::Found;
    result.symbol = it->second.front();
  } else {
    result.status = LookupStatus::Ambiguous;
    result.candidates = it->second;
  }
  return result;
}

std::optional<SymbolId> SymbolTable::find_member(
  ScopeId scope, std::string_view name, bool include_public_imports) const
{
  if (scope >= scopes_.size()) {
    return std::nullopt;
  }
  const Scope & s = scopes_[scope];
  if (auto it = s.members.find(name); it != s.members.end()) {
    return it->second;
  }
  if (include_public_imports) {
    auto it = s.imports.find(name);
    if (it != s.imports.end() && it->second.is_public && !it->second.ambiguous) {
      return it->second.symbol;
    }
  }
  return std::nullopt;
}

std::optional<ScopeId> SymbolTable::find_namespace(std::string_view qualified_name) const
{
  if (qualified_name.empty()) {
    return k_root_scope;
  }
  auto id = find_qualified(qualified_name);
  if (!id || symbols_[*id].body_scope == k_invalid_scope) {
    return std::nullopt;
  }
  return symbols_[*id].body_scope;
}

ScopeId SymbolTable::scope_at(FileId file, uint32_t offset) const
{
  ScopeId best = k_root_scope;
  uint32_t best_size = UINT32_MAX;
  for (const auto & scope : scopes_) {
    if (scope.id == k_root_scope || scope.file != file || !scope.range.touches(offset)) {
      continue;
    }
    if (scope.range.size() < best_size) {
      best = scope.id;
      best_size = scope.range.size();
    }
  }
  return best;
}

// ============================================================================
// Accessors
// ============================================================================

std::vector<SymbolId> SymbolTable::symbols_in_file(FileId file) const
{
  std::vector<SymbolId> out;
  for (SymbolId id = 0; id < symbols_.size(); ++id) {
    if (symbols_[id].source_file == file) {
      out.push_back(id);
    }
  }
  return out;
}

}  // namespace sysml
