// sysml/sema/resolution/import_resolver.cpp - Three-pass import resolution
#include "sysml/sema/resolution/import_resolver.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

#include "sysml/basic/diagnostic_codes.hpp"
#include "sysml/sema/resolution/resolver.hpp"

namespace sysml
{

namespace
{

std::string_view last_segment(std::string_view qualified)
{
  const size_t pos = qualified.rfind("::");
  return pos == std::string_view::npos ? qualified : qualified.substr(pos + 2);
}

}  // namespace

bool ImportResolver::resolve_all(std::vector<ImportDirective> & directives)
{
  return run_namespace_pass(directives) && run_member_pass(directives) &&
         run_recursive_pass(directives);
}

// ============================================================================
// Passes
// ============================================================================

bool ImportResolver::run_namespace_pass(std::vector<ImportDirective> & directives)
{
  for (auto & d : directives) {
    if (cancel_.is_cancelled()) {
      return false;
    }
    if (d.kind != ImportKind::Namespace) {
      continue;
    }

    auto ns = resolve_namespace(d.target, d.importing_scope);
    if (!ns) {
      report_unresolved(d);
      continue;
    }
    d.resolved = *ns;
    bind_members_of(symbols_.get(*ns).body_scope, d, false);
  }
  return !cancel_.is_cancelled();
}

bool ImportResolver::run_member_pass(std::vector<ImportDirective> & directives)
{
  for (auto & d : directives) {
    if (cancel_.is_cancelled()) {
      return false;
    }
    if (d.kind != ImportKind::Member) {
      continue;
    }

    auto member = resolve_member(d.target, d.importing_scope);
    if (!member) {
      report_unresolved(d);
      continue;
    }
    d.resolved = *member;
    bind(d, last_segment(d.target), *member, false);
  }
  return !cancel_.is_cancelled();
}

bool ImportResolver::run_recursive_pass(std::vector<ImportDirective> & directives)
{
  for (auto & d : directives) {
    if (cancel_.is_cancelled()) {
      return false;
    }
    if (d.kind != ImportKind::Recursive) {
      continue;
    }

    auto ns = resolve_namespace(d.target, d.importing_scope);
    if (!ns) {
      report_unresolved(d);
      continue;
    }
    d.resolved = *ns;

    if (!walk_recursive(symbols_.get(*ns).body_scope, d)) {
      return false;
    }
  }
  return !cancel_.is_cancelled();
}

bool ImportResolver::walk_recursive(ScopeId root, const ImportDirective & d)
{
  // Nested namespaces are reached through declarations and through public
  // imports alike, so the walk follows both and may revisit a scope.
  std::set<ScopeId> visited;
  std::vector<ScopeId> worklist{root};

  while (!worklist.empty()) {
    if (cancel_.is_cancelled()) {
      return false;
    }
    const ScopeId current = worklist.back();
    worklist.pop_back();
    if (!visited.insert(current).second) {
      continue;
    }

    bind_members_of(current, d, true);

    // Declared children are walked before imported namespaces.
    const Scope & scope = symbols_.get_scope(current);
    for (const auto & [name, binding] : scope.imports) {
      if (!binding.is_public || binding.ambiguous) {
        continue;
      }
      const ScopeId body = symbols_.get(binding.symbol).body_scope;
      if (body != k_invalid_scope) {
        worklist.push_back(body);
      }
    }
    worklist.insert(worklist.end(), scope.children.rbegin(), scope.children.rend());
  }
  return true;
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<SymbolId> ImportResolver::resolve_namespace(
  std::string_view target, ScopeId from) const
{
  const Resolver resolver(symbols_);
  const ResolveResult r = resolver.resolve(target, from);
  if (!r.resolved() || symbols_.get(r.symbol).body_scope == k_invalid_scope) {
    return std::nullopt;
  }
  return r.symbol;
}

std::optional<SymbolId> ImportResolver::resolve_member(std::string_view target, ScopeId from) const
{
  const Resolver resolver(symbols_);
  const ResolveResult r = resolver.resolve(target, from);
  if (!r.resolved()) {
    return std::nullopt;
  }
  return r.symbol;
}

void ImportResolver::bind_members_of(
  ScopeId source, const ImportDirective & d, bool include_public_imports)
{
  // Snapshot first: binding may add to the scope being read.
  const Scope & scope = symbols_.get_scope(source);
  std::vector<std::pair<std::string, SymbolId>> visible;
  visible.reserve(scope.members.size());
  for (const auto & [name, id] : scope.members) {
    visible.emplace_back(name, id);
  }
  std::sort(visible.begin(), visible.end(), [](const auto & a, const auto & b) {
    return a.second < b.second;
  });

  if (include_public_imports) {
    for (const auto & [name, binding] : scope.imports) {
      if (binding.is_public && !binding.ambiguous) {
        visible.emplace_back(name, binding.symbol);
      }
    }
  }

  for (const auto & [name, id] : visible) {
    if (symbols_.get(id).visibility == Visibility::Private) {
      continue;
    }
    bind(d, name, id, true);
  }
}

void ImportResolver::bind(
  const ImportDirective & d, std::string_view name, SymbolId symbol, bool wildcard)
{
  const BindResult result = symbols_.bind_import(
    d.importing_scope, name, symbol, d.kind, d.visibility == Visibility::Public, wildcard);
  if (result == BindResult::Added) {
    ++bindings_added_;
  }
}

void ImportResolver::report_unresolved(const ImportDirective & d)
{
  diags_.report_error(d.range, "cannot resolve import '" + d.target + "'")
    .with_code(diag_codes::k_unresolved_import);
}

}  // namespace sysml
