// sysml/sema/resolution/resolver.cpp - Name resolution
#include "sysml/sema/resolution/resolver.hpp"

#include <deque>
#include <set>
#include <string>

namespace sysml
{

namespace
{

std::vector<std::string_view> split(std::string_view text, std::string_view sep)
{
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    const size_t pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + sep.size();
  }
  return parts;
}

ResolveResult from_lookup(const SimpleLookup & lookup)
{
  ResolveResult r;
  switch (lookup.status) {
    case LookupStatus::Found:
      return ResolveResult::found(lookup.symbol);
    case LookupStatus::Ambiguous:
      r.status = ResolveStatus::Ambiguous;
      r.candidates = lookup.candidates;
      return r;
    case LookupStatus::NotFound:
      break;
  }
  return r;
}

}  // namespace

// ============================================================================
// Public entry points
// ============================================================================

ResolveResult Resolver::resolve(std::string_view reference, ScopeId scope) const
{
  if (reference.empty()) {
    return {};
  }
  if (reference.find('.') != std::string_view::npos) {
    return resolve_chain(reference, scope);
  }

  ResolveResult r = resolve_name(reference, scope);
  return r.resolved() ? follow_alias(r.symbol) : r;
}

ResolveResult Resolver::resolve_inherited(std::string_view name, ScopeId scope) const
{
  if (scope >= symbols_.all_scopes().size()) {
    return {};
  }
  const SymbolId owner = symbols_.get_scope(scope).owner;
  if (owner == k_invalid_symbol) {
    return {};
  }
  const SymbolId member = inherited_member(owner, name);
  return member != k_invalid_symbol ? follow_alias(member) : ResolveResult{};
}

ResolveResult Resolver::follow_alias(SymbolId id) const
{
  std::vector<SymbolId> chain;
  while (id != k_invalid_symbol && symbols_.get(id).is_alias()) {
    for (const SymbolId seen : chain) {
      if (seen == id) {
        ResolveResult r;
        r.status = ResolveStatus::AliasCycle;
        r.candidates = chain;
        return r;
      }
    }
    chain.push_back(id);

    const Symbol & alias = symbols_.get(id);
    const ResolveResult target = resolve_name(alias.alias_target, alias.scope);
    if (!target.resolved()) {
      return target;
    }
    id = target.symbol;
  }
  return id != k_invalid_symbol ? ResolveResult::found(id) : ResolveResult{};
}

// ============================================================================
// Names
// ============================================================================

ResolveResult Resolver::resolve_name(std::string_view name, ScopeId scope) const
{
  if (name.find("::") != std::string_view::npos) {
    return resolve_qualified(name, scope);
  }
  return from_lookup(symbols_.lookup_simple(name, scope));
}

ResolveResult Resolver::resolve_qualified(std::string_view name, ScopeId scope) const
{
  if (auto id = symbols_.find_qualified(name)) {
    return ResolveResult::found(*id);
  }

  // Relative to an enclosing namespace
  const auto & scopes = symbols_.all_scopes();
  for (ScopeId s = scope < scopes.size() ? scope : k_root_scope; s != k_root_scope;
       s = scopes[s].parent) {
    std::string candidate = scopes[s].qualified_name;
    candidate += "::";
    candidate += name;
    if (auto id = symbols_.find_qualified(candidate)) {
      return ResolveResult::found(*id);
    }
  }

  // Head by simple lookup, then member by member
  const auto segments = split(name, "::");
  ResolveResult head = from_lookup(symbols_.lookup_simple(segments.front(), scope));
  if (!head.resolved()) {
    return head;
  }
  head = follow_alias(head.symbol);
  if (!head.resolved()) {
    return head;
  }

  SymbolId current = head.symbol;
  for (size_t i = 1; i < segments.size(); ++i) {
    const SymbolId next = member_of(current, segments[i]);
    if (next == k_invalid_symbol) {
      return {};
    }
    if (i + 1 == segments.size()) {
      return ResolveResult::found(next);
    }
    const ResolveResult step = follow_alias(next);
    if (!step.resolved()) {
      return step;
    }
    current = step.symbol;
  }
  return ResolveResult::found(current);
}

ResolveResult Resolver::resolve_chain(std::string_view chain, ScopeId scope) const
{
  const auto segments = split(chain, ".");
  ResolveResult current = resolve_name(segments.front(), scope);
  if (!current.resolved()) {
    return current;
  }
  current = follow_alias(current.symbol);

  for (size_t i = 1; i < segments.size() && current.resolved(); ++i) {
    const SymbolId next = member_of(current.symbol, segments[i]);
    if (next == k_invalid_symbol) {
      return {};
    }
    current = follow_alias(next);
  }
  return current;
}

// ============================================================================
// Members
// ============================================================================

SymbolId Resolver::member_of(SymbolId owner, std::string_view name) const
{
  const Symbol & sym = symbols_.get(owner);
  if (sym.body_scope != k_invalid_scope) {
    if (auto id = symbols_.find_member(sym.body_scope, name)) {
      return *id;
    }
  }
  return inherited_member(owner, name);
}

SymbolId Resolver::inherited_member(SymbolId owner, std::string_view name) const
{
  if (graph_ == nullptr) {
    return k_invalid_symbol;
  }

  // Breadth-first over types and supertypes; nearest declaration wins.
  std::set<std::string, std::less<>> visited;
  std::deque<std::string> queue;
  queue.push_back(symbols_.get(owner).qualified_name);
  visited.insert(queue.front());

  while (!queue.empty() && visited.size() < RelationshipGraph::k_max_walk_depth) {
    const std::string current = std::move(queue.front());
    queue.pop_front();

    std::vector<std::string> supers = graph_->targets(RelationshipKind::Typing, current);
    for (const auto kind : RelationshipGraph::k_specialization_kinds) {
      auto more = graph_->targets(kind, current);
      supers.insert(supers.end(), more.begin(), more.end());
    }

    for (auto & super : supers) {
      if (!visited.insert(super).second) {
        continue;
      }
      if (const Symbol * sym = symbols_.lookup_qualified(super);
          sym != nullptr && sym->body_scope != k_invalid_scope) {
        if (auto id = symbols_.find_member(sym->body_scope, name)) {
          return *id;
        }
      }
      queue.push_back(std::move(super));
    }
  }
  return k_invalid_symbol;
}

}  // namespace sysml
