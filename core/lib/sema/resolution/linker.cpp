// sysml/sema/resolution/linker.cpp - Reference linking
#include "sysml/sema/resolution/linker.hpp"

#include <string>

#include "sysml/basic/diagnostic_codes.hpp"

namespace sysml
{

namespace
{

bool links_early(const ReferenceOccurrence & ref)
{
  return (ref.kind == RelationshipKind::Specialization || ref.kind == RelationshipKind::Typing) &&
         ref.target_text.find('.') == std::string::npos;
}

bool is_feature_relationship(RelationshipKind k)
{
  return k == RelationshipKind::Redefinition || k == RelationshipKind::Subsetting ||
         k == RelationshipKind::ReferenceSubsetting;
}

}  // namespace

bool Linker::link(std::vector<ReferenceOccurrence> & references)
{
  const Resolver resolver(symbols_, &graph_);

  for (auto & ref : references) {
    if (cancel_.is_cancelled()) {
      return false;
    }
    if (links_early(ref)) {
      link_one(ref, resolver);
    }
  }
  for (auto & ref : references) {
    if (cancel_.is_cancelled()) {
      return false;
    }
    if (!links_early(ref)) {
      link_one(ref, resolver);
    }
  }
  return true;
}

void Linker::link_one(ReferenceOccurrence & ref, const Resolver & resolver)
{
  std::string source = ref.source;

  if (ref.has_subject()) {
    const ResolveResult subject = resolver.resolve(ref.subject_text, ref.scope);
    if (subject.resolved()) {
      ref.resolved_subject = subject.symbol;
      source = symbols_.get(subject.symbol).qualified_name;
    } else if (subject.status == ResolveStatus::NotFound) {
      source = ref.subject_text;
    } else {
      report(subject, ref.subject_text, ref.subject_range);
      return;
    }
  }

  // A relationship member outside any element and without a subject
  if (source.empty()) {
    return;
  }

  const ResolveResult target = resolve_target(ref, resolver);
  std::string target_name;
  if (target.resolved()) {
    ref.resolved = target.symbol;
    target_name = symbols_.get(target.symbol).qualified_name;
  } else if (target.status == ResolveStatus::NotFound) {
    target_name = ref.target_text;
  } else {
    report(target, ref.target_text, ref.range);
    return;
  }

  ref.edge_source = source;
  ref.edge_target = target_name;
  graph_.add_edge(ref.kind, source, target_name);
}

ResolveResult Linker::resolve_target(
  const ReferenceOccurrence & ref, const Resolver & resolver) const
{
  ResolveResult result = resolver.resolve(ref.target_text, ref.scope);
  if (
    !result.resolved() || result.symbol != ref.source_symbol ||
    !is_feature_relationship(ref.kind)) {
    return result;
  }

  // `attribute mass :>> mass;` names the inherited feature, not itself.
  ResolveResult inherited = resolver.resolve_inherited(ref.target_text, ref.scope);
  if (inherited.resolved() && inherited.symbol != ref.source_symbol) {
    return inherited;
  }
  return {};
}

void Linker::report(const ResolveResult & result, std::string_view text, SourceRange range)
{
  std::string names;
  for (const SymbolId id : result.candidates) {
    if (!names.empty()) {
      names += ", ";
    }
    names += symbols_.get(id).qualified_name;
  }

  if (result.status == ResolveStatus::Ambiguous) {
    diags_.report_error(range, "ambiguous reference to '" + std::string(text) + "'")
      .with_code(diag_codes::k_ambiguous_simple_name)
      .with_help("candidates: " + names);
  } else if (result.status == ResolveStatus::AliasCycle) {
    diags_.report_error(range, "alias cycle while resolving '" + std::string(text) + "'")
      .with_code(diag_codes::k_alias_cycle)
      .with_help("aliases on the cycle: " + names);
  }
}

}  // namespace sysml
