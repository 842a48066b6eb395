// sysml/basic/diagnostic.cpp - Diagnostic, builder and per-file bag
#include "sysml/basic/diagnostic.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace sysml
{

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l != nullptr ? l->range : SourceRange{};
}

std::string_view severity_to_string(Severity s) noexcept
{
  return s == Severity::Warning ? "warning" : "error";
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  SourceRange range, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  return with_label(range, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic diag)
{
  if (diag.severity == Severity::Error) {
    ++errors_;
  }
  by_file_[diag.file_id()].push_back(diagnostics_.size());
  diagnostics_.push_back(std::move(diag));
}

std::vector<Diagnostic> DiagnosticBag::for_file(FileId file) const
{
  std::vector<Diagnostic> out;
  if (const auto it = by_file_.find(file); it != by_file_.end()) {
    out.reserve(it->second.size());
    for (const size_t i : it->second) {
      out.push_back(diagnostics_[i]);
    }
  }
  return out;
}

std::vector<const Diagnostic *> DiagnosticBag::in_source_order() const
{
  std::vector<const Diagnostic *> out;
  out.reserve(diagnostics_.size());
  for (const auto & [file, indices] : by_file_) {
    const auto first = out.size();
    for (const size_t i : indices) {
      out.push_back(&diagnostics_[i]);
    }
    std::stable_sort(
      out.begin() + static_cast<std::ptrdiff_t>(first), out.end(),
      [](const Diagnostic * a, const Diagnostic * b) {
        return a->primary_range().get_begin().offset() < b->primary_range().get_begin().offset();
      });
  }
  return out;
}

size_t DiagnosticBag::count_code(std::string_view code) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(), [code](const Diagnostic & d) { return d.code == code; }));
}

}  // namespace sysml
