// sysml/basic/diagnostic.hpp - Diagnostic types shared by every phase
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sysml/basic/source_manager.hpp"

namespace sysml
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
};

enum class LabelStyle : uint8_t {
  Primary,    // Direct cause
  Secondary,  // Related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "E001"
  std::string message;  // Main message

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;

  /// File of the primary label (invalid when the diagnostic has no location).
  [[nodiscard]] FileId file_id() const noexcept { return primary_range().file_id(); }
};

[[nodiscard]] std::string_view severity_to_string(Severity s) noexcept;

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder; the diagnostic is added to its bag when the builder is
 * destroyed.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Diagnostics in report order, indexed by the file of their primary label.
 *
 * Diagnostics without a location are kept under FileId::invalid(), which
 * sorts after every real file.
 */
class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  // Builder Starters
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const noexcept
  {
    return severity == Severity::Error ? errors_ : diagnostics_.size() - errors_;
  }
  [[nodiscard]] bool has_errors() const noexcept { return errors_ > 0; }

  /// Diagnostics whose primary label lies in `file`, in report order.
  [[nodiscard]] std::vector<Diagnostic> for_file(FileId file) const;

  /// Every diagnostic, ordered by file and then by start offset.
  [[nodiscard]] std::vector<const Diagnostic *> in_source_order() const;

  /// Number of diagnostics carrying `code`.
  [[nodiscard]] size_t count_code(std::string_view code) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
  std::map<FileId, std::vector<size_t>> by_file_;
  size_t errors_ = 0;
};

}  // namespace sysml
