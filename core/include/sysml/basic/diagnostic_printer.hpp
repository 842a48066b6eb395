// sysml/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
// Prints diagnostics with source context and position markers in a
// Rust-like layout.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "sysml/basic/diagnostic.hpp"
#include "sysml/basic/source_manager.hpp"

namespace sysml
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E002]: Cannot find symbol 'Engin'
 *     --> models/vehicle.sysml:5:18
 *      |
 *    5 |     part engine : Engin;
 *      |                   ^^^^^ not found
 *      |
 *      = help: check the spelling or add an import
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic, ordered by file and offset.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// Print "N error(s), M warning(s)" if any were reported.
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace sysml
