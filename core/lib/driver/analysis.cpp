// sysml/driver/analysis.cpp - Batch analysis driver implementation
//
#include "sysml/driver/analysis.hpp"

#include "sysml/basic/diagnostic_codes.hpp"
#include "sysml/driver/stdlib_finder.hpp"
#include "sysml/workspace/stdlib_loader.hpp"

namespace sysml
{

namespace fs = std::filesystem;

namespace
{

std::optional<fs::path> pick_stdlib(const AnalysisOptions & options)
{
  if (!options.use_stdlib) {
    return std::nullopt;
  }
  if (options.stdlib_dir) {
    return options.stdlib_dir;
  }
  if (options.auto_detect_stdlib) {
    return find_stdlib();
  }
  return std::nullopt;
}

}  // namespace

AnalysisResult run_analysis(const std::vector<fs::path> & inputs, const AnalysisOptions & options)
{
  AnalysisResult result;
  result.workspace = std::make_unique<Workspace>();
  Workspace & ws = *result.workspace;

  if (auto stdlib = pick_stdlib(options)) {
    std::error_code ec;
    if (fs::is_directory(*stdlib, ec)) {
      (void)ws.load_stdlib(*stdlib);
      result.stdlib_dir = std::move(stdlib);
    } else {
      result.diagnostics
        .report_error(SourceRange{}, "standard library not found: " + stdlib->string())
        .with_code(diag_codes::k_read_failure);
    }
  }

  for (const auto & input : inputs) {
    std::error_code ec;
    if (!fs::exists(input, ec)) {
      result.diagnostics.report_error(SourceRange{}, "file not found: " + input.string())
        .with_code(diag_codes::k_read_failure);
      continue;
    }
    for (const auto & file : collect_model_files(input)) {
      if (!ws.add_file(file).is_valid()) {
        result.diagnostics.report_error(SourceRange{}, "too many files: " + file.string())
          .with_code(diag_codes::k_read_failure);
      }
    }
  }
  for (const auto & info : ws.files()) {
    if (!info.is_stdlib) {
      ++result.file_count;
    }
  }

  const PopulateResult populated = ws.populate_all();
  const WorkspaceView view = ws.view();
  if (populated.cancelled()) {
    result.diagnostics.report_error(SourceRange{}, "analysis was cancelled");
  }

  for (const auto & d : view.all_diagnostics()) {
    result.diagnostics.add(d);
  }
  result.symbol_count = view.symbol_count();
  result.success = !result.diagnostics.has_errors();
  return result;
}

AnalysisResult run_project_analysis(const ProjectConfig & config, const AnalysisOptions & options)
{
  AnalysisOptions effective = options;
  if (!config.stdlib.enabled && !options.stdlib_dir) {
    effective.use_stdlib = false;
  }
  if (!effective.stdlib_dir) {
    effective.stdlib_dir = config.resolved_stdlib_path();
  }
  return run_analysis(config.resolved_sources(), effective);
}

}  // namespace sysml
