// sysml/driver/analysis.hpp - Batch analysis driver
//
// Single entry point for analyzing a set of model files or a project.
// Used by sysmlc and usable from other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "sysml/basic/diagnostic.hpp"
#include "sysml/project/project_config.hpp"
#include "sysml/workspace/workspace.hpp"

namespace sysml
{

// ============================================================================
// Analysis Options
// ============================================================================

struct AnalysisOptions
{
  /// Explicit standard library directory (overrides detection and config)
  std::optional<std::filesystem::path> stdlib_dir;

  /// Load a standard library at all
  bool use_stdlib = true;

  /// Search the standard locations when no directory is given
  bool auto_detect_stdlib = true;
};

// ============================================================================
// Analysis Result
// ============================================================================

struct AnalysisResult
{
  /// Whether analysis found no errors
  bool success = false;

  /// Analyzed input files (standard library excluded)
  size_t file_count = 0;

  /// Symbols in the published model
  size_t symbol_count = 0;

  /// Parse, IO and semantic diagnostics, plus driver errors
  DiagnosticBag diagnostics;

  /// Standard library actually loaded, if any
  std::optional<std::filesystem::path> stdlib_dir;

  /// Workspace holding sources and the model (for printing and listing)
  std::unique_ptr<Workspace> workspace;
};

/**
 * Analyze files and directories.
 *
 * Directories are searched recursively for `.sysml` and `.kerml` files.
 * A missing input is reported as an IO001 diagnostic.
 */
[[nodiscard]] AnalysisResult run_analysis(
  const std::vector<std::filesystem::path> & inputs, const AnalysisOptions & options);

/**
 * Analyze the sources of a project (sysml.yaml).
 *
 * The configuration's stdlib section applies unless `options` overrides it.
 */
[[nodiscard]] AnalysisResult run_project_analysis(
  const ProjectConfig & config, const AnalysisOptions & options);

}  // namespace sysml
