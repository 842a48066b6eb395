// sysml/project/project_config.hpp - Project configuration (sysml.yaml)
//
// Parses and validates sysml.yaml project configuration files.
// Shared by the CLI and the language server.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sysml
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Standard library section.
 */
struct StdlibConfig
{
  /// Load the standard library before project files
  bool enabled = true;

  /// Explicit location (relative to sysml.yaml); auto-detected when absent
  std::optional<std::filesystem::path> path;
};

/**
 * Complete project configuration (sysml.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;

  /// Files or directories holding model files, relative to sysml.yaml
  std::vector<std::filesystem::path> sources;

  StdlibConfig stdlib;

  /// Directory containing sysml.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Source entries made absolute against project_root
  [[nodiscard]] std::vector<std::filesystem::path> resolved_sources() const;

  /// Stdlib path made absolute against project_root, if configured
  [[nodiscard]] std::optional<std::filesystem::path> resolved_stdlib_path() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a sysml.yaml file.
 *
 * @param config_path Path to sysml.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to sysml.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Render the sysml.yaml written by `sysmlc init`.
 */
[[nodiscard]] std::string default_project_config(const std::string & package_name);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "sysml.yaml";

}  // namespace sysml
