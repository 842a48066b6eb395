// sysml/workspace/stdlib_loader.hpp - Model file discovery
#pragma once

#include <filesystem>
#include <vector>

namespace sysml
{

/// True for `.sysml` and `.kerml` files.
[[nodiscard]] bool is_model_file(const std::filesystem::path & path);

/**
 * Every model file under `dir`, recursively, sorted by path.
 *
 * A regular file is returned as-is when it is a model file. Unreadable
 * directories are skipped.
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_model_files(
  const std::filesystem::path & dir);

}  // namespace sysml
