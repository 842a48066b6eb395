// sysml/driver/stdlib_finder.hpp - Standard library auto-detection
//
// Locates the model standard library. Used by sysmlc and the LSP server.
//
#pragma once

#include <filesystem>
#include <optional>

namespace sysml
{

/**
 * Try to find the standard library in standard locations.
 *
 * Search order:
 * 1. Installed path (from cmake install, SYSML_STDLIB_INSTALL_PATH)
 * 2. Relative to executable: <prefix>/share/sysml/sysml.library/
 * 3. Development layout: <build>/../sysml.library/ or <build>/../core/sysml.library/
 *
 * @return Path to stdlib directory, or nullopt if not found
 */
[[nodiscard]] std::optional<std::filesystem::path> find_stdlib();

}  // namespace sysml
