// sysml/driver/stdlib_finder.cpp - Standard library auto-detection
//
#include "sysml/driver/stdlib_finder.hpp"

namespace fs = std::filesystem;

namespace sysml
{

std::optional<fs::path> find_stdlib()
{
  // 1. Check installed path (from cmake install)
#ifdef SYSML_STDLIB_INSTALL_PATH
  {
    fs::path installed = SYSML_STDLIB_INSTALL_PATH;
    std::error_code ec;
    if (fs::is_directory(installed, ec)) {
      return installed;
    }
  }
#endif

  // 2. Check relative to executable location
  // Typical layout:
  //   Installed: <prefix>/bin/sysmlc, <prefix>/share/sysml/sysml.library/
  //   Development: <build>/sysmlc, <repo>/core/sysml.library/
  std::error_code ec;
  const auto exe_path = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return std::nullopt;
  }
  const auto bin_dir = exe_path.parent_path();

  const auto share_stdlib = bin_dir / ".." / "share" / "sysml" / "sysml.library";
  if (fs::is_directory(share_stdlib, ec)) {
    return fs::canonical(share_stdlib, ec);
  }

  for (const auto & dev_stdlib :
       {bin_dir / ".." / "sysml.library", bin_dir / ".." / "core" / "sysml.library"}) {
    if (fs::is_directory(dev_stdlib, ec)) {
      return fs::canonical(dev_stdlib, ec);
    }
  }

  return std::nullopt;
}

}  // namespace sysml
