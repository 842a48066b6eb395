// sysml/workspace/stdlib_loader.cpp - Model file discovery
#include "sysml/workspace/stdlib_loader.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace sysml
{

bool is_model_file(const fs::path & path)
{
  const auto ext = path.extension();
  return ext == ".sysml" || ext == ".kerml";
}

std::vector<fs::path> collect_model_files(const fs::path & dir)
{
  std::vector<fs::path> out;
  std::error_code ec;

  if (fs::is_regular_file(dir, ec)) {
    if (is_model_file(dir)) {
      out.push_back(dir);
    }
    return out;
  }
  if (!fs::is_directory(dir, ec)) {
    return out;
  }

  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && is_model_file(it->path())) {
      out.push_back(it->path());
    }
  }

  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace sysml
