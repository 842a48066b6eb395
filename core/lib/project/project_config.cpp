// sysml/project/project_config.cpp - Project configuration implementation
//
#include "sysml/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace sysml
{

namespace fs = std::filesystem;

namespace
{

fs::path anchor(const fs::path & root, const fs::path & p)
{
  return p.is_absolute() ? p : (root / p).lexically_normal();
}

}  // namespace

std::vector<fs::path> ProjectConfig::resolved_sources() const
{
  std::vector<fs::path> out;
  out.reserve(sources.size());
  for (const auto & s : sources) {
    out.push_back(anchor(project_root, s));
  }
  return out;
}

std::optional<fs::path> ProjectConfig::resolved_stdlib_path() const
{
  if (!stdlib.path) {
    return std::nullopt;
  }
  return anchor(project_root, *stdlib.path);
}

ConfigLoadResult load_project_config(const fs::path & config_path)
{
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (!pkg.IsMap()) {
        return ConfigLoadResult::fail("package must be a map");
      }
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'sources' section
    if (root["sources"]) {
      const auto & sources = root["sources"];
      if (!sources.IsSequence()) {
        return ConfigLoadResult::fail("sources must be a list");
      }
      for (const auto & entry : sources) {
        config.sources.emplace_back(entry.as<std::string>());
      }
    }

    // Parse 'stdlib' section
    if (root["stdlib"]) {
      const auto & stdlib = root["stdlib"];
      if (!stdlib.IsMap()) {
        return ConfigLoadResult::fail("stdlib must be a map");
      }
      if (stdlib["enabled"]) {
        config.stdlib.enabled = stdlib["enabled"].as<bool>();
      }
      if (stdlib["path"]) {
        config.stdlib.path = stdlib["path"].as<std::string>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  // No sources listed: the project directory itself
  if (config.sources.empty()) {
    config.sources.emplace_back(".");
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<fs::path> find_project_config(const fs::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config(const std::string & package_name)
{
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "package" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << package_name;
  out << YAML::Key << "version" << YAML::Value << "0.1.0";
  out << YAML::EndMap;
  out << YAML::Key << "sources" << YAML::Value << YAML::BeginSeq << "models" << YAML::EndSeq;
  out << YAML::Key << "stdlib" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "enabled" << YAML::Value << true;
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

}  // namespace sysml
