// tests/project/test_project_config.cpp - Unit tests for sysml.yaml loading

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "sysml/project/project_config.hpp"

using namespace sysml;
namespace fs = std::filesystem;

namespace
{

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

}  // namespace

// ============================================================================
// Loading
// ============================================================================

TEST(ProjectConfig, LoadsAllSections)
{
  const fs::path dir = make_temp_dir("sysml_cfg_full");
  write_all(dir / "sysml.yaml", R"(
package:
  name: vehicles
  version: 1.2.0
sources:
  - models
  - extra/brakes.sysml
stdlib:
  enabled: false
  path: ../shared/library
)");

  const auto r = load_project_config(dir / "sysml.yaml");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "vehicles");
  EXPECT_EQ(r.config.package.version, "1.2.0");
  EXPECT_FALSE(r.config.stdlib.enabled);

  const auto sources = r.config.resolved_sources();
  ASSERT_EQ(sources.size(), 2U);
  EXPECT_EQ(sources[0], (fs::absolute(dir) / "models").lexically_normal());
  EXPECT_EQ(sources[1], (fs::absolute(dir) / "extra/brakes.sysml").lexically_normal());

  const auto stdlib = r.config.resolved_stdlib_path();
  ASSERT_TRUE(stdlib.has_value());
  EXPECT_EQ(*stdlib, (fs::absolute(dir) / "../shared/library").lexically_normal());

  fs::remove_all(dir);
}

TEST(ProjectConfig, DefaultsWhenSectionsAreMissing)
{
  const fs::path dir = make_temp_dir("sysml_cfg_empty");
  write_all(dir / "sysml.yaml", "package:\n  name: bare\n");

  const auto r = load_project_config(dir / "sysml.yaml");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.config.stdlib.enabled);
  EXPECT_FALSE(r.config.resolved_stdlib_path().has_value());

  // No sources listed: the project directory itself
  ASSERT_EQ(r.config.sources.size(), 1U);
  EXPECT_TRUE(fs::equivalent(r.config.resolved_sources()[0], dir));

  fs::remove_all(dir);
}

TEST(ProjectConfig, MissingFileFails)
{
  const auto r = load_project_config(fs::temp_directory_path() / "sysml_cfg_nowhere" / "sysml.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("not found"), std::string::npos) << r.error;
}

TEST(ProjectConfig, MalformedYamlFails)
{
  const fs::path dir = make_temp_dir("sysml_cfg_bad");
  write_all(dir / "sysml.yaml", "package: [unterminated\n");

  const auto r = load_project_config(dir / "sysml.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("failed to parse YAML"), std::string::npos) << r.error;

  fs::remove_all(dir);
}

TEST(ProjectConfig, WrongShapesAreRejected)
{
  const fs::path dir = make_temp_dir("sysml_cfg_shape");

  write_all(dir / "sysml.yaml", "sources: models\n");
  auto r = load_project_config(dir / "sysml.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "sources must be a list");

  write_all(dir / "sysml.yaml", "stdlib: yes\n");
  r = load_project_config(dir / "sysml.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "stdlib must be a map");

  write_all(dir / "sysml.yaml", "stdlib:\n  enabled: sometimes\n");
  r = load_project_config(dir / "sysml.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("invalid configuration"), std::string::npos) << r.error;

  fs::remove_all(dir);
}

// ============================================================================
// Discovery and init
// ============================================================================

TEST(ProjectConfig, FindSearchesUpward)
{
  const fs::path dir = make_temp_dir("sysml_cfg_find");
  fs::create_directories(dir / "models" / "deep");
  write_all(dir / "sysml.yaml", "package:\n  name: found\n");
  write_all(dir / "models" / "deep" / "car.sysml", "part def Car;");

  const auto from_dir = find_project_config(dir / "models" / "deep");
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_TRUE(fs::equivalent(*from_dir, dir / "sysml.yaml"));

  const auto from_file = find_project_config(dir / "models" / "deep" / "car.sysml");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_TRUE(fs::equivalent(*from_file, dir / "sysml.yaml"));

  fs::remove_all(dir);
}

TEST(ProjectConfig, DefaultConfigLoadsBack)
{
  const fs::path dir = make_temp_dir("sysml_cfg_init");
  write_all(dir / "sysml.yaml", default_project_config("starter"));

  const auto r = load_project_config(dir / "sysml.yaml");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "starter");
  EXPECT_EQ(r.config.package.version, "0.1.0");
  EXPECT_TRUE(r.config.stdlib.enabled);
  ASSERT_EQ(r.config.sources.size(), 1U);
  EXPECT_EQ(r.config.sources[0], fs::path("models"));

  fs::remove_all(dir);
}
