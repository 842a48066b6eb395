// sysmlc - SysML/KerML semantic analyzer command line interface
//
// Usage:
//   sysmlc check [path...] [--project] [--stdlib <dir>] [--no-stdlib] [-v]
//   sysmlc symbols <path> [--stdlib <dir>] [--no-stdlib]
//   sysmlc init <project-name>
//
#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include "sysml/basic/diagnostic_printer.hpp"
#include "sysml/driver/analysis.hpp"
#include "sysml/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "SysML Semantic Analyzer v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [path...]          Analyze files, directories or the project\n"
            << "  symbols <path>           List every symbol as 'kind qualified-name'\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  --project                Analyze the project from sysml.yaml\n"
            << "  --stdlib <dir>           Use this standard library directory\n"
            << "  --no-stdlib              Do not load a standard library\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const sysml::AnalysisResult & result)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  sysml::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(result.diagnostics, result.workspace->sources());
  printer.print_summary(result.diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::string stdlib_dir;
  bool use_project = false;
  bool no_stdlib = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--stdlib") {
      if (i + 1 < argc) {
        args.stdlib_dir = argv[++i];
      } else {
        args.error = "--stdlib requires a directory";
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--no-stdlib") {
      args.no_stdlib = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else {
      args.inputs.push_back(arg);
    }
  }

  return args;
}

sysml::AnalysisOptions make_options(const CommandArgs & args)
{
  sysml::AnalysisOptions options;
  options.use_stdlib = !args.no_stdlib;
  if (!args.stdlib_dir.empty()) {
    options.stdlib_dir = fs::absolute(args.stdlib_dir);
  }
  return options;
}

std::optional<sysml::AnalysisResult> analyze(const CommandArgs & args)
{
  const sysml::AnalysisOptions options = make_options(args);

  if (args.use_project || args.inputs.empty()) {
    auto config_path = sysml::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << sysml::k_project_config_file_name
                << " found in current directory or parents\n";
      return std::nullopt;
    }

    const auto config_result = sysml::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return std::nullopt;
    }

    if (args.verbose) {
      fmt::print(stderr, "Checking project: {}\n", config_result.config.package.name);
    }
    return sysml::run_project_analysis(config_result.config, options);
  }

  std::vector<fs::path> inputs;
  for (const auto & input : args.inputs) {
    inputs.push_back(fs::absolute(input));
    if (args.verbose) {
      fmt::print(stderr, "Checking: {}\n", inputs.back().string());
    }
  }
  return sysml::run_analysis(inputs, options);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  auto result = analyze(args);
  if (!result) {
    return 1;
  }

  if (args.verbose) {
    if (result->stdlib_dir) {
      fmt::print(stderr, "Standard library: {}\n", result->stdlib_dir->string());
    } else {
      fmt::print(stderr, "Standard library: none\n");
    }
  }

  if (!result->diagnostics.empty()) {
    print_diagnostics(*result);
  }

  fmt::print("{} files, {} symbols\n", result->file_count, result->symbol_count);
  return result->success ? 0 : 1;
}

int cmd_symbols(const CommandArgs & args)
{
  if (args.inputs.size() != 1) {
    std::cerr << "error: exactly one path required\n";
    std::cerr << "usage: sysmlc symbols <path>\n";
    return 1;
  }

  auto result = analyze(args);
  if (!result) {
    return 1;
  }

  const sysml::WorkspaceView view = result->workspace->view();
  std::vector<sysml::FileId> stdlib_files;
  for (const auto & info : view.files()) {
    if (info.is_stdlib) {
      stdlib_files.push_back(info.id);
    }
  }

  for (const auto & sym : view.all_symbols()) {
    if (std::find(stdlib_files.begin(), stdlib_files.end(), sym.file) != stdlib_files.end()) {
      continue;
    }
    fmt::print("{} {}\n", sym.keyword, sym.qualified_name);
  }

  if (result->diagnostics.has_errors()) {
    print_diagnostics(*result);
    return 1;
  }
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: sysmlc init <project-name>\n";
    return 1;
  }

  const std::string & name = args.inputs.front();
  const fs::path project_dir = fs::current_path() / name;

  std::error_code ec;
  if (fs::exists(project_dir, ec)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  fs::create_directories(project_dir / "models", ec);
  if (ec) {
    std::cerr << "error: " << ec.message() << "\n";
    return 1;
  }

  std::ofstream config(project_dir / sysml::k_project_config_file_name);
  config << sysml::default_project_config(name);
  config.close();

  std::ofstream model(project_dir / "models" / (name + ".sysml"));
  model << "package '" << name << "' {\n"
        << "    doc /* Root package */\n"
        << "\n"
        << "    part def System;\n"
        << "}\n";
  model.close();

  if (!config || !model) {
    std::cerr << "error: failed to write project files in " << project_dir.string() << "\n";
    return 1;
  }

  std::cout << "Initialized new SysML project in " << project_dir.string() << "\n";
  std::cout << "\nNext steps:\n"
            << "  cd " << name << "\n"
            << "  sysmlc check\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "symbols") {
    return cmd_symbols(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
