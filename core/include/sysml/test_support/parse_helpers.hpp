// sysml/test_support/parse_helpers.hpp - helpers for unit tests
//
// Lightweight single-file parsing and multi-file model building for tests.
// Ownership stays explicit (SourceRegistry + AstContext per file).
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sysml/ast/ast_context.hpp"
#include "sysml/basic/diagnostic.hpp"
#include "sysml/basic/source_manager.hpp"
#include "sysml/sema/semantic_model.hpp"
#include "sysml/syntax/frontend.hpp"

namespace sysml::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  SourceUnit * unit = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.get_full_range(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.sysml")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.unit = parsed.unit;
  return out;
}

/// {path, text} pairs, populated in order.
using SourceFiles = std::vector<std::pair<std::string, std::string>>;

/// Several files populated into one model, in the order given.
struct TestModel
{
  SourceRegistry sources;
  std::vector<std::unique_ptr<AstContext>> asts;
  std::vector<FileId> files;
  DiagnosticBag parse_diags;
  SemanticModel model;

  [[nodiscard]] const Symbol * find(std::string_view qualified_name) const
  {
    return model.symbols.lookup_qualified(qualified_name);
  }

  [[nodiscard]] size_t count(std::string_view code) const
  {
    return model.diagnostics.count_code(code);
  }
};

/// Parse and populate `files` without resolving.
[[nodiscard]] inline std::unique_ptr<TestModel> populate(const SourceFiles & files)
{
  auto out = std::make_unique<TestModel>();
  for (const auto & [path, text] : files) {
    out->asts.push_back(std::make_unique<AstContext>());
    const ParseOutput parsed =
      parse_source(out->sources, path, text, *out->asts.back(), out->parse_diags);
    out->files.push_back(parsed.file_id);
    if (parsed.unit != nullptr) {
      (void)populate_file(out->model, *parsed.unit, parsed.file_id);
    }
  }
  return out;
}

/// Parse, populate, resolve and analyze `files`.
[[nodiscard]] inline std::unique_ptr<TestModel> analyze(const SourceFiles & files)
{
  auto out = populate(files);
  (void)resolve_and_analyze(out->model);
  return out;
}

[[nodiscard]] inline std::unique_ptr<TestModel> analyze(std::string src)
{
  return analyze({{"<test>.sysml", std::move(src)}});
}

}  // namespace sysml::test_support
