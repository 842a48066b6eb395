// sysml/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "sysml/ast/ast.hpp"
#include "sysml/ast/ast_context.hpp"
#include "sysml/basic/diagnostic.hpp"
#include "sysml/basic/source_manager.hpp"

namespace sysml
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  SourceUnit * unit = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (tree) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

/**
 * A parsed file that owns its arena.
 *
 * The tree does not reference the registry's text buffer, so it stays valid
 * after the file content is replaced.
 */
struct ParsedFile
{
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  const SourceUnit * unit = nullptr;
  DiagnosticBag diags;

  [[nodiscard]] bool has_errors() const { return diags.has_errors(); }
};

/// Parse a file already present in the registry.
[[nodiscard]] std::unique_ptr<ParsedFile> parse_file(const SourceRegistry & sources, FileId id);

}  // namespace sysml
