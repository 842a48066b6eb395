// sysml/syntax/frontend.cpp - High-level parse pipeline
#include "sysml/syntax/frontend.hpp"

#include "sysml/syntax/lexer.hpp"
#include "sysml/syntax/parser.hpp"

namespace sysml
{

namespace
{

SourceUnit * run_parser(
  const SourceFile & file, FileId id, AstContext & ast, DiagnosticBag & diags)
{
  syntax::Lexer lexer(id, file.content());
  syntax::Parser parser(ast, id, file, diags, lexer.lex_all());
  return parser.parse_source_unit();
}

}  // namespace

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = sources.register_file(path, std::move(source_text));

  const SourceFile * file = sources.get_file(out.file_id);
  if (file == nullptr) {
    diags.report_error({}, "too many source files registered: " + path.string());
    return out;
  }

  out.unit = run_parser(*file, out.file_id, ast, diags);
  return out;
}

std::unique_ptr<ParsedFile> parse_file(const SourceRegistry & sources, FileId id)
{
  auto parsed = std::make_unique<ParsedFile>();
  parsed->file_id = id;
  parsed->ast = std::make_unique<AstContext>();

  const SourceFile * file = sources.get_file(id);
  if (file == nullptr) {
    parsed->diags.report_error({}, "unknown file id");
    return parsed;
  }

  parsed->unit = run_parser(*file, id, *parsed->ast, parsed->diags);
  return parsed;
}

}  // namespace sysml
