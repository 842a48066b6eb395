#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sysml/ast/ast.hpp"
#include "sysml/ast/ast_context.hpp"
#include "sysml/basic/diagnostic.hpp"
#include "sysml/basic/source_manager.hpp"
#include "sysml/syntax/token.hpp"

namespace sysml::syntax
{

enum class RecoverySet : uint32_t {
  None = 0,
  Member = 1 << 0,  // ; or a member keyword
  Block = 1 << 1,   // } or ;
};

inline RecoverySet operator|(RecoverySet a, RecoverySet b)
{
  return static_cast<RecoverySet>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(RecoverySet a, RecoverySet b)
{
  return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

/// A `::`-separated name as written at a reference site.
struct QualifiedRef
{
  std::string_view text;  ///< Interned, segments unquoted
  SourceRange range;
};

/**
 * Recursive-descent parser for the textual notation.
 *
 * Produces an immutable tree in the given AstContext. Errors are reported
 * to the DiagnosticBag (P001/P002) and parsing continues after recovery, so
 * a tree is always returned.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
    std::vector<Token> tokens);

  [[nodiscard]] SourceUnit * parse_source_unit();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw, size_t lookahead = 0) const;

  const Token & advance();
  bool match(TokenKind k);
  bool match_kw(std::string_view kw);
  bool expect(TokenKind k, std::string_view what, RecoverySet recovery = RecoverySet::None);
  [[nodiscard]] const Token & prev() const;

  void error_at(const Token & t, std::string_view msg);
  void unexpected(const Token & t, std::string_view context);
  void synchronize_to_member();
  void skip_statement();

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] bool at_member_start() const;
  [[nodiscard]] bool at_name() const;

  // Names
  [[nodiscard]] std::optional<QualifiedRef> parse_qualified_name(std::string_view what);
  [[nodiscard]] std::string_view block_comment_before_cur() const;

  // Members
  [[nodiscard]] std::vector<AstNode *> parse_body(std::string_view & doc_out);
  [[nodiscard]] AstNode * parse_member(std::string_view & doc_out);
  [[nodiscard]] PackageDecl * parse_package(
    Visibility vis, bool is_library, bool is_standard, uint32_t start);
  [[nodiscard]] ImportDecl * parse_import(Visibility vis, uint32_t start);
  [[nodiscard]] AliasDecl * parse_alias(Visibility vis, uint32_t start);
  [[nodiscard]] RelationshipPart * parse_relationship_member(
    RelationshipKind kind, uint32_t start);
  [[nodiscard]] std::string_view parse_doc();
  void skip_comment_element();
  void skip_annotation();
  void skip_expression_statement();
  [[nodiscard]] bool at_expression_statement() const;
  [[nodiscard]] std::string_view slice_interned(uint32_t begin, uint32_t end);

  // Elements
  struct Prefixes
  {
    Visibility visibility = Visibility::Public;
    Direction direction = Direction::None;
    bool is_abstract = false;
    bool is_variation = false;
    bool is_readonly = false;
    bool is_derived = false;
    bool is_end = false;
    bool is_ref = false;
  };

  [[nodiscard]] std::optional<ElementKind> peek_element_kind(size_t & word_count) const;
  [[nodiscard]] ElementDecl * parse_element(
    const Prefixes & prefixes, std::optional<ElementKind> kind, uint32_t start);
  void parse_relationship_clauses(
    bool is_type_declaration, std::vector<RelationshipPart *> & out,
    std::string_view & multiplicity);
  void parse_relationship_targets(RelationshipKind kind, std::vector<RelationshipPart *> & out);
  [[nodiscard]] std::string_view parse_multiplicity();
  [[nodiscard]] const ValueExpr * parse_value_opt();

  AstContext & ast_;
  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  // Interior of the block comment directly preceding tokens_[i], if any.
  std::vector<std::string_view> leading_comments_;
  size_t idx_ = 0;
};

}  // namespace sysml::syntax
