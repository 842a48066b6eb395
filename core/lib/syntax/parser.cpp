#include "sysml/syntax/parser.hpp"

#include <algorithm>
#include <string>

#include "sysml/basic/diagnostic_codes.hpp"
#include "sysml/syntax/keywords.hpp"

namespace sysml::syntax
{
namespace
{

template <typename Table>
std::optional<ElementKind> lookup_kind(const Table & table, std::string_view word) noexcept
{
  for (const auto & [kw, kind] : table) {
    if (kw == word) {
      return kind;
    }
  }
  return std::nullopt;
}

constexpr bool is_kerml_classifier(ElementKind k) noexcept
{
  return k >= ElementKind::Class && k <= ElementKind::Type;
}

std::string_view trim(std::string_view s) noexcept
{
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::string describe(const Token & t)
{
  if (t.kind == TokenKind::Identifier) {
    return "'" + std::string(t.text) + "'";
  }
  if (t.kind == TokenKind::Eof) {
    return "end of file";
  }
  return "'" + std::string(to_string(t.kind)) + "'";
}

}  // namespace

Parser::Parser(
  AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
  std::vector<Token> tokens)
: ast_(ast), file_id_(file_id), source_(source), diags_(diags)
{
  // Block comments only matter as `doc` bodies; keep them beside the token
  // they precede instead of in the stream.
  tokens_.reserve(tokens.size());
  leading_comments_.reserve(tokens.size());
  std::string_view pending;
  for (const Token & t : tokens) {
    if (t.kind == TokenKind::BlockComment) {
      pending = t.text;
      continue;
    }
    tokens_.push_back(t);
    leading_comments_.push_back(pending);
    pending = {};
  }
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    const auto at = static_cast<uint32_t>(source_.size());
    tokens_.push_back({TokenKind::Eof, SourceRange(file_id_, at, at), {}});
    leading_comments_.push_back(pending);
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw, size_t lookahead) const
{
  return is_kw(kw, cur(lookahead));
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::match_kw(std::string_view kw)
{
  if (at_kw(kw)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what, RecoverySet recovery)
{
  if (match(k)) {
    return true;
  }

  // A missing ';' at a line break is reported at the end of the previous line.
  SourceRange where = cur().range;
  if (k == TokenKind::Semicolon && idx_ > 0) {
    const auto prev_lc = source_.get_line_column(prev().end());
    const auto cur_lc = source_.get_line_column(cur().begin());
    if (cur_lc.line > prev_lc.line) {
      where = prev().range;
    }
  }
  diags_.report_error(where, "expected " + std::string(what), "found " + describe(cur()))
    .with_code(diag_codes::k_syntax_error);

  if (recovery == RecoverySet::None) {
    return false;
  }

  while (!at_eof()) {
    if (match(k)) {
      return true;
    }
    if (at(TokenKind::Semicolon)) {
      advance();
      return false;
    }
    if (at(TokenKind::RBrace) && (recovery & RecoverySet::Block)) {
      return false;
    }
    if ((recovery & RecoverySet::Member) && (at(TokenKind::RBrace) || at_member_start())) {
      return false;
    }
    advance();
  }
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  diags_.report_error(t.range, std::string(msg)).with_code(diag_codes::k_syntax_error);
}

void Parser::unexpected(const Token & t, std::string_view context)
{
  diags_.report_error(t.range, "unexpected " + describe(t) + " " + std::string(context))
    .with_code(diag_codes::k_unexpected_token);
}

void Parser::synchronize_to_member()
{
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      ++depth;
      advance();
      continue;
    }
    if (at(TokenKind::RBrace)) {
      if (depth == 0) {
        return;
      }
      --depth;
      advance();
      if (depth == 0) {
        return;
      }
      continue;
    }
    if (depth == 0) {
      if (match(TokenKind::Semicolon) || at_member_start()) {
        return;
      }
    }
    advance();
  }
}

void Parser::skip_statement()
{
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      ++depth;
      advance();
      continue;
    }
    if (at(TokenKind::RBrace)) {
      if (depth == 0) {
        return;
      }
      --depth;
      advance();
      if (depth == 0) {
        return;
      }
      continue;
    }
    if (depth == 0 && match(TokenKind::Semicolon)) {
      return;
    }
    advance();
  }
}

void Parser::skip_expression_statement()
{
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LParen) || at(TokenKind::LBracket) || at(TokenKind::LBrace)) {
      ++depth;
    } else if (at(TokenKind::RParen) || at(TokenKind::RBracket) || at(TokenKind::RBrace)) {
      if (depth == 0) {
        return;
      }
      --depth;
    } else if (depth == 0 && at(TokenKind::Semicolon)) {
      advance();
      return;
    }
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && !t.quoted && t.text == kw;
}

bool Parser::at_member_start() const
{
  const Token & t = cur();
  if (t.kind != TokenKind::Identifier || t.quoted) {
    return false;
  }
  return contains_keyword(k_member_keywords, t.text) || t.text == "include" ||
         contains_keyword(k_element_keywords, t.text) ||
         contains_keyword(k_member_feature_keywords, t.text) ||
         contains_keyword(k_skipped_statement_keywords, t.text) || t.text == "use" ||
         t.text == "analysis" || t.text == "verification";
}

bool Parser::at_name() const
{
  const Token & t = cur();
  if (t.kind != TokenKind::Identifier) {
    return false;
  }
  return t.quoted || (!contains_keyword(k_relationship_keywords, t.text) && t.text != "def");
}

bool Parser::at_expression_statement() const
{
  switch (cur().kind) {
    case TokenKind::IntLiteral:
    case TokenKind::RealLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::LParen:
    case TokenKind::Minus:
    case TokenKind::Bang:
      return true;
    case TokenKind::Identifier:
      break;
    default:
      return false;
  }

  if (at_kw("not") || at_kw("true") || at_kw("false") || at_kw("null")) {
    return true;
  }

  // A bare name followed by an operator is a result/constraint expression.
  switch (cur(1).kind) {
    case TokenKind::Lt:
    case TokenKind::Gt:
    case TokenKind::Le:
    case TokenKind::Ge:
    case TokenKind::EqEq:
    case TokenKind::Ne:
    case TokenKind::Plus:
    case TokenKind::Minus:
    case TokenKind::Star:
    case TokenKind::StarStar:
    case TokenKind::Slash:
    case TokenKind::Percent:
    case TokenKind::Caret:
    case TokenKind::Amp:
    case TokenKind::Pipe:
    case TokenKind::Dot:
    case TokenKind::LParen:
    case TokenKind::Arrow:
    case TokenKind::RBrace:
      return true;
    default:
      return false;
  }
}

std::string_view Parser::slice_interned(uint32_t begin, uint32_t end)
{
  const std::string_view content = source_.content();
  if (begin >= end || begin >= content.size()) {
    return {};
  }
  end = std::min<uint32_t>(end, static_cast<uint32_t>(content.size()));
  return ast_.intern(trim(content.substr(begin, end - begin)));
}

// ============================================================================
// Names
// ============================================================================

std::optional<QualifiedRef> Parser::parse_qualified_name(std::string_view what)
{
  if (!at(TokenKind::Identifier)) {
    diags_.report_error(cur().range, "expected " + std::string(what), "found " + describe(cur()))
      .with_code(diag_codes::k_syntax_error);
    return std::nullopt;
  }

  const Token & first = advance();
  std::string text(first.text);
  SourceRange range = first.range;

  while (true) {
    if (at(TokenKind::ColonColon) && cur(1).kind == TokenKind::Identifier) {
      advance();
      const Token & seg = advance();
      text += "::";
      text += seg.text;
      range = join_ranges(range, seg.range);
      continue;
    }
    // Feature chains (`vehicle.engine`) keep their dots.
    if (at(TokenKind::Dot) && cur(1).kind == TokenKind::Identifier) {
      advance();
      const Token & seg = advance();
      text += ".";
      text += seg.text;
      range = join_ranges(range, seg.range);
      continue;
    }
    break;
  }

  return QualifiedRef{ast_.intern(text), range};
}

std::string_view Parser::block_comment_before_cur() const
{
  return idx_ < leading_comments_.size() ? leading_comments_[idx_] : std::string_view{};
}

// ============================================================================
// Top level
// ============================================================================

SourceUnit * Parser::parse_source_unit()
{
  auto * unit =
    ast_.create<SourceUnit>(SourceRange(file_id_, 0, static_cast<uint32_t>(source_.size())));

  std::vector<AstNode *> members;
  std::string_view top_level_doc;

  while (!at_eof()) {
    if (at(TokenKind::RBrace)) {
      unexpected(cur(), "at top level");
      advance();
      continue;
    }
    const size_t before = idx_;
    if (auto * m = parse_member(top_level_doc)) {
      members.push_back(m);
    }
    if (idx_ == before) {
      advance();
    }
  }

  unit->members = ast_.copy_to_arena(members);
  return unit;
}

// ============================================================================
// Members
// ============================================================================

std::vector<AstNode *> Parser::parse_body(std::string_view & doc_out)
{
  std::vector<AstNode *> members;
  advance();  // '{'

  while (!at(TokenKind::RBrace) && !at_eof()) {
    const size_t before = idx_;
    if (auto * m = parse_member(doc_out)) {
      members.push_back(m);
    }
    if (idx_ == before) {
      advance();
    }
  }

  expect(TokenKind::RBrace, "'}' to close body");
  return members;
}

AstNode * Parser::parse_member(std::string_view & doc_out)
{
  const uint32_t start = cur().begin();

  if (at_kw("doc")) {
    doc_out = parse_doc();
    return nullptr;
  }
  if (at_kw("comment")) {
    skip_comment_element();
    return nullptr;
  }
  if (at(TokenKind::At)) {
    skip_annotation();
    return nullptr;
  }

  Prefixes p;
  bool explicit_visibility = true;
  if (match_kw("public")) {
    p.visibility = Visibility::Public;
  } else if (match_kw("private")) {
    p.visibility = Visibility::Private;
  } else if (match_kw("protected")) {
    p.visibility = Visibility::Protected;
  } else {
    explicit_visibility = false;
  }

  if (at_kw("package")) {
    return parse_package(p.visibility, false, false, start);
  }
  if (at_kw("library") && at_kw("package", 1)) {
    advance();
    return parse_package(p.visibility, true, false, start);
  }
  if (at_kw("standard") && at_kw("library", 1) && at_kw("package", 2)) {
    advance();
    advance();
    return parse_package(p.visibility, true, true, start);
  }
  if (at_kw("import")) {
    return parse_import(explicit_visibility ? p.visibility : Visibility::Private, start);
  }
  if (at_kw("alias")) {
    return parse_alias(p.visibility, start);
  }
  if (at_kw("satisfy")) {
    return parse_relationship_member(RelationshipKind::Satisfy, start);
  }
  if (at_kw("perform")) {
    return parse_relationship_member(RelationshipKind::Perform, start);
  }
  if (at_kw("exhibit")) {
    return parse_relationship_member(RelationshipKind::Exhibit, start);
  }
  if (at_kw("include")) {
    return parse_relationship_member(RelationshipKind::Include, start);
  }
  if (cur().kind == TokenKind::Identifier && !cur().quoted &&
      contains_keyword(k_skipped_statement_keywords, cur().text)) {
    skip_statement();
    return nullptr;
  }

  while (true) {
    if (at(TokenKind::Hash)) {
      advance();
      if (!parse_qualified_name("metadata name after '#'")) {
        synchronize_to_member();
        return nullptr;
      }
      continue;
    }
    if (match_kw("abstract")) {
      p.is_abstract = true;
      continue;
    }
    if (match_kw("variation")) {
      p.is_variation = true;
      continue;
    }
    if (match_kw("readonly")) {
      p.is_readonly = true;
      continue;
    }
    if (match_kw("derived")) {
      p.is_derived = true;
      continue;
    }
    if (match_kw("end")) {
      p.is_end = true;
      continue;
    }
    if (match_kw("in")) {
      p.direction = Direction::In;
      continue;
    }
    if (match_kw("out")) {
      p.direction = Direction::Out;
      continue;
    }
    if (match_kw("inout")) {
      p.direction = Direction::InOut;
      continue;
    }
    if (at_kw("ref")) {
      size_t words = 0;
      ++idx_;
      const bool kind_follows = peek_element_kind(words).has_value();
      --idx_;
      if (kind_follows) {
        advance();
        p.is_ref = true;
        continue;
      }
    }
    break;
  }

  size_t words = 0;
  if (const auto kind = peek_element_kind(words)) {
    for (size_t i = 0; i < words; ++i) {
      advance();
    }
    return parse_element(p, kind, start);
  }

  if (at_expression_statement()) {
    skip_expression_statement();
    return nullptr;
  }

  if (
    at_name() || at(TokenKind::Colon) || at(TokenKind::ColonGt) || at(TokenKind::ColonGtGt) ||
    at(TokenKind::ColonColonGt) || at_kw("redefines") || at_kw("subsets") ||
    at_kw("references")) {
    return parse_element(p, std::nullopt, start);
  }

  unexpected(cur(), "in member position");
  advance();
  synchronize_to_member();
  return nullptr;
}

PackageDecl * Parser::parse_package(
  Visibility vis, bool is_library, bool is_standard, uint32_t start)
{
  advance();  // 'package'

  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected package name");
    synchronize_to_member();
    return nullptr;
  }
  const Token & name = advance();

  auto * decl = ast_.create<PackageDecl>(ast_.intern(name.text), name.range, SourceRange{});
  decl->visibility = vis;
  decl->is_library = is_library;
  decl->is_standard = is_standard;

  if (at(TokenKind::LBrace)) {
    std::string_view doc;
    auto members = parse_body(doc);
    decl->members = ast_.copy_to_arena(members);
    decl->doc = doc;
  } else {
    expect(TokenKind::Semicolon, "';' or '{' after package name", RecoverySet::Member);
  }

  decl->range_ = SourceRange(file_id_, start, prev().end());
  return decl;
}

ImportDecl * Parser::parse_import(Visibility vis, uint32_t start)
{
  advance();  // 'import'
  match_kw("all");

  auto target = parse_qualified_name("import target");
  if (!target) {
    synchronize_to_member();
    return nullptr;
  }

  ImportKind kind = ImportKind::Member;
  if (at(TokenKind::ColonColon) && cur(1).kind == TokenKind::Star) {
    advance();
    advance();
    kind = ImportKind::Namespace;
  }
  if (at(TokenKind::ColonColon) && cur(1).kind == TokenKind::StarStar) {
    advance();
    advance();
    kind = ImportKind::Recursive;
  }

  // Filter conditions (`[@Safety]`) do not change what becomes visible here.
  while (at(TokenKind::LBracket)) {
    (void)parse_multiplicity();
  }

  auto * decl = ast_.create<ImportDecl>(kind, target->text, target->range, SourceRange{});
  decl->visibility = vis;

  expect(TokenKind::Semicolon, "';' after import", RecoverySet::Member);
  decl->range_ = SourceRange(file_id_, start, prev().end());
  return decl;
}

AliasDecl * Parser::parse_alias(Visibility vis, uint32_t start)
{
  advance();  // 'alias'

  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected alias name");
    synchronize_to_member();
    return nullptr;
  }
  const Token & name = advance();

  if (!match_kw("for")) {
    error_at(cur(), "expected 'for' after alias name");
    synchronize_to_member();
    return nullptr;
  }

  auto target = parse_qualified_name("alias target");
  if (!target) {
    synchronize_to_member();
    return nullptr;
  }

  auto * decl = ast_.create<AliasDecl>(
    ast_.intern(name.text), name.range, target->text, target->range, SourceRange{});
  decl->visibility = vis;

  if (at(TokenKind::LBrace)) {
    std::string_view doc;
    (void)parse_body(doc);
    decl->doc = doc;
  } else {
    expect(TokenKind::Semicolon, "';' after alias", RecoverySet::Member);
  }

  decl->range_ = SourceRange(file_id_, start, prev().end());
  return decl;
}

RelationshipPart * Parser::parse_relationship_member(RelationshipKind kind, uint32_t start)
{
  advance();  // satisfy / perform / exhibit / include

  // Optional role keyword (`perform action a;`, `include use case u;`).
  size_t words = 0;
  if (peek_element_kind(words) && cur(words).kind == TokenKind::Identifier) {
    for (size_t i = 0; i < words; ++i) {
      advance();
    }
  }

  auto target = parse_qualified_name("relationship target");
  if (!target) {
    synchronize_to_member();
    return nullptr;
  }

  auto * part = ast_.create<RelationshipPart>(kind, target->text, target->range);

  if (kind == RelationshipKind::Satisfy && match_kw("by")) {
    if (auto subject = parse_qualified_name("satisfying element after 'by'")) {
      part->subject = subject->text;
      part->subject_range = subject->range;
    }
  }

  // Clauses on a relationship member describe the member, not new symbols.
  std::vector<RelationshipPart *> ignored;
  std::string_view ignored_multiplicity;
  parse_relationship_clauses(false, ignored, ignored_multiplicity);

  if (at(TokenKind::LBrace)) {
    std::string_view ignored_doc;
    (void)parse_body(ignored_doc);
  } else {
    expect(TokenKind::Semicolon, "';' after relationship", RecoverySet::Member);
  }

  part->range_ = SourceRange(file_id_, start, prev().end());
  return part;
}

std::string_view Parser::parse_doc()
{
  advance();  // 'doc'

  if (at(TokenKind::Identifier) && !at_kw("locale") && block_comment_before_cur().empty()) {
    advance();  // doc name
  }
  if (match_kw("locale")) {
    match(TokenKind::StringLiteral);
  }

  const std::string_view body = block_comment_before_cur();
  if (body.empty()) {
    error_at(cur(), "expected '/* ... */' after 'doc'");
    return {};
  }
  return ast_.intern(trim(body));
}

void Parser::skip_comment_element()
{
  advance();  // 'comment'

  if (
    at(TokenKind::Identifier) && !at_kw("about") && !at_kw("locale") &&
    block_comment_before_cur().empty()) {
    advance();
  }
  if (match_kw("about")) {
    do {
      if (!parse_qualified_name("annotated element after 'about'")) {
        return;
      }
    } while (match(TokenKind::Comma));
  }
  if (match_kw("locale")) {
    match(TokenKind::StringLiteral);
  }
  match(TokenKind::Semicolon);
}

void Parser::skip_annotation()
{
  advance();  // '@'
  if (!parse_qualified_name("metadata name after '@'")) {
    synchronize_to_member();
    return;
  }
  if (at(TokenKind::LBrace)) {
    skip_statement();
    return;
  }
  expect(TokenKind::Semicolon, "';' after metadata annotation", RecoverySet::Member);
}

// ============================================================================
// Elements
// ============================================================================

std::optional<ElementKind> Parser::peek_element_kind(size_t & word_count) const
{
  const Token & t = cur();
  if (t.kind != TokenKind::Identifier || t.quoted) {
    return std::nullopt;
  }

  if (at_kw("case", 1)) {
    if (t.text == "use") {
      word_count = 2;
      return ElementKind::UseCase;
    }
    if (t.text == "analysis") {
      word_count = 2;
      return ElementKind::AnalysisCase;
    }
    if (t.text == "verification") {
      word_count = 2;
      return ElementKind::VerificationCase;
    }
  }

  if (auto k = lookup_kind(k_element_keywords, t.text)) {
    word_count = 1;
    return k;
  }
  if (auto k = lookup_kind(k_member_feature_keywords, t.text)) {
    word_count = 1;
    return k;
  }
  return std::nullopt;
}

ElementDecl * Parser::parse_element(
  const Prefixes & prefixes, std::optional<ElementKind> kind, uint32_t start)
{
  const ElementKind ek = kind.value_or(ElementKind::Ref);
  const bool is_def = kind.has_value() && match_kw("def");

  ElementDecl * decl = nullptr;
  if (ek == ElementKind::Feature) {
    decl = ast_.create<FeatureDecl>(SourceRange{});
  } else if (is_kerml_classifier(ek)) {
    decl = ast_.create<ClassifierDecl>(ek, SourceRange{});
  } else if (is_def) {
    decl = ast_.create<DefinitionDecl>(ek, SourceRange{});
  } else {
    decl = ast_.create<UsageDecl>(ek, SourceRange{});
  }
  const bool is_type_declaration = isa<DefinitionDecl>(decl) || isa<ClassifierDecl>(decl);

  // Short name: <'1.2'>
  if (at(TokenKind::Lt)) {
    advance();
    while (!at(TokenKind::Gt) && !at_eof() && !at(TokenKind::Semicolon)) {
      advance();
    }
    expect(TokenKind::Gt, "'>' to close short name");
  }

  if (at_name()) {
    const Token & name = advance();
    decl->name = ast_.intern(name.text);
    decl->name_range = name.range;
  }

  std::vector<RelationshipPart *> relationships;
  std::string_view multiplicity;
  parse_relationship_clauses(is_type_declaration, relationships, multiplicity);
  decl->value = parse_value_opt();

  std::vector<AstNode *> members;
  std::string_view doc;
  if (at(TokenKind::LBrace)) {
    members = parse_body(doc);
  } else {
    expect(TokenKind::Semicolon, "';' or '{' after declaration", RecoverySet::Member);
  }

  decl->visibility = prefixes.visibility;
  decl->direction = prefixes.direction;
  decl->is_abstract = prefixes.is_abstract;
  decl->is_variation = prefixes.is_variation;
  decl->is_readonly = prefixes.is_readonly;
  decl->is_derived = prefixes.is_derived;
  decl->is_end = prefixes.is_end;
  decl->multiplicity = multiplicity;
  decl->relationships = ast_.copy_to_arena(relationships);
  decl->members = ast_.copy_to_arena(members);
  decl->doc = doc;
  decl->range_ = SourceRange(file_id_, start, prev().end());
  return decl;
}

void Parser::parse_relationship_clauses(
  bool is_type_declaration, std::vector<RelationshipPart *> & out,
  std::string_view & multiplicity)
{
  while (!at_eof()) {
    if (at(TokenKind::LBracket)) {
      multiplicity = parse_multiplicity();
      continue;
    }
    if (match_kw("ordered") || match_kw("nonunique")) {
      continue;
    }
    if (match(TokenKind::Colon)) {
      parse_relationship_targets(RelationshipKind::Typing, out);
      continue;
    }
    if ((at_kw("defined") || at_kw("typed")) && at_kw("by", 1)) {
      advance();
      advance();
      parse_relationship_targets(RelationshipKind::Typing, out);
      continue;
    }
    if (match(TokenKind::ColonGt)) {
      parse_relationship_targets(
        is_type_declaration ? RelationshipKind::Specialization : RelationshipKind::Subsetting, out);
      continue;
    }
    if (match_kw("specializes")) {
      parse_relationship_targets(RelationshipKind::Specialization, out);
      continue;
    }
    if (match_kw("subsets")) {
      parse_relationship_targets(RelationshipKind::Subsetting, out);
      continue;
    }
    if (match(TokenKind::ColonGtGt) || match_kw("redefines")) {
      parse_relationship_targets(RelationshipKind::Redefinition, out);
      continue;
    }
    if (match(TokenKind::ColonColonGt) || match_kw("references")) {
      parse_relationship_targets(RelationshipKind::ReferenceSubsetting, out);
      continue;
    }
    break;
  }
}

void Parser::parse_relationship_targets(
  RelationshipKind kind, std::vector<RelationshipPart *> & out)
{
  do {
    match(TokenKind::Tilde);  // conjugated port type
    auto target = parse_qualified_name("relationship target");
    if (!target) {
      return;
    }
    out.push_back(ast_.create<RelationshipPart>(kind, target->text, target->range, target->range));
  } while (match(TokenKind::Comma));
}

std::string_view Parser::parse_multiplicity()
{
  const Token & open = advance();  // '['
  const uint32_t begin = open.end();
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LBracket)) {
      ++depth;
    } else if (at(TokenKind::RBracket)) {
      if (depth == 0) {
        break;
      }
      --depth;
    } else if (at(TokenKind::Semicolon) || at(TokenKind::LBrace)) {
      break;
    }
    advance();
  }
  const uint32_t end = cur().begin();
  expect(TokenKind::RBracket, "']' to close multiplicity");
  return slice_interned(begin, end);
}

const ValueExpr * Parser::parse_value_opt()
{
  const bool is_default = match_kw("default");
  bool is_initial = false;
  if (match(TokenKind::ColonEq)) {
    is_initial = true;
  } else if (!match(TokenKind::Eq) && !is_default) {
    return nullptr;
  }

  const uint32_t begin = cur().begin();
  uint32_t end = begin;
  int depth = 0;
  while (!at_eof()) {
    if (depth == 0 && (at(TokenKind::Semicolon) || at(TokenKind::LBrace) || at(TokenKind::RBrace))) {
      break;
    }
    if (at(TokenKind::Unknown)) {
      unexpected(cur(), "in value expression");
    }
    if (at(TokenKind::LParen) || at(TokenKind::LBracket)) {
      ++depth;
    } else if ((at(TokenKind::RParen) || at(TokenKind::RBracket)) && depth > 0) {
      --depth;
    }
    end = advance().end();
  }

  if (end == begin) {
    error_at(cur(), "expected expression after '='");
    return nullptr;
  }

  auto * value = ast_.create<ValueExpr>(slice_interned(begin, end), SourceRange(file_id_, begin, end));
  value->is_initial = is_initial;
  value->is_default = is_default;
  return value;
}

}  // namespace sysml::syntax
