#include "sysml/lsp/completion_context.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sysml/syntax/keywords.hpp"
#include "sysml/syntax/lexer.hpp"

namespace sysml::lsp
{
namespace
{

using syntax::Token;
using syntax::TokenKind;

uint32_t clamp_byte_offset(uint32_t off, size_t text_size)
{
  if (off > text_size) {
    return static_cast<uint32_t>(text_size);
  }
  return off;
}

// Words after which a reference to an existing element is written.
constexpr std::array<std::string_view, 10> k_reference_keywords = {
  "specializes", "subsets", "redefines", "references", "by",
  "for",         "satisfy", "perform",   "exhibit",    "include",
};

// Words after which a new name is written.
constexpr std::array<std::string_view, 3> k_naming_keywords = {"def", "package", "alias"};

// Prefixes that may stand before a member keyword.
constexpr std::array<std::string_view, 13> k_prefix_keywords = {
  "public",   "private", "protected", "abstract", "variation", "readonly", "derived",
  "end",      "in",      "out",       "inout",    "library",   "standard",
};

bool is_word(const Token & t)
{
  return t.kind == TokenKind::Identifier && !t.quoted;
}

bool is_word_in(const Token & t, const auto & table)
{
  return is_word(t) && syntax::contains_keyword(table, t.text);
}

bool opens_reference(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Colon:
    case TokenKind::ColonGt:
    case TokenKind::ColonGtGt:
    case TokenKind::ColonColonGt:
      return true;
    default:
      break;
  }
  return is_word_in(t, k_reference_keywords);
}

bool ends_statement(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Semicolon:
    case TokenKind::LBrace:
    case TokenKind::RBrace:
      return true;
    default:
      return false;
  }
}

// Whether the cursor sits inside a comment, a string or an unterminated
// quoted token.
bool encloses(const Token & t, uint32_t byte_offset)
{
  if (t.kind == TokenKind::BlockComment || t.kind == TokenKind::StringLiteral) {
    return t.begin() < byte_offset && byte_offset < t.end();
  }
  if (t.kind == TokenKind::Unknown && !t.text.empty()) {
    const char c = t.text.front();
    const bool opens = c == '"' || c == '\'' || (c == '/' && t.text.size() > 1 && t.text[1] == '*');
    return opens && t.begin() < byte_offset && byte_offset <= t.end();
  }
  return false;
}

}  // namespace

std::optional<CompletionContext> classify_completion_context(
  std::string_view text, uint32_t byte_offset)
{
  byte_offset = clamp_byte_offset(byte_offset, text.size());
  const std::vector<Token> tokens = syntax::Lexer(FileId{0}, text).lex_all();

  CompletionContext ctx;
  ctx.replace_begin = byte_offset;
  ctx.replace_end = byte_offset;

  std::vector<const Token *> before;
  uint32_t gap_begin = 0;
  bool on_word = false;
  for (const auto & t : tokens) {
    if (t.kind == TokenKind::Eof || t.begin() >= byte_offset) {
      break;
    }
    if (t.kind == TokenKind::Identifier && byte_offset <= t.end()) {
      ctx.replace_begin = t.begin();
      ctx.replace_end = t.end();
      on_word = true;
      break;
    }
    if (encloses(t, byte_offset)) {
      return std::nullopt;
    }
    if (t.kind != TokenKind::BlockComment) {
      before.push_back(&t);
    }
    gap_begin = t.end();
  }

  // Line comments leave no token; look for one between the last token and
  // the cursor on the cursor's line.
  if (!on_word) {
    std::string_view gap = text.substr(gap_begin, byte_offset - gap_begin);
    if (const auto nl = gap.rfind('\n'); nl != std::string_view::npos) {
      gap.remove_prefix(nl + 1);
    }
    if (gap.find("//") != std::string_view::npos) {
      return std::nullopt;
    }
  }

  if (before.empty()) {
    return ctx;
  }
  const Token & prev = *before.back();

  if (prev.kind == TokenKind::ColonColon) {
    // Walk back over `A::B::` to the first segment of the qualifier
    size_t first = before.size();
    while (first >= 2 && before[first - 1]->kind == TokenKind::ColonColon &&
           before[first - 2]->kind == TokenKind::Identifier) {
      first -= 2;
    }
    if (first == before.size()) {
      return std::nullopt;
    }
    const uint32_t q_begin = before[first]->begin();
    const uint32_t q_end = before[before.size() - 2]->end();
    ctx.kind = CompletionContextKind::QualifiedMember;
    ctx.qualifier = std::string(text.substr(q_begin, q_end - q_begin));
    return ctx;
  }

  if (is_word(prev) && prev.text == "import") {
    ctx.kind = CompletionContextKind::ImportPath;
    return ctx;
  }
  if (is_word_in(prev, k_naming_keywords)) {
    return std::nullopt;
  }
  if (opens_reference(prev)) {
    ctx.kind = CompletionContextKind::TypeReference;
    return ctx;
  }

  if (prev.kind == TokenKind::Comma) {
    // `: A, B` and `specializes A, B` continue the same clause
    for (auto it = before.rbegin() + 1; it != before.rend(); ++it) {
      if (opens_reference(**it)) {
        ctx.kind = CompletionContextKind::TypeReference;
        return ctx;
      }
      if (ends_statement(**it) || (*it)->kind == TokenKind::LParen) {
        break;
      }
    }
    return std::nullopt;
  }

  if (
    ends_statement(prev) || is_word_in(prev, k_prefix_keywords) ||
    is_word_in(prev, syntax::k_element_keywords)) {
    ctx.kind = CompletionContextKind::MemberStart;
    return ctx;
  }

  return std::nullopt;
}

}  // namespace sysml::lsp
