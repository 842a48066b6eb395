// sysml/syntax/token.hpp - Token kinds produced by the lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "sysml/basic/source_manager.hpp"

namespace sysml::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  BlockComment,  // /* ... */ (text is the interior)

  Identifier,  // also 'unrestricted names' (text is the interior, quoted = true)
  IntLiteral,
  RealLiteral,
  StringLiteral,  // text is the contents without quotes

  // Punctuation
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Comma,
  Semicolon,
  Dot,
  DotDot,
  Colon,
  ColonColon,
  ColonGt,       // :>
  ColonGtGt,     // :>>
  ColonColonGt,  // ::>
  ColonEq,       // :=
  Arrow,         // ->
  At,
  Hash,
  Question,
  Tilde,

  // Operators (only inside value expressions)
  Plus,
  Minus,
  Star,
  StarStar,
  Slash,
  Percent,
  Caret,
  Amp,
  Pipe,
  Bang,
  Eq,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes)
  std::string_view text;  // slice view (for quoted names and strings: interior)
  bool quoted = false;    // identifier written as 'name'

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer";
    case TokenKind::RealLiteral:
      return "real";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::DotDot:
      return "..";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonColon:
      return "::";
    case TokenKind::ColonGt:
      return ":>";
    case TokenKind::ColonGtGt:
      return ":>>";
    case TokenKind::ColonColonGt:
      return "::>";
    case TokenKind::ColonEq:
      return ":=";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::At:
      return "@";
    case TokenKind::Hash:
      return "#";
    case TokenKind::Question:
      return "?";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::StarStar:
      return "**";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Amp:
      return "&";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
  }
  return "<unknown>";
}

}  // namespace sysml::syntax
