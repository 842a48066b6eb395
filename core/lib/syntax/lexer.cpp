#include "sysml/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace sysml::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Longest spelling first so that e.g. ":>>" wins over ":>".
constexpr std::array<std::pair<std::string_view, TokenKind>, 12> k_multi_char_punct = {{
  {"::>", TokenKind::ColonColonGt},
  {":>>", TokenKind::ColonGtGt},
  {"::", TokenKind::ColonColon},
  {":>", TokenKind::ColonGt},
  {":=", TokenKind::ColonEq},
  {"..", TokenKind::DotDot},
  {"->", TokenKind::Arrow},
  {"**", TokenKind::StarStar},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::Ne},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
}};

TokenKind single_char_kind(char ch)
{
  switch (ch) {
    case '(':
      return TokenKind::LParen;
    case ')':
      return TokenKind::RParen;
    case '{':
      return TokenKind::LBrace;
    case '}':
      return TokenKind::RBrace;
    case '[':
      return TokenKind::LBracket;
    case ']':
      return TokenKind::RBracket;
    case ',':
      return TokenKind::Comma;
    case ';':
      return TokenKind::Semicolon;
    case '.':
      return TokenKind::Dot;
    case ':':
      return TokenKind::Colon;
    case '@':
      return TokenKind::At;
    case '#':
      return TokenKind::Hash;
    case '?':
      return TokenKind::Question;
    case '~':
      return TokenKind::Tilde;
    case '+':
      return TokenKind::Plus;
    case '-':
      return TokenKind::Minus;
    case '*':
      return TokenKind::Star;
    case '/':
      return TokenKind::Slash;
    case '%':
      return TokenKind::Percent;
    case '^':
      return TokenKind::Caret;
    case '&':
      return TokenKind::Amp;
    case '|':
      return TokenKind::Pipe;
    case '!':
      return TokenKind::Bang;
    case '=':
      return TokenKind::Eq;
    case '<':
      return TokenKind::Lt;
    case '>':
      return TokenKind::Gt;
    default:
      return TokenKind::Unknown;
  }
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make_token(TokenKind k, uint32_t start) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  return {k, make_range(start, end), src_.substr(start, end - start)};
}

void Lexer::skip_whitespace_and_line_comments()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
      advance(1);
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    break;
  }
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_quoted_name()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && peek() != '\'' && peek() != '\n') {
    if (peek() == '\\' && pos_ + 1 < src_.size()) {
      advance(2);
      continue;
    }
    advance(1);
  }

  if (eof() || peek() != '\'') {
    return make_token(TokenKind::Unknown, start);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);

  Token t = make_token(TokenKind::Identifier, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  t.quoted = true;
  if (t.text.empty()) {
    t.kind = TokenKind::Unknown;
  }
  return t;
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && is_digit(peek())) {
    advance(1);
  }

  bool is_real = false;

  // A '.' followed by a digit is a fraction; "1..5" stays a range.
  if (peek() == '.' && is_digit(peek(1))) {
    is_real = true;
    advance(1);
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    const size_t sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
    if (is_digit(peek(1 + sign))) {
      is_real = true;
      advance(1 + sign);
      while (!eof() && is_digit(peek())) {
        advance(1);
      }
    }
  }

  return make_token(is_real ? TokenKind::RealLiteral : TokenKind::IntLiteral, start);
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && peek() != '"') {
    if (peek() == '\n') {
      // Raw newlines end an unterminated string.
      return make_token(TokenKind::Unknown, start);
    }
    if (peek() == '\\' && pos_ + 1 < src_.size()) {
      advance(2);
      continue;
    }
    advance(1);
  }

  if (eof()) {
    return make_token(TokenKind::Unknown, start);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);

  Token t = make_token(TokenKind::StringLiteral, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_block_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && !starts_with("*/")) {
    advance(1);
  }

  if (eof()) {
    return make_token(TokenKind::Unknown, start);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(2);

  Token t = make_token(TokenKind::BlockComment, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::next_token()
{
  skip_whitespace_and_line_comments();

  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    return {TokenKind::Eof, make_range(at, at), {}};
  }

  if (starts_with("/*")) {
    return lex_block_comment();
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (c == '\'') {
    return lex_quoted_name();
  }
  if (c == '"') {
    return lex_string();
  }

  const auto start = static_cast<uint32_t>(pos_);

  for (const auto & [spelling, kind] : k_multi_char_punct) {
    if (starts_with(spelling)) {
      advance(spelling.size());
      return make_token(kind, start);
    }
  }

  advance(1);
  return make_token(single_char_kind(static_cast<char>(c)), start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(t);
    if (done) {
      break;
    }
  }
  return out;
}

}  // namespace sysml::syntax
