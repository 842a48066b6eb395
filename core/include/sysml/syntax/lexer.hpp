// sysml/syntax/lexer.hpp - Hand-written lexer for the textual notation
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "sysml/syntax/token.hpp"

namespace sysml::syntax
{

/**
 * Splits a source buffer into tokens.
 *
 * Line comments and whitespace are dropped. Block comments are kept as
 * BlockComment tokens because `doc` bodies are block comments. The last
 * token is always Eof.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace_and_line_comments();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_quoted_name();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_block_comment();

  [[nodiscard]] Token make_token(TokenKind k, uint32_t start) const noexcept;

  [[nodiscard]] SourceRange make_range(uint32_t start, uint32_t end) const noexcept
  {
    return {file_id_, start, end};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace sysml::syntax
