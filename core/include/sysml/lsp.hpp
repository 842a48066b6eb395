// sysml/lsp.hpp - LSP-like language service APIs (serverless)
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sysml/basic/source_manager.hpp"

namespace sysml::lsp
{

/**
 * Serverless language service for SysML/KerML models.
 *
 * Provides LSP-equivalent features (diagnostics, hover, definition,
 * references, outline, workspace symbols, completion, rename, folding,
 * selection ranges, semantic tokens) on top of a sysml::Workspace without
 * implementing an LSP server. Every payload is a JSON string.
 *
 * Positions passed in are UTF-8 byte offsets; offset_at() converts an editor
 * position. Ranges carry byte offsets, 1-indexed line/column, and an
 * LSP-ready `start`/`end` pair (0-indexed line, character in the position
 * encoding set with set_position_encoding()).
 *
 * Documents are keyed by URI. `file://` URIs map to filesystem paths; any
 * other URI is used verbatim as the document's path.
 *
 * Tickets: a host that queues requests takes a ticket with begin_request()
 * when a request arrives and passes it to the query. If a document changed
 * in between, the query returns an empty payload with `"stale": true`.
 * Without a ticket the query answers from the current model.
 */
class LanguageService
{
public:
  using Ticket = std::optional<uint64_t>;

  LanguageService();
  ~LanguageService();

  LanguageService(const LanguageService &) = delete;
  LanguageService & operator=(const LanguageService &) = delete;

  LanguageService(LanguageService && other) noexcept;
  LanguageService & operator=(LanguageService && other) noexcept;

  /// Register standard library files (first call only). Returns files added.
  size_t load_stdlib(const std::filesystem::path & dir);

  /// Units of the `character` field in ranges and in offset_at().
  void set_position_encoding(PositionEncoding encoding) noexcept;
  [[nodiscard]] PositionEncoding position_encoding() const noexcept;

  // Documents
  //
  // Each mutation repopulates the model and returns the URIs of the open
  // documents whose diagnostics may have changed (the document itself first).
  std::vector<std::string> open_document(std::string uri, std::string text);
  std::vector<std::string> change_document(std::string uri, std::string text);
  std::vector<std::string> close_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;
  [[nodiscard]] std::vector<std::string> open_documents() const;

  /// Byte offset of a 0-indexed editor position in an open document.
  [[nodiscard]] std::optional<uint32_t> offset_at(
    std::string_view uri, uint32_t line, uint32_t character) const;

  /// Generation of the visible model.
  [[nodiscard]] uint64_t generation() const noexcept;

  [[nodiscard]] uint64_t begin_request() const noexcept;
  [[nodiscard]] bool is_current(uint64_t ticket) const noexcept;

  // Diagnostics (parse + semantic)
  std::string diagnostics_json(std::string_view uri, Ticket ticket = std::nullopt);

  // Hover
  std::string hover_json(std::string_view uri, uint32_t byte_offset, Ticket ticket = std::nullopt);

  // Go-to-definition
  std::string definition_json(
    std::string_view uri, uint32_t byte_offset, Ticket ticket = std::nullopt);

  // Find references
  std::string references_json(
    std::string_view uri, uint32_t byte_offset, bool include_declaration = true,
    Ticket ticket = std::nullopt);

  // Document symbols (outline)
  std::string document_symbols_json(std::string_view uri, Ticket ticket = std::nullopt);

  // Workspace symbols, filtered by a case-insensitive substring of the
  // qualified name (empty query matches everything)
  std::string workspace_symbols_json(std::string_view query, Ticket ticket = std::nullopt);

  // Completion: keywords where a member starts, visible names after `:` and
  // relationship keywords, namespace members after `Q::`
  std::string completion_json(
    std::string_view uri, uint32_t byte_offset, Ticket ticket = std::nullopt);

  // Rename: edits for the declaration and every reference, or an "error"
  std::string rename_json(
    std::string_view uri, uint32_t byte_offset, std::string_view new_name,
    Ticket ticket = std::nullopt);

  // Folding ranges: multi-line bodies and block comments
  std::string folding_ranges_json(std::string_view uri, Ticket ticket = std::nullopt);

  // Selection ranges: for each offset, the enclosing ranges innermost first
  std::string selection_ranges_json(
    std::string_view uri, const std::vector<uint32_t> & byte_offsets, Ticket ticket = std::nullopt);

  // Semantic tokens: declared names and references, in source order
  std::string semantic_tokens_json(std::string_view uri, Ticket ticket = std::nullopt);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sysml::lsp
