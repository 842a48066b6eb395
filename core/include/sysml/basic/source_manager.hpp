// sysml/basic/source_manager.hpp - Source files, locations and ranges
//
// This header provides the file registry shared by the parser, the semantic
// model and the tools, plus compact location types that refer into it.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sysml
{

namespace fs = std::filesystem;

// ============================================================================
// FileId - Compact file handle
// ============================================================================

/**
 * Index of a file inside a SourceRegistry.
 *
 * 16 bits keep SourceRange at 12 bytes; a workspace with more than 65534
 * files is rejected by the registry.
 */
struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
  [[nodiscard]] constexpr bool operator<(FileId other) const noexcept
  {
    return value < other.value;
  }
};

// ============================================================================
// SourceLocation - Byte offset inside one file
// ============================================================================

class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;

  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }

  /// Orders by file first, then by offset.
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_ != other.file_) {
      return file_ < other.file_;
    }
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return !(other < *this);
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - Half-open byte range [begin, end) inside one file
// ============================================================================

class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : begin_(file, begin), end_(file, end)
  {
  }

  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return begin_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid() && begin_.file_id() == end_.file_id();
  }

  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return is_valid() && loc.file_id() == file_id() && begin_.offset() <= loc.offset() &&
           loc.offset() < end_.offset();
  }

  /// Like contains(), but also accepts the end offset (cursor just after a word).
  [[nodiscard]] constexpr bool touches(uint32_t offset) const noexcept
  {
    return is_valid() && begin_.offset() <= offset && offset <= end_.offset();
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_.offset() - begin_.offset() : 0;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// Smallest range covering both inputs; an invalid side is ignored.
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (!a.is_valid()) return b;
  if (!b.is_valid()) return a;
  return {a.get_begin(), b.get_end()};
}

// ============================================================================
// Line/column information
// ============================================================================

/**
 * Human-readable line and column position (1-indexed, columns in bytes).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Byte range plus pre-computed line/column information.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

/// Unit in which an editor counts the characters of a line.
enum class PositionEncoding : uint8_t {
  Utf8,   ///< Bytes
  Utf16,  ///< UTF-16 code units; astral code points count twice
};

/**
 * Start offset of every line of a buffer.
 *
 * There is always at least one line. A buffer ending in '\n' has an empty
 * last line.
 */
class LineTable
{
public:
  LineTable() : starts_{0} {}
  explicit LineTable(std::string_view text);

  [[nodiscard]] size_t size() const noexcept { return starts_.size(); }

  /// 0-indexed line holding `offset`.
  [[nodiscard]] uint32_t line_of(uint32_t offset) const noexcept;

  /// Start of a 0-indexed line; `size()` yields `end`.
  [[nodiscard]] uint32_t start_of(uint32_t line_index, uint32_t end) const noexcept
  {
    return line_index < starts_.size() ? starts_[line_index] : end;
  }

private:
  std::vector<uint32_t> starts_;
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Content of one model file plus its line table.
 */
class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return lines_.size(); }

  void set_content(std::string new_content);

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line (0-indexed), without its line ending.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

  /**
   * Byte offset of an editor position (0-indexed line and character).
   *
   * A character past the end of its line clamps to the line end; a line past
   * the end of the buffer yields the buffer size. A UTF-16 character that
   * falls inside a surrogate pair rounds down to the code point.
   */
  [[nodiscard]] uint32_t offset_of(
    uint32_t line_index, uint32_t character,
    PositionEncoding encoding = PositionEncoding::Utf8) const noexcept;

  /// 0-indexed character of `offset` within its line.
  [[nodiscard]] uint32_t character_of(uint32_t offset, PositionEncoding encoding) const noexcept;

private:
  fs::path path_;
  std::string content_;
  LineTable lines_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Owns every source file of a session and maps paths to FileIds.
 *
 * Paths are normalized (weakly canonical) before lookup, so the same file
 * reached through different relative spellings shares one FileId. FileIds
 * are never reused.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Register a file, or return the existing id (content is then replaced).
  [[nodiscard]] FileId register_file(fs::path path, std::string content);

  void update_content(FileId id, std::string new_content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_path(const fs::path & path) const;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
  std::map<std::string, FileId, std::less<>> by_path_;
};

}  // namespace sysml
