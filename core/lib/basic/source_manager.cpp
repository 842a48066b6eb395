// sysml/basic/source_manager.cpp - Line tables, source files and the registry
#include "sysml/basic/source_manager.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace sysml
{
namespace
{

/// Bytes in the UTF-8 sequence introduced by `lead` (1 for stray bytes).
uint32_t utf8_sequence_length(char lead) noexcept
{
  const auto c = static_cast<unsigned char>(lead);
  if ((c & 0xE0U) == 0xC0U) return 2;
  if ((c & 0xF0U) == 0xE0U) return 3;
  if ((c & 0xF8U) == 0xF0U) return 4;
  return 1;
}

uint32_t utf16_units(uint32_t sequence_length) noexcept { return sequence_length == 4 ? 2U : 1U; }

/// Registry key: weakly canonical when the filesystem allows it.
std::string path_key(const fs::path & path)
{
  std::error_code ec;
  const fs::path canonical = fs::weakly_canonical(path, ec);
  return ec ? path.lexically_normal().string() : canonical.string();
}

}  // namespace

// ============================================================================
// LineTable
// ============================================================================

LineTable::LineTable(std::string_view text) : starts_{0}
{
  for (auto nl = text.find('\n'); nl != std::string_view::npos; nl = text.find('\n', nl + 1)) {
    starts_.push_back(static_cast<uint32_t>(nl + 1));
  }
}

uint32_t LineTable::line_of(uint32_t offset) const noexcept
{
  const auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
  return static_cast<uint32_t>(std::distance(starts_.begin(), it)) - 1;
}

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content)), lines_(content_)
{
}

void SourceFile::set_content(std::string new_content)
{
  content_ = std::move(new_content);
  lines_ = LineTable(content_);
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));
  const uint32_t line = lines_.line_of(offset);
  return {line + 1, offset - lines_.start_of(line, offset) + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= lines_.size()) {
    return {};
  }

  const auto size = static_cast<uint32_t>(content_.size());
  const uint32_t start = lines_.start_of(line_index, size);
  std::string_view line =
    std::string_view(content_).substr(start, lines_.start_of(line_index + 1, size) - start);

  if (!line.empty() && line.back() == '\n') line.remove_suffix(1);
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  return line;
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const uint32_t begin = range.get_begin().offset();
  const uint32_t end = std::min(range.get_end().offset(), static_cast<uint32_t>(content_.size()));
  if (begin >= content_.size() || end < begin) {
    return {};
  }
  return std::string_view(content_).substr(begin, end - begin);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const LineColumn begin = get_line_column(range.get_begin().offset());
  const LineColumn end = get_line_column(range.get_end().offset());
  FullSourceRange full;
  full.start_line = begin.line;
  full.start_column = begin.column;
  full.end_line = end.line;
  full.end_column = end.column;
  full.start_byte = range.get_begin().offset();
  full.end_byte = range.get_end().offset();
  return full;
}

uint32_t SourceFile::offset_of(
  uint32_t line_index, uint32_t character, PositionEncoding encoding) const noexcept
{
  const auto size = static_cast<uint32_t>(content_.size());
  if (line_index >= lines_.size()) {
    return size;
  }

  const uint32_t start = lines_.start_of(line_index, size);
  const std::string_view line = get_line(line_index);
  if (encoding == PositionEncoding::Utf8) {
    return start + std::min(character, static_cast<uint32_t>(line.size()));
  }

  uint32_t units = 0;
  uint32_t i = 0;
  while (i < line.size()) {
    const uint32_t n = utf8_sequence_length(line[i]);
    if (units + utf16_units(n) > character || i + n > line.size()) {
      break;
    }
    units += utf16_units(n);
    i += n;
  }
  return start + i;
}

uint32_t SourceFile::character_of(uint32_t offset, PositionEncoding encoding) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));
  const uint32_t start = lines_.start_of(lines_.line_of(offset), offset);
  if (encoding == PositionEncoding::Utf8) {
    return offset - start;
  }

  uint32_t units = 0;
  for (uint32_t i = start; i < offset;) {
    const uint32_t n = utf8_sequence_length(content_[i]);
    units += utf16_units(n);
    i += n;
  }
  return units;
}

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  std::string key = path_key(path);
  if (const auto it = by_path_.find(key); it != by_path_.end()) {
    update_content(it->second, std::move(content));
    return it->second;
  }

  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  by_path_.emplace(std::move(key), id);
  return id;
}

void SourceRegistry::update_content(FileId id, std::string new_content)
{
  if (get_file(id) != nullptr) {
    files_[id.value]->set_content(std::move(new_content));
  }
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

const fs::path & SourceRegistry::get_path(FileId id) const noexcept
{
  static const fs::path k_no_path;
  const SourceFile * f = get_file(id);
  return f != nullptr ? f->path() : k_no_path;
}

std::optional<FileId> SourceRegistry::find_by_path(const fs::path & path) const
{
  if (const auto it = by_path_.find(path_key(path)); it != by_path_.end()) {
    return it->second;
  }
  return std::nullopt;
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const SourceFile * f = get_file(range.file_id());
  return f != nullptr ? f->get_full_range(range) : FullSourceRange{};
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * f = get_file(range.file_id());
  return f != nullptr ? f->get_slice(range) : std::string_view{};
}

}  // namespace sysml
