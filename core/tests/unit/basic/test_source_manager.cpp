// tests/basic/test_source_manager.cpp - Source files, ranges and the registry

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "sysml/basic/source_manager.hpp"

using namespace sysml;
namespace fs = std::filesystem;

// ============================================================================
// SourceFile
// ============================================================================

TEST(BasicSourceFile, LineColumnIsOneIndexed)
{
  const SourceFile f("a.sysml", "package P {\n  part def A;\n}\n");

  EXPECT_EQ(f.line_count(), 4U);
  const auto lc = f.get_line_column(16);  // 'r' of "part"
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 5U);

  EXPECT_EQ(f.get_line_column(0).line, 1U);
  EXPECT_EQ(f.get_line_column(0).column, 1U);

  // Past the end clamps to the end of the buffer
  EXPECT_EQ(f.get_line_column(10000).line, 4U);
}

TEST(BasicSourceFile, GetLineStripsLineEndings)
{
  const SourceFile f("crlf.sysml", "part def A;\r\npart def B;\r\nlast");
  EXPECT_EQ(f.get_line(0), "part def A;");
  EXPECT_EQ(f.get_line(1), "part def B;");
  EXPECT_EQ(f.get_line(2), "last");
  EXPECT_TRUE(f.get_line(3).empty());
}

TEST(BasicSourceFile, SliceAndFullRange)
{
  const SourceFile f("r.sysml", "part def Car;\npart engine : Engine;\n");
  const SourceRange r(FileId{0}, 28, 34);

  EXPECT_EQ(f.get_slice(r), "Engine");
  const FullSourceRange full = f.get_full_range(r);
  EXPECT_EQ(full.start_line, 2U);
  EXPECT_EQ(full.start_column, 15U);
  EXPECT_EQ(full.end_column, 21U);
  EXPECT_EQ(full.start_byte, 28U);

  EXPECT_TRUE(f.get_slice(SourceRange{}).empty());
  EXPECT_FALSE(f.get_full_range(SourceRange{}).is_valid());
}

TEST(BasicSourceFile, OffsetOfClampsToLine)
{
  const SourceFile f("o.sysml", "ab\ncdef\n");
  EXPECT_EQ(f.offset_of(1, 2), 5U);
  EXPECT_EQ(f.offset_of(1, 99), 7U);
  EXPECT_EQ(f.offset_of(9, 0), 8U);
}

TEST(BasicSourceFile, Utf16PositionsCountSurrogatePairsTwice)
{
  // "é" is 2 bytes / 1 unit, "𝄞" is 4 bytes / 2 units
  const SourceFile f("u.sysml", "part def A;\n'\xC3\xA9\xF0\x9D\x84\x9E' x;\n");
  const uint32_t line_start = 12;

  EXPECT_EQ(f.offset_of(1, 1, PositionEncoding::Utf16), line_start + 1);
  EXPECT_EQ(f.offset_of(1, 2, PositionEncoding::Utf16), line_start + 3);
  EXPECT_EQ(f.offset_of(1, 4, PositionEncoding::Utf16), line_start + 7);
  EXPECT_EQ(f.offset_of(1, 5, PositionEncoding::Utf16), line_start + 8);

  // Halfway through the pair rounds down to the code point
  EXPECT_EQ(f.offset_of(1, 3, PositionEncoding::Utf16), line_start + 3);

  EXPECT_EQ(f.character_of(line_start + 7, PositionEncoding::Utf16), 4U);
  EXPECT_EQ(f.character_of(line_start + 7, PositionEncoding::Utf8), 7U);
  EXPECT_EQ(f.character_of(5, PositionEncoding::Utf16), 5U);
}

TEST(BasicLineTable, LinesStartAfterEachNewline)
{
  const LineTable lines("a\nbc\n\nd");
  ASSERT_EQ(lines.size(), 4U);
  EXPECT_EQ(lines.line_of(0), 0U);
  EXPECT_EQ(lines.line_of(2), 1U);
  EXPECT_EQ(lines.line_of(4), 1U);
  EXPECT_EQ(lines.line_of(5), 2U);
  EXPECT_EQ(lines.line_of(6), 3U);
  EXPECT_EQ(lines.start_of(3, 7), 6U);
  EXPECT_EQ(lines.start_of(4, 7), 7U);

  EXPECT_EQ(LineTable().size(), 1U);
  EXPECT_EQ(LineTable("").line_of(0), 0U);
}

TEST(BasicSourceFile, SetContentRebuildsLineTable)
{
  SourceFile f("s.sysml", "one line");
  EXPECT_EQ(f.line_count(), 1U);
  f.set_content("a\nb\nc");
  EXPECT_EQ(f.line_count(), 3U);
  EXPECT_EQ(f.get_line(2), "c");
}

// ============================================================================
// SourceRange
// ============================================================================

TEST(BasicSourceRange, ContainsAndTouches)
{
  const SourceRange r(FileId{1}, 10, 15);
  EXPECT_TRUE(r.contains(SourceLocation(FileId{1}, 10)));
  EXPECT_FALSE(r.contains(SourceLocation(FileId{1}, 15)));
  EXPECT_TRUE(r.touches(15));
  EXPECT_FALSE(r.touches(16));
  EXPECT_FALSE(r.contains(SourceLocation(FileId{2}, 12)));
  EXPECT_EQ(r.size(), 5U);

  const SourceRange joined = join_ranges(r, SourceRange(FileId{1}, 20, 25));
  EXPECT_EQ(joined.get_begin().offset(), 10U);
  EXPECT_EQ(joined.get_end().offset(), 25U);
  EXPECT_EQ(join_ranges(SourceRange{}, r), r);
}

// ============================================================================
// SourceRegistry
// ============================================================================

TEST(BasicSourceRegistry, SamePathSharesId)
{
  SourceRegistry reg;
  const fs::path dir = fs::temp_directory_path() / "sysml_registry_test";
  const FileId a = reg.register_file(dir / "models" / "a.sysml", "part def A;");
  const FileId again = reg.register_file(dir / "models" / ".." / "models" / "a.sysml", "part def B;");
  const FileId b = reg.register_file(dir / "b.sysml", "");

  EXPECT_EQ(a, again);
  EXPECT_NE(a, b);
  EXPECT_EQ(reg.size(), 2U);

  // Re-registering replaced the content
  EXPECT_EQ(reg.get_file(a)->content(), "part def B;");
  EXPECT_EQ(reg.find_by_path(dir / "models" / "a.sysml"), a);
  EXPECT_FALSE(reg.find_by_path(dir / "missing.sysml").has_value());
}

TEST(BasicSourceRegistry, UpdateAndLookup)
{
  SourceRegistry reg;
  const FileId id = reg.register_file("u.sysml", "part def A;");
  reg.update_content(id, "package P;\npart def Z;");

  const SourceRange r(id, 20, 21);
  EXPECT_EQ(reg.get_slice(r), "Z");
  EXPECT_EQ(reg.get_full_range(r).start_line, 2U);
  EXPECT_EQ(reg.get_full_range(r).start_column, 10U);

  EXPECT_EQ(reg.get_file(FileId{42}), nullptr);
  EXPECT_TRUE(reg.get_slice(SourceRange(FileId{42}, 0, 1)).empty());
}
