// tests/basic/test_diagnostic.cpp - Diagnostic builder and per-file bag

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sysml/basic/diagnostic.hpp"
#include "sysml/basic/diagnostic_codes.hpp"

using namespace sysml;

// ============================================================================
// Builder
// ============================================================================

TEST(BasicDiagnostic, BuilderCommitsOnScopeExit)
{
  DiagnosticBag diags;
  {
    auto builder = diags.report_error(SourceRange(FileId{0}, 4, 8), "cannot find symbol 'Car'");
    builder.with_code(diag_codes::k_undefined_symbol);
    EXPECT_TRUE(diags.empty());
  }
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all().front().code, "E002");
  EXPECT_TRUE(diags.has_errors());
}

TEST(BasicDiagnostic, MovedBuilderCommitsOnce)
{
  DiagnosticBag diags;
  {
    auto first = diags.report_warning(SourceRange{}, "unused");
    auto second = std::move(first);
    second.with_help("remove it");
  }
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all().front().help_message, std::optional<std::string>("remove it"));
  EXPECT_FALSE(diags.has_errors());
}

TEST(BasicDiagnostic, PrimaryLabelFallsBackToFirstLabel)
{
  Diagnostic d;
  EXPECT_EQ(d.primary_label(), nullptr);
  EXPECT_FALSE(d.primary_range().is_valid());

  d.labels.push_back(Label{SourceRange(FileId{3}, 1, 2), "related", LabelStyle::Secondary});
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.file_id(), FileId{3});

  d.labels.push_back(Label{SourceRange(FileId{4}, 5, 6), "here", LabelStyle::Primary});
  EXPECT_EQ(d.primary_label()->message, "here");
  EXPECT_EQ(d.file_id(), FileId{4});
}

// ============================================================================
// Bag
// ============================================================================

TEST(BasicDiagnosticBag, ForFileKeepsReportOrder)
{
  DiagnosticBag diags;
  diags.report_error(SourceRange(FileId{1}, 30, 31), "b-late");
  diags.report_error(SourceRange(FileId{0}, 5, 6), "a");
  diags.report_error(SourceRange(FileId{1}, 2, 3), "b-early");
  diags.report_error(SourceRange{}, "nowhere");

  const auto in_b = diags.for_file(FileId{1});
  ASSERT_EQ(in_b.size(), 2U);
  EXPECT_EQ(in_b[0].message, "b-late");
  EXPECT_EQ(in_b[1].message, "b-early");

  EXPECT_EQ(diags.for_file(FileId{0}).size(), 1U);
  EXPECT_EQ(diags.for_file(FileId::invalid()).size(), 1U);
  EXPECT_TRUE(diags.for_file(FileId{7}).empty());
}

TEST(BasicDiagnosticBag, SourceOrderGroupsFilesAndUnlocatedLast)
{
  DiagnosticBag diags;
  diags.report_error(SourceRange{}, "nowhere");
  diags.report_error(SourceRange(FileId{1}, 30, 31), "b-late");
  diags.report_error(SourceRange(FileId{0}, 5, 6), "a");
  diags.report_error(SourceRange(FileId{1}, 2, 3), "b-early");
  diags.report_error(SourceRange(FileId{1}, 2, 4), "b-early-second");

  std::vector<std::string> order;
  for (const Diagnostic * d : diags.in_source_order()) {
    order.push_back(d->message);
  }
  const std::vector<std::string> expected{"a", "b-early", "b-early-second", "b-late", "nowhere"};
  EXPECT_EQ(order, expected);
}

TEST(BasicDiagnosticBag, CountsBySeverityAndCode)
{
  DiagnosticBag diags;
  EXPECT_EQ(diags.count(Severity::Error), 0U);

  diags.report_error(SourceRange{}, "one").with_code(diag_codes::k_duplicate_definition);
  diags.report_error(SourceRange{}, "two").with_code(diag_codes::k_duplicate_definition);
  diags.report_warning(SourceRange{}, "three");

  Diagnostic copied;
  copied.code = diag_codes::k_alias_cycle;
  diags.add(copied);

  EXPECT_EQ(diags.count(Severity::Error), 3U);
  EXPECT_EQ(diags.count(Severity::Warning), 1U);
  EXPECT_EQ(diags.count_code(diag_codes::k_duplicate_definition), 2U);
  EXPECT_EQ(diags.count_code(diag_codes::k_alias_cycle), 1U);
  EXPECT_EQ(diags.count_code("E999"), 0U);
}
