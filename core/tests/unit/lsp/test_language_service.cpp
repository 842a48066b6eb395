// tests/lsp/test_language_service.cpp - Serverless language service tests

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "sysml/lsp.hpp"

using json = nlohmann::json;

static uint32_t find_byte_offset(const std::string & text, const std::string & needle, size_t nth = 0)
{
  auto pos = text.find(needle);
  for (size_t i = 0; i < nth && pos != std::string::npos; ++i) {
    pos = text.find(needle, pos + 1);
  }
  EXPECT_NE(pos, std::string::npos) << "needle must exist: '" << needle << "'";
  if (pos == std::string::npos) return 0U;
  return static_cast<uint32_t>(pos);
}

static constexpr const char * k_lib_uri = "file:///tmp/sysml_lsp_test/lib.sysml";
static constexpr const char * k_app_uri = "file:///tmp/sysml_lsp_test/app.sysml";
static constexpr const char * k_blank_uri = "file:///tmp/sysml_lsp_test/blank.sysml";
static constexpr const char * k_more_uri = "file:///tmp/sysml_lsp_test/more.sysml";

static std::string lib_source()
{
  return "package Lib {\n"
         "  part def Engine {\n"
         "    doc /* Turns fuel into torque. */\n"
         "  }\n"
         "  abstract part def Vehicle;\n"
         "}\n";
}

static std::string app_source()
{
  return "package App {\n"
         "  import Lib::*;\n"
         "  part def Car :> Vehicle {\n"
         "    part engine : Engine;\n"
         "  }\n"
         "}\n";
}

static bool contains(const std::vector<std::string> & v, const std::string & s)
{
  return std::find(v.begin(), v.end(), s) != v.end();
}

// ============================================================================
// Documents and diagnostics
// ============================================================================

TEST(LspLanguageService, CleanDocumentsHaveNoDiagnostics)
{
  sysml::lsp::LanguageService svc;
  svc.open_document(k_lib_uri, lib_source());
  svc.open_document(k_app_uri, app_source());

  for (const char * uri : {k_lib_uri, k_app_uri}) {
    const auto j = json::parse(svc.diagnostics_json(uri));
    ASSERT_TRUE(j["items"].is_array());
    EXPECT_TRUE(j["items"].empty()) << j.dump();
    EXPECT_EQ(j["uri"], uri);
  }
  EXPECT_TRUE(svc.has_document(k_app_uri));
  EXPECT_EQ(svc.open_documents().size(), 2U);
}

TEST(LspLanguageService, DiagnosticsCarryCodeAndRange)
{
  sysml::lsp::LanguageService svc;
  const std::string src = "package P {\n  part def Car :> Vehicle;\n}\n";
  svc.open_document(k_app_uri, src);

  const auto j = json::parse(svc.diagnostics_json(k_app_uri));
  ASSERT_EQ(j["items"].size(), 1U);
  const auto & d = j["items"][0];
  EXPECT_EQ(d["code"], "E002");
  EXPECT_EQ(d["severity"], "error");
  EXPECT_EQ(d["message"], "cannot find symbol 'Vehicle'");
  EXPECT_EQ(d["range"]["startLine"], 2);
  EXPECT_EQ(d["range"]["startByte"], find_byte_offset(src, "Vehicle"));
}

TEST(LspLanguageService, ChangeReportsDependentDocuments)
{
  sysml::lsp::LanguageService svc;
  svc.open_document(k_lib_uri, lib_source());
  svc.open_document(k_app_uri, app_source());

  const auto affected = svc.change_document(k_lib_uri, "package Lib { part def Engine; }\n");
  ASSERT_FALSE(affected.empty());
  EXPECT_EQ(affected[0], k_lib_uri);
  EXPECT_TRUE(contains(affected, k_app_uri));

  const auto j = json::parse(svc.diagnostics_json(k_app_uri));
  ASSERT_EQ(j["items"].size(), 1U);
  EXPECT_EQ(j["items"][0]["message"], "cannot find symbol 'Vehicle'");
}

TEST(LspLanguageService, CloseRemovesDocumentFromModel)
{
  sysml::lsp::LanguageService svc;
  svc.open_document(k_lib_uri, lib_source());
  svc.open_document(k_app_uri, app_source());
  const uint64_t before = svc.generation();

  const auto affected = svc.close_document(k_lib_uri);
  EXPECT_TRUE(contains(affected, k_app_uri));
  EXPECT_FALSE(svc.has_document(k_lib_uri));
  EXPECT_GT(svc.generation(), before);

  const auto j = json::parse(svc.diagnostics_json(k_app_uri));
  EXPECT_FALSE(j["items"].empty());

  // Unknown documents answer with empty payloads
  EXPECT_TRUE(svc.close_document(k_lib_uri).empty());
  EXPECT_TRUE(json::parse(svc.diagnostics_json(k_lib_uri))["items"].empty());
}

// ============================================================================
// Navigation
// ============================================================================

TEST(LspLanguageService, HoverShowsKeywordRoleAndDoc)
{
  sysml::lsp::LanguageService svc;
  const std::string app = app_source();
  svc.open_document(k_lib_uri, lib_source());
  svc.open_document(k_app_uri, app);

  const auto j = json::parse(svc.hover_json(k_app_uri, find_byte_offset(app, "Engine;") + 1));
  ASSERT_TRUE(j["contents"].is_string()) << j.dump();
  const std::string md = j["contents"];
  EXPECT_NE(md.find("**part def** `Lib::Engine`"), std::string::npos) << md;
  EXPECT_NE(md.find("Role: component"), std::string::npos) << md;
  EXPECT_NE(md.find("Turns fuel into torque."), std::string::npos) << md;
  EXPECT_EQ(j["range"]["startByte"], find_byte_offset(app, "Engine;"));

  // Blank lines outside any element have nothing to show
  svc.open_document(k_blank_uri, "\n\npart def Lonely;\n");
  const auto none = json::parse(svc.hover_json(k_blank_uri, 0));
  EXPECT_TRUE(none["contents"].is_null());
  EXPECT_TRUE(none["range"].is_null());
}

TEST(LspLanguageService, HoverMarksAbstractTypes)
{
  sysml::lsp::LanguageService svc;
  const std::string app = app_source();
  svc.open_document(k_lib_uri, lib_source());
  svc.open_document(k_app_uri, app);

  const auto j = json::parse(svc.hover_json(k_app_uri, find_byte_offset(app, "Vehicle") + 2));
  ASSERT_TRUE(j["contents"].is_string());
  EXPECT_NE(j["contents"].get<std::string>().find("*abstract*"), std::string::npos);
}

TEST(LspLanguageService, DefinitionCrossesFiles)
{
  sysml::lsp::LanguageService svc;
  const std::string lib = lib_source();
  const std::string app = app_source();
  svc.open_document(k_lib_uri, lib);
  svc.open_document(k_app_uri, app);

  const auto j = json::parse(svc.definition_json(k_app_uri, find_byte_offset(app, "Engine;")));
  ASSERT_EQ(j["locations"].size(), 1U);
  EXPECT_EQ(j["locations"][0]["uri"], k_lib_uri);
  EXPECT_EQ(j["locations"][0]["range"]["startLine"], 2);
  EXPECT_EQ(j["locations"][0]["range"]["startByte"], find_byte_offset(lib, "Engine"));

  // Clamped past the end of the document
  const auto past = json::parse(svc.definition_json(k_app_uri, 100000));
  EXPECT_TRUE(past["locations"].is_array());
}

TEST(LspLanguageService, ReferencesWithAndWithoutDeclaration)
{
  sysml::lsp::LanguageService svc;
  const std::string lib = lib_source();
  svc.open_document(k_lib_uri, lib);
  svc.open_document(k_app_uri, app_source());
  svc.open_document(k_more_uri, "package More { part spare : Lib::Engine; }\n");

  const uint32_t decl = find_byte_offset(lib, "Engine") + 1;
  const auto with_decl = json::parse(svc.references_json(k_lib_uri, decl, true));
  const auto without_decl = json::parse(svc.references_json(k_lib_uri, decl, false));

  ASSERT_EQ(with_decl["locations"].size(), 3U) << with_decl.dump();
  ASSERT_EQ(without_decl["locations"].size(), 2U);
  EXPECT_EQ(with_decl["locations"][0]["uri"], k_lib_uri);
  for (const auto & loc : without_decl["locations"]) {
    EXPECT_EQ(loc["kind"], "typing");
  }
}

// ============================================================================
// Symbols
// ============================================================================

TEST(LspLanguageService, DocumentSymbolsInDeclarationOrder)
{
  sysml::lsp::LanguageService svc;
  svc.open_document(k_app_uri, app_source());

  const auto j = json::parse(svc.document_symbols_json(k_app_uri));
  const auto & syms = j["symbols"];
  ASSERT_EQ(syms.size(), 3U) << j.dump();
  EXPECT_EQ(syms[0]["qualifiedName"], "App");
  EXPECT_EQ(syms[1]["qualifiedName"], "App::Car");
  EXPECT_EQ(syms[1]["detail"], "part def");
  EXPECT_EQ(syms[2]["qualifiedName"], "App::Car::engine");
  EXPECT_EQ(syms[2]["name"], "engine");
}

TEST(LspLanguageService, WorkspaceSymbolsFilterCaseInsensitively)
{
  sysml::lsp::LanguageService svc;
  svc.open_document(k_lib_uri, lib_source());
  svc.open_document(k_app_uri, app_source());

  const auto j = json::parse(svc.workspace_symbols_json("ENGINE"));
  std::vector<std::string> names;
  for (const auto & s : j["symbols"]) {
    names.push_back(s["qualifiedName"]);
  }
  ASSERT_EQ(names.size(), 2U);
  EXPECT_TRUE(contains(names, "Lib::Engine"));
  EXPECT_TRUE(contains(names, "App::Car::engine"));

  const auto all = json::parse(svc.workspace_symbols_json(""));
  EXPECT_EQ(all["symbols"].size(), 6U);
}

TEST(LspLanguageService, StdlibSymbolsAreSearchable)
{
  sysml::lsp::LanguageService svc;
  EXPECT_GT(svc.load_stdlib(SYSML_TEST_STDLIB_DIR), 0U);
  svc.open_document(k_app_uri, "part def Car { attribute speed : Real; }\n");

  EXPECT_TRUE(json::parse(svc.diagnostics_json(k_app_uri))["items"].empty());
  const auto j = json::parse(svc.workspace_symbols_json("ScalarValues::Real"));
  ASSERT_FALSE(j["symbols"].empty());
  EXPECT_EQ(j["symbols"][0]["qualifiedName"], "ScalarValues::Real");
}

// ============================================================================
// Request tickets
// ============================================================================

TEST(LspLanguageService, TicketTakenBeforeAnEditAnswersStale)
{
  sysml::lsp::LanguageService svc;
  const std::string app = app_source();
  svc.open_document(k_lib_uri, lib_source());
  svc.open_document(k_app_uri, app);
  const uint32_t at = find_byte_offset(app, "Engine;");

  // Request read, then an edit arrives before it is answered
  const uint64_t ticket = svc.begin_request();
  EXPECT_TRUE(svc.is_current(ticket));
  svc.change_document(k_lib_uri, lib_source() + "\n");
  EXPECT_FALSE(svc.is_current(ticket));

  const auto stale = json::parse(svc.definition_json(k_app_uri, at, ticket));
  EXPECT_TRUE(stale["locations"].empty());
  EXPECT_TRUE(stale.value("stale", false));

  const auto stale_hover = json::parse(svc.hover_json(k_app_uri, at, ticket));
  EXPECT_TRUE(stale_hover["contents"].is_null());
  EXPECT_TRUE(stale_hover["range"].is_null());

  const auto fresh = json::parse(svc.definition_json(k_app_uri, at, svc.begin_request()));
  EXPECT_EQ(fresh["locations"].size(), 1U);
  EXPECT_FALSE(fresh.contains("stale"));

  // Without a ticket the current model answers
  EXPECT_EQ(json::parse(svc.definition_json(k_app_uri, at))["locations"].size(), 1U);
}

// ============================================================================
// Positions
// ============================================================================

TEST(LspLanguageService, Utf16PositionsCountSurrogatePairs)
{
  sysml::lsp::LanguageService svc;
  // "/* <U+1F600> */ part def Car;" - the emoji is 4 bytes, 2 UTF-16 units
  const std::string src = "/* \xF0\x9F\x98\x80 */ part def Car;\n";
  svc.open_document(k_blank_uri, src);
  const uint32_t car = find_byte_offset(src, "Car");
  ASSERT_EQ(car, 20U);

  const auto utf8 = json::parse(svc.document_symbols_json(k_blank_uri));
  EXPECT_EQ(utf8["symbols"][0]["selectionRange"]["start"]["character"], 20);
  EXPECT_EQ(svc.offset_at(k_blank_uri, 0, 20).value_or(0), car);

  svc.set_position_encoding(sysml::PositionEncoding::Utf16);
  const auto utf16 = json::parse(svc.document_symbols_json(k_blank_uri));
  EXPECT_EQ(utf16["symbols"][0]["selectionRange"]["start"]["line"], 0);
  EXPECT_EQ(utf16["symbols"][0]["selectionRange"]["start"]["character"], 18);
  EXPECT_EQ(svc.offset_at(k_blank_uri, 0, 18).value_or(0), car);

  EXPECT_FALSE(svc.offset_at(k_app_uri, 0, 0).has_value());
}

// ============================================================================
// Completion
// ============================================================================

static std::vector<std::string> labels(const json & items)
{
  std::vector<std::string> out;
  for (const auto & item : items) {
    out.push_back(item["label"]);
  }
  return out;
}

TEST(LspLanguageService, CompletionAfterColonListsVisibleNames)
{
  sysml::lsp::LanguageService svc;
  const std::string app = app_source();
  svc.open_document(k_lib_uri, lib_source());
  svc.open_document(k_app_uri, app);

  const uint32_t word = find_byte_offset(app, "Engine;");
  const auto j = json::parse(svc.completion_json(k_app_uri, word + 2));
  const auto names = labels(j["items"]);
  EXPECT_TRUE(contains(names, "Engine")) << j.dump();
  EXPECT_TRUE(contains(names, "Vehicle"));
  EXPECT_TRUE(contains(names, "Car"));
  EXPECT_TRUE(contains(names, "Lib"));

  for (const auto & item : j["items"]) {
    EXPECT_EQ(item["replaceRange"]["startByte"], word);
    EXPECT_EQ(item["replaceRange"]["endByte"], word + 6);
    if (item["label"] == "Engine") {
      EXPECT_EQ(item["kind"], "Class");
      EXPECT_EQ(item["detail"], "part def Lib::Engine");
    }
    if (item["label"] == "Lib") {
      EXPECT_EQ(item["kind"], "Module");
    }
  }
}

TEST(LspLanguageService, CompletionAfterQualifierListsMembers)
{
  sysml::lsp::LanguageService svc;
  const std::string more = "package More { part spare : Lib::Engine; }\n";
  svc.open_document(k_lib_uri, lib_source());
  svc.open_document(k_app_uri, more);

  const auto j = json::parse(svc.completion_json(k_app_uri, find_byte_offset(more, "Engine;") + 1));
  const auto names = labels(j["items"]);
  ASSERT_EQ(names.size(), 2U) << j.dump();
  EXPECT_EQ(names[0], "Engine");
  EXPECT_EQ(names[1], "Vehicle");
}

TEST(LspLanguageService, CompletionOffersKeywordsWhereAMemberStarts)
{
  sysml::lsp::LanguageService svc;
  const std::string src = "package P {\n  \n}\n";
  svc.open_document(k_blank_uri, src);

  const auto j = json::parse(svc.completion_json(k_blank_uri, find_byte_offset(src, "\n  \n") + 3));
  const auto names = labels(j["items"]);
  EXPECT_TRUE(contains(names, "part"));
  EXPECT_TRUE(contains(names, "package"));
  EXPECT_TRUE(contains(names, "import"));
  for (const auto & item : j["items"]) {
    EXPECT_EQ(item["kind"], "Keyword");
  }
}

TEST(LspLanguageService, CompletionIsQuietInComments)
{
  sysml::lsp::LanguageService svc;
  const std::string src = "package P {\n  // part x : \n}\n";
  svc.open_document(k_blank_uri, src);

  const auto j = json::parse(svc.completion_json(k_blank_uri, find_byte_offset(src, ": ") + 2));
  EXPECT_TRUE(j["items"].empty()) << j.dump();
}

// ============================================================================
// Rename
// ============================================================================

TEST(LspLanguageService, RenameEditsDeclarationAndEveryReference)
{
  sysml::lsp::LanguageService svc;
  const std::string lib = lib_source();
  const std::string app = app_source();
  const std::string more = "package More { part spare : Lib::Engine; }\n";
  svc.open_document(k_lib_uri, lib);
  svc.open_document(k_app_uri, app);
  svc.open_document(k_more_uri, more);

  // From a reference site; the qualified reference keeps its qualifier
  const auto j = json::parse(svc.rename_json(k_app_uri, find_byte_offset(app, "Engine;"), "Motor"));
  ASSERT_FALSE(j.contains("error")) << j.dump();
  const auto & changes = j["changes"];
  ASSERT_EQ(changes.size(), 3U) << j.dump();

  ASSERT_EQ(changes[k_lib_uri].size(), 1U);
  EXPECT_EQ(changes[k_lib_uri][0]["newText"], "Motor");
  EXPECT_EQ(changes[k_lib_uri][0]["range"]["startByte"], find_byte_offset(lib, "Engine"));

  ASSERT_EQ(changes[k_app_uri].size(), 1U);
  EXPECT_EQ(changes[k_app_uri][0]["range"]["startByte"], find_byte_offset(app, "Engine;"));

  ASSERT_EQ(changes[k_more_uri].size(), 1U);
  EXPECT_EQ(changes[k_more_uri][0]["range"]["startByte"], find_byte_offset(more, "Engine"));
  EXPECT_EQ(changes[k_more_uri][0]["range"]["endByte"], find_byte_offset(more, ";"));
}

TEST(LspLanguageService, RenameRejectsInvalidNames)
{
  sysml::lsp::LanguageService svc;
  const std::string lib = lib_source();
  svc.open_document(k_lib_uri, lib);
  const uint32_t at = find_byte_offset(lib, "Engine");

  for (const char * bad : {"", "part", "9lives", "has space", "a::b"}) {
    const auto j = json::parse(svc.rename_json(k_lib_uri, at, bad));
    EXPECT_TRUE(j.contains("error")) << bad;
    EXPECT_FALSE(j.contains("changes")) << bad;
  }

  // Nothing under the cursor
  svc.open_document(k_blank_uri, "\n\npart def Lonely;\n");
  EXPECT_TRUE(json::parse(svc.rename_json(k_blank_uri, 0, "Other")).contains("error"));
}

TEST(LspLanguageService, RenameRefusesStdlibSymbols)
{
  sysml::lsp::LanguageService svc;
  ASSERT_GT(svc.load_stdlib(SYSML_TEST_STDLIB_DIR), 0U);
  const std::string src = "part def Car { attribute speed : Real; }\n";
  svc.open_document(k_app_uri, src);

  const auto j = json::parse(svc.rename_json(k_app_uri, find_byte_offset(src, "Real"), "Number"));
  ASSERT_TRUE(j.contains("error"));
  EXPECT_NE(j["error"].get<std::string>().find("standard library"), std::string::npos);
}

// ============================================================================
// Folding, selection and semantic tokens
// ============================================================================

TEST(LspLanguageService, FoldingCoversMultiLineBodiesAndComments)
{
  sysml::lsp::LanguageService svc;
  svc.open_document(k_lib_uri, lib_source());

  const auto j = json::parse(svc.folding_ranges_json(k_lib_uri));
  const auto & ranges = j["ranges"];
  ASSERT_EQ(ranges.size(), 2U) << j.dump();
  EXPECT_EQ(ranges[0]["kind"], "region");
  EXPECT_EQ(ranges[0]["range"]["start"]["line"], 0);
  EXPECT_EQ(ranges[0]["range"]["end"]["line"], 5);
  EXPECT_EQ(ranges[1]["range"]["start"]["line"], 1);
  EXPECT_EQ(ranges[1]["range"]["end"]["line"], 3);

  svc.open_document(k_blank_uri, "/* first\n   second */\npart def X;\n");
  const auto comments = json::parse(svc.folding_ranges_json(k_blank_uri));
  ASSERT_EQ(comments["ranges"].size(), 1U);
  EXPECT_EQ(comments["ranges"][0]["kind"], "comment");
  EXPECT_EQ(comments["ranges"][0]["range"]["end"]["line"], 1);
}

TEST(LspLanguageService, SelectionGrowsFromNameToOutermostElement)
{
  sysml::lsp::LanguageService svc;
  const std::string app = app_source();
  svc.open_document(k_app_uri, app);
  svc.open_document(k_blank_uri, "\n\npart def Lonely;\n");

  const auto j = json::parse(
    svc.selection_ranges_json(k_app_uri, {find_byte_offset(app, "engine") + 1}));
  ASSERT_EQ(j["selections"].size(), 1U);
  const auto & ranges = j["selections"][0]["ranges"];
  ASSERT_GE(ranges.size(), 3U) << j.dump();
  EXPECT_EQ(ranges[0]["startByte"], find_byte_offset(app, "engine"));
  EXPECT_EQ(ranges[ranges.size() - 1]["startByte"], 0);
  const auto width = [](const json & r) {
    return r["endByte"].get<uint32_t>() - r["startByte"].get<uint32_t>();
  };
  for (size_t i = 1; i < ranges.size(); ++i) {
    EXPECT_LT(width(ranges[i - 1]), width(ranges[i]));
  }

  // Outside every element the selection is the cursor itself
  const auto empty = json::parse(svc.selection_ranges_json(k_blank_uri, {0}));
  ASSERT_EQ(empty["selections"][0]["ranges"].size(), 1U);
  EXPECT_EQ(empty["selections"][0]["ranges"][0]["startByte"], 0);
  EXPECT_EQ(empty["selections"][0]["ranges"][0]["endByte"], 0);
}

TEST(LspLanguageService, SemanticTokensFollowSourceOrder)
{
  sysml::lsp::LanguageService svc;
  const std::string lib = lib_source();
  const std::string app = app_source();
  svc.open_document(k_lib_uri, lib);
  svc.open_document(k_app_uri, app);

  const auto j = json::parse(svc.semantic_tokens_json(k_app_uri));
  std::vector<std::string> types;
  std::vector<uint32_t> starts;
  for (const auto & t : j["tokens"]) {
    types.push_back(t["type"]);
    starts.push_back(t["range"]["startByte"]);
  }
  const std::vector<std::string> expected_types{"namespace", "type", "type", "variable", "type"};
  EXPECT_EQ(types, expected_types) << j.dump();
  const std::vector<uint32_t> expected_starts{
    find_byte_offset(app, "App"), find_byte_offset(app, "Car"), find_byte_offset(app, "Vehicle"),
    find_byte_offset(app, "engine"), find_byte_offset(app, "Engine;")};
  EXPECT_EQ(starts, expected_starts);
  EXPECT_EQ(j["tokens"][0]["modifiers"], json::array({"declaration"}));
  EXPECT_TRUE(j["tokens"][2]["modifiers"].empty());

  const auto in_lib = json::parse(svc.semantic_tokens_json(k_lib_uri));
  bool saw_abstract = false;
  for (const auto & t : in_lib["tokens"]) {
    if (t["range"]["startByte"] == find_byte_offset(lib, "Vehicle")) {
      EXPECT_EQ(t["modifiers"], json::array({"declaration", "abstract"}));
      saw_abstract = true;
    }
  }
  EXPECT_TRUE(saw_abstract);
}
