#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "sysml/lsp.hpp"
#include "sysml/lsp/completion_context.hpp"
#include "sysml/syntax/keywords.hpp"
#include "sysml/syntax/lexer.hpp"
#include "sysml/workspace/workspace.hpp"

namespace sysml::lsp
{
namespace
{

using json = nlohmann::json;
namespace fs = std::filesystem;

// -----------------------------
// Range helpers
// -----------------------------

uint32_t clamp_byte_offset(uint32_t off, size_t text_size)
{
  if (off > text_size) {
    return static_cast<uint32_t>(text_size);
  }
  return off;
}

json range_to_json(const sysml::FullSourceRange & r)
{
  return json{
    {"startByte", r.start_byte},     {"endByte", r.end_byte}, {"startLine", r.start_line},
    {"startColumn", r.start_column}, {"endLine", r.end_line}, {"endColumn", r.end_column},
  };
}

// -----------------------------
// URI helpers
// -----------------------------

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string percent_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(s[i]);
  }
  return out;
}

fs::path uri_to_path(std::string_view uri)
{
  if (starts_with(uri, "file:///")) {
    return fs::path(percent_decode(uri.substr(std::string_view("file://").size())));
  }
  return fs::path(std::string(uri));
}

std::string path_to_uri(const fs::path & path)
{
  const std::string s = path.generic_string();
  if (!s.empty() && s[0] == '/') {
    return "file://" + s;
  }
  return s;
}

std::string lowercase(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string hover_markdown(const sysml::SymbolView & sym)
{
  std::string md;
  md += "**" + sym.keyword + "** `" + sym.qualified_name + "`";
  if (sym.type) {
    md += "\n\nType: `" + *sym.type + "`";
  }
  if (!sym.alias_target.empty()) {
    md += "\n\nAlias for: `" + sym.alias_target + "`";
  }
  if (sym.role != sysml::SemanticRole::Unknown) {
    md += "\n\nRole: " + std::string(sysml::to_string(sym.role));
  }
  if (sym.is_variation) {
    md += "\n\n*variation*";
  } else if (sym.is_abstract) {
    md += "\n\n*abstract*";
  }
  if (!sym.documentation.empty()) {
    md += "\n\n" + sym.documentation;
  }
  return md;
}

// -----------------------------
// Completion, rename and token helpers
// -----------------------------

std::string_view completion_kind(sysml::SymbolKind k)
{
  switch (k) {
    case sysml::SymbolKind::Package:
      return "Module";
    case sysml::SymbolKind::Classifier:
    case sysml::SymbolKind::Definition:
      return "Class";
    case sysml::SymbolKind::Feature:
    case sysml::SymbolKind::Usage:
      return "Property";
    case sysml::SymbolKind::Alias:
      return "Reference";
  }
  return "Text";
}

std::string_view token_type(sysml::SymbolKind k)
{
  switch (k) {
    case sysml::SymbolKind::Package:
      return "namespace";
    case sysml::SymbolKind::Classifier:
    case sysml::SymbolKind::Definition:
    case sysml::SymbolKind::Alias:
      return "type";
    case sysml::SymbolKind::Feature:
      return "property";
    case sysml::SymbolKind::Usage:
      return "variable";
  }
  return "variable";
}

/// Keywords offered where a member may start, element keywords first.
std::vector<std::string_view> member_start_keywords()
{
  std::vector<std::string_view> out;
  std::set<std::string_view> seen;
  for (const auto & [word, kind] : sysml::syntax::k_element_keywords) {
    if (seen.insert(word).second) out.push_back(word);
  }
  for (const auto word : sysml::syntax::k_member_keywords) {
    if (seen.insert(word).second) out.push_back(word);
  }
  if (seen.insert("def").second) out.push_back("def");
  return out;
}

bool is_reserved_word(std::string_view word)
{
  using sysml::syntax::contains_keyword;
  return word == "def" || contains_keyword(sysml::syntax::k_element_keywords, word) ||
         contains_keyword(sysml::syntax::k_member_keywords, word);
}

/// A plain name that can replace a declared name without quoting.
bool is_plain_name(std::string_view name)
{
  if (name.empty() || is_reserved_word(name)) {
    return false;
  }
  const auto word_char = [](unsigned char c) { return std::isalnum(c) != 0 || c == '_'; };
  if (std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), word_char);
}

/// Range of the last segment of a qualified or dotted name.
sysml::SourceRange last_segment(const sysml::SourceRegistry & sources, sysml::SourceRange range)
{
  const std::string_view text = sources.get_slice(range);
  if (text.empty()) {
    return range;
  }

  size_t cut = 0;
  if (text.back() == '\'' && text.size() > 1) {
    const size_t open = text.rfind('\'', text.size() - 2);
    cut = open == std::string_view::npos ? 0 : open;
  } else {
    const size_t colons = text.rfind("::");
    const size_t dot = text.rfind('.');
    if (colons != std::string_view::npos) cut = colons + 2;
    if (dot != std::string_view::npos) cut = std::max(cut, dot + 1);
  }
  const uint32_t begin = range.get_begin().offset() + static_cast<uint32_t>(cut);
  return sysml::SourceRange(range.file_id(), begin, range.get_end().offset());
}

/// Whether `range` spells `name`, plain or quoted.
bool spells(const sysml::SourceRegistry & sources, sysml::SourceRange range, std::string_view name)
{
  const std::string_view text = sources.get_slice(range);
  if (text == name) {
    return true;
  }
  return text.size() == name.size() + 2 && text.front() == '\'' && text.back() == '\'' &&
         text.substr(1, name.size()) == name;
}

}  // namespace

// ============================================================================
// Impl
// ============================================================================

struct LanguageService::Impl
{
  sysml::Workspace ws;

  /// Open documents: URI -> registered path
  std::map<std::string, fs::path, std::less<>> docs;

  sysml::PositionEncoding encoding = sysml::PositionEncoding::Utf8;

  std::optional<sysml::FileId> file_of(std::string_view uri) const
  {
    auto it = docs.find(uri);
    if (it == docs.end()) {
      return std::nullopt;
    }
    return ws.find_file(it->second);
  }

  /// URI for a file: the open document's URI, else a file URI of its path.
  std::string uri_of(sysml::FileId id) const
  {
    for (const auto & [uri, path] : docs) {
      if (ws.find_file(path) == id) {
        return uri;
      }
    }
    return path_to_uri(ws.sources().get_path(id));
  }

  size_t text_size(sysml::FileId id) const
  {
    const sysml::SourceFile * f = ws.sources().get_file(id);
    return f != nullptr ? f->content().size() : 0;
  }

  /// Byte and line/column range plus the editor `start`/`end` positions.
  json range_json(sysml::SourceRange range) const
  {
    json r = range_to_json(ws.sources().get_full_range(range));
    const sysml::SourceFile * f = ws.sources().get_file(range.file_id());
    if (f == nullptr || !range.is_valid()) {
      return r;
    }

    const auto position = [&](uint32_t offset) {
      return json{
        {"line", f->get_line_column(offset).line - 1},
        {"character", f->character_of(offset, encoding)},
      };
    };
    r["start"] = position(range.get_begin().offset());
    r["end"] = position(range.get_end().offset());
    return r;
  }

  json location_json(sysml::FileId file, sysml::SourceRange range) const
  {
    json loc;
    loc["uri"] = uri_of(file);
    loc["range"] = range_json(range);
    return loc;
  }

  bool is_stdlib(const sysml::WorkspaceView & view, sysml::FileId file) const
  {
    for (const auto & info : view.files()) {
      if (info.id == file) {
        return info.is_stdlib;
      }
    }
    return false;
  }

  /// Open documents affected by a change of `id` in either model.
  std::vector<std::string> affected_uris(
    std::string_view self, std::optional<sysml::FileId> id, const sysml::WorkspaceView & before,
    const sysml::WorkspaceView & after) const
  {
    std::set<sysml::FileId> files;
    if (id) {
      for (const auto f : before.affected_files(*id)) files.insert(f);
      for (const auto f : after.affected_files(*id)) files.insert(f);
    }

    std::vector<std::string> out{std::string(self)};
    for (const auto & [uri, path] : docs) {
      if (uri == self) {
        continue;
      }
      const auto open_id = ws.find_file(path);
      if (open_id && files.count(*open_id) > 0) {
        out.push_back(uri);
      }
    }
    return out;
  }

  std::vector<std::string> set_document(std::string uri, std::string text)
  {
    const fs::path path = uri_to_path(uri);
    const sysml::WorkspaceView before = ws.view();
    docs[uri] = path;
    (void)ws.update_file(path, std::move(text));
    return affected_uris(uri, ws.find_file(path), before, ws.view());
  }

  // -----------------------------
  // Payloads
  // -----------------------------

  json diagnostics_json_impl(std::string_view uri) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["items"] = json::array();

    const auto id = file_of(uri);
    if (!id) {
      return out;
    }

    const sysml::WorkspaceView view = ws.view();
    for (const auto & d : view.diagnostics(*id)) {
      json item;
      item["source"] = "sysml";
      item["code"] = d.code;
      item["message"] = d.message;
      item["severity"] = std::string(sysml::severity_to_string(d.severity));
      item["range"] = range_json(d.primary_range());
      if (d.help_message) {
        item["help"] = *d.help_message;
      }
      out["items"].push_back(std::move(item));
    }
    return out;
  }

  json hover_json_impl(std::string_view uri, uint32_t byte_offset) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["contents"] = nullptr;
    out["range"] = nullptr;

    const auto id = file_of(uri);
    if (!id) {
      return out;
    }

    byte_offset = clamp_byte_offset(byte_offset, text_size(*id));
    const auto hit = ws.view().hit_at(*id, byte_offset);
    if (!hit) {
      return out;
    }

    out["contents"] = hover_markdown(hit->symbol);
    out["range"] = range_json(hit->range);
    return out;
  }

  json definition_json_impl(std::string_view uri, uint32_t byte_offset) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    const auto id = file_of(uri);
    if (!id) {
      return out;
    }

    byte_offset = clamp_byte_offset(byte_offset, text_size(*id));
    const auto hit = ws.view().hit_at(*id, byte_offset);
    if (!hit || !hit->symbol.file.is_valid()) {
      return out;
    }

    out["locations"].push_back(location_json(hit->symbol.file, hit->symbol.span));
    return out;
  }

  json references_json_impl(
    std::string_view uri, uint32_t byte_offset, bool include_declaration) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    const auto id = file_of(uri);
    if (!id) {
      return out;
    }

    byte_offset = clamp_byte_offset(byte_offset, text_size(*id));
    const sysml::WorkspaceView view = ws.view();
    const auto hit = view.hit_at(*id, byte_offset);
    if (!hit) {
      return out;
    }

    if (include_declaration && hit->symbol.file.is_valid()) {
      out["locations"].push_back(location_json(hit->symbol.file, hit->symbol.span));
    }
    for (const auto & ref : view.references_to(hit->symbol.qualified_name)) {
      json loc = location_json(ref.file, ref.range);
      loc["kind"] = std::string(sysml::to_string(ref.kind));
      out["locations"].push_back(std::move(loc));
    }
    return out;
  }

  json symbol_json(const sysml::SymbolView & sym) const
  {
    json s;
    s["name"] = sym.simple_name;
    s["qualifiedName"] = sym.qualified_name;
    s["kind"] = std::string(sysml::to_string(sym.kind));
    s["detail"] = sym.keyword;
    const sysml::SourceRange full = sym.decl_range.is_valid() ? sym.decl_range : sym.span;
    s["range"] = range_json(full);
    s["selectionRange"] = range_json(sym.span);
    return s;
  }

  json document_symbols_json_impl(std::string_view uri) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["symbols"] = json::array();

    const auto id = file_of(uri);
    if (!id) {
      return out;
    }

    for (const auto & sym : ws.view().symbols_in_file(*id)) {
      out["symbols"].push_back(symbol_json(sym));
    }
    return out;
  }

  json workspace_symbols_json_impl(std::string_view query) const
  {
    json out;
    out["query"] = std::string(query);
    out["symbols"] = json::array();

    const std::string needle = lowercase(query);
    for (const auto & sym : ws.view().all_symbols()) {
      if (!sym.file.is_valid()) {
        continue;
      }
      if (!needle.empty() && lowercase(sym.qualified_name).find(needle) == std::string::npos) {
        continue;
      }
      json s = symbol_json(sym);
      s["uri"] = uri_of(sym.file);
      out["symbols"].push_back(std::move(s));
    }
    return out;
  }

  json completion_json_impl(std::string_view uri, uint32_t byte_offset) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["items"] = json::array();

    const auto id = file_of(uri);
    const sysml::SourceFile * f = id ? ws.sources().get_file(*id) : nullptr;
    if (f == nullptr) {
      return out;
    }

    byte_offset = clamp_byte_offset(byte_offset, f->content().size());
    const auto ctx = classify_completion_context(f->content(), byte_offset);
    if (!ctx) {
      return out;
    }

    const json replace = range_json(sysml::SourceRange(*id, ctx->replace_begin, ctx->replace_end));
    const auto add_item = [&](std::string label, std::string_view kind, std::string detail) {
      json item;
      item["label"] = label;
      item["kind"] = std::string(kind);
      item["detail"] = std::move(detail);
      item["insertText"] = std::move(label);
      item["replaceRange"] = replace;
      out["items"].push_back(std::move(item));
    };
    const auto add_symbol = [&](const sysml::SymbolView & sym) {
      add_item(sym.simple_name, completion_kind(sym.kind), sym.keyword + " " + sym.qualified_name);
    };

    const sysml::WorkspaceView view = ws.view();
    switch (ctx->kind) {
      case CompletionContextKind::MemberStart:
        for (const auto word : member_start_keywords()) {
          add_item(std::string(word), "Keyword", "keyword");
        }
        break;
      case CompletionContextKind::TypeReference:
        for (const auto & sym : view.visible_at(*id, byte_offset)) {
          add_symbol(sym);
        }
        break;
      case CompletionContextKind::QualifiedMember:
        for (const auto & sym : view.members_of(ctx->qualifier.value_or(""), *id, byte_offset)) {
          add_symbol(sym);
        }
        break;
      case CompletionContextKind::ImportPath:
        for (const auto & sym : view.visible_at(*id, byte_offset)) {
          if (sym.kind == sysml::SymbolKind::Package) {
            add_symbol(sym);
          }
        }
        break;
    }
    return out;
  }

  json rename_json_impl(std::string_view uri, uint32_t byte_offset, std::string_view new_name) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["changes"] = json::object();

    const auto fail = [&](std::string message) {
      out.erase("changes");
      out["error"] = std::move(message);
      return out;
    };

    const auto id = file_of(uri);
    if (!id) {
      return fail("document is not open");
    }
    if (!is_plain_name(new_name)) {
      return fail("'" + std::string(new_name) + "' is not a valid name");
    }

    byte_offset = clamp_byte_offset(byte_offset, text_size(*id));
    const sysml::WorkspaceView view = ws.view();
    const auto hit = view.hit_at(*id, byte_offset);
    if (!hit || hit->symbol.simple_name.empty()) {
      return fail("no named element at this position");
    }
    const sysml::SymbolView & sym = hit->symbol;
    if (!sym.file.is_valid() || is_stdlib(view, sym.file)) {
      return fail("'" + sym.qualified_name + "' is declared in the standard library");
    }

    const sysml::SourceRegistry & sources = ws.sources();
    std::set<std::tuple<sysml::FileId, uint32_t>> seen;
    const auto add_edit = [&](sysml::FileId file, sysml::SourceRange range) {
      const sysml::SourceRange name = last_segment(sources, range);
      if (!spells(sources, name, sym.simple_name)) {
        return;
      }
      if (!seen.emplace(file, name.get_begin().offset()).second) {
        return;
      }
      out["changes"][uri_of(file)].push_back(
        json{{"range", range_json(name)}, {"newText", std::string(new_name)}});
    };

    add_edit(sym.file, sym.span);
    for (const auto & ref : view.references_to(sym.qualified_name)) {
      add_edit(ref.file, ref.range);
    }
    return out;
  }

  json folding_ranges_json_impl(std::string_view uri) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["ranges"] = json::array();

    const auto id = file_of(uri);
    const sysml::SourceFile * f = id ? ws.sources().get_file(*id) : nullptr;
    if (f == nullptr) {
      return out;
    }

    // (start line, end line, kind, range), ordered by start line
    std::set<std::tuple<uint32_t, uint32_t, std::string_view, uint32_t, uint32_t>> folds;
    const auto add_fold = [&](sysml::SourceRange range, std::string_view kind) {
      const auto full = f->get_full_range(range);
      if (full.end_line > full.start_line) {
        folds.emplace(
          full.start_line, full.end_line, kind, range.get_begin().offset(),
          range.get_end().offset());
      }
    };

    for (const auto & sym : ws.view().symbols_in_file(*id)) {
      if (sym.decl_range.is_valid()) {
        add_fold(sym.decl_range, "region");
      }
    }
    for (const auto & token : sysml::syntax::Lexer(*id, f->content()).lex_all()) {
      if (token.kind == sysml::syntax::TokenKind::BlockComment) {
        add_fold(token.range, "comment");
      }
    }

    for (const auto & [start, end, kind, begin_byte, end_byte] : folds) {
      json fold;
      fold["kind"] = std::string(kind);
      fold["range"] = range_json(sysml::SourceRange(*id, begin_byte, end_byte));
      out["ranges"].push_back(std::move(fold));
    }
    return out;
  }

  json selection_ranges_json_impl(std::string_view uri, const std::vector<uint32_t> & offsets) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["selections"] = json::array();

    const auto id = file_of(uri);
    if (!id) {
      return out;
    }

    const sysml::WorkspaceView view = ws.view();
    const auto symbols = view.symbols_in_file(*id);
    for (uint32_t offset : offsets) {
      offset = clamp_byte_offset(offset, text_size(*id));

      std::vector<sysml::SourceRange> chain;
      if (const auto hit = view.hit_at(*id, offset); hit && hit->range.file_id() == *id) {
        chain.push_back(hit->range);
      }
      std::vector<sysml::SourceRange> enclosing;
      for (const auto & sym : symbols) {
        if (sym.decl_range.touches(offset)) {
          enclosing.push_back(sym.decl_range);
        }
      }
      std::stable_sort(enclosing.begin(), enclosing.end(), [](auto a, auto b) {
        return a.size() < b.size();
      });
      for (const auto range : enclosing) {
        if (chain.empty() || chain.back() != range) {
          chain.push_back(range);
        }
      }
      if (chain.empty()) {
        chain.emplace_back(*id, offset, offset);
      }

      json selection;
      selection["offset"] = offset;
      selection["ranges"] = json::array();
      for (const auto range : chain) {
        selection["ranges"].push_back(range_json(range));
      }
      out["selections"].push_back(std::move(selection));
    }
    return out;
  }

  json semantic_tokens_json_impl(std::string_view uri) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["tokens"] = json::array();

    const auto id = file_of(uri);
    if (!id) {
      return out;
    }

    struct NameToken
    {
      sysml::SourceRange range;
      std::string_view type;
      bool declaration = false;
      bool is_abstract = false;
    };
    std::vector<NameToken> tokens;

    const sysml::WorkspaceView view = ws.view();
    const sysml::SourceRegistry & sources = ws.sources();
    const sysml::SymbolTable & table = view.snapshot().model.symbols;

    const auto add_reference = [&](sysml::SourceRange range, sysml::SymbolId target) {
      if (target == sysml::k_invalid_symbol) {
        return;
      }
      const sysml::Symbol & sym = table.get(target);
      const sysml::SourceRange name = last_segment(sources, range);
      if (spells(sources, name, sym.simple_name)) {
        tokens.push_back(NameToken{name, token_type(sym.kind), false, false});
      }
    };
    for (const auto & ref : view.snapshot().model.references) {
      if (ref.file == *id) {
        add_reference(ref.range, ref.resolved);
        add_reference(ref.subject_range, ref.resolved_subject);
      }
    }
    for (const auto & sym : view.symbols_in_file(*id)) {
      if (!sym.simple_name.empty() && spells(sources, sym.span, sym.simple_name)) {
        tokens.push_back(NameToken{sym.span, token_type(sym.kind), true, sym.is_abstract});
      }
    }

    // References first at equal offsets: a redefinition names what it redefines
    std::stable_sort(tokens.begin(), tokens.end(), [](const NameToken & a, const NameToken & b) {
      return std::make_tuple(a.range.get_begin().offset(), a.declaration) <
             std::make_tuple(b.range.get_begin().offset(), b.declaration);
    });

    uint32_t covered = 0;
    for (const auto & t : tokens) {
      if (t.range.get_begin().offset() < covered) {
        continue;
      }
      covered = t.range.get_end().offset();

      json modifiers = json::array();
      if (t.declaration) modifiers.push_back("declaration");
      if (t.is_abstract) modifiers.push_back("abstract");
      json token;
      token["type"] = std::string(t.type);
      token["modifiers"] = std::move(modifiers);
      token["range"] = range_json(t.range);
      out["tokens"].push_back(std::move(token));
    }
    return out;
  }

  /// Serialize a payload, emptied when the model moved since the ticket was taken.
  std::string finish(
    json payload, LanguageService::Ticket ticket, std::string_view key,
    json empty = json::array()) const
  {
    if (ticket && !ws.is_current(sysml::RequestTicket{*ticket})) {
      payload[std::string(key)] = std::move(empty);
      payload["stale"] = true;
    }
    return payload.dump();
  }
};

// ============================================================================
// LanguageService
// ============================================================================

LanguageService::LanguageService() : impl_(std::make_unique<Impl>()) {}

LanguageService::~LanguageService() = default;

LanguageService::LanguageService(LanguageService && other) noexcept = default;

LanguageService & LanguageService::operator=(LanguageService && other) noexcept = default;

size_t LanguageService::load_stdlib(const std::filesystem::path & dir)
{
  const size_t added = impl_->ws.load_stdlib(dir);
  if (added > 0) {
    (void)impl_->ws.populate_all();
  }
  return added;
}

void LanguageService::set_position_encoding(PositionEncoding encoding) noexcept
{
  impl_->encoding = encoding;
}

PositionEncoding LanguageService::position_encoding() const noexcept { return impl_->encoding; }

std::vector<std::string> LanguageService::open_document(std::string uri, std::string text)
{
  return impl_->set_document(std::move(uri), std::move(text));
}

std::vector<std::string> LanguageService::change_document(std::string uri, std::string text)
{
  return impl_->set_document(std::move(uri), std::move(text));
}

std::vector<std::string> LanguageService::close_document(std::string_view uri)
{
  auto it = impl_->docs.find(uri);
  if (it == impl_->docs.end()) {
    return {};
  }

  const fs::path path = it->second;
  const auto id = impl_->ws.find_file(path);
  const sysml::WorkspaceView before = impl_->ws.view();
  impl_->docs.erase(it);
  (void)impl_->ws.remove_file(path);
  return impl_->affected_uris(uri, id, before, impl_->ws.view());
}

bool LanguageService::has_document(std::string_view uri) const
{
  return impl_->docs.find(uri) != impl_->docs.end();
}

std::vector<std::string> LanguageService::open_documents() const
{
  std::vector<std::string> out;
  out.reserve(impl_->docs.size());
  for (const auto & [uri, path] : impl_->docs) {
    out.push_back(uri);
  }
  return out;
}

std::optional<uint32_t> LanguageService::offset_at(
  std::string_view uri, uint32_t line, uint32_t character) const
{
  const auto id = impl_->file_of(uri);
  const sysml::SourceFile * f = id ? impl_->ws.sources().get_file(*id) : nullptr;
  if (f == nullptr) {
    return std::nullopt;
  }
  return f->offset_of(line, character, impl_->encoding);
}

uint64_t LanguageService::generation() const noexcept { return impl_->ws.view().generation(); }

uint64_t LanguageService::begin_request() const noexcept
{
  return impl_->ws.begin_request().generation;
}

bool LanguageService::is_current(uint64_t ticket) const noexcept
{
  return impl_->ws.is_current(sysml::RequestTicket{ticket});
}

std::string LanguageService::diagnostics_json(std::string_view uri, Ticket ticket)
{
  return impl_->finish(impl_->diagnostics_json_impl(uri), ticket, "items");
}

std::string LanguageService::hover_json(std::string_view uri, uint32_t byte_offset, Ticket ticket)
{
  json j = impl_->hover_json_impl(uri, byte_offset);
  if (ticket && !is_current(*ticket)) {
    j["range"] = nullptr;
  }
  return impl_->finish(std::move(j), ticket, "contents", nullptr);
}

std::string LanguageService::definition_json(
  std::string_view uri, uint32_t byte_offset, Ticket ticket)
{
  return impl_->finish(impl_->definition_json_impl(uri, byte_offset), ticket, "locations");
}

std::string LanguageService::references_json(
  std::string_view uri, uint32_t byte_offset, bool include_declaration, Ticket ticket)
{
  return impl_->finish(
    impl_->references_json_impl(uri, byte_offset, include_declaration), ticket, "locations");
}

std::string LanguageService::document_symbols_json(std::string_view uri, Ticket ticket)
{
  return impl_->finish(impl_->document_symbols_json_impl(uri), ticket, "symbols");
}

std::string LanguageService::workspace_symbols_json(std::string_view query, Ticket ticket)
{
  return impl_->finish(impl_->workspace_symbols_json_impl(query), ticket, "symbols");
}

std::string LanguageService::completion_json(
  std::string_view uri, uint32_t byte_offset, Ticket ticket)
{
  return impl_->finish(impl_->completion_json_impl(uri, byte_offset), ticket, "items");
}

std::string LanguageService::rename_json(
  std::string_view uri, uint32_t byte_offset, std::string_view new_name, Ticket ticket)
{
  return impl_->finish(
    impl_->rename_json_impl(uri, byte_offset, new_name), ticket, "changes", json::object());
}

std::string LanguageService::folding_ranges_json(std::string_view uri, Ticket ticket)
{
  return impl_->finish(impl_->folding_ranges_json_impl(uri), ticket, "ranges");
}

std::string LanguageService::selection_ranges_json(
  std::string_view uri, const std::vector<uint32_t> & byte_offsets, Ticket ticket)
{
  return impl_->finish(impl_->selection_ranges_json_impl(uri, byte_offsets), ticket, "selections");
}

std::string LanguageService::semantic_tokens_json(std::string_view uri, Ticket ticket)
{
  return impl_->finish(impl_->semantic_tokens_json_impl(uri), ticket, "tokens");
}

}  // namespace sysml::lsp
