// SysML LSP server (stdio JSON-RPC)
//
// This is a thin wrapper around sysml::lsp::LanguageService (serverless APIs).
//
// Read-only requests are queued with a ticket taken when they are read and
// answered once no input is waiting. A request whose document changed in the
// meantime is answered with ContentModified.
//
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sysml/driver/stdlib_finder.hpp"
#include "sysml/lsp.hpp"

using nlohmann::json;

namespace
{

// JSON-RPC / LSP error codes
constexpr int k_method_not_found = -32601;
constexpr int k_request_cancelled = -32800;
constexpr int k_content_modified = -32801;
constexpr int k_request_failed = -32803;

// Semantic token legend; indices are the wire encoding
constexpr std::string_view k_token_types[] = {"namespace", "type", "property", "variable"};
constexpr std::string_view k_token_modifiers[] = {"declaration", "abstract"};

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int lsp_severity(std::string_view s)
{
  // LSP DiagnosticSeverity: 1 Error, 2 Warning
  if (s == "error") return 1;
  if (s == "warning") return 2;
  return 1;
}

int symbol_kind(std::string_view s)
{
  // LSP SymbolKind (subset)
  if (s == "package") return 4;      // Package
  if (s == "classifier") return 5;   // Class
  if (s == "definition") return 5;   // Class
  if (s == "feature") return 7;      // Property
  if (s == "usage") return 7;        // Property
  if (s == "alias") return 21;       // Null
  return 13;
}

int completion_kind(std::string_view s)
{
  // LSP CompletionItemKind (subset)
  if (s == "Keyword") return 14;
  if (s == "Class") return 7;
  if (s == "Module") return 9;
  if (s == "Property") return 10;
  if (s == "Reference") return 18;
  return 1;
}

int legend_index(const auto & legend, std::string_view name)
{
  for (size_t i = 0; i < std::size(legend); ++i) {
    if (legend[i] == name) return static_cast<int>(i);
  }
  return -1;
}

json legend_json(const auto & legend)
{
  json out = json::array();
  for (const auto name : legend) {
    out.push_back(std::string(name));
  }
  return out;
}

json empty_lsp_range()
{
  return json{
    {"start", json{{"line", 0}, {"character", 0}}}, {"end", json{{"line", 0}, {"character", 0}}}};
}

/// Editor range of a service range (its `start`/`end` pair).
json to_lsp_range(const json & r)
{
  if (!r.is_object() || !r.contains("start") || !r.contains("end")) {
    return empty_lsp_range();
  }
  return json{{"start", r["start"]}, {"end", r["end"]}};
}

json to_lsp_location(const json & loc)
{
  json out;
  out["uri"] = loc.value("uri", "");
  out["range"] = to_lsp_range(loc.value("range", json()));
  return out;
}

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    std::cerr << "sysml_lsp_server: ignoring malformed message\n";
    return std::nullopt;
  }
  return parsed;
}

/// Parse a payload produced by the language service.
json parse_payload(const std::string & s)
{
  json j = json::parse(s, nullptr, false);
  return j.is_discarded() ? json::object() : j;
}

void respond(const json & id, const json & result)
{
  json resp;
  resp["jsonrpc"] = "2.0";
  resp["id"] = id;
  resp["result"] = result;
  write_message(resp);
}

void respond_error(const json & id, int code, std::string message)
{
  json resp;
  resp["jsonrpc"] = "2.0";
  resp["id"] = id;
  resp["error"] = json{{"code", code}, {"message", std::move(message)}};
  write_message(resp);
}

/// A read-only request waiting to be answered.
struct PendingRequest
{
  json id;
  std::string method;
  json params;
  uint64_t ticket = 0;
};

bool is_query(std::string_view method)
{
  return method == "textDocument/hover" || method == "textDocument/definition" ||
         method == "textDocument/references" || method == "textDocument/documentSymbol" ||
         method == "workspace/symbol" || method == "textDocument/completion" ||
         method == "textDocument/rename" || method == "textDocument/foldingRange" ||
         method == "textDocument/selectionRange" || method == "textDocument/semanticTokens/full";
}

/// Answers queued requests from the language service.
class QueryHandler
{
public:
  explicit QueryHandler(sysml::lsp::LanguageService & service) : service_(service) {}

  void answer(const PendingRequest & req)
  {
    const auto td = req.params.value("textDocument", json::object());
    uri_ = td.value("uri", "");
    ticket_ = req.ticket;
    if (!service_.is_current(ticket_)) {
      respond_error(req.id, k_content_modified, "content modified");
      return;
    }

    std::optional<json> result;
    if (req.method == "textDocument/hover") {
      result = hover(req.params);
    } else if (req.method == "textDocument/definition" || req.method == "textDocument/references") {
      result = locations(req.method, req.params);
    } else if (req.method == "textDocument/documentSymbol") {
      result = document_symbols();
    } else if (req.method == "workspace/symbol") {
      result = workspace_symbols(req.params);
    } else if (req.method == "textDocument/completion") {
      result = completion(req.params);
    } else if (req.method == "textDocument/rename") {
      result = rename(req.params);
    } else if (req.method == "textDocument/foldingRange") {
      result = folding_ranges();
    } else if (req.method == "textDocument/selectionRange") {
      result = selection_ranges(req.params);
    } else if (req.method == "textDocument/semanticTokens/full") {
      result = semantic_tokens();
    }

    if (stale_) {
      respond_error(req.id, k_content_modified, "content modified");
    } else if (!error_.empty()) {
      respond_error(req.id, k_request_failed, error_);
    } else {
      respond(req.id, result.value_or(json()));
    }
    stale_ = false;
    error_.clear();
  }

private:
  /// Parse a service payload, noting whether it was computed too late.
  json payload(const std::string & s)
  {
    json j = parse_payload(s);
    stale_ = stale_ || j.value("stale", false);
    return j;
  }

  std::optional<uint32_t> offset(const json & position) const
  {
    if (!position.is_object()) {
      return std::nullopt;
    }
    return service_.offset_at(
      uri_, position.value<uint32_t>("line", 0U), position.value<uint32_t>("character", 0U));
  }

  json hover(const json & params)
  {
    const auto at = offset(params.value("position", json()));
    if (!at) {
      return nullptr;
    }

    const json hj = payload(service_.hover_json(uri_, *at, ticket_));
    if (!hj.contains("contents") || !hj["contents"].is_string()) {
      return nullptr;
    }

    json out;
    out["contents"] = json{{"kind", "markdown"}, {"value", hj["contents"]}};
    if (hj.contains("range") && hj["range"].is_object()) {
      out["range"] = to_lsp_range(hj["range"]);
    }
    return out;
  }

  json locations(const std::string & method, const json & params)
  {
    const auto at = offset(params.value("position", json()));
    if (!at) {
      return json::array();
    }

    json lj;
    if (method == "textDocument/definition") {
      lj = payload(service_.definition_json(uri_, *at, ticket_));
    } else {
      const auto context = params.value("context", json::object());
      const bool include_decl = context.value("includeDeclaration", true);
      lj = payload(service_.references_json(uri_, *at, include_decl, ticket_));
    }

    json locs = json::array();
    for (const auto & loc : lj.value("locations", json::array())) {
      if (loc.is_object()) {
        locs.push_back(to_lsp_location(loc));
      }
    }
    return locs;
  }

  json document_symbols()
  {
    const json sj = payload(service_.document_symbols_json(uri_, ticket_));

    json out = json::array();
    for (const auto & s0 : sj.value("symbols", json::array())) {
      if (!s0.is_object()) continue;
      json ds;
      ds["name"] = s0.value("name", "");
      ds["detail"] = s0.value("detail", "");
      ds["kind"] = symbol_kind(s0.value("kind", ""));
      ds["range"] = to_lsp_range(s0.value("range", json()));
      ds["selectionRange"] = to_lsp_range(s0.value("selectionRange", json()));
      ds["children"] = json::array();
      out.push_back(std::move(ds));
    }
    return out;
  }

  json workspace_symbols(const json & params)
  {
    const json sj = payload(service_.workspace_symbols_json(params.value("query", ""), ticket_));

    json out = json::array();
    for (const auto & s0 : sj.value("symbols", json::array())) {
      if (!s0.is_object()) continue;
      json ws0;
      ws0["name"] = s0.value("name", "");
      ws0["kind"] = symbol_kind(s0.value("kind", ""));
      ws0["containerName"] = s0.value("qualifiedName", "");
      ws0["location"] = to_lsp_location(s0);
      out.push_back(std::move(ws0));
    }
    return out;
  }

  json completion(const json & params)
  {
    json out = json{{"isIncomplete", false}, {"items", json::array()}};
    const auto at = offset(params.value("position", json()));
    if (!at) {
      return out;
    }

    const json cj = payload(service_.completion_json(uri_, *at, ticket_));
    for (const auto & it : cj.value("items", json::array())) {
      if (!it.is_object()) continue;
      json item;
      item["label"] = it.value("label", "");
      item["kind"] = completion_kind(it.value("kind", ""));
      item["detail"] = it.value("detail", "");
      item["textEdit"] = json{
        {"range", to_lsp_range(it.value("replaceRange", json()))},
        {"newText", it.value("insertText", "")},
      };
      out["items"].push_back(std::move(item));
    }
    return out;
  }

  json rename(const json & params)
  {
    const auto at = offset(params.value("position", json()));
    if (!at) {
      return nullptr;
    }

    const json rj = payload(service_.rename_json(uri_, *at, params.value("newName", ""), ticket_));
    if (rj.contains("error") && rj["error"].is_string()) {
      error_ = rj["error"].get<std::string>();
      return nullptr;
    }

    json changes = json::object();
    const json edits_by_uri = rj.value("changes", json::object());
    for (const auto & [uri, edits] : edits_by_uri.items()) {
      json lsp_edits = json::array();
      for (const auto & e : edits) {
        const json range = to_lsp_range(e.value("range", json()));
        lsp_edits.push_back(json{{"range", range}, {"newText", e.value("newText", "")}});
      }
      changes[uri] = std::move(lsp_edits);
    }
    return json{{"changes", changes}};
  }

  json folding_ranges()
  {
    const json fj = payload(service_.folding_ranges_json(uri_, ticket_));

    json out = json::array();
    for (const auto & f : fj.value("ranges", json::array())) {
      const json r = to_lsp_range(f.value("range", json()));
      json fold;
      fold["startLine"] = r["start"]["line"];
      fold["endLine"] = r["end"]["line"];
      fold["kind"] = f.value("kind", "region");
      out.push_back(std::move(fold));
    }
    return out;
  }

  json selection_ranges(const json & params)
  {
    std::vector<uint32_t> offsets;
    for (const auto & pos : params.value("positions", json::array())) {
      offsets.push_back(offset(pos).value_or(0));
    }

    const json sj = payload(service_.selection_ranges_json(uri_, offsets, ticket_));

    // Nest the innermost-first chain into SelectionRange parents
    json out = json::array();
    for (const auto & sel : sj.value("selections", json::array())) {
      const json ranges = sel.value("ranges", json::array());
      json node;
      for (auto it = ranges.rbegin(); it != ranges.rend(); ++it) {
        json inner = json{{"range", to_lsp_range(*it)}};
        if (!node.is_null()) {
          inner["parent"] = std::move(node);
        }
        node = std::move(inner);
      }
      out.push_back(node.is_null() ? json{{"range", empty_lsp_range()}} : std::move(node));
    }
    return out;
  }

  json semantic_tokens()
  {
    const json tj = payload(service_.semantic_tokens_json(uri_, ticket_));

    // Relative encoding: delta line, delta start, length, type, modifier bits
    json data = json::array();
    uint32_t prev_line = 0;
    uint32_t prev_char = 0;
    for (const auto & t : tj.value("tokens", json::array())) {
      const json r = to_lsp_range(t.value("range", json()));
      const auto line = r["start"].value<uint32_t>("line", 0U);
      const auto start = r["start"].value<uint32_t>("character", 0U);
      const auto end = r["end"].value<uint32_t>("character", 0U);
      const int type = legend_index(k_token_types, t.value("type", ""));
      if (type < 0 || r["end"].value<uint32_t>("line", 0U) != line || end <= start) {
        continue;
      }

      uint32_t modifiers = 0;
      for (const auto & m : t.value("modifiers", json::array())) {
        const int bit = m.is_string() ? legend_index(k_token_modifiers, m.get<std::string>()) : -1;
        if (bit >= 0) modifiers |= 1U << bit;
      }

      data.push_back(line - prev_line);
      data.push_back(line == prev_line ? start - prev_char : start);
      data.push_back(end - start);
      data.push_back(type);
      data.push_back(modifiers);
      prev_line = line;
      prev_char = start;
    }
    return json{{"data", data}};
  }

  sysml::lsp::LanguageService & service_;
  std::string uri_;
  uint64_t ticket_ = 0;
  bool stale_ = false;
  std::string error_;
};

}  // namespace

int main()
{
  try {
    std::ios::sync_with_stdio(false);

    sysml::lsp::LanguageService service;
    QueryHandler queries(service);
    std::deque<PendingRequest> pending;

    auto publish_diagnostics = [&](const std::string & uri) {
      const json dj = parse_payload(service.diagnostics_json(uri));

      json lsp_diags = json::array();
      for (const auto & it : dj.value("items", json::array())) {
        if (!it.is_object()) continue;
        json d0;
        d0["message"] = it.value("message", "");
        d0["severity"] = lsp_severity(it.value("severity", "error"));
        if (it.contains("source") && it["source"].is_string()) {
          d0["source"] = it["source"];
        }
        if (it.contains("code") && it["code"].is_string() && !it["code"].get<std::string>().empty()) {
          d0["code"] = it["code"];
        }
        d0["range"] = to_lsp_range(it.value("range", json()));
        lsp_diags.push_back(std::move(d0));
      }

      json notif;
      notif["jsonrpc"] = "2.0";
      notif["method"] = "textDocument/publishDiagnostics";
      notif["params"] = json{{"uri", uri}, {"diagnostics", lsp_diags}};
      write_message(notif);
    };

    auto publish_all = [&](const std::vector<std::string> & uris) {
      for (const auto & uri : uris) {
        publish_diagnostics(uri);
      }
    };

    auto drain = [&]() {
      while (!pending.empty()) {
        const PendingRequest req = std::move(pending.front());
        pending.pop_front();
        queries.answer(req);
      }
    };

    bool running = true;
    while (running) {
      // Answer queued requests once the client has nothing more buffered
      if (std::cin.rdbuf()->in_avail() <= 0) {
        drain();
      }

      const auto msg_opt = read_message();
      if (!msg_opt) {
        if (!std::cin.good()) {
          break;
        }
        continue;
      }

      const json & msg = *msg_opt;
      const std::string method = msg.value("method", "");
      const bool is_request = msg.contains("id");
      const json params = msg.value("params", json::object());

      if (is_request && is_query(method)) {
        pending.push_back(PendingRequest{msg["id"], method, params, service.begin_request()});
        continue;
      }

      if (method == "$/cancelRequest") {
        const json id = params.value("id", json());
        const auto it = std::find_if(pending.begin(), pending.end(), [&](const PendingRequest & r) {
          return r.id == id;
        });
        if (it != pending.end()) {
          respond_error(it->id, k_request_cancelled, "request cancelled");
          pending.erase(it);
        }
        continue;
      }

      if (method == "initialize" && is_request) {
        // Position encoding: UTF-8 when the client offers it, else the UTF-16 default
        std::string negotiated_position_encoding = "utf-16";
        const auto caps_in = params.value("capabilities", json::object());
        const auto general = caps_in.value("general", json::object());
        for (const auto & e : general.value("positionEncodings", json::array())) {
          if (e.is_string() && e.get<std::string>() == "utf-8") {
            negotiated_position_encoding = "utf-8";
          }
        }
        service.set_position_encoding(
          negotiated_position_encoding == "utf-8" ? sysml::PositionEncoding::Utf8
                                                  : sysml::PositionEncoding::Utf16);

        // Standard library: explicit option first, then auto-detection
        std::optional<std::filesystem::path> stdlib;
        const auto init_opts = params.value("initializationOptions", json::object());
        if (init_opts.is_object() && init_opts.contains("stdlibPath") && init_opts["stdlibPath"].is_string()) {
          stdlib = std::filesystem::path(init_opts["stdlibPath"].get<std::string>());
        } else {
          stdlib = sysml::find_stdlib();
        }
        if (stdlib) {
          const size_t loaded = service.load_stdlib(*stdlib);
          std::cerr << "sysml_lsp_server: loaded " << loaded << " standard library files from "
                    << stdlib->string() << "\n";
        }

        json caps;
        caps["positionEncoding"] = negotiated_position_encoding;
        caps["textDocumentSync"] = json{{"openClose", true}, {"change", 1}};  // Full sync
        caps["hoverProvider"] = true;
        caps["definitionProvider"] = true;
        caps["referencesProvider"] = true;
        caps["documentSymbolProvider"] = true;
        caps["workspaceSymbolProvider"] = true;
        caps["completionProvider"] = json{{"triggerCharacters", json::array({":"})}};
        caps["renameProvider"] = true;
        caps["foldingRangeProvider"] = true;
        caps["selectionRangeProvider"] = true;
        caps["semanticTokensProvider"] = json{
          {"legend",
           json{
             {"tokenTypes", legend_json(k_token_types)},
             {"tokenModifiers", legend_json(k_token_modifiers)}}},
          {"full", true},
        };

        const json result = json{
          {"capabilities", caps},
          {"serverInfo", json{{"name", "sysml_lsp_server"}, {"version", "0.1.0"}}}};
        respond(msg["id"], result);
        continue;
      }

      if (method == "initialized") {
        continue;
      }

      if (method == "shutdown" && is_request) {
        drain();
        respond(msg["id"], json());
        continue;
      }

      if (method == "exit") {
        running = false;
        continue;
      }

      if (method == "textDocument/didOpen") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (!uri.empty()) {
          publish_all(service.open_document(uri, td.value("text", "")));
        }
        continue;
      }

      if (method == "textDocument/didChange") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (uri.empty()) {
          continue;
        }

        // Full sync: take first change text
        const auto changes = params.value("contentChanges", json::array());
        if (!changes.is_array() || changes.empty()) {
          continue;
        }
        const auto & c0 = changes.at(0);
        if (!c0.is_object() || !c0.contains("text") || !c0["text"].is_string()) {
          continue;
        }

        publish_all(service.change_document(uri, c0["text"].get<std::string>()));
        continue;
      }

      if (method == "textDocument/didClose") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (!uri.empty()) {
          // The closed document has no diagnostics left; dependents are republished.
          publish_all(service.close_document(uri));
        }
        continue;
      }

      // Unknown method
      if (is_request) {
        respond_error(msg["id"], k_method_not_found, "Method not found");
      }
    }

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "sysml_lsp_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
