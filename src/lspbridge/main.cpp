#include <fmt/format.h>

#include <algorithm>
#include <boost/json.hpp>
#include <chrono>
#include <iostream>
#include <optional>
#include <span>
#include <type_traits>
#include <typeinfo>
#include <variant>

#include "lspbridge/client.hpp"
#include "lspbridge/logger.hpp"
#include "lspbridge/requests.hpp"
#include "lspbridge/resolver.hpp"
#include "lspbridge/uri.hpp"
#include "options.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
namespace lsp = lspbridge;
namespace json = boost::json;

struct query_result {
  std::string text;
  json::value data;
};

/// JSON views, all 1-indexed

json::object range_to_json(const lsp::text_range& r) {
  auto u = lsp::to_user(r);
  json::object start;
  start["line"] = u.start.line;
  start["column"] = u.start.column;
  json::object end;
  end["line"] = u.end.line;
  end["column"] = u.end.column;
  json::object res;
  res["start"] = std::move(start);
  res["end"] = std::move(end);
  return res;
}

std::string file_of(std::string_view uri) {
  try {
    return lsp::uri_to_path(uri).string();
  } catch (const std::invalid_argument&) {
    return std::string{uri};  // not a file:// URI, show it as is
  }
}

json::object location_to_json(const lsp::location& l) {
  json::object res;
  res["file"] = file_of(l.uri);
  res["range"] = range_to_json(l.range);
  return res;
}

std::string where(const lsp::location& l) {
  auto p = lsp::to_user(l.range.start);
  return fmt::format("{}:{}:{}", file_of(l.uri), p.line, p.column);
}

/// Queries

std::string_view declared(const lsp::capability_value& v) {
  return std::visit(
      [](auto&& w) -> std::string_view {
        using T = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<T, lsp::capability::absent>) {
          return "absent";
        } else if constexpr (std::is_same_v<T, lsp::capability::present_null>) {
          return "null";
        } else {
          return "value";
        }
      },
      v);
}

query_result show_capabilities(lsp::client& c) {
  auto caps = c.server_capabilities();
  query_result res;
  json::object data;
  for (std::size_t i = 0; i < lsp::feature_count; ++i) {
    auto f = static_cast<lsp::feature>(i);
    json::object entry;
    entry["supported"] = caps.supports(f);
    entry["declared"] = declared(caps.field(f));
    data[lsp::capability_key(f)] = std::move(entry);
    res.text += fmt::format(
        "{:<26} {:<13} ({})\n", lsp::capability_key(f),
        caps.supports(f) ? "supported" : "not supported", declared(caps.field(f)));
  }
  data["definitionLookup"] = caps.has_definition_support();
  data["editApplication"] = lsp::capabilities::has_edit_support();
  data["diagnostics"] = lsp::capabilities::has_diagnostics_support();
  res.text += fmt::format(
      "{:<26} {}\n", "definition lookup",
      caps.has_definition_support() ? "supported" : "not supported");
  res.data = std::move(data);
  return res;
}

query_result show_definition(lsp::client& c, const std::string& symbol) {
  auto found = lsp::resolve_definition(c, symbol);
  json::array matches;
  for (const auto& m : found.matches) {
    json::object entry;
    entry["symbol"] = m.symbol;
    entry["kind"] = lsp::symbol_kind_name(m.kind);
    entry["container"] = m.container;
    entry["file"] = m.file;
    entry["range"] = range_to_json(m.range);
    entry["lines"] = json::array(m.lines.begin(), m.lines.end());
    matches.push_back(std::move(entry));
  }
  return {lsp::format_definitions(found), std::move(matches)};
}

query_result show_references(lsp::client& c, const std::string& symbol) {
  auto found = lsp::find_references(c, symbol);
  json::array refs;
  for (const auto& l : found.locations) refs.push_back(location_to_json(l));
  return {lsp::format_references(found), std::move(refs)};
}

query_result show_diagnostics(
    lsp::client& c, const fs::path& file, std::chrono::milliseconds wait) {
  auto uri = c.ensure_open(file);
  auto diags = c.wait_for_diagnostics(uri, wait);
  query_result res;
  json::array data;
  for (const auto& d : diags) {
    auto p = lsp::to_user(d.range.start);
    res.text += fmt::format(
        "{}:{}:{}: {}: {}{}\n", file.string(), p.line, p.column,
        lsp::severity_name(d.severity), d.message,
        d.source.empty() ? "" : fmt::format(" [{}]", d.source));
    json::object entry;
    entry["range"] = range_to_json(d.range);
    entry["severity"] = lsp::severity_name(d.severity);
    entry["message"] = d.message;
    entry["source"] = d.source;
    if (d.code)
      std::visit([&](const auto& code) { entry["code"] = code; }, *d.code);
    data.push_back(std::move(entry));
  }
  if (diags.empty()) res.text = fmt::format("No diagnostics for {}\n", file.string());
  res.data = std::move(data);
  return res;
}

json::array outline(
    const std::vector<lsp::document_symbol>& syms, int depth, std::string& text) {
  json::array out;
  for (const auto& s : syms) {
    auto r = lsp::to_user(s.range);
    text += fmt::format(
        "{:{}}{} {} L{}:C{} - L{}:C{}\n", "", depth * 2,
        lsp::symbol_kind_name(s.kind), s.name, r.start.line, r.start.column,
        r.end.line, r.end.column);
    json::object entry;
    entry["name"] = s.name;
    entry["kind"] = lsp::symbol_kind_name(s.kind);
    entry["range"] = range_to_json(s.range);
    if (!s.children.empty())
      entry["children"] = outline(s.children, depth + 1, text);
    out.push_back(std::move(entry));
  }
  return out;
}

query_result show_document_symbols(lsp::client& c, const fs::path& file) {
  auto syms = lsp::requests::document_symbols(c, file);
  query_result res;
  std::visit(
      [&](auto&& w) {
        using T = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<T, std::vector<lsp::document_symbol>>) {
          res.data = outline(w, 0, res.text);
        } else {
          json::array data;
          for (const auto& s : w) {
            res.text += fmt::format(
                "{} {} {}\n", lsp::symbol_kind_name(s.kind), s.name, where(s.loc));
            json::object entry;
            entry["name"] = s.name;
            entry["kind"] = lsp::symbol_kind_name(s.kind);
            entry["container"] = s.container_name;
            entry["location"] = location_to_json(s.loc);
            data.push_back(std::move(entry));
          }
          res.data = std::move(data);
        }
      },
      syms);
  if (res.text.empty()) res.text = fmt::format("No symbols in {}\n", file.string());
  return res;
}

query_result show_call_hierarchy(
    lsp::client& c, const lsp::cli::file_position& at, const std::string& direction) {
  auto items = lsp::requests::prepare_call_hierarchy(c, at.file, at.pos);
  if (items.empty())
    return {
      fmt::format(
          "No symbol found at {}:{}:{}\n", at.file.string(), at.pos.line,
          at.pos.column),
      json::array{}};

  const auto& item = items.front();
  auto calls = direction == "incoming" ? lsp::requests::incoming_calls(c, item)
                                       : lsp::requests::outgoing_calls(c, item);
  query_result res;
  res.text = fmt::format(
      "{} calls for {} ({}):\n", direction == "incoming" ? "Incoming" : "Outgoing",
      item.name, lsp::symbol_kind_name(item.kind));
  json::array data;
  for (const auto& call : calls) {
    lsp::location loc{call.item.uri, call.item.selection_range};
    res.text += fmt::format(
        "  {} ({}) {}\n", call.item.name, lsp::symbol_kind_name(call.item.kind),
        where(loc));
    json::object entry;
    entry["name"] = call.item.name;
    entry["kind"] = lsp::symbol_kind_name(call.item.kind);
    entry["location"] = location_to_json(loc);
    json::array ranges;
    for (const auto& r : call.from_ranges) ranges.push_back(range_to_json(r));
    entry["fromRanges"] = std::move(ranges);
    data.push_back(std::move(entry));
  }
  if (calls.empty()) res.text += "  (none)\n";
  res.data = std::move(data);
  return res;
}

query_result show_hover(lsp::client& c, const lsp::cli::file_position& at) {
  auto text = lsp::requests::hover(c, at.file, at.pos);
  if (text.empty())
    return {
      fmt::format(
          "No hover information at {}:{}:{}\n", at.file.string(), at.pos.line,
          at.pos.column),
      nullptr};
  return {text + "\n", json::value(text)};
}

query_result run_query(lsp::client& c, const lsp::cli::query_options& q) {
  auto absolute = [&](const fs::path& p) {
    return p.is_absolute() ? p : (c.workspace_root() / p).lexically_normal();
  };

  if (q.capabilities) return show_capabilities(c);
  if (q.definition) return show_definition(c, *q.definition);
  if (q.references) return show_references(c, *q.references);
  if (q.diagnostics)
    return show_diagnostics(
        c, absolute(*q.diagnostics),
        std::chrono::milliseconds{q.wait_diagnostics_ms});
  if (q.document_symbols) return show_document_symbols(c, absolute(*q.document_symbols));
  if (q.call_hierarchy)
    return show_call_hierarchy(
        c, lsp::cli::parse_file_position(*q.call_hierarchy, c.workspace_root()),
        q.direction);
  if (q.hover)
    return show_hover(
        c, lsp::cli::parse_file_position(*q.hover, c.workspace_root()));
  lsp::utils::throwf<std::logic_error>("No query given");
}

int main(int argc, char* argv[]) {
  lsp::cli::query_options qopts{};
  int loglevel{3};
  bool json_output{false};

  auto done = lsp::cli::parse_options(
      std::span(argv, argc), loglevel, qopts, json_output);
  if (done) return done.value();

  loglevel = std::clamp(loglevel, 0, 5);
  lsp::logger log{static_cast<lsp::logging::level>(loglevel)};
  LOG_DEBUG(log, "loglevel={}", loglevel);

  json::object json_result;
  int retval = 0;

  try {
    lsp::client_options copts{};
    copts.command = qopts.server_command.front();
    copts.args.assign(qopts.server_command.begin() + 1, qopts.server_command.end());
    copts.workspace_root = qopts.workspace.value_or(fs::current_path());

    lsp::client c{copts, log};
    c.initialize();
    auto res = run_query(c, qopts);

    json_result["workspace"] = c.workspace_root().string();
    if (auto si = c.server()) {
      json::object server;
      server["name"] = si->name;
      server["version"] = si->version;
      json_result["server"] = std::move(server);
    }
    json_result["result"] = std::move(res.data);

    auto outcome = c.close();
    if (outcome.warning) LOG_WARN(log, "{}", *outcome.warning);

    if (!json_output) std::cout << res.text;
  } catch (std::exception& e) {
    if (!json_output) {
      std::cerr << e.what() << "\n";
      return -1;
    }
    json_result["error"] = lsp::utils::demangle_symbol(typeid(e).name());
    json_result["details"] = e.what();
    retval = -1;
  }

  if (json_output) std::cout << json::serialize(json_result) << "\n";
  return retval;
}
