#include "lspbridge/resolver.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>
#include <stdexcept>
#include <tuple>

#include "lspbridge/errors.hpp"
#include "lspbridge/requests.hpp"
#include "lspbridge/uri.hpp"
#include "utils.hpp"

namespace lspbridge {

namespace fs = std::filesystem;

namespace {

bool iequals(std::string_view a, std::string_view b) {
  return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

std::string location_key(const location& l) {
  return fmt::format(
      "{}:{}:{}", canonical_uri(l.uri), l.range.start.line,
      l.range.start.character);
}

bool contains(const text_range& outer, const position& p) {
  auto le = [](const position& x, const position& y) {
    return x.line < y.line || (x.line == y.line && x.character <= y.character);
  };
  return le(outer.start, p) && le(p, outer.end);
}

void innermost(
    const std::vector<document_symbol>& syms, const position& p,
    std::optional<text_range>& best) {
  for (const auto& s : syms) {
    if (!contains(s.range, p)) continue;
    best = s.range;
    innermost(s.children, p, best);
  }
}

// The range of the innermost document symbol around @p def, if the server
// can tell us.
std::optional<text_range> enclosing_range(client& c, const location& def) {
  if (!c.server_capabilities().has_document_symbol_support()) return std::nullopt;
  auto syms = requests::document_symbols(c, uri_to_path(def.uri));
  std::optional<text_range> best;
  if (auto* tree = std::get_if<std::vector<document_symbol>>(&syms)) {
    innermost(*tree, def.range.start, best);
  } else {
    for (const auto& s : std::get<std::vector<symbol_information>>(syms)) {
      if (s.loc.uri != def.uri || !contains(s.loc.range, def.range.start))
        continue;
      if (!best || contains(*best, s.loc.range.start)) best = s.loc.range;
    }
  }
  return best;
}

definition_match describe(
    client& c, const symbol_information& sym, const location& def) {
  auto path = uri_to_path(def.uri);
  c.ensure_open(path);

  auto range = def.range;
  try {
    if (auto r = enclosing_range(c, def)) range = *r;
  } catch (const rpc_error& e) {
    LOG_DEBUG(c.log(), "No document symbols for {}: {}", path.string(), e.what());
  } catch (const protocol_error& e) {
    LOG_DEBUG(c.log(), "Bad document symbols for {}: {}", path.string(), e.what());
  }

  auto all = utils::split_lines(c.documents().content(path));
  definition_match m{
    .symbol = sym.name,
    .kind = sym.kind,
    .container = sym.container_name,
    .file = path.string(),
    .range = range};
  auto first = std::min<std::size_t>(range.start.line, all.size());
  auto last = std::min<std::size_t>(range.end.line + 1, all.size());
  m.lines.assign(all.begin() + first, all.begin() + std::max(first, last));
  return m;
}

// Workspace symbols for @p query that survive symbol_matches(), each
// already opened.
std::vector<symbol_information> candidates(client& c, std::string_view query) {
  std::vector<symbol_information> out;
  for (auto& sym : requests::workspace_symbols(c, query)) {
    if (!symbol_matches(query, sym.name, sym.kind, sym.container_name)) continue;
    LOG_DEBUG(c.log(), "Candidate {} in {}", sym.name, sym.loc.uri);
    out.push_back(std::move(sym));
  }
  return out;
}

}  // namespace

bool symbol_matches(
    std::string_view query, std::string_view name, symbol_kind kind,
    std::string_view container) {
  if (name == query) return true;

  if (query.find_first_of(".:") != std::string_view::npos) return false;

  auto ends_with = [&](std::string_view sep) {
    return name.size() >= query.size() + sep.size() && name.ends_with(query) &&
           name.substr(0, name.size() - query.size()).ends_with(sep);
  };
  if (ends_with("::") || ends_with(".")) return true;

  if ((kind == symbol_kind::method || kind == symbol_kind::function) &&
      !container.empty() && name == query)
    return true;

  if (kind == symbol_kind::class_ || kind == symbol_kind::struct_ ||
      kind == symbol_kind::interface || kind == symbol_kind::enum_) {
    if (iequals(name, query)) return true;
    if (name.find(query) != std::string_view::npos) return true;
  }

  if (kind == symbol_kind::variable || kind == symbol_kind::constant) {
    auto sep = name.rfind("::");
    if (sep != std::string_view::npos && name.substr(sep + 2) == query)
      return true;
  }

  return false;
}

definition_result resolve_definition(client& c, std::string_view query) {
  definition_result result{.query = std::string{query}};
  std::set<std::string> seen;

  for (const auto& sym : candidates(c, query)) {
    try {
      auto defs = requests::definition(c, uri_to_path(sym.loc.uri), to_user(sym.loc.range.start));
      for (const auto& def : defs) {
        if (!seen.insert(location_key(def)).second) continue;
        result.matches.push_back(describe(c, sym, def));
      }
    } catch (const rpc_error& e) {
      LOG_ERROR(c.log(), "Definition of {} failed: {}", sym.name, e.what());
    } catch (const protocol_error& e) {
      LOG_ERROR(c.log(), "Bad definition result for {}: {}", sym.name, e.what());
    } catch (const document_error& e) {
      LOG_ERROR(c.log(), "Can't open file for {}: {}", sym.name, e.what());
    } catch (const std::invalid_argument& e) {
      LOG_ERROR(c.log(), "Unusable location for {}: {}", sym.name, e.what());
    }
  }
  return result;
}

reference_result find_references(client& c, std::string_view query) {
  reference_result result{.query = std::string{query}};
  std::set<std::string> seen;

  for (const auto& sym : candidates(c, query)) {
    try {
      auto refs = requests::references(
          c, uri_to_path(sym.loc.uri), to_user(sym.loc.range.start), false);
      for (auto& ref : refs)
        if (seen.insert(location_key(ref)).second)
          result.locations.push_back(std::move(ref));
    } catch (const rpc_error& e) {
      LOG_ERROR(c.log(), "References to {} failed: {}", sym.name, e.what());
    } catch (const protocol_error& e) {
      LOG_ERROR(c.log(), "Bad references result for {}: {}", sym.name, e.what());
    } catch (const document_error& e) {
      LOG_ERROR(c.log(), "Can't open file for {}: {}", sym.name, e.what());
    } catch (const std::invalid_argument& e) {
      LOG_ERROR(c.log(), "Unusable location for {}: {}", sym.name, e.what());
    }
  }

  std::ranges::sort(result.locations, [](const location& a, const location& b) {
    return std::tie(a.uri, a.range.start.line, a.range.start.character) <
           std::tie(b.uri, b.range.start.line, b.range.start.character);
  });
  return result;
}

std::string add_line_numbers(const std::vector<std::string>& lines, int first_line) {
  auto width = fmt::formatted_size("{}", first_line + static_cast<int>(lines.size()) - 1);
  std::string out;
  int n = first_line;
  for (const auto& l : lines) out += fmt::format("{:>{}}|{}\n", n++, width, l);
  return out;
}

std::string format_definitions(const definition_result& r) {
  if (!r.found()) return fmt::format("{} not found", r.query);

  std::string out;
  for (const auto& m : r.matches) {
    auto range = to_user(m.range);
    out += "---\n\n";
    out += fmt::format("Symbol: {}\nFile: {}\n", m.symbol, m.file);
    if (m.kind != symbol_kind::unknown)
      out += fmt::format("Kind: {}\n", symbol_kind_name(m.kind));
    if (!m.container.empty())
      out += fmt::format("Container Name: {}\n", m.container);
    out += fmt::format(
        "Range: L{}:C{} - L{}:C{}\n\n", range.start.line, range.start.column,
        range.end.line, range.end.column);
    out += add_line_numbers(m.lines, range.start.line);
    out += "\n";
  }
  return out;
}

std::string format_references(const reference_result& r) {
  if (r.locations.empty()) return fmt::format("No references found for {}", r.query);

  std::string out;
  std::string_view current;
  for (const auto& l : r.locations) {
    if (l.uri != current) {
      current = l.uri;
      out += fmt::format("---\n\nFile: {}\n", uri_to_path(l.uri).string());
    }
    auto p = to_user(l.range.start);
    out += fmt::format("  L{}:C{}\n", p.line, p.column);
  }
  return out;
}

}  // namespace lspbridge
