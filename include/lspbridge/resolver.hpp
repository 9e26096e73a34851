#pragma once

/**
 * @file resolver.hpp
 * @brief "Where is X defined?" on top of workspace/symbol and definition.
 *
 * workspace/symbol is fuzzy by each server's own policy, so candidates are
 * filtered again with symbol_matches() before asking for their definitions.
 * Definitions reached from several candidates are reported once.  Finding
 * nothing is a normal, empty result.
 */

#include <string>
#include <string_view>
#include <vector>

#include "lspbridge/client.hpp"
#include "lspbridge/protocol.hpp"

namespace lspbridge {

/** @brief Decide whether a workspace symbol is the one @p query names.
 *
 * Rules, the first one that applies decides:
 *  1. identical names match;
 *  2. a query containing '.' or ':' matches nothing else;
 *  3. a name ending in "::query" or ".query" matches;
 *  4. a method or function with a container and the same name matches;
 *  5. class, struct, interface and enum names match case-insensitively or
 *     by substring ("vector" finds "std::vector<int>");
 *  6. a variable or constant whose last "::" component is the query
 *     matches.
 */
bool symbol_matches(
    std::string_view query, std::string_view name, symbol_kind kind,
    std::string_view container);

struct definition_match {
  std::string symbol;  // the workspace symbol that led here
  symbol_kind kind{};
  std::string container;
  std::string file;  // absolute path
  // What the text below spans: the innermost document symbol around the
  // definition, or the definition range itself.
  text_range range;
  std::vector<std::string> lines;
};

struct definition_result {
  std::string query;
  std::vector<definition_match> matches;
  bool found() const { return !matches.empty(); }
};

definition_result resolve_definition(client& c, std::string_view query);

struct reference_result {
  std::string query;
  std::vector<location> locations;  // deduplicated, sorted by file and position
};

// textDocument/references at every matching workspace symbol.
reference_result find_references(client& c, std::string_view query);

// "  12|text" with the numbers right-aligned, one line each.
std::string add_line_numbers(const std::vector<std::string>& lines, int first_line);

std::string format_definitions(const definition_result& r);
std::string format_references(const reference_result& r);

}  // namespace lspbridge
