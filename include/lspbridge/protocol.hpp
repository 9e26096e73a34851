#pragma once

/**
 * @file protocol.hpp
 * @brief The slice of LSP data structures the runtime decodes.
 *
 * Payloads arrive as open JSON.  Each shape is decoded once, here, into a
 * closed set of structs and variants; shapes that match none of the known
 * alternatives raise protocol_error or land in an explicit "unrecognized"
 * alternative, never in best-effort probing further up.
 *
 * Coordinates: @c position and @c text_range are the protocol's 0-indexed
 * values.  Anything facing a human or an external tool uses the 1-indexed
 * @c user_position, converted with to_protocol() and to_user().
 */

#include <boost/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lspbridge {

namespace json = boost::json;

/// Coordinates

struct position {
  std::uint32_t line{};
  std::uint32_t character{};
  bool operator==(const position&) const = default;
};

struct text_range {
  position start;
  position end;
  bool operator==(const text_range&) const = default;
};

struct location {
  std::string uri;
  text_range range;
  bool operator==(const location&) const = default;
};

// 1-indexed line and column, as typed by a user or reported back to one.
struct user_position {
  int line{1};
  int column{1};
  bool operator==(const user_position&) const = default;
};

struct user_range {
  user_position start;
  user_position end;
  bool operator==(const user_range&) const = default;
};

// Throws std::invalid_argument when line or column is below 1.
position to_protocol(const user_position& p);
text_range to_protocol(const user_range& r);
// Saturates at INT_MAX for coordinates no user type can hold.
user_position to_user(const position& p);
user_range to_user(const text_range& r);

/// Symbols

enum class symbol_kind : std::uint8_t {
  unknown = 0,
  file = 1,
  module,
  namespace_,
  package,
  class_,
  method,
  property,
  field,
  constructor,
  enum_,
  interface,
  function,
  variable,
  constant,
  string,
  number,
  boolean,
  array,
  object,
  key,
  null,
  enum_member,
  struct_,
  event,
  operator_,
  type_parameter,
};

std::string_view symbol_kind_name(symbol_kind kind);

struct symbol_information {
  std::string name;
  symbol_kind kind{};
  std::string container_name;
  location loc;
};

struct document_symbol {
  std::string name;
  std::string detail;
  symbol_kind kind{};
  text_range range;
  text_range selection_range;
  std::vector<document_symbol> children;
};

// textDocument/documentSymbol answers either with a tree or a flat list.
using document_symbols = std::variant<
    std::vector<document_symbol>, std::vector<symbol_information>>;

/// Diagnostics

enum class diagnostic_severity : std::uint8_t {
  unspecified = 0,
  error = 1,
  warning = 2,
  information = 3,
  hint = 4,
};

std::string_view severity_name(diagnostic_severity s);

// integer | string, kept as sent
using diagnostic_code = std::variant<std::int64_t, std::string>;

struct diagnostic {
  text_range range;
  diagnostic_severity severity{};
  std::optional<diagnostic_code> code;
  std::string source;
  std::string message;
};

/// Call hierarchy

struct call_hierarchy_item {
  std::string name;
  symbol_kind kind{};
  std::string detail;
  std::string uri;
  text_range range;
  text_range selection_range;
  // The item as the server sent it; incoming/outgoing queries send it back
  // verbatim so server-private fields like "data" survive.
  json::object raw;
};

struct call_hierarchy_call {
  call_hierarchy_item item;  // the caller (incoming) or callee (outgoing)
  std::vector<text_range> from_ranges;
};

/// Code actions

struct server_command {
  std::string title;
  std::string command;
  json::array arguments;
};

struct code_action {
  std::string title;
  std::string kind;
  std::optional<server_command> command;
  bool has_edit{};
  bool is_preferred{};
};

struct unrecognized_action {
  json::value raw;
};

using code_action_or_command =
    std::variant<code_action, server_command, unrecognized_action>;

/// Completion

struct completion_item {
  std::string label;
  int kind{};  // CompletionItemKind, 0 if not given
  std::string detail;
  std::string documentation;
  std::string sort_text;
  std::string insert_text;
};

// Servers answer with CompletionItem[] or a CompletionList; both land here.
struct completion_list {
  bool is_incomplete{};
  std::vector<completion_item> items;
};

/// Signature help

struct parameter_information {
  std::string label;  // offset labels resolved against the signature
  std::string documentation;
};

struct signature_information {
  std::string label;
  std::string documentation;
  std::vector<parameter_information> parameters;
  std::optional<std::uint32_t> active_parameter;
};

struct signature_help_result {
  std::vector<signature_information> signatures;
  std::uint32_t active_signature{};
  std::optional<std::uint32_t> active_parameter;
};

/// Edits

struct text_edit {
  text_range range;
  std::string new_text;
  bool operator==(const text_edit&) const = default;
};

struct workspace_edit {
  // By document URI, from "changes" or from the TextDocumentEdits of
  // "documentChanges"
  std::map<std::string, std::vector<text_edit>> changes;
  // create, rename and delete file operations, as sent
  json::array resource_operations;
};

/// Code lens

struct code_lens {
  text_range range;
  std::optional<server_command> command;  // absent until resolved
  json::value data;
};

/// Decoding (server to client).  Throw protocol_error on malformed input.

position decode_position(const json::value& v);
text_range decode_range(const json::value& v);
location decode_location(const json::value& v);

// Location, Location[], LocationLink[] or null, flattened.  Links contribute
// their targetUri and targetRange.
std::vector<location> decode_locations(const json::value& v);

// SymbolInformation[] or WorkspaceSymbol[] (whose location may lack a range).
std::vector<symbol_information> decode_workspace_symbols(const json::value& v);

document_symbols decode_document_symbols(const json::value& v);

diagnostic decode_diagnostic(const json::value& v);
std::vector<diagnostic> decode_diagnostics(const json::value& v);

call_hierarchy_item decode_call_hierarchy_item(const json::value& v);
std::vector<call_hierarchy_item> decode_call_hierarchy_items(
    const json::value& v);
// "from" for incoming calls, "to" for outgoing calls
std::vector<call_hierarchy_call> decode_call_hierarchy_calls(
    const json::value& v, std::string_view peer_key);

code_action_or_command decode_code_action(const json::value& v);
std::vector<code_action_or_command> decode_code_actions(const json::value& v);

// MarkupContent, MarkedString or MarkedString[]; empty for null.
std::string decode_hover(const json::value& v);

completion_list decode_completion(const json::value& v);

// Empty for null or an answer without signatures.
std::optional<signature_help_result> decode_signature_help(const json::value& v);

text_edit decode_text_edit(const json::value& v);
workspace_edit decode_workspace_edit(const json::value& v);

code_lens decode_code_lens(const json::value& v);
std::vector<code_lens> decode_code_lenses(const json::value& v);

/// Encoding (client to server)

json::object to_json(const position& p);
json::object to_json(const text_range& r);
json::object to_json(const location& l);
json::object to_json(const diagnostic& d);
json::object to_json(const server_command& c);
json::object to_json(const code_lens& l);

json::object text_document_identifier(std::string_view uri);

// {"textDocument": {"uri": ...}, "position": ...}
json::object text_document_position(std::string_view uri, const position& p);

}  // namespace lspbridge
