#include "lspbridge/protocol.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

#include "lspbridge/errors.hpp"
#include "utils.hpp"

namespace lspbridge {

using utils::throwf;

namespace {

const json::object& expect_object(const json::value& v, std::string_view what) {
  auto* obj = v.if_object();
  if (!obj)
    throwf<protocol_error>(
        "{}: expected an object, got {}", what, json::serialize(v));
  return *obj;
}

const json::value& expect_field(
    const json::object& obj, std::string_view key, std::string_view what) {
  auto* v = obj.if_contains(key);
  if (!v) throwf<protocol_error>("{}: missing '{}'", what, key);
  return *v;
}

std::string get_string(const json::object& obj, std::string_view key) {
  if (auto* v = obj.if_contains(key); v && v->is_string())
    return std::string{v->as_string()};
  return {};
}

std::uint32_t get_uint(
    const json::object& obj, std::string_view key, std::string_view what) {
  const auto& v = expect_field(obj, key, what);
  boost::system::error_code ec;
  auto n = v.to_number<std::int64_t>(ec);
  if (ec || n < 0)
    throwf<protocol_error>("{}: '{}' is not a non-negative integer", what, key);
  if (n > std::numeric_limits<std::uint32_t>::max())
    throwf<protocol_error>("{}: '{}' is out of range: {}", what, key, n);
  return static_cast<std::uint32_t>(n);
}

std::optional<std::uint32_t> get_optional_uint(
    const json::object& obj, std::string_view key, std::string_view what) {
  auto* v = obj.if_contains(key);
  if (!v || v->is_null()) return std::nullopt;
  return get_uint(obj, key, what);
}

symbol_kind get_kind(const json::object& obj) {
  auto* v = obj.if_contains("kind");
  if (!v) return symbol_kind::unknown;
  boost::system::error_code ec;
  auto n = v->to_number<std::int64_t>(ec);
  if (ec || n < 1 || n > 26) return symbol_kind::unknown;
  return static_cast<symbol_kind>(n);
}

server_command decode_command(const json::object& o) {
  server_command cmd{
    .title = get_string(o, "title"), .command = get_string(o, "command")};
  if (auto* args = o.if_contains("arguments"); args && args->is_array())
    cmd.arguments = args->as_array();
  return cmd;
}

std::string markup_text(const json::value& v) {
  if (v.is_string()) return std::string{v.as_string()};
  if (auto* obj = v.if_object()) return get_string(*obj, "value");
  return {};
}

}  // namespace

/// Coordinates

position to_protocol(const user_position& p) {
  if (p.line < 1 || p.column < 1)
    throwf<std::invalid_argument>(
        "Line and column are 1-indexed, got {}:{}", p.line, p.column);
  return {
    .line = static_cast<std::uint32_t>(p.line - 1),
    .character = static_cast<std::uint32_t>(p.column - 1)};
}

text_range to_protocol(const user_range& r) {
  return {.start = to_protocol(r.start), .end = to_protocol(r.end)};
}

user_position to_user(const position& p) {
  constexpr std::int64_t top{std::numeric_limits<int>::max()};
  auto one_based = [](std::uint32_t n) {
    return static_cast<int>(std::min(std::int64_t{n} + 1, top));
  };
  return {.line = one_based(p.line), .column = one_based(p.character)};
}

user_range to_user(const text_range& r) {
  return {.start = to_user(r.start), .end = to_user(r.end)};
}

/// Names

std::string_view symbol_kind_name(symbol_kind kind) {
  static constexpr std::array<std::string_view, 27> names{
    "Unknown",     "File",     "Module",      "Namespace", "Package",
    "Class",       "Method",   "Property",    "Field",     "Constructor",
    "Enum",        "Interface", "Function",   "Variable",  "Constant",
    "String",      "Number",   "Boolean",     "Array",     "Object",
    "Key",         "Null",     "EnumMember",  "Struct",    "Event",
    "Operator",    "TypeParameter"};
  auto idx = static_cast<std::size_t>(kind);
  return idx < names.size() ? names[idx] : names[0];
}

std::string_view severity_name(diagnostic_severity s) {
  // clang-format off
  switch (s) {
  case diagnostic_severity::error:       return "Error";
  case diagnostic_severity::warning:     return "Warning";
  case diagnostic_severity::information: return "Information";
  case diagnostic_severity::hint:        return "Hint";
  default: return "Unspecified";
  }
  // clang-format on
}

/// Decoding

position decode_position(const json::value& v) {
  const auto& obj = expect_object(v, "Position");
  return {
    .line = get_uint(obj, "line", "Position"),
    .character = get_uint(obj, "character", "Position")};
}

text_range decode_range(const json::value& v) {
  const auto& obj = expect_object(v, "Range");
  return {
    .start = decode_position(expect_field(obj, "start", "Range")),
    .end = decode_position(expect_field(obj, "end", "Range"))};
}

location decode_location(const json::value& v) {
  const auto& obj = expect_object(v, "Location");
  location loc{.uri = get_string(obj, "uri")};
  if (loc.uri.empty()) throwf<protocol_error>("Location: missing 'uri'");
  // WorkspaceSymbol may carry a location without a range
  if (auto* r = obj.if_contains("range")) loc.range = decode_range(*r);
  return loc;
}

std::vector<location> decode_locations(const json::value& v) {
  std::vector<location> res;
  auto one = [&](const json::value& elem) {
    const auto& obj = expect_object(elem, "Definition");
    if (obj.contains("targetUri")) {
      res.push_back(
          {.uri = get_string(obj, "targetUri"),
           .range = decode_range(expect_field(obj, "targetRange", "LocationLink"))});
    } else {
      res.push_back(decode_location(elem));
    }
  };

  if (v.is_null()) return res;
  if (auto* arr = v.if_array()) {
    for (auto&& elem : *arr) one(elem);
  } else if (v.is_object()) {
    one(v);
  } else {
    throwf<protocol_error>(
        "Unexpected definition result: {}", json::serialize(v));
  }
  return res;
}

std::vector<symbol_information> decode_workspace_symbols(const json::value& v) {
  std::vector<symbol_information> res;
  if (v.is_null()) return res;
  auto* arr = v.if_array();
  if (!arr)
    throwf<protocol_error>(
        "Unexpected workspace/symbol result: {}", json::serialize(v));
  for (auto&& elem : *arr) {
    const auto& obj = expect_object(elem, "SymbolInformation");
    res.push_back(
        {.name = get_string(obj, "name"),
         .kind = get_kind(obj),
         .container_name = get_string(obj, "containerName"),
         .loc = decode_location(expect_field(obj, "location", "SymbolInformation"))});
  }
  return res;
}

namespace {

document_symbol decode_document_symbol(const json::value& v) {
  const auto& obj = expect_object(v, "DocumentSymbol");
  document_symbol sym{
    .name = get_string(obj, "name"),
    .detail = get_string(obj, "detail"),
    .kind = get_kind(obj),
    .range = decode_range(expect_field(obj, "range", "DocumentSymbol")),
    .selection_range =
        decode_range(expect_field(obj, "selectionRange", "DocumentSymbol"))};
  if (auto* children = obj.if_contains("children"); children && children->is_array())
    for (auto&& c : children->as_array())
      sym.children.push_back(decode_document_symbol(c));
  return sym;
}

}  // namespace

document_symbols decode_document_symbols(const json::value& v) {
  if (v.is_null()) return std::vector<document_symbol>{};
  auto* arr = v.if_array();
  if (!arr)
    throwf<protocol_error>(
        "Unexpected documentSymbol result: {}", json::serialize(v));

  bool flat = !arr->empty() && arr->front().is_object() &&
              arr->front().as_object().contains("location");
  if (flat) return decode_workspace_symbols(v);

  std::vector<document_symbol> tree;
  for (auto&& elem : *arr) tree.push_back(decode_document_symbol(elem));
  return tree;
}

diagnostic decode_diagnostic(const json::value& v) {
  const auto& obj = expect_object(v, "Diagnostic");
  diagnostic d{
    .range = decode_range(expect_field(obj, "range", "Diagnostic")),
    .source = get_string(obj, "source"),
    .message = get_string(obj, "message")};
  if (auto* sev = obj.if_contains("severity")) {
    boost::system::error_code ec;
    auto n = sev->to_number<std::int64_t>(ec);
    if (!ec && n >= 1 && n <= 4) d.severity = static_cast<diagnostic_severity>(n);
  }
  if (auto* code = obj.if_contains("code")) {
    if (code->is_string()) {
      d.code = std::string{code->as_string()};
    } else if (code->is_number()) {
      boost::system::error_code ec;
      auto n = code->to_number<std::int64_t>(ec);
      if (ec)
        throwf<protocol_error>(
            "Diagnostic: 'code' is not an integer: {}", json::serialize(*code));
      d.code = n;
    }
  }
  return d;
}

std::vector<diagnostic> decode_diagnostics(const json::value& v) {
  std::vector<diagnostic> res;
  if (v.is_null()) return res;
  auto* arr = v.if_array();
  if (!arr)
    throwf<protocol_error>("Diagnostics must be an array: {}", json::serialize(v));
  res.reserve(arr->size());
  for (auto&& elem : *arr) res.push_back(decode_diagnostic(elem));
  return res;
}

call_hierarchy_item decode_call_hierarchy_item(const json::value& v) {
  const auto& obj = expect_object(v, "CallHierarchyItem");
  return {
    .name = get_string(obj, "name"),
    .kind = get_kind(obj),
    .detail = get_string(obj, "detail"),
    .uri = get_string(obj, "uri"),
    .range = decode_range(expect_field(obj, "range", "CallHierarchyItem")),
    .selection_range =
        decode_range(expect_field(obj, "selectionRange", "CallHierarchyItem")),
    .raw = obj};
}

std::vector<call_hierarchy_item> decode_call_hierarchy_items(
    const json::value& v) {
  std::vector<call_hierarchy_item> res;
  if (v.is_null()) return res;
  auto* arr = v.if_array();
  if (!arr)
    throwf<protocol_error>(
        "Unexpected prepareCallHierarchy result: {}", json::serialize(v));
  for (auto&& elem : *arr) res.push_back(decode_call_hierarchy_item(elem));
  return res;
}

std::vector<call_hierarchy_call> decode_call_hierarchy_calls(
    const json::value& v, std::string_view peer_key) {
  std::vector<call_hierarchy_call> res;
  if (v.is_null()) return res;
  auto* arr = v.if_array();
  if (!arr)
    throwf<protocol_error>(
        "Unexpected call hierarchy result: {}", json::serialize(v));
  for (auto&& elem : *arr) {
    const auto& obj = expect_object(elem, "CallHierarchyCall");
    call_hierarchy_call call{.item = decode_call_hierarchy_item(
                                 expect_field(obj, peer_key, "CallHierarchyCall"))};
    if (auto* ranges = obj.if_contains("fromRanges"); ranges && ranges->is_array())
      for (auto&& r : ranges->as_array())
        call.from_ranges.push_back(decode_range(r));
    res.push_back(std::move(call));
  }
  return res;
}

code_action_or_command decode_code_action(const json::value& v) {
  auto* obj = v.if_object();
  if (!obj) return unrecognized_action{v};

  // A bare Command carries "command" as a string, a CodeAction as an object
  if (auto* c = obj->if_contains("command"); c && c->is_string())
    return decode_command(*obj);

  if (!obj->contains("title")) return unrecognized_action{v};

  code_action action{
    .title = get_string(*obj, "title"),
    .kind = get_string(*obj, "kind"),
    .has_edit = obj->contains("edit")};
  if (auto* c = obj->if_contains("command"); c && c->is_object())
    action.command = decode_command(c->as_object());
  if (auto* p = obj->if_contains("isPreferred"); p && p->is_bool())
    action.is_preferred = p->as_bool();
  return action;
}

std::vector<code_action_or_command> decode_code_actions(const json::value& v) {
  std::vector<code_action_or_command> res;
  if (v.is_null()) return res;
  auto* arr = v.if_array();
  if (!arr)
    throwf<protocol_error>(
        "Unexpected codeAction result: {}", json::serialize(v));
  for (auto&& elem : *arr) res.push_back(decode_code_action(elem));
  return res;
}

std::string decode_hover(const json::value& v) {
  if (v.is_null()) return {};
  const auto& obj = expect_object(v, "Hover");
  auto* contents = obj.if_contains("contents");
  if (!contents) return {};
  if (auto* arr = contents->if_array()) {
    std::string res;
    for (auto&& elem : *arr) {
      if (!res.empty()) res += '\n';
      res += markup_text(elem);
    }
    return res;
  }
  return markup_text(*contents);
}

completion_list decode_completion(const json::value& v) {
  completion_list res;
  if (v.is_null()) return res;

  const json::array* items{nullptr};
  if (auto* obj = v.if_object()) {
    if (auto* inc = obj->if_contains("isIncomplete"); inc && inc->is_bool())
      res.is_incomplete = inc->as_bool();
    if (auto* i = obj->if_contains("items")) items = i->if_array();
    if (!items)
      throwf<protocol_error>("CompletionList: 'items' is not an array");
  } else {
    items = v.if_array();
  }
  if (!items)
    throwf<protocol_error>(
        "Unexpected completion result: {}", json::serialize(v));

  for (auto&& elem : *items) {
    const auto& obj = expect_object(elem, "CompletionItem");
    completion_item item{
      .label = get_string(obj, "label"),
      .detail = get_string(obj, "detail"),
      .sort_text = get_string(obj, "sortText"),
      .insert_text = get_string(obj, "insertText")};
    if (auto* k = obj.if_contains("kind")) {
      boost::system::error_code ec;
      auto n = k->to_number<std::int64_t>(ec);
      if (!ec && n >= 1 && n <= 25) item.kind = static_cast<int>(n);
    }
    if (auto* doc = obj.if_contains("documentation"))
      item.documentation = markup_text(*doc);
    res.items.push_back(std::move(item));
  }
  return res;
}

namespace {

parameter_information decode_parameter(
    const json::value& v, std::string_view signature_label) {
  const auto& obj = expect_object(v, "ParameterInformation");
  parameter_information param;
  if (auto* doc = obj.if_contains("documentation"))
    param.documentation = markup_text(*doc);

  const auto& label = expect_field(obj, "label", "ParameterInformation");
  if (label.is_string()) {
    param.label = std::string{label.as_string()};
  } else if (auto* offsets = label.if_array(); offsets && offsets->size() == 2) {
    boost::system::error_code ec1, ec2;
    auto from = (*offsets)[0].to_number<std::uint64_t>(ec1);
    auto to = (*offsets)[1].to_number<std::uint64_t>(ec2);
    if (ec1 || ec2 || from > to || to > signature_label.size())
      throwf<protocol_error>(
          "ParameterInformation: bad label offsets {}", json::serialize(label));
    param.label = std::string{signature_label.substr(from, to - from)};
  } else {
    throwf<protocol_error>(
        "ParameterInformation: bad label {}", json::serialize(label));
  }
  return param;
}

}  // namespace

std::optional<signature_help_result> decode_signature_help(const json::value& v) {
  if (v.is_null()) return std::nullopt;
  const auto& obj = expect_object(v, "SignatureHelp");
  signature_help_result res;
  if (auto* sigs = obj.if_contains("signatures"); sigs && sigs->is_array()) {
    for (auto&& elem : sigs->as_array()) {
      const auto& so = expect_object(elem, "SignatureInformation");
      signature_information sig{
        .label = get_string(so, "label"),
        .active_parameter =
            get_optional_uint(so, "activeParameter", "SignatureInformation")};
      if (auto* doc = so.if_contains("documentation"))
        sig.documentation = markup_text(*doc);
      if (auto* params = so.if_contains("parameters"); params && params->is_array())
        for (auto&& p : params->as_array())
          sig.parameters.push_back(decode_parameter(p, sig.label));
      res.signatures.push_back(std::move(sig));
    }
  }
  if (res.signatures.empty()) return std::nullopt;

  // Out of range means "not given"
  res.active_signature =
      get_optional_uint(obj, "activeSignature", "SignatureHelp").value_or(0);
  if (res.active_signature >= res.signatures.size()) res.active_signature = 0;
  res.active_parameter =
      get_optional_uint(obj, "activeParameter", "SignatureHelp");
  return res;
}

text_edit decode_text_edit(const json::value& v) {
  const auto& obj = expect_object(v, "TextEdit");
  const auto& text = expect_field(obj, "newText", "TextEdit");
  if (!text.is_string())
    throwf<protocol_error>("TextEdit: 'newText' is not a string");
  return {
    .range = decode_range(expect_field(obj, "range", "TextEdit")),
    .new_text = std::string{text.as_string()}};
}

workspace_edit decode_workspace_edit(const json::value& v) {
  workspace_edit res;
  if (v.is_null()) return res;
  const auto& obj = expect_object(v, "WorkspaceEdit");

  auto add_edits = [&](const std::string& uri, const json::value& edits) {
    auto* arr = edits.if_array();
    if (!arr)
      throwf<protocol_error>("WorkspaceEdit: edits for {} are not an array", uri);
    auto& out = res.changes[uri];
    for (auto&& e : *arr) out.push_back(decode_text_edit(e));
  };

  // documentChanges wins over changes when a server sends both
  if (auto* dc = obj.if_contains("documentChanges"); dc && dc->is_array()) {
    for (auto&& elem : dc->as_array()) {
      const auto& change = expect_object(elem, "DocumentChange");
      if (change.contains("kind")) {
        res.resource_operations.push_back(elem);
        continue;
      }
      const auto& doc = expect_object(
          expect_field(change, "textDocument", "TextDocumentEdit"),
          "TextDocumentEdit");
      auto uri = get_string(doc, "uri");
      if (uri.empty())
        throwf<protocol_error>("TextDocumentEdit: missing 'uri'");
      add_edits(uri, expect_field(change, "edits", "TextDocumentEdit"));
    }
    return res;
  }

  if (auto* changes = obj.if_contains("changes"); changes && !changes->is_null()) {
    const auto& by_uri = expect_object(*changes, "WorkspaceEdit changes");
    for (auto&& kv : by_uri) add_edits(std::string{kv.key()}, kv.value());
  }
  return res;
}

code_lens decode_code_lens(const json::value& v) {
  const auto& obj = expect_object(v, "CodeLens");
  code_lens lens{.range = decode_range(expect_field(obj, "range", "CodeLens"))};
  if (auto* c = obj.if_contains("command"); c && c->is_object())
    lens.command = decode_command(c->as_object());
  if (auto* d = obj.if_contains("data")) lens.data = *d;
  return lens;
}

std::vector<code_lens> decode_code_lenses(const json::value& v) {
  std::vector<code_lens> res;
  if (v.is_null()) return res;
  auto* arr = v.if_array();
  if (!arr)
    throwf<protocol_error>("Unexpected codeLens result: {}", json::serialize(v));
  for (auto&& elem : *arr) res.push_back(decode_code_lens(elem));
  return res;
}

/// Encoding

json::object to_json(const position& p) {
  json::object obj;
  obj["line"] = p.line;
  obj["character"] = p.character;
  return obj;
}

json::object to_json(const text_range& r) {
  json::object obj;
  obj["start"] = to_json(r.start);
  obj["end"] = to_json(r.end);
  return obj;
}

json::object to_json(const location& l) {
  json::object obj;
  obj["uri"] = l.uri;
  obj["range"] = to_json(l.range);
  return obj;
}

json::object to_json(const diagnostic& d) {
  json::object obj;
  obj["range"] = to_json(d.range);
  if (d.severity != diagnostic_severity::unspecified)
    obj["severity"] = static_cast<int>(d.severity);
  if (d.code)
    std::visit([&](const auto& c) { obj["code"] = c; }, *d.code);
  if (!d.source.empty()) obj["source"] = d.source;
  obj["message"] = d.message;
  return obj;
}

json::object to_json(const server_command& c) {
  json::object obj;
  obj["title"] = c.title;
  obj["command"] = c.command;
  if (!c.arguments.empty()) obj["arguments"] = c.arguments;
  return obj;
}

json::object to_json(const code_lens& l) {
  json::object obj;
  obj["range"] = to_json(l.range);
  if (l.command) obj["command"] = to_json(*l.command);
  if (!l.data.is_null()) obj["data"] = l.data;
  return obj;
}

json::object text_document_identifier(std::string_view uri) {
  json::object obj;
  obj["uri"] = uri;
  return obj;
}

json::object text_document_position(std::string_view uri, const position& p) {
  json::object obj;
  obj["textDocument"] = text_document_identifier(uri);
  obj["position"] = to_json(p);
  return obj;
}

}  // namespace lspbridge
