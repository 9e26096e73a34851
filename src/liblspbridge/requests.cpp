#include "lspbridge/requests.hpp"

namespace lspbridge::requests {

namespace fs = std::filesystem;

namespace {

bool touches(const text_range& a, const text_range& b) {
  auto before = [](const position& x, const position& y) {
    return x.line < y.line || (x.line == y.line && x.character < y.character);
  };
  return !before(a.end, b.start) && !before(b.end, a.start);
}

json::object call_hierarchy_params(const call_hierarchy_item& item) {
  json::object params;
  params["item"] = item.raw;
  return params;
}

}  // namespace

std::vector<symbol_information> workspace_symbols(
    client& c, std::string_view query) {
  json::object params;
  params["query"] = query;
  return decode_workspace_symbols(c.call("workspace/symbol", std::move(params)));
}

std::vector<location> definition(
    client& c, const fs::path& file, user_position pos) {
  auto uri = c.ensure_open(file);
  return decode_locations(c.call(
      "textDocument/definition", text_document_position(uri, to_protocol(pos))));
}

std::vector<location> references(
    client& c, const fs::path& file, user_position pos,
    bool include_declaration) {
  auto uri = c.ensure_open(file);
  auto params = text_document_position(uri, to_protocol(pos));
  json::object context;
  context["includeDeclaration"] = include_declaration;
  params["context"] = std::move(context);
  return decode_locations(c.call("textDocument/references", std::move(params)));
}

std::string hover(client& c, const fs::path& file, user_position pos) {
  auto uri = c.ensure_open(file);
  return decode_hover(c.call(
      "textDocument/hover", text_document_position(uri, to_protocol(pos))));
}

lspbridge::document_symbols document_symbols(client& c, const fs::path& file) {
  auto uri = c.ensure_open(file);
  json::object params;
  params["textDocument"] = text_document_identifier(uri);
  return decode_document_symbols(
      c.call("textDocument/documentSymbol", std::move(params)));
}

std::vector<call_hierarchy_item> prepare_call_hierarchy(
    client& c, const fs::path& file, user_position pos) {
  auto uri = c.ensure_open(file);
  return decode_call_hierarchy_items(c.call(
      "textDocument/prepareCallHierarchy",
      text_document_position(uri, to_protocol(pos))));
}

std::vector<call_hierarchy_call> incoming_calls(
    client& c, const call_hierarchy_item& item) {
  return decode_call_hierarchy_calls(
      c.call("callHierarchy/incomingCalls", call_hierarchy_params(item)),
      "from");
}

std::vector<call_hierarchy_call> outgoing_calls(
    client& c, const call_hierarchy_item& item) {
  return decode_call_hierarchy_calls(
      c.call("callHierarchy/outgoingCalls", call_hierarchy_params(item)), "to");
}

std::vector<code_action_or_command> code_actions(
    client& c, const fs::path& file, const user_range& range) {
  auto uri = c.ensure_open(file);
  auto wire_range = to_protocol(range);

  json::array diags;
  for (const auto& d : c.get_diagnostics(uri))
    if (touches(d.range, wire_range)) diags.push_back(to_json(d));

  json::object context;
  context["diagnostics"] = std::move(diags);
  json::object params;
  params["textDocument"] = text_document_identifier(uri);
  params["range"] = to_json(wire_range);
  params["context"] = std::move(context);
  return decode_code_actions(c.call("textDocument/codeAction", std::move(params)));
}

completion_list completion(client& c, const fs::path& file, user_position pos) {
  auto uri = c.ensure_open(file);
  return decode_completion(c.call(
      "textDocument/completion", text_document_position(uri, to_protocol(pos))));
}

std::optional<signature_help_result> signature_help(
    client& c, const fs::path& file, user_position pos) {
  auto uri = c.ensure_open(file);
  return decode_signature_help(c.call(
      "textDocument/signatureHelp",
      text_document_position(uri, to_protocol(pos))));
}

workspace_edit rename(
    client& c, const fs::path& file, user_position pos,
    std::string_view new_name) {
  auto uri = c.ensure_open(file);
  auto params = text_document_position(uri, to_protocol(pos));
  params["newName"] = new_name;
  return decode_workspace_edit(c.call("textDocument/rename", std::move(params)));
}

std::vector<code_lens> code_lenses(client& c, const fs::path& file) {
  auto uri = c.ensure_open(file);
  json::object params;
  params["textDocument"] = text_document_identifier(uri);
  return decode_code_lenses(c.call("textDocument/codeLens", std::move(params)));
}

code_lens resolve_code_lens(client& c, const code_lens& lens) {
  return decode_code_lens(c.call("codeLens/resolve", to_json(lens)));
}

json::value execute_command(client& c, const server_command& cmd) {
  json::object params;
  params["command"] = cmd.command;
  if (!cmd.arguments.empty()) params["arguments"] = cmd.arguments;
  return c.call("workspace/executeCommand", std::move(params));
}

}  // namespace lspbridge::requests
