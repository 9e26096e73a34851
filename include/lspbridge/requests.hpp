#pragma once

/**
 * @file requests.hpp
 * @brief Typed wrappers over client::call for the requests the bridge uses.
 *
 * Every file-addressing request opens its file first.  Positions and ranges
 * going in are 1-indexed; the decoded results keep the protocol's 0-indexed
 * coordinates and are converted with to_user() where they are shown.
 * Errors propagate from client::call unchanged.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lspbridge/client.hpp"
#include "lspbridge/protocol.hpp"

namespace lspbridge::requests {

std::vector<symbol_information> workspace_symbols(
    client& c, std::string_view query);

std::vector<location> definition(
    client& c, const std::filesystem::path& file, user_position pos);

std::vector<location> references(
    client& c, const std::filesystem::path& file, user_position pos,
    bool include_declaration = true);

// Plain text of the hover contents, empty if there is nothing to show.
std::string hover(
    client& c, const std::filesystem::path& file, user_position pos);

lspbridge::document_symbols document_symbols(
    client& c, const std::filesystem::path& file);

std::vector<call_hierarchy_item> prepare_call_hierarchy(
    client& c, const std::filesystem::path& file, user_position pos);
std::vector<call_hierarchy_call> incoming_calls(
    client& c, const call_hierarchy_item& item);
std::vector<call_hierarchy_call> outgoing_calls(
    client& c, const call_hierarchy_item& item);

// Code actions for @p range, with the file's current diagnostics that
// touch the range as context.
std::vector<code_action_or_command> code_actions(
    client& c, const std::filesystem::path& file, const user_range& range);

completion_list completion(
    client& c, const std::filesystem::path& file, user_position pos);

// Empty when the server has no signature to offer at @p pos.
std::optional<signature_help_result> signature_help(
    client& c, const std::filesystem::path& file, user_position pos);

// The edit the server proposes.  Nothing is applied.
workspace_edit rename(
    client& c, const std::filesystem::path& file, user_position pos,
    std::string_view new_name);

std::vector<code_lens> code_lenses(
    client& c, const std::filesystem::path& file);
// codeLens/resolve, for lenses that came without a command.
code_lens resolve_code_lens(client& c, const code_lens& lens);

// workspace/executeCommand, e.g. for a lens or code action command.
json::value execute_command(client& c, const server_command& cmd);

}  // namespace lspbridge::requests
