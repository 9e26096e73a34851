// SPDX-License-Identifier: MIT
#include "lspbridge/jsonrpc.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

namespace lspbridge::jsonrpc {

std::optional<std::size_t> parse_content_length(std::string_view headers) {
  static const RE2 content_length_re{R"((?i)Content-Length:\s*(\d+))"};
  std::size_t length{};
  re2::StringPiece text{headers.data(), headers.size()};
  if (RE2::PartialMatch(text, content_length_re, &length)) return length;
  return std::nullopt;
}

std::string frame_message(const json::object& msg) {
  std::string json_str{json::serialize(msg)};
  return fmt::format("Content-Length: {}\r\n\r\n{}", json_str.size(), json_str);
}

json::object make_request(
    std::int64_t id, std::string_view method, json::value params) {
  json::object msg;
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["method"] = method;
  if (!params.is_null()) msg["params"] = std::move(params);
  return msg;
}

json::object make_notification(std::string_view method, json::value params) {
  json::object msg;
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  if (!params.is_null()) msg["params"] = std::move(params);
  return msg;
}

json::object make_result(const json::value& id, json::value result) {
  json::object msg;
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["result"] = std::move(result);
  return msg;
}

json::object make_error(
    const json::value& id, int code, std::string_view message,
    std::optional<json::value> data) {
  json::object err;
  err["code"] = code;
  err["message"] = message;
  if (data) err["data"] = std::move(*data);
  json::object msg;
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["error"] = std::move(err);
  return msg;
}

}  // namespace lspbridge::jsonrpc
