// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSONRPC 2.0 message framing and message construction.
 *
 * Messages are framed with the Language Server Protocol header convention:
 * each message is preceded by a header block of the form
 * @c "Content-Length: N\r\n\r\n" (other headers are tolerated and ignored)
 * followed by exactly @c N bytes of UTF-8 JSON text.
 *
 * Reading is asynchronous and meant to be @c co_await ed from the single
 * read loop that owns the stream.  Writers either queue frame_message()
 * output themselves or push one whole frame with write_jsonrpc_message().
 */

#include <fmt/format.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/json.hpp>
#include <boost/system/system_error.hpp>
#include <algorithm>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "lspbridge/errors.hpp"

namespace lspbridge::jsonrpc {

namespace asio = boost::asio;
namespace json = boost::json;

/// Longest payload read_jsonrpc_message() accepts
inline constexpr std::size_t max_content_length{64 * 1024 * 1024};

/** @brief Extract the payload length from a header block.
 *
 * @p headers is everything up to and including the terminating blank line.
 * Returns an empty optional when no @c Content-Length field is present.
 */
std::optional<std::size_t> parse_content_length(std::string_view headers);

/** @brief Serialise @p msg and prepend its @c Content-Length header. */
std::string frame_message(const json::object& msg);

/** @brief Read one framed JSONRPC message from @p stream.
 *
 * @p buf must outlive the loop calling this: bytes read past the end of one
 * frame stay there and belong to the next.  Returns the raw JSON text, or
 * an empty optional if the stream reaches EOF before a complete message is
 * received.  Throws protocol_error for a header block without a length;
 * the header has been consumed at that point so the caller may keep
 * reading.  A length above max_content_length throws oversized_frame_error
 * and leaves the stream out of sync.
 */
template <typename AsyncReadStream>
asio::awaitable<std::optional<std::string>> read_jsonrpc_message(
    AsyncReadStream& stream, asio::streambuf& buf) {
  try {
    auto header_end = co_await asio::async_read_until(
        stream, buf, "\r\n\r\n", asio::use_awaitable);

    std::string headers(header_end, '\0');
    std::istream(&buf).read(headers.data(), static_cast<std::streamsize>(header_end));

    auto content_length = parse_content_length(headers);
    if (!content_length)
      throw protocol_error{"Missing Content-Length header"};
    if (*content_length > max_content_length)
      throw oversized_frame_error{fmt::format(
          "Content-Length {} exceeds the {} byte limit", *content_length,
          max_content_length)};

    std::string content(*content_length, '\0');

    // First, consume any already-buffered data
    std::size_t buffered{std::min(buf.size(), *content_length)};
    if (buffered > 0)
      std::istream(&buf).read(content.data(), static_cast<std::streamsize>(buffered));

    // Then read remaining bytes
    if (buffered < *content_length) {
      co_await asio::async_read(
          stream,
          asio::buffer(content.data() + buffered, *content_length - buffered),
          asio::use_awaitable);
    }

    co_return content;

  } catch (const boost::system::system_error& e) {
    if (e.code() == asio::error::eof) {
      co_return std::nullopt;
    }
    throw;
  }
}

/** @brief Write one framed JSONRPC message to @p stream in one go. */
template <typename SyncWriteStream>
void write_jsonrpc_message(SyncWriteStream& stream, const json::object& msg) {
  auto frame = frame_message(msg);
  asio::write(stream, asio::buffer(frame));
}

/// Message construction

json::object make_request(
    std::int64_t id, std::string_view method, json::value params);

json::object make_notification(std::string_view method, json::value params);

json::object make_result(const json::value& id, json::value result);

json::object make_error(
    const json::value& id, int code, std::string_view message,
    std::optional<json::value> data = std::nullopt);

}  // namespace lspbridge::jsonrpc
