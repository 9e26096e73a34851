#pragma once

#include <boost/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace lspbridge {

namespace jsonrpc_code {
// clang-format off
inline constexpr int parse_error{-32700};
inline constexpr int invalid_request{-32600};
inline constexpr int method_not_found{-32601};
inline constexpr int invalid_params{-32602};
inline constexpr int internal_error{-32603};
inline constexpr int request_cancelled{-32800};
// clang-format on
}  // namespace jsonrpc_code

// The child could not be spawned.  Fatal to the client instance.
struct transport_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The peer is gone: raised by writes after the stream closed and by every
// call still pending when the read loop terminated.
struct disconnected_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A malformed frame.  The read loop logs these and keeps going.
struct protocol_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A frame whose declared length is past the limit.  Its payload can't be
// skipped, so this ends the connection.
struct oversized_frame_error : protocol_error {
  using protocol_error::protocol_error;
};

// The server answered a request with an error object.
struct rpc_error : std::runtime_error {
  rpc_error(
      int code, const std::string& message,
      std::optional<boost::json::value> data = std::nullopt)
      : std::runtime_error{message}, code{code}, data{std::move(data)} {}
  int code;
  std::optional<boost::json::value> data;
};

// The caller gave up on a request, via stop token or timeout.
struct cancelled_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Misuse of the document table: unreadable file, or a request against a
// document that is not open.
struct document_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace lspbridge
