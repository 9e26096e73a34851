#pragma once

/**
 * @file rpc.hpp
 * @brief Request/response multiplexing over a transport.
 *
 * Any number of threads may have calls outstanding.  Each call registers a
 * pending entry keyed by a fresh id and blocks on its own future; the single
 * read loop completes entries as responses arrive, in whatever order the
 * server sends them.  Removal from the pending table happens on the io
 * thread only: responses, cancellations (posted there) and the final sweep
 * when the read loop ends.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lspbridge/logger.hpp"
#include "lspbridge/transport.hpp"

namespace lspbridge {

namespace asio = boost::asio;
namespace json = boost::json;

class rpc_engine {
 public:
  using notification_handler = std::function<void(const json::value& params)>;
  // Answers a server-initiated request.  Throw rpc_error to reply with an
  // error object.
  using request_handler = std::function<json::value(const json::value& params)>;

  rpc_engine(transport& tp, asio::io_context& ctx, logger& log);

  rpc_engine(const rpc_engine&) = delete;
  rpc_engine& operator=(const rpc_engine&) = delete;

  // Spawn the read loop and the stderr pump on the io context.
  // @p on_disconnect runs on the io thread once the read loop has ended and
  // every pending call has been failed.
  void start(std::function<void()> on_disconnect);

  // Send a request and block until its response.  Throws rpc_error for an
  // error response, cancelled_error if @p stop fires first, and
  // disconnected_error if the connection goes away.
  json::value call(
      std::string_view method, json::value params, std::stop_token stop = {});

  // Same, giving up with cancelled_error after @p timeout.
  json::value call(
      std::string_view method, json::value params,
      std::chrono::milliseconds timeout);

  // Same, giving up at @p deadline.
  json::value call_until(
      std::string_view method, json::value params,
      std::chrono::steady_clock::time_point deadline);

  void notify(std::string_view method, json::value params);

  // Same, giving up with cancelled_error if the frame can't be written by
  // @p deadline.
  void notify_until(
      std::string_view method, json::value params,
      std::chrono::steady_clock::time_point deadline);

  // Handlers run on the read loop, in arrival order, and must return fast.
  void on_notification(std::string method, notification_handler handler);
  void on_request(std::string method, request_handler handler);

  // Complete every pending call with disconnected_error and refuse new
  // ones.  Idempotent.  io thread, or any thread once the io thread is gone.
  void fail_pending(const std::string& reason);

  std::size_t pending_count();

 private:
  struct pending_call {
    std::string method;
    std::promise<json::value> promise;
  };

  struct outstanding {
    std::int64_t id;
    std::future<json::value> result;
  };

  outstanding start_call(
      std::string_view method, json::value params,
      std::optional<std::chrono::steady_clock::time_point> deadline);
  json::value await_response(
      outstanding call, std::stop_token stop,
      std::optional<std::chrono::steady_clock::time_point> deadline);
  void post_cancel(std::int64_t id, std::string reason);
  void cancel(std::int64_t id, const std::string& reason);

  asio::awaitable<void> read_loop();
  void dispatch(std::string_view text);
  void handle_response(const json::value& id, const json::object& msg);
  void handle_notification(const std::string& method, const json::value& params);
  void handle_request(
      const json::value& id, const std::string& method,
      const json::value& params);

  transport* tp;
  asio::io_context* ctx;
  logger* log;
  std::function<void()> on_disconnect;

  std::atomic<std::int64_t> next_id{0};

  std::mutex pending_mtx;
  std::unordered_map<std::int64_t, std::shared_ptr<pending_call>> pending;
  bool accepting{true};
  std::string closed_reason;

  std::mutex handlers_mtx;
  std::unordered_map<std::string, std::vector<notification_handler>>
      notification_handlers;
  std::unordered_map<std::string, request_handler> request_handlers;
};

}  // namespace lspbridge
