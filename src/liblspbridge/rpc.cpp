#include "lspbridge/rpc.hpp"

#include <fmt/format.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>

#include "lspbridge/errors.hpp"
#include "lspbridge/jsonrpc.hpp"

namespace lspbridge {

rpc_engine::rpc_engine(transport& tp, asio::io_context& ctx, logger& log)
    : tp{&tp}, ctx{&ctx}, log{&log} {}

void rpc_engine::start(std::function<void()> on_disconnect) {
  this->on_disconnect = std::move(on_disconnect);
  asio::co_spawn(*ctx, read_loop(), asio::detached);
  asio::co_spawn(*ctx, tp->pump_stderr(), asio::detached);
}

/// Outgoing

rpc_engine::outstanding rpc_engine::start_call(
    std::string_view method, json::value params,
    std::optional<std::chrono::steady_clock::time_point> deadline) {
  auto id = ++next_id;
  auto entry = std::make_shared<pending_call>();
  entry->method = method;
  auto result = entry->promise.get_future();
  {
    std::scoped_lock lk{pending_mtx};
    if (!accepting) throw disconnected_error{closed_reason};
    pending.emplace(id, std::move(entry));
  }

  LOG_DEBUG(*log, "--> {} (id {})", method, id);
  try {
    tp->send(jsonrpc::make_request(id, method, std::move(params)), deadline);
  } catch (const disconnected_error& e) {
    post_cancel(id, e.what());
    throw;
  } catch (const cancelled_error& e) {
    post_cancel(id, e.what());
    throw;
  }
  return {id, std::move(result)};
}

json::value rpc_engine::await_response(
    outstanding call, std::stop_token stop,
    std::optional<std::chrono::steady_clock::time_point> deadline) {
  std::stop_callback on_stop{
    stop, [this, id = call.id] { post_cancel(id, "Request cancelled"); }};

  if (deadline &&
      call.result.wait_until(*deadline) == std::future_status::timeout)
    post_cancel(call.id, "Request timed out");

  return call.result.get();
}

json::value rpc_engine::call(
    std::string_view method, json::value params, std::stop_token stop) {
  return await_response(
      start_call(method, std::move(params), std::nullopt), std::move(stop),
      std::nullopt);
}

json::value rpc_engine::call(
    std::string_view method, json::value params,
    std::chrono::milliseconds timeout) {
  return call_until(
      method, std::move(params), std::chrono::steady_clock::now() + timeout);
}

json::value rpc_engine::call_until(
    std::string_view method, json::value params,
    std::chrono::steady_clock::time_point deadline) {
  return await_response(
      start_call(method, std::move(params), deadline), std::stop_token{},
      deadline);
}

void rpc_engine::notify(std::string_view method, json::value params) {
  LOG_DEBUG(*log, "--> {} (notification)", method);
  tp->send(jsonrpc::make_notification(method, std::move(params)));
}

void rpc_engine::notify_until(
    std::string_view method, json::value params,
    std::chrono::steady_clock::time_point deadline) {
  LOG_DEBUG(*log, "--> {} (notification)", method);
  tp->send(jsonrpc::make_notification(method, std::move(params)), deadline);
}

void rpc_engine::post_cancel(std::int64_t id, std::string reason) {
  asio::post(*ctx, [this, id, reason = std::move(reason)] { cancel(id, reason); });
}

void rpc_engine::cancel(std::int64_t id, const std::string& reason) {
  std::shared_ptr<pending_call> entry;
  {
    std::scoped_lock lk{pending_mtx};
    auto it = pending.find(id);
    if (it == pending.end()) return;  // already answered
    entry = std::move(it->second);
    pending.erase(it);
  }
  LOG_DEBUG(*log, "Cancelling {} (id {}): {}", entry->method, id, reason);
  entry->promise.set_exception(
      std::make_exception_ptr(cancelled_error{reason}));

  json::object params;
  params["id"] = id;
  tp->send_async(jsonrpc::make_notification("$/cancelRequest", std::move(params)));
}

void rpc_engine::fail_pending(const std::string& reason) {
  std::unordered_map<std::int64_t, std::shared_ptr<pending_call>> doomed;
  {
    std::scoped_lock lk{pending_mtx};
    accepting = false;
    if (closed_reason.empty()) closed_reason = reason;
    doomed.swap(pending);
  }
  for (auto& [id, entry] : doomed) {
    LOG_DEBUG(*log, "Failing {} (id {}): {}", entry->method, id, reason);
    entry->promise.set_exception(
        std::make_exception_ptr(disconnected_error{reason}));
  }
}

std::size_t rpc_engine::pending_count() {
  std::scoped_lock lk{pending_mtx};
  return pending.size();
}

void rpc_engine::on_notification(
    std::string method, notification_handler handler) {
  std::scoped_lock lk{handlers_mtx};
  notification_handlers[std::move(method)].push_back(std::move(handler));
}

void rpc_engine::on_request(std::string method, request_handler handler) {
  std::scoped_lock lk{handlers_mtx};
  request_handlers[std::move(method)] = std::move(handler);
}

/// Incoming

asio::awaitable<void> rpc_engine::read_loop() {
  std::string reason{"Language server closed the connection"};
  for (;;) {
    std::optional<std::string> frame;
    try {
      frame = co_await tp->receive();
    } catch (const oversized_frame_error& e) {
      reason = fmt::format("Language server stream unusable: {}", e.what());
      break;
    } catch (const protocol_error& e) {
      LOG_WARN(*log, "Dropping malformed frame: {}", e.what());
      continue;
    } catch (const boost::system::system_error& e) {
      reason = fmt::format("Language server connection lost: {}", e.code().message());
      break;
    } catch (const std::exception& e) {
      reason = fmt::format("Language server connection lost: {}", e.what());
      break;
    }
    if (!frame) break;

    LOG_TRACE(*log, "<-- {}", *frame);
    try {
      dispatch(*frame);
    } catch (const std::exception& e) {
      LOG_ERROR(*log, "Failed to dispatch frame: {}", e.what());
    }
  }

  LOG_INFO(*log, "{}", reason);
  tp->mark_disconnected();
  fail_pending(reason);
  if (on_disconnect) on_disconnect();
}

void rpc_engine::dispatch(std::string_view text) {
  json::value msg_val{};
  {
    boost::system::error_code jec{};
    msg_val = json::parse(text, jec);
    if (jec) {
      LOG_WARN(*log, "Dropping unparseable frame: {}", jec.message());
      return;
    }
  }

  auto* msg = msg_val.if_object();
  if (!msg) {
    LOG_WARN(*log, "Dropping frame that isn't an object: {}", text);
    return;
  }

  auto* id = msg->if_contains("id");
  auto* method = msg->if_contains("method");
  if (method && method->is_string()) {
    std::string name{method->as_string()};
    json::value params{nullptr};
    if (auto* p = msg->if_contains("params")) params = *p;
    if (id)
      handle_request(*id, name, params);
    else
      handle_notification(name, params);
    return;
  }

  if (id && (msg->contains("result") || msg->contains("error"))) {
    handle_response(*id, *msg);
    return;
  }

  LOG_WARN(*log, "Dropping frame of unknown shape: {}", text);
}

void rpc_engine::handle_response(const json::value& id, const json::object& msg) {
  boost::system::error_code ec;
  auto key = id.to_number<std::int64_t>(ec);
  if (ec) {
    LOG_WARN(*log, "Dropping response with foreign id {}", json::serialize(id));
    return;
  }

  std::shared_ptr<pending_call> entry;
  {
    std::scoped_lock lk{pending_mtx};
    auto it = pending.find(key);
    if (it != pending.end()) {
      entry = std::move(it->second);
      pending.erase(it);
    }
  }
  if (!entry) {
    LOG_WARN(*log, "Dropping response for unknown id {}", key);
    return;
  }

  if (auto* err = msg.if_contains("error"); err && !err->is_null()) {
    int code{jsonrpc_code::internal_error};
    std::string message{"Malformed error response"};
    std::optional<json::value> data;
    if (auto* obj = err->if_object()) {
      if (auto* c = obj->if_contains("code"); c && c->is_int64())
        code = static_cast<int>(c->as_int64());
      if (auto* m = obj->if_contains("message"); m && m->is_string())
        message = std::string{m->as_string()};
      if (auto* d = obj->if_contains("data")) data = *d;
    }
    LOG_DEBUG(*log, "<-- {} (id {}) error {}: {}", entry->method, key, code, message);
    entry->promise.set_exception(
        std::make_exception_ptr(rpc_error{code, message, std::move(data)}));
    return;
  }

  LOG_DEBUG(*log, "<-- {} (id {})", entry->method, key);
  auto* result = msg.if_contains("result");
  entry->promise.set_value(result ? *result : json::value{nullptr});
}

void rpc_engine::handle_notification(
    const std::string& method, const json::value& params) {
  std::vector<notification_handler> handlers;
  {
    std::scoped_lock lk{handlers_mtx};
    if (auto it = notification_handlers.find(method);
        it != notification_handlers.end())
      handlers = it->second;
  }
  if (handlers.empty()) {
    LOG_TRACE(*log, "No handler for notification {}", method);
    return;
  }
  for (auto& h : handlers) {
    try {
      h(params);
    } catch (const std::exception& e) {
      LOG_ERROR(*log, "Handler for {} failed: {}", method, e.what());
    }
  }
}

void rpc_engine::handle_request(
    const json::value& id, const std::string& method,
    const json::value& params) {
  request_handler handler;
  {
    std::scoped_lock lk{handlers_mtx};
    if (auto it = request_handlers.find(method); it != request_handlers.end())
      handler = it->second;
  }

  json::object reply;
  if (!handler) {
    LOG_DEBUG(*log, "Unhandled server request {}", method);
    reply = jsonrpc::make_error(
        id, jsonrpc_code::method_not_found, "Method not found",
        json::value(method));
  } else {
    try {
      reply = jsonrpc::make_result(id, handler(params));
    } catch (const rpc_error& e) {
      reply = jsonrpc::make_error(id, e.code, e.what(), e.data);
    } catch (const std::exception& e) {
      reply = jsonrpc::make_error(id, jsonrpc_code::internal_error, e.what());
    }
  }

  tp->send_async(reply);
}

}  // namespace lspbridge
