#pragma once

/**
 * @file client.hpp
 * @brief One language server session: spawn, handshake, use, tear down.
 *
 * States run starting -> ready -> shutting_down -> closed.  The public API
 * is blocking and may be used from any number of threads; the protocol
 * itself runs on a private io thread owned by the client.
 *
 * close() is safe to call concurrently and repeatedly.  Exactly one caller
 * performs the teardown: close open documents, @c shutdown, @c exit, wait
 * out the grace period, kill if still alive.  Everybody else blocks until
 * that is done and gets the same close_outcome.  Do not call close() from a
 * notification or request handler, those run on the io thread it joins.
 */

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "lspbridge/capabilities.hpp"
#include "lspbridge/diagnostics.hpp"
#include "lspbridge/documents.hpp"
#include "lspbridge/logger.hpp"
#include "lspbridge/protocol.hpp"
#include "lspbridge/rpc.hpp"
#include "lspbridge/transport.hpp"

namespace lspbridge {

namespace asio = boost::asio;
namespace json = boost::json;

struct client_options {
  std::string command;
  std::vector<std::string> args;
  // Where the server runs, and what it is told the workspace is.  Defaults
  // to the current directory.
  std::filesystem::path workspace_root;
  // How long close() lets the server exit on its own before killing it.
  std::chrono::milliseconds grace_period{2000};
  // Zero means wait forever.
  std::chrono::milliseconds initialize_timeout{30000};
  json::value initialization_options{nullptr};
  std::string client_name{"lspbridge"};
};

enum class lifecycle_state : std::uint8_t { starting, ready, shutting_down, closed };

std::string_view lifecycle_state_name(lifecycle_state s);

struct server_info {
  std::string name;
  std::string version;
};

struct close_outcome {
  // The server had to be killed after the grace period.
  bool forced{false};
  // Set when something went wrong on the way down.  Never fatal.
  std::optional<std::string> warning;
  std::optional<int> exit_code;
};

class client {
 public:
  // Spawns the server and starts reading from it.  Throws transport_error
  // if the server can't be started.  The handshake is initialize()'s job.
  client(client_options opts, logger& log);

  client(const client&) = delete;
  client(client&&) = delete;
  client& operator=(const client&) = delete;
  client& operator=(client&&) = delete;
  ~client();

  // initialize / initialized.  Throws rpc_error if the server refuses,
  // cancelled_error on timeout, protocol_error for a result without
  // capabilities, std::logic_error unless in the starting state.
  void initialize();

  close_outcome close();

  lifecycle_state state() const;
  // A snapshot; empty until initialize() has returned.
  capabilities server_capabilities() const;
  std::optional<server_info> server() const;
  const std::filesystem::path& workspace_root() const { return opts.workspace_root; }
  int pid();

  /// Raw protocol access

  json::value call(
      std::string_view method, json::value params, std::stop_token stop = {});
  json::value call(
      std::string_view method, json::value params,
      std::chrono::milliseconds timeout);
  void notify(std::string_view method, json::value params);
  void on_notification(std::string method, rpc_engine::notification_handler h);
  void on_request(std::string method, rpc_engine::request_handler h);

  /// Documents and diagnostics

  void open_file(const std::filesystem::path& path);
  // The URI of @p path, opening it if it hasn't been yet.
  std::string ensure_open(const std::filesystem::path& path);
  void close_file(const std::filesystem::path& path);
  int apply_text_edits(
      const std::filesystem::path& path, std::vector<line_edit> edits);

  std::vector<diagnostic> get_diagnostics(std::string_view uri) const;
  // Wait until at least one push for @p uri arrived, or @p timeout passed.
  // Returns whatever is stored at that point.
  std::vector<diagnostic> wait_for_diagnostics(
      std::string_view uri, std::chrono::milliseconds timeout) const;

  document_manager& documents() { return *docs; }
  logger& log() { return *lg; }

 private:
  enum class teardown_state : std::uint8_t { not_started, in_progress, done };

  void register_default_handlers();
  void run_io();
  close_outcome teardown();
  json::object initialize_params() const;

  logger* lg;
  client_options opts;

  asio::io_context ctx;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work;
  std::unique_ptr<transport> tp;
  std::unique_ptr<rpc_engine> rpc;
  std::unique_ptr<document_manager> docs;
  diagnostics_store diags;
  std::thread io_thread;

  mutable std::mutex state_mtx;
  std::condition_variable teardown_cv;
  lifecycle_state st{lifecycle_state::starting};
  teardown_state teardown_st{teardown_state::not_started};
  close_outcome outcome;
  capabilities caps;
  std::optional<server_info> info;
};

}  // namespace lspbridge
