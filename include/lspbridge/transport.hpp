#pragma once

/**
 * @file transport.hpp
 * @brief The language server child process and its three pipes.
 *
 * Writes may come from any thread.  Each whole frame is handed to the io
 * thread, which queues it and writes the queue out in order with
 * async_write, so a server that stops reading its stdin blocks no lock.
 * Reads (stdout frames and stderr lines) are awaitables that only the
 * client's io thread runs.
 */

#define BOOST_PROCESS_USE_STD_FS 1

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/json.hpp>
#include <boost/process/v2/process.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lspbridge/logger.hpp"

namespace lspbridge {

namespace asio = boost::asio;
namespace json = boost::json;

class transport {
 public:
  // Spawns @p command (looked up in PATH unless it contains a '/') with
  // @p args in @p workdir.  Throws transport_error if that fails.
  transport(
      asio::io_context& ctx, const std::string& command,
      const std::vector<std::string>& args,
      const std::filesystem::path& workdir, logger& log);

  transport(const transport&) = delete;
  transport(transport&&) = delete;
  transport& operator=(const transport&) = delete;
  transport& operator=(transport&&) = delete;
  ~transport();

  // One framed message, atomically with respect to other sends.  Blocks
  // until the frame is written.  Throws disconnected_error once the peer is
  // known to be gone, and cancelled_error if @p deadline passes first (the
  // frame stays queued).  Not from the io thread.
  void send(
      const json::object& msg,
      std::optional<std::chrono::steady_clock::time_point> deadline = {});

  // Queue @p msg without waiting for it.  io thread only.
  void send_async(const json::object& msg);

  // Next frame from the child's stdout, empty at EOF.  io thread only.
  asio::awaitable<std::optional<std::string>> receive();

  // Log the child's stderr line by line until EOF.  io thread only.
  asio::awaitable<void> pump_stderr();

  // Further sends fail fast.  Called by the read loop when stdout closes.
  void mark_disconnected();
  bool connected();

  // Close our end of the child's stdin, and mark disconnected.  A write in
  // progress is aborted and every queued frame fails with
  // disconnected_error.
  void close_stdin();

  // Cancel and close stdout/stderr.  io thread only.
  void close_reads();

  bool running();
  // Poll until the child exits or @p deadline passes.  True if it exited.
  bool wait_for_exit(std::chrono::steady_clock::time_point deadline);
  // SIGKILL and reap.  Returns an error description if that failed.
  std::optional<std::string> kill();
  std::optional<int> exit_code();
  int pid();

 private:
  struct queued_frame {
    std::string frame;
    std::shared_ptr<std::promise<void>> done;  // null for send_async
  };

  /// io thread only
  void enqueue(std::string frame, std::shared_ptr<std::promise<void>> done);
  asio::awaitable<void> drain_writes();
  void fail_writes(const std::string& reason);
  void shut_writes();

  asio::io_context* ctx;
  logger* log;
  asio::writable_pipe child_in;
  asio::readable_pipe child_out;
  asio::readable_pipe child_err;
  asio::streambuf out_buf;
  std::optional<boost::process::v2::process> proc;

  std::deque<queued_frame> write_queue;
  bool writing{false};
  bool broken{false};

  // Orders send() against close_stdin()
  std::mutex post_mtx;
  std::atomic<bool> disconnected{false};
};

}  // namespace lspbridge
