#include "lspbridge/transport.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/system_error.hpp>
#include <csignal>
#include <istream>
#include <thread>

#include "lspbridge/errors.hpp"
#include "lspbridge/jsonrpc.hpp"
#include "utils.hpp"

namespace lspbridge {

namespace fs = std::filesystem;
namespace p2 = boost::process::v2;
namespace sys = boost::system;

namespace {

// A child that exits while we're writing to it must not take us down with
// SIGPIPE; the write reports EPIPE instead.
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

fs::path resolve_executable(const std::string& command) {
  if (command.find('/') != std::string::npos) return command;
  auto exe = p2::environment::find_executable(command);
  if (exe.empty())
    utils::throwf<transport_error>("Can't find '{}' in PATH", command);
  return exe;
}

}  // namespace

transport::transport(
    asio::io_context& ctx, const std::string& command,
    const std::vector<std::string>& args, const fs::path& workdir,
    logger& log)
    : ctx{&ctx}, log{&log}, child_in{ctx}, child_out{ctx}, child_err{ctx} {
  ignore_sigpipe();
  auto exe = resolve_executable(command);

  LOG_INFO(
      log, "Starting language server: {}",
      fmt::format("{} {}", exe, fmt::join(args, " ")));
  LOG_DEBUG(log, "Workdir {}", workdir.string());

  try {
    proc.emplace(
        ctx, exe, args,
        p2::process_stdio{.in = child_in, .out = child_out, .err = child_err},
        p2::process_start_dir{workdir});
  } catch (const sys::system_error& e) {
    utils::throwf<transport_error>(
        "Failed to start '{}': {}", command, e.what());
  }
  LOG_DEBUG(log, "Language server pid {}", proc->id());
}

transport::~transport() {
  if (proc && running()) {
    if (auto err = kill()) LOG_WARN(*log, "{}", *err);
  }
}

void transport::send(
    const json::object& msg,
    std::optional<std::chrono::steady_clock::time_point> deadline) {
  auto done = std::make_shared<std::promise<void>>();
  auto written = done->get_future();
  {
    std::scoped_lock lk{post_mtx};
    if (disconnected) throw disconnected_error{"Language server disconnected"};
    asio::post(
        *ctx, [this, frame = jsonrpc::frame_message(msg), done]() mutable {
          enqueue(std::move(frame), std::move(done));
        });
  }
  if (deadline &&
      written.wait_until(*deadline) == std::future_status::timeout)
    throw cancelled_error{"Language server is not reading its input"};
  written.get();
}

void transport::send_async(const json::object& msg) {
  enqueue(jsonrpc::frame_message(msg), nullptr);
}

void transport::enqueue(
    std::string frame, std::shared_ptr<std::promise<void>> done) {
  if (broken) {
    if (done)
      done->set_exception(std::make_exception_ptr(
          disconnected_error{"Language server disconnected"}));
    else
      LOG_DEBUG(*log, "Dropping frame for a disconnected server");
    return;
  }
  write_queue.push_back({std::move(frame), std::move(done)});
  if (!writing) {
    writing = true;
    asio::co_spawn(*ctx, drain_writes(), asio::detached);
  }
}

asio::awaitable<void> transport::drain_writes() {
  while (!write_queue.empty()) {
    auto& next = write_queue.front();
    try {
      co_await asio::async_write(
          child_in, asio::buffer(next.frame), asio::use_awaitable);
    } catch (const sys::system_error& e) {
      fail_writes(
          fmt::format("Language server disconnected: {}", e.code().message()));
      break;
    }
    if (next.done) next.done->set_value();
    write_queue.pop_front();
  }
  writing = false;
}

void transport::fail_writes(const std::string& reason) {
  broken = true;
  disconnected = true;
  for (auto& w : write_queue)
    if (w.done)
      w.done->set_exception(
          std::make_exception_ptr(disconnected_error{reason}));
  if (!write_queue.empty())
    LOG_DEBUG(*log, "{} unwritten frame(s): {}", write_queue.size(), reason);
  write_queue.clear();
}

void transport::shut_writes() {
  broken = true;
  sys::error_code ec;
  // Aborts a write in progress; drain_writes then fails the queue
  child_in.close(ec);
  if (ec) LOG_DEBUG(*log, "Closing server stdin: {}", ec.message());
  if (!writing) fail_writes("Language server stdin closed");
}

asio::awaitable<std::optional<std::string>> transport::receive() {
  return jsonrpc::read_jsonrpc_message(child_out, out_buf);
}

asio::awaitable<void> transport::pump_stderr() {
  asio::streambuf buf;
  try {
    for (;;) {
      auto n = co_await asio::async_read_until(
          child_err, buf, '\n', asio::use_awaitable);
      std::string line(n, '\0');
      std::istream(&buf).read(line.data(), static_cast<std::streamsize>(n));
      while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.pop_back();
      LOG_DEBUG(*log, "<server stderr> {}", line);
    }
  } catch (const sys::system_error& e) {
    if (buf.size() > 0) {
      std::string rest(buf.size(), '\0');
      std::istream(&buf).read(rest.data(), static_cast<std::streamsize>(rest.size()));
      LOG_DEBUG(*log, "<server stderr> {}", rest);
    }
    if (e.code() != asio::error::eof &&
        e.code() != asio::error::operation_aborted)
      LOG_DEBUG(*log, "stderr pump stopped: {}", e.code().message());
  }
}

void transport::mark_disconnected() {
  std::scoped_lock lk{post_mtx};
  disconnected = true;
}

bool transport::connected() { return !disconnected; }

void transport::close_stdin() {
  std::scoped_lock lk{post_mtx};
  disconnected = true;
  asio::post(*ctx, [this] { shut_writes(); });
}

void transport::close_reads() {
  sys::error_code ec;
  child_out.close(ec);
  child_err.close(ec);
}

bool transport::running() {
  sys::error_code ec;
  bool alive = proc->running(ec);
  // ECHILD and friends: nothing left to wait for
  return alive && !ec;
}

bool transport::wait_for_exit(std::chrono::steady_clock::time_point deadline) {
  using namespace std::chrono_literals;
  while (running()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(10ms);
  }
  return true;
}

std::optional<std::string> transport::kill() {
  sys::error_code ec;
  proc->terminate(ec);
  if (ec) return fmt::format("Failed to kill language server: {}", ec.message());
  proc->wait(ec);
  if (ec && ec != sys::errc::no_child_process)
    return fmt::format("Failed to reap language server: {}", ec.message());
  return std::nullopt;
}

std::optional<int> transport::exit_code() {
  if (running()) return std::nullopt;
  return proc->exit_code();
}

int transport::pid() { return proc->id(); }

}  // namespace lspbridge
