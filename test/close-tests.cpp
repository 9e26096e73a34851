#include <doctest/doctest.h>
#include <signal.h>

#include <chrono>
#include <fstream>
#include <future>
#include <thread>
#include <vector>

#include "helpers.hpp"
#include "lspbridge/client.hpp"
#include "lspbridge/errors.hpp"

using namespace lspbridge;
using namespace std::chrono_literals;
using std::chrono::steady_clock;
using lspbridge::test::fakels_options;
using lspbridge::test::scratch_workspace;
using lspbridge::test::test_logger;

namespace {

client_options plain(const scratch_workspace& ws, std::string command,
                     std::vector<std::string> args) {
  client_options opts{};
  opts.command = std::move(command);
  opts.args = std::move(args);
  opts.workspace_root = ws.root;
  return opts;
}

template <typename F>
std::chrono::milliseconds timed(F&& f) {
  auto start = steady_clock::now();
  f();
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      steady_clock::now() - start);
}

}  // namespace

TEST_CASE("close-after-server-exits-on-its-own") {
  scratch_workspace ws;
  client c{plain(ws, "echo", {"test"}), test_logger()};
  close_outcome res;
  auto took = timed([&] { res = c.close(); });
  CHECK(took < 1000ms);
  CHECK_FALSE(res.forced);
  CHECK(c.state() == lifecycle_state::closed);
}

TEST_CASE("close-while-server-still-finishing") {
  scratch_workspace ws;
  client c{plain(ws, "sh", {"-c", "sleep 0.1"}), test_logger()};
  close_outcome res;
  auto took = timed([&] { res = c.close(); });
  CHECK(took < 1500ms);
  CHECK_FALSE(res.forced);
}

TEST_CASE("close-kills-after-grace-period") {
  scratch_workspace ws;
  client c{plain(ws, "sleep", {"10"}), test_logger()};
  close_outcome res;
  auto took = timed([&] { res = c.close(); });
  CHECK(took >= 1800ms);
  CHECK(took < 3500ms);
  CHECK(res.forced);
  CHECK(res.warning);
  CHECK(c.state() == lifecycle_state::closed);
}

TEST_CASE("close-with-a-write-stuck-on-a-server-not-reading") {
  scratch_workspace ws;
  auto big = ws.file("big.txt");
  {
    std::ofstream out{big};
    for (int i = 0; i < 4096; ++i) out << std::string(49, 'x') << '\n';
  }
  client c{plain(ws, "sleep", {"10"}), test_logger()};

  // Far more than a pipe holds, so the write can't finish
  auto opener = std::async(std::launch::async, [&] { c.open_file(big); });
  REQUIRE(opener.wait_for(200ms) == std::future_status::timeout);

  close_outcome res;
  auto took = timed([&] { res = c.close(); });
  CHECK(took < 3500ms);
  CHECK(res.forced);
  CHECK(res.warning);
  REQUIRE(opener.wait_for(1s) == std::future_status::ready);
  CHECK_THROWS_AS(opener.get(), disconnected_error);
  CHECK(c.state() == lifecycle_state::closed);
}

TEST_CASE("custom-grace-period") {
  scratch_workspace ws;
  auto opts = plain(ws, "sleep", {"10"});
  opts.grace_period = 300ms;
  client c{opts, test_logger()};
  close_outcome res;
  auto took = timed([&] { res = c.close(); });
  CHECK(took < 1500ms);
  CHECK(res.forced);
}

TEST_CASE("concurrent-close") {
  scratch_workspace ws;
  client c{plain(ws, "sleep", {"10"}), test_logger()};

  std::vector<std::future<close_outcome>> closers;
  auto took = timed([&] {
    for (int i = 0; i < 8; ++i)
      closers.push_back(std::async(std::launch::async, [&c] { return c.close(); }));
    for (auto& f : closers) f.wait();
  });

  // One teardown, so one grace period, not eight
  CHECK(took < 3500ms);
  std::vector<close_outcome> outcomes;
  for (auto& f : closers) outcomes.push_back(f.get());
  for (const auto& o : outcomes) {
    CHECK(o.forced);
    CHECK(o.warning == outcomes.front().warning);
    CHECK(o.exit_code == outcomes.front().exit_code);
  }
}

TEST_CASE("close-is-idempotent") {
  scratch_workspace ws;
  client c{fakels_options(ws, "basic.json"), test_logger()};
  c.initialize();
  auto first = c.close();
  auto second = timed([&] { CHECK(c.close().exit_code == first.exit_code); });
  CHECK(second < 100ms);
  CHECK_THROWS_AS(c.call("fakels/echo", nullptr), disconnected_error);
}

TEST_CASE("graceful-shutdown-sequence") {
  scratch_workspace ws;
  client c{fakels_options(ws, "basic.json"), test_logger()};
  c.initialize();
  c.open_file(ws.file("main.cpp"));
  c.open_file(ws.file("widget.hpp"));

  auto res = c.close();
  CHECK_FALSE(res.forced);
  CHECK_FALSE(res.warning);
  REQUIRE(res.exit_code);
  CHECK(*res.exit_code == 0);
  CHECK(c.documents().open_documents().empty());
}

TEST_CASE("server-ignoring-shutdown-is-killed") {
  scratch_workspace ws;
  client c{fakels_options(ws, "stubborn.json"), test_logger()};
  c.initialize();
  close_outcome res;
  auto took = timed([&] { res = c.close(); });
  CHECK(res.forced);
  CHECK(res.warning);
  CHECK(took < 3500ms);
}

TEST_CASE("destructor-closes") {
  scratch_workspace ws;
  int pid{};
  {
    client c{fakels_options(ws, "basic.json"), test_logger()};
    c.initialize();
    pid = c.pid();
  }
  CHECK(pid > 0);
  // Reaped, so no such process any more
  std::this_thread::sleep_for(50ms);
  CHECK(::kill(pid, 0) == -1);
}
