#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect_pipe.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/asio/write.hpp>
#include <boost/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "lspbridge/errors.hpp"
#include "lspbridge/jsonrpc.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
namespace jsonrpc = lspbridge::jsonrpc;

namespace {

// Push @p bytes through a pipe, close it and collect whatever frames come
// out the other end.  Malformed frames show up as "<protocol_error>"; an
// oversized one as "<oversized>", and ends the reading.
std::vector<std::optional<std::string>> read_all(const std::string& bytes) {
  asio::io_context ctx;
  asio::readable_pipe r{ctx};
  asio::writable_pipe w{ctx};
  asio::connect_pipe(r, w);
  asio::write(w, asio::buffer(bytes));
  w.close();

  auto reader = [&]() -> asio::awaitable<std::vector<std::optional<std::string>>> {
    asio::streambuf buf;
    std::vector<std::optional<std::string>> frames;
    for (;;) {
      try {
        auto f = co_await jsonrpc::read_jsonrpc_message(r, buf);
        frames.push_back(f);
        if (!f) break;
      } catch (const lspbridge::oversized_frame_error&) {
        frames.emplace_back("<oversized>");
        break;
      } catch (const lspbridge::protocol_error&) {
        frames.emplace_back("<protocol_error>");
      }
    }
    co_return frames;
  };
  auto fut = asio::co_spawn(ctx, reader(), asio::use_future);
  ctx.run();
  return fut.get();
}

}  // namespace

TEST_CASE("content-length-parsing") {
  CHECK(jsonrpc::parse_content_length("Content-Length: 42\r\n\r\n") == 42);
  CHECK(
      jsonrpc::parse_content_length(
          "Content-Type: application/vscode-jsonrpc; charset=utf-8\r\n"
          "content-length:7\r\n\r\n") == 7);
  CHECK_FALSE(jsonrpc::parse_content_length("Content-Type: x\r\n\r\n"));
}

TEST_CASE("frame-message") {
  json::object msg;
  msg["jsonrpc"] = "2.0";
  msg["method"] = "exit";
  auto frame = jsonrpc::frame_message(msg);
  auto body = json::serialize(msg);
  CHECK(frame == "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
}

TEST_CASE("back-to-back-frames") {
  // Both frames arrive in one read; the second must not be lost
  auto bytes = std::string{"Content-Length: 2\r\n\r\n{}"} +
               "Content-Length: 7\r\n\r\n[1,2,3]";
  auto frames = read_all(bytes);
  REQUIRE(frames.size() == 3);
  CHECK(frames[0] == "{}");
  CHECK(frames[1] == "[1,2,3]");
  CHECK_FALSE(frames[2]);
}

TEST_CASE("missing-length-is-recoverable") {
  auto bytes = std::string{"X-Nonsense: 1\r\n\r\n"} + "Content-Length: 2\r\n\r\n{}";
  auto frames = read_all(bytes);
  REQUIRE(frames.size() == 3);
  CHECK(frames[0] == "<protocol_error>");
  CHECK(frames[1] == "{}");
  CHECK_FALSE(frames[2]);
}

TEST_CASE("oversized-length-is-refused") {
  auto frames = read_all("Content-Length: 99999999999999\r\n\r\n{}");
  REQUIRE(frames.size() == 1);
  CHECK(frames[0] == "<oversized>");

  auto limit = std::to_string(jsonrpc::max_content_length + 1);
  frames = read_all("Content-Length: " + limit + "\r\n\r\n{}");
  REQUIRE(frames.size() == 1);
  CHECK(frames[0] == "<oversized>");
}

TEST_CASE("eof-mid-frame") {
  auto frames = read_all("Content-Length: 10\r\n\r\n{\"a\"");
  REQUIRE(frames.size() == 1);
  CHECK_FALSE(frames[0]);
}

TEST_CASE("message-builders") {
  auto req = jsonrpc::make_request(3, "shutdown", nullptr);
  CHECK(req.at("jsonrpc") == "2.0");
  CHECK(req.at("id") == 3);
  CHECK(req.at("method") == "shutdown");
  CHECK_FALSE(req.contains("params"));

  auto note = jsonrpc::make_notification("initialized", json::object{});
  CHECK_FALSE(note.contains("id"));
  CHECK(note.at("params").is_object());

  auto err = jsonrpc::make_error(
      "srv-1", lspbridge::jsonrpc_code::method_not_found, "Method not found");
  CHECK(err.at("id") == "srv-1");
  CHECK(err.at("error").as_object().at("code") == -32601);
  CHECK_FALSE(err.at("error").as_object().contains("data"));
}
