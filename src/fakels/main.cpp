// SPDX-License-Identifier: MIT
//
// A scriptable stand-in for a language server, speaking the framed protocol
// on stdio.  The script is a JSON object, "${WORKSPACE}" replaced by the
// --workspace directory before parsing:
//
//   serverInfo, capabilities   answered to initialize
//   symbols                    workspace/symbol answers the ones whose name
//                              contains the query, case-insensitively
//   positional.METHOD          [{uri?, line?, character?, result}], first
//                              entry matching the request's document and
//                              position wins
//   responses.METHOD           result for any request of METHOD
//   errors.METHOD              {code, message} error for METHOD
//   diagnostics.URI            pushed after didOpen and didChange of URI
//   ignoreShutdown, hangOnExit misbehave on the way out
//
// plus a few test hooks: fakels/echo, fakels/sleep, fakels/notify,
// fakels/request, fakels/state, fakels/crash, and fakels/raw, which writes
// {bytes} verbatim and each of {frames} behind its own Content-Length
// before answering.

#include <fmt/format.h>
#include <unistd.h>

#include <CLI/CLI.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "lspbridge/errors.hpp"
#include "lspbridge/jsonrpc.hpp"
#include "lspbridge/logger.hpp"
#include "utils.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
namespace fs = std::filesystem;
namespace jsonrpc = lspbridge::jsonrpc;
namespace jsonrpc_code = lspbridge::jsonrpc_code;

namespace {

json::object load_script(const std::optional<fs::path>& file, const fs::path& workspace) {
  if (!file) return {};
  auto text = lspbridge::utils::slurp(*file);
  const std::string placeholder{"${WORKSPACE}"};
  auto root = workspace.lexically_normal().string();
  while (root.size() > 1 && root.back() == '/') root.pop_back();
  for (auto at = text.find(placeholder); at != std::string::npos;
       at = text.find(placeholder, at + root.size()))
    text.replace(at, placeholder.size(), root);
  auto v = json::parse(text);
  if (!v.is_object())
    lspbridge::utils::throwf("Script {} is not a JSON object", file->string());
  return v.as_object();
}

const json::object* member_object(const json::object& obj, std::string_view key) {
  if (auto* v = obj.if_contains(key)) return v->if_object();
  return nullptr;
}

bool flag(const json::object& obj, std::string_view key) {
  if (auto* v = obj.if_contains(key); v && v->is_bool()) return v->as_bool();
  return false;
}

std::string lowercase(std::string_view s) {
  std::string out{s};
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

class fake_server {
 public:
  fake_server(
      asio::any_io_executor ex, json::object script, bool hang_on_exit,
      lspbridge::logger& log)
      : ex{ex},
        in{ex, ::dup(STDIN_FILENO)},
        out{ex, ::dup(STDOUT_FILENO)},
        script{std::move(script)},
        hang_on_exit{hang_on_exit || flag(this->script, "hangOnExit")},
        log{&log} {}

  asio::awaitable<int> run() {
    LOG_INFO(*log, "fakels ready");
    while (!exiting) {
      std::optional<std::string> frame;
      try {
        frame = co_await jsonrpc::read_jsonrpc_message(in, buf);
      } catch (const lspbridge::protocol_error& e) {
        LOG_WARN(*log, "Bad frame: {}", e.what());
        continue;
      }
      if (!frame) break;
      handle_frame(*frame);
    }

    if (hang_on_exit) {
      LOG_INFO(*log, "Refusing to exit");
      asio::steady_timer forever{ex, std::chrono::hours{1}};
      co_await forever.async_wait(asio::use_awaitable);
    }
    LOG_INFO(*log, "fakels exiting");
    co_return shutdown_requested ? 0 : 1;
  }

 private:
  void send(const json::object& msg) { jsonrpc::write_jsonrpc_message(out, msg); }

  void notify(std::string_view method, json::value params) {
    send(jsonrpc::make_notification(method, std::move(params)));
  }

  void handle_frame(const std::string& text) {
    json::value parsed;
    try {
      parsed = json::parse(text);
    } catch (const std::exception& e) {
      send(jsonrpc::make_error(nullptr, jsonrpc_code::parse_error, e.what()));
      return;
    }
    auto* msg = parsed.if_object();
    if (!msg) {
      send(jsonrpc::make_error(nullptr, jsonrpc_code::invalid_request, "Not an object"));
      return;
    }

    auto* method = msg->if_contains("method");
    auto* id = msg->if_contains("id");
    if (!method) {
      if (id) handle_reply(*id, *msg);
      return;
    }
    std::string name{method->as_string()};
    received.push_back(name);
    json::value params{nullptr};
    if (auto* p = msg->if_contains("params")) params = *p;

    if (id)
      handle_request(*id, name, params);
    else
      handle_notification(name, params);
  }

  /// Notifications

  void handle_notification(const std::string& method, const json::value& params) {
    LOG_DEBUG(*log, "notification {}", method);
    if (method == "initialized") {
      initialized = true;
    } else if (method == "exit") {
      if (hang_on_exit)
        LOG_INFO(*log, "Ignoring exit");
      else
        exiting = true;
    } else if (method == "textDocument/didOpen") {
      const auto& doc = params.as_object().at("textDocument").as_object();
      std::string uri{doc.at("uri").as_string()};
      versions[uri] = doc.at("version").as_int64();
      open.insert(uri);
      publish(uri);
    } else if (method == "textDocument/didChange") {
      const auto& doc = params.as_object().at("textDocument").as_object();
      std::string uri{doc.at("uri").as_string()};
      versions[uri] = doc.at("version").as_int64();
      const auto& changes = params.as_object().at("contentChanges").as_array();
      if (!changes.empty())
        texts[uri] = std::string{changes.back().as_object().at("text").as_string()};
      publish(uri);
    } else if (method == "textDocument/didClose") {
      open.erase(std::string{
          params.as_object().at("textDocument").as_object().at("uri").as_string()});
    }
  }

  void publish(const std::string& uri) {
    auto* diags = member_object(script, "diagnostics");
    if (!diags) return;
    auto* list = diags->if_contains(uri);
    if (!list) return;
    json::object params;
    params["uri"] = uri;
    params["diagnostics"] = *list;
    notify("textDocument/publishDiagnostics", std::move(params));
  }

  /// Requests

  void handle_request(
      const json::value& id, const std::string& method, const json::value& params) {
    LOG_DEBUG(*log, "request {}", method);
    try {
      if (auto reply = builtin(id, method, params)) {
        if (!reply->empty()) send(*reply);
        return;
      }
      send(scripted(id, method, params));
    } catch (const std::exception& e) {
      send(jsonrpc::make_error(id, jsonrpc_code::internal_error, e.what()));
    }
  }

  // An empty object means "answered later, or never".
  std::optional<json::object> builtin(
      const json::value& id, const std::string& method, const json::value& params) {
    if (method == "initialize") {
      json::object result;
      if (auto* caps = member_object(script, "capabilities"))
        result["capabilities"] = *caps;
      else
        result["capabilities"] = json::object{};
      json::object info{{"name", "fakels"}, {"version", "0.1"}};
      if (auto* si = member_object(script, "serverInfo")) info = *si;
      result["serverInfo"] = std::move(info);
      initialize_params = params;
      return jsonrpc::make_result(id, std::move(result));
    }
    if (method == "shutdown") {
      shutdown_requested = true;
      if (flag(script, "ignoreShutdown")) return json::object{};
      return jsonrpc::make_result(id, nullptr);
    }
    if (method == "fakels/echo") return jsonrpc::make_result(id, params);
    if (method == "fakels/sleep") {
      auto ms = params.as_object().at("ms").to_number<std::int64_t>();
      asio::co_spawn(ex, delayed_reply(id, ms), asio::detached);
      return json::object{};
    }
    if (method == "fakels/notify") {
      notify(params.as_object().at("method").as_string(), params.as_object().at("params"));
      return jsonrpc::make_result(id, nullptr);
    }
    if (method == "fakels/request") {
      auto srv_id = fmt::format("fakels-{}", ++next_request);
      forwarded.emplace(srv_id, id);
      json::object req;
      req["jsonrpc"] = "2.0";
      req["id"] = srv_id;
      req["method"] = params.as_object().at("method");
      if (auto* p = params.as_object().if_contains("params")) req["params"] = *p;
      send(req);
      return json::object{};
    }
    if (method == "fakels/state") return jsonrpc::make_result(id, state());
    if (method == "fakels/raw") {
      std::string bytes;
      const auto& p = params.as_object();
      if (auto* b = p.if_contains("bytes")) bytes = std::string{b->as_string()};
      if (auto* frames = p.if_contains("frames")) {
        for (const auto& f : frames->as_array())
          bytes += fmt::format(
              "Content-Length: {}\r\n\r\n{}", f.as_string().size(),
              std::string_view{f.as_string()});
      }
      asio::write(out, asio::buffer(bytes));
      return jsonrpc::make_result(id, nullptr);
    }
    if (method == "fakels/crash") {
      LOG_INFO(*log, "Crashing on request");
      std::_Exit(3);
    }
    return std::nullopt;
  }

  json::object scripted(
      const json::value& id, const std::string& method, const json::value& params) {
    if (auto* errors = member_object(script, "errors")) {
      if (auto* e = errors->if_contains(method)) {
        const auto& err = e->as_object();
        return jsonrpc::make_error(
            id, static_cast<int>(err.at("code").to_number<std::int64_t>()),
            err.at("message").as_string());
      }
    }
    if (auto result = positional(method, params))
      return jsonrpc::make_result(id, *result);
    if (auto* responses = member_object(script, "responses")) {
      if (auto* r = responses->if_contains(method))
        return jsonrpc::make_result(id, *r);
    }
    if (method == "workspace/symbol") return jsonrpc::make_result(id, symbols(params));
    if (method == "textDocument/hover") {
      // Echo the position as received, so callers can check the translation
      const auto& pos = params.as_object().at("position").as_object();
      json::object contents;
      contents["kind"] = "plaintext";
      contents["value"] = fmt::format(
          "{}:{}", pos.at("line").to_number<std::int64_t>(),
          pos.at("character").to_number<std::int64_t>());
      json::object result;
      result["contents"] = std::move(contents);
      return jsonrpc::make_result(id, std::move(result));
    }
    return jsonrpc::make_error(
        id, jsonrpc_code::method_not_found, "Method not found", json::value(method));
  }

  std::optional<json::value> positional(
      const std::string& method, const json::value& params) {
    auto* table = member_object(script, "positional");
    if (!table) return std::nullopt;
    auto* entries = table->if_contains(method);
    if (!entries || !entries->is_array()) return std::nullopt;

    const auto* p = params.if_object();
    const json::value* uri{nullptr};
    const json::object* pos{nullptr};
    if (p) {
      if (auto* td = p->if_contains("textDocument"); td && td->is_object())
        uri = td->as_object().if_contains("uri");
      if (auto* item = p->if_contains("item"); item && item->is_object())
        uri = item->as_object().if_contains("uri");
      if (auto* ps = p->if_contains("position")) pos = ps->if_object();
    }

    auto matches = [&](const json::object& entry, std::string_view key,
                       const json::value* actual) {
      auto* wanted = entry.if_contains(key);
      return !wanted || (actual && *wanted == *actual);
    };
    for (const auto& e : entries->as_array()) {
      const auto& entry = e.as_object();
      if (!matches(entry, "uri", uri)) continue;
      if (!matches(entry, "line", pos ? pos->if_contains("line") : nullptr)) continue;
      if (!matches(entry, "character", pos ? pos->if_contains("character") : nullptr))
        continue;
      if (auto* name = entry.if_contains("item"); name && p) {
        auto* item = p->if_contains("item");
        if (!item || item->as_object().at("name") != *name) continue;
      }
      return entry.at("result");
    }
    return std::nullopt;
  }

  json::array symbols(const json::value& params) {
    json::array out;
    auto* all = script.if_contains("symbols");
    if (!all) return out;
    auto query = lowercase(params.as_object().at("query").as_string());
    for (const auto& s : all->as_array()) {
      auto name = lowercase(s.as_object().at("name").as_string());
      if (name.find(query) != std::string::npos) out.push_back(s);
    }
    return out;
  }

  json::object state() {
    json::object st;
    st["initialized"] = initialized;
    st["shutdown"] = shutdown_requested;
    json::object v;
    for (const auto& [uri, version] : versions) v[uri] = version;
    st["versions"] = std::move(v);
    st["open"] = json::array(open.begin(), open.end());
    json::object t;
    for (const auto& [uri, text] : texts) t[uri] = text;
    st["texts"] = std::move(t);
    st["received"] = json::array(received.begin(), received.end());
    st["initializeParams"] = initialize_params;
    return st;
  }

  asio::awaitable<void> delayed_reply(json::value id, std::int64_t ms) {
    asio::steady_timer t{ex, std::chrono::milliseconds{ms}};
    co_await t.async_wait(asio::use_awaitable);
    json::object result;
    result["slept"] = ms;
    send(jsonrpc::make_result(id, std::move(result)));
  }

  // The client answered one of our fakels/request requests; hand its reply
  // back as the result of the original request.
  void handle_reply(const json::value& id, const json::object& msg) {
    if (!id.is_string()) return;
    auto it = forwarded.find(std::string{id.as_string()});
    if (it == forwarded.end()) return;
    json::object reply;
    if (auto* r = msg.if_contains("result")) reply["result"] = *r;
    if (auto* e = msg.if_contains("error")) reply["error"] = *e;
    send(jsonrpc::make_result(it->second, std::move(reply)));
    forwarded.erase(it);
  }

  asio::any_io_executor ex;
  asio::posix::stream_descriptor in;
  asio::posix::stream_descriptor out;
  asio::streambuf buf;
  json::object script;
  bool hang_on_exit;
  lspbridge::logger* log;

  bool initialized{false};
  bool shutdown_requested{false};
  bool exiting{false};
  json::value initialize_params{nullptr};
  std::map<std::string, std::int64_t> versions;
  std::map<std::string, std::string> texts;
  std::set<std::string> open;
  std::vector<std::string> received;
  int next_request{0};
  std::unordered_map<std::string, json::value> forwarded;
};

}  // namespace

int main(int argc, char* argv[]) {
  std::optional<fs::path> script_file;
  fs::path workspace = fs::current_path();
  bool hang_on_exit{false};
  int loglevel{2};

  CLI::App app{"Scriptable fake language server"};
  app.add_option("--script", script_file, "JSON script")->check(CLI::ExistingFile);
  app.add_option("--workspace", workspace, "Replaces ${WORKSPACE} in the script")
    ->capture_default_str();
  app.add_flag("--hang-on-exit", hang_on_exit, "Ignore exit and stdin EOF");
  app.add_option("-d,--debug", loglevel, "Debug log level (3=INFO)")
    ->capture_default_str();
  CLI11_PARSE(app, argc, argv);

  // stdout is the protocol channel, log to stderr
  lspbridge::logger log{
    static_cast<lspbridge::logging::level>(std::clamp(loglevel, 0, 5))};

  try {
    asio::io_context ctx;
    fake_server server{
      ctx.get_executor(), load_script(script_file, workspace), hang_on_exit, log};
    int code{0};
    asio::co_spawn(ctx, server.run(), [&](std::exception_ptr ep, int rc) {
      if (ep) std::rethrow_exception(ep);
      code = rc;
      ctx.stop();
    });
    ctx.run();
    return code;
  } catch (const std::exception& e) {
    LOG_FATAL(log, "{}", e.what());
    return 2;
  }
}
