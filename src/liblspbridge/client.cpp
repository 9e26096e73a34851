#include "lspbridge/client.hpp"

#include <unistd.h>

#include <fmt/format.h>

#include <boost/asio/post.hpp>
#include <stdexcept>

#include "lspbridge/errors.hpp"
#include "lspbridge/uri.hpp"
#include "utils.hpp"

namespace lspbridge {

namespace fs = std::filesystem;
using std::chrono::steady_clock;

std::string_view lifecycle_state_name(lifecycle_state s) {
  // clang-format off
  switch (s) {
  case lifecycle_state::starting:      return "starting";
  case lifecycle_state::ready:         return "ready";
  case lifecycle_state::shutting_down: return "shutting_down";
  case lifecycle_state::closed:        return "closed";
  }
  // clang-format on
  return "unknown";
}

namespace {

json::object client_capabilities() {
  json::object text_document{
    {"synchronization", {{"dynamicRegistration", false}, {"didSave", false}}},
    {"definition", {{"linkSupport", true}}},
    {"references", json::object{}},
    {"hover", {{"contentFormat", {"markdown", "plaintext"}}}},
    {"documentSymbol", {{"hierarchicalDocumentSymbolSupport", true}}},
    {"callHierarchy", json::object{}},
    {"codeAction",
     {{"codeActionLiteralSupport",
       {{"codeActionKind",
         {{"valueSet",
           {"quickfix", "refactor", "refactor.extract", "refactor.inline",
            "refactor.rewrite", "source", "source.organizeImports"}}}}}}}},
    {"publishDiagnostics",
     {{"relatedInformation", true}, {"versionSupport", true}}},
  };
  json::object workspace{
    {"configuration", true},
    {"workspaceFolders", true},
    {"symbol", {{"dynamicRegistration", false}}},
  };
  json::object window{{"workDoneProgress", true}};

  json::object caps;
  caps["textDocument"] = std::move(text_document);
  caps["workspace"] = std::move(workspace);
  caps["window"] = std::move(window);
  return caps;
}

// window/logMessage and window/showMessage share the MessageType scale
logging::level message_level(const json::value& params) {
  if (auto* obj = params.if_object()) {
    if (auto* t = obj->if_contains("type"); t && t->is_int64()) {
      switch (t->as_int64()) {
        case 1: return logging::level::error;
        case 2: return logging::level::warning;
        case 3: return logging::level::info;
        default: return logging::level::debug;
      }
    }
  }
  return logging::level::debug;
}

std::string message_text(const json::value& params) {
  if (auto* obj = params.if_object())
    if (auto* m = obj->if_contains("message"); m && m->is_string())
      return std::string{m->as_string()};
  return json::serialize(params);
}

}  // namespace

client::client(client_options o, logger& log) : lg{&log}, opts{std::move(o)} {
  if (opts.command.empty())
    throw std::invalid_argument{"No language server command given"};
  if (opts.workspace_root.empty()) opts.workspace_root = fs::current_path();
  opts.workspace_root = fs::absolute(opts.workspace_root).lexically_normal();
  if (!fs::is_directory(opts.workspace_root))
    utils::throwf<transport_error>(
        "Workspace {} is not a directory", opts.workspace_root.string());

  tp = std::make_unique<transport>(
      ctx, opts.command, opts.args, opts.workspace_root, log);
  rpc = std::make_unique<rpc_engine>(*tp, ctx, log);
  docs = std::make_unique<document_manager>(*rpc, log);
  register_default_handlers();

  work.emplace(ctx.get_executor());
  rpc->start([this] {
    std::scoped_lock lk{state_mtx};
    if (st == lifecycle_state::ready || st == lifecycle_state::starting)
      LOG_WARN(*lg, "Language server went away while {}", lifecycle_state_name(st));
  });
  io_thread = std::thread{[this] { run_io(); }};
}

client::~client() {
  auto res = close();
  if (res.warning) LOG_DEBUG(*lg, "Closed with warning: {}", *res.warning);
}

void client::run_io() {
  // Keep running after a handler throws: queued writes and the teardown
  // still need the loop
  for (;;) {
    try {
      ctx.run();
      return;
    } catch (const std::exception& e) {
      LOG_ERROR(*lg, "io loop handler failed: {}", e.what());
      tp->mark_disconnected();
      rpc->fail_pending(e.what());
    }
  }
}

void client::register_default_handlers() {
  rpc->on_notification(
      "textDocument/publishDiagnostics", [this](const json::value& params) {
        const auto& obj = params.as_object();
        std::string uri{obj.at("uri").as_string()};
        auto list = decode_diagnostics(obj.at("diagnostics"));
        LOG_DEBUG(*lg, "{} diagnostic(s) for {}", list.size(), uri);
        diags.publish(uri, std::move(list));
      });

  auto server_says = [this](const json::value& params) {
    auto lvl = message_level(params);
    lg->log(
        lvl, std::source_location::current(), "<server> {}",
        message_text(params));
  };
  rpc->on_notification("window/logMessage", server_says);
  rpc->on_notification("window/showMessage", server_says);

  rpc->on_request("workspace/configuration", [](const json::value& params) {
    // One null per requested item: "use your defaults"
    json::array result;
    if (auto* obj = params.if_object())
      if (auto* items = obj->if_contains("items"); items && items->is_array())
        result.resize(items->as_array().size());
    return json::value{std::move(result)};
  });
  auto acknowledge = [](const json::value&) { return json::value{nullptr}; };
  rpc->on_request("client/registerCapability", acknowledge);
  rpc->on_request("client/unregisterCapability", acknowledge);
  rpc->on_request("window/workDoneProgress/create", acknowledge);
  rpc->on_request("window/showMessageRequest", acknowledge);
}

json::object client::initialize_params() const {
  auto root_uri = path_to_uri(opts.workspace_root);

  json::object params;
  params["processId"] = static_cast<std::int64_t>(::getpid());
  params["clientInfo"] = {{"name", opts.client_name}, {"version", "0.1"}};
  params["rootUri"] = root_uri;
  params["rootPath"] = opts.workspace_root.string();
  json::object folder;
  folder["uri"] = root_uri;
  folder["name"] = opts.workspace_root.filename().string();
  params["workspaceFolders"] = json::array{std::move(folder)};
  params["capabilities"] = client_capabilities();
  if (!opts.initialization_options.is_null())
    params["initializationOptions"] = opts.initialization_options;
  return params;
}

void client::initialize() {
  {
    std::scoped_lock lk{state_mtx};
    if (st != lifecycle_state::starting)
      utils::throwf<std::logic_error>(
          "Can't initialize a client that is {}", lifecycle_state_name(st));
  }

  LOG_INFO(*lg, "Initializing in {}", opts.workspace_root.string());
  auto result = opts.initialize_timeout.count() > 0
                    ? rpc->call("initialize", initialize_params(), opts.initialize_timeout)
                    : rpc->call("initialize", initialize_params());

  auto* obj = result.if_object();
  const json::object* server_caps{nullptr};
  if (obj) {
    if (auto* c = obj->if_contains("capabilities")) server_caps = c->if_object();
  }
  if (!server_caps)
    throw protocol_error{"initialize result carries no capabilities"};

  std::optional<server_info> si;
  if (auto* s = obj->if_contains("serverInfo"); s && s->is_object()) {
    si.emplace();
    if (auto* n = s->as_object().if_contains("name"); n && n->is_string())
      si->name = std::string{n->as_string()};
    if (auto* v = s->as_object().if_contains("version"); v && v->is_string())
      si->version = std::string{v->as_string()};
    LOG_INFO(*lg, "Server is {} {}", si->name, si->version);
  }

  {
    std::scoped_lock lk{state_mtx};
    if (st != lifecycle_state::starting)
      utils::throwf<std::logic_error>(
          "Client became {} during initialize", lifecycle_state_name(st));
    caps = capabilities{*server_caps};
    info = std::move(si);
  }

  rpc->notify("initialized", json::object{});

  std::scoped_lock lk{state_mtx};
  if (st == lifecycle_state::starting) st = lifecycle_state::ready;
}

/// Teardown

close_outcome client::close() {
  {
    std::unique_lock lk{state_mtx};
    if (teardown_st != teardown_state::not_started) {
      teardown_cv.wait(lk, [this] { return teardown_st == teardown_state::done; });
      return outcome;
    }
    teardown_st = teardown_state::in_progress;
    st = lifecycle_state::shutting_down;
  }

  auto res = teardown();

  {
    std::scoped_lock lk{state_mtx};
    outcome = res;
    st = lifecycle_state::closed;
    teardown_st = teardown_state::done;
  }
  teardown_cv.notify_all();
  return res;
}

close_outcome client::teardown() {
  close_outcome res;
  auto deadline = steady_clock::now() + opts.grace_period;
  LOG_DEBUG(*lg, "Shutting down language server (pid {})", tp->pid());

  if (tp->connected()) {
    docs->close_all(deadline);
    try {
      rpc->call_until("shutdown", nullptr, deadline);
    } catch (const rpc_error& e) {
      LOG_DEBUG(*lg, "shutdown refused: {}", e.what());
    } catch (const cancelled_error& e) {
      LOG_DEBUG(*lg, "shutdown unanswered: {}", e.what());
    } catch (const disconnected_error& e) {
      LOG_DEBUG(*lg, "shutdown not delivered: {}", e.what());
    }
    try {
      rpc->notify_until("exit", nullptr, deadline);
    } catch (const disconnected_error& e) {
      LOG_DEBUG(*lg, "exit not delivered: {}", e.what());
    } catch (const cancelled_error& e) {
      LOG_DEBUG(*lg, "exit not delivered: {}", e.what());
    }
  }
  tp->close_stdin();

  if (!tp->wait_for_exit(deadline)) {
    LOG_WARN(
        *lg, "Language server didn't exit within {} ms, killing it",
        opts.grace_period.count());
    res.forced = true;
    if (auto err = tp->kill())
      res.warning = *err;
    else
      res.warning = fmt::format(
          "Language server killed after {} ms grace period",
          opts.grace_period.count());
  }
  res.exit_code = tp->exit_code();

  work.reset();
  asio::post(ctx, [this] { tp->close_reads(); });
  if (io_thread.joinable()) io_thread.join();
  rpc->fail_pending("Client closed");

  LOG_DEBUG(
      *lg, "Language server gone{}",
      res.exit_code ? fmt::format(", exit code {}", *res.exit_code) : "");
  return res;
}

/// Accessors and pass-throughs

lifecycle_state client::state() const {
  std::scoped_lock lk{state_mtx};
  return st;
}

capabilities client::server_capabilities() const {
  std::scoped_lock lk{state_mtx};
  return caps;
}

std::optional<server_info> client::server() const {
  std::scoped_lock lk{state_mtx};
  return info;
}

int client::pid() { return tp->pid(); }

json::value client::call(
    std::string_view method, json::value params, std::stop_token stop) {
  return rpc->call(method, std::move(params), std::move(stop));
}

json::value client::call(
    std::string_view method, json::value params,
    std::chrono::milliseconds timeout) {
  return rpc->call(method, std::move(params), timeout);
}

void client::notify(std::string_view method, json::value params) {
  rpc->notify(method, std::move(params));
}

void client::on_notification(
    std::string method, rpc_engine::notification_handler h) {
  rpc->on_notification(std::move(method), std::move(h));
}

void client::on_request(std::string method, rpc_engine::request_handler h) {
  rpc->on_request(std::move(method), std::move(h));
}

void client::open_file(const fs::path& path) { docs->open_file(path); }

std::string client::ensure_open(const fs::path& path) {
  return docs->ensure_open(path);
}

void client::close_file(const fs::path& path) { docs->close_file(path); }

int client::apply_text_edits(const fs::path& path, std::vector<line_edit> edits) {
  return docs->apply_text_edits(path, std::move(edits));
}

std::vector<diagnostic> client::get_diagnostics(std::string_view uri) const {
  return diags.get(uri);
}

std::vector<diagnostic> client::wait_for_diagnostics(
    std::string_view uri, std::chrono::milliseconds timeout) const {
  using namespace std::chrono_literals;
  auto deadline = steady_clock::now() + timeout;
  while (diags.generation(uri) == 0 && steady_clock::now() < deadline)
    std::this_thread::sleep_for(10ms);
  return diags.get(uri);
}

}  // namespace lspbridge
