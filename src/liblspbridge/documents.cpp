#include "lspbridge/documents.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <utility>

#include "lspbridge/errors.hpp"
#include "lspbridge/uri.hpp"
#include "utils.hpp"

namespace lspbridge {

namespace fs = std::filesystem;
using utils::throwf;

namespace {

// clang-format off
constexpr std::array<std::pair<std::string_view, std::string_view>, 36> languages{{
  {".c", "c"}, {".h", "c"},
  {".cc", "cpp"}, {".cpp", "cpp"}, {".cxx", "cpp"}, {".c++", "cpp"},
  {".hh", "cpp"}, {".hpp", "cpp"}, {".hxx", "cpp"}, {".ipp", "cpp"},
  {".go", "go"},
  {".py", "python"},
  {".rs", "rust"},
  {".ts", "typescript"}, {".tsx", "typescriptreact"},
  {".js", "javascript"}, {".jsx", "javascriptreact"},
  {".java", "java"}, {".kt", "kotlin"},
  {".cs", "csharp"},
  {".rb", "ruby"},
  {".lua", "lua"},
  {".swift", "swift"},
  {".zig", "zig"},
  {".sh", "shellscript"}, {".bash", "shellscript"},
  {".json", "json"},
  {".yaml", "yaml"}, {".yml", "yaml"},
  {".toml", "toml"},
  {".md", "markdown"},
  {".html", "html"}, {".css", "css"},
  {".php", "php"},
  {".m", "objective-c"}, {".mm", "objective-cpp"},
}};
// clang-format on

std::string key_of(const fs::path& path) {
  if (!path.is_absolute())
    throwf<document_error>("Not an absolute path: {}", path.string());
  return path.lexically_normal().string();
}

void write_file(const fs::path& path, const std::string& content) {
  std::ofstream out{path, std::ios::binary | std::ios::trunc};
  if (!out) throwf<document_error>("Can't write {}", path.string());
  out << content;
  out.flush();
  if (!out) throwf<document_error>("Failed writing {}", path.string());
}

std::string apply_edits(const std::string& text, std::vector<line_edit>& edits) {
  auto lines = utils::split_lines(text);
  bool trailing_newline = !text.empty() && text.back() == '\n';
  auto nlines = static_cast<int>(lines.size());

  std::ranges::sort(edits, std::ranges::greater{}, &line_edit::start_line);
  int floor = nlines + 1;
  for (const auto& e : edits) {
    if (e.start_line < 1 || e.end_line < e.start_line)
      throwf<document_error>(
          "Bad line range {}-{}", e.start_line, e.end_line);
    if (e.start_line > nlines + 1)
      throwf<document_error>(
          "Line {} is past the end of the document ({} lines)",
          e.start_line, nlines);
    if (e.end_line >= floor && floor <= nlines)
      throwf<document_error>(
          "Edit {}-{} overlaps another edit", e.start_line, e.end_line);
    floor = e.start_line;
  }

  // Bottom-up, so earlier line numbers stay valid
  for (const auto& e : edits) {
    auto first = lines.begin() + (e.start_line - 1);
    auto last = lines.begin() + std::min(e.end_line, nlines);
    auto replacement = utils::split_lines(e.new_text);
    auto at = lines.erase(first, last);
    lines.insert(at, replacement.begin(), replacement.end());
  }

  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  if (trailing_newline && !lines.empty()) out += '\n';
  return out;
}

}  // namespace

std::string_view language_id_for(const fs::path& path) {
  auto ext = path.extension().string();
  std::ranges::transform(ext, ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  // .C and .H are C++ by convention
  if (path.extension() == ".C" || path.extension() == ".H") return "cpp";
  for (const auto& [suffix, id] : languages)
    if (suffix == ext) return id;
  return "plaintext";
}

document_manager::document_manager(rpc_engine& rpc, logger& log)
    : rpc{&rpc}, log{&log} {}

document_manager::document& document_manager::open_locked(
    const fs::path& path, bool reopen) {
  auto key = key_of(path);
  auto& doc = docs[key];
  if (doc.state == document_state::open) return doc;
  if (doc.state == document_state::closed && !reopen)
    throwf<document_error>("{} was closed", key);

  auto content = utils::slurp<document_error>(key);
  document fresh{
    .uri = path_to_uri(key),
    .language_id = std::string{language_id_for(key)},
    .version = 1,
    .content = std::move(content),
    .state = document_state::open};

  json::object item;
  item["uri"] = fresh.uri;
  item["languageId"] = fresh.language_id;
  item["version"] = fresh.version;
  item["text"] = fresh.content;
  json::object params;
  params["textDocument"] = std::move(item);
  rpc->notify("textDocument/didOpen", std::move(params));

  LOG_DEBUG(*log, "Opened {} as {}", key, fresh.language_id);
  doc = std::move(fresh);
  return doc;
}

const document_manager::document& document_manager::require_open_locked(
    const fs::path& path) const {
  auto key = key_of(path);
  auto it = docs.find(key);
  if (it == docs.end() || it->second.state != document_state::open)
    throwf<document_error>("{} is not open", key);
  return it->second;
}

document_manager::document& document_manager::require_open_locked(
    const fs::path& path) {
  auto key = key_of(path);
  auto it = docs.find(key);
  if (it == docs.end() || it->second.state != document_state::open)
    throwf<document_error>("{} is not open", key);
  return it->second;
}

void document_manager::send_did_change(const document& doc) {
  json::object id;
  id["uri"] = doc.uri;
  id["version"] = doc.version;
  json::object change;
  change["text"] = doc.content;
  json::object params;
  params["textDocument"] = std::move(id);
  params["contentChanges"] = json::array{std::move(change)};
  rpc->notify("textDocument/didChange", std::move(params));
}

void document_manager::open_file(const fs::path& path) {
  std::scoped_lock lk{mtx};
  open_locked(path, true);
}

std::string document_manager::ensure_open(const fs::path& path) {
  std::scoped_lock lk{mtx};
  return open_locked(path, false).uri;
}

int document_manager::change_file(const fs::path& path, std::string content) {
  std::scoped_lock lk{mtx};
  auto& doc = require_open_locked(path);
  doc.content = std::move(content);
  ++doc.version;
  send_did_change(doc);
  return doc.version;
}

int document_manager::apply_text_edits(
    const fs::path& path, std::vector<line_edit> edits) {
  std::scoped_lock lk{mtx};
  auto& doc = open_locked(path, false);
  auto updated = apply_edits(doc.content, edits);
  write_file(key_of(path), updated);
  doc.content = std::move(updated);
  ++doc.version;
  LOG_DEBUG(
      *log, "Applied {} edit(s) to {}, now version {}", edits.size(),
      key_of(path), doc.version);
  send_did_change(doc);
  return doc.version;
}

void document_manager::close_file(const fs::path& path) {
  std::scoped_lock lk{mtx};
  auto it = docs.find(key_of(path));
  if (it == docs.end() || it->second.state != document_state::open) return;
  auto& doc = it->second;
  doc.state = document_state::closed;
  LOG_DEBUG(*log, "Closing {}", it->first);
  json::object params;
  params["textDocument"] = text_document_identifier(doc.uri);
  rpc->notify("textDocument/didClose", std::move(params));
}

void document_manager::close_all(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock lk{mtx, deadline};
  if (!lk.owns_lock()) {
    LOG_WARN(*log, "Documents still busy, not sending didClose");
    return;
  }
  for (auto& [key, doc] : docs) {
    if (doc.state != document_state::open) continue;
    doc.state = document_state::closed;
    json::object params;
    params["textDocument"] = text_document_identifier(doc.uri);
    try {
      rpc->notify_until("textDocument/didClose", std::move(params), deadline);
    } catch (const disconnected_error& e) {
      LOG_DEBUG(*log, "Not closing {}: {}", key, e.what());
    } catch (const cancelled_error& e) {
      LOG_DEBUG(*log, "Not closing {}: {}", key, e.what());
    }
  }
}

document_state document_manager::state(const fs::path& path) const {
  std::scoped_lock lk{mtx};
  auto it = docs.find(key_of(path));
  return it == docs.end() ? document_state::unopened : it->second.state;
}

bool document_manager::is_open(const fs::path& path) const {
  return state(path) == document_state::open;
}

int document_manager::version(const fs::path& path) const {
  std::scoped_lock lk{mtx};
  return require_open_locked(path).version;
}

std::string document_manager::content(const fs::path& path) const {
  std::scoped_lock lk{mtx};
  return require_open_locked(path).content;
}

std::vector<fs::path> document_manager::open_documents() const {
  std::scoped_lock lk{mtx};
  std::vector<fs::path> out;
  for (const auto& [key, doc] : docs)
    if (doc.state == document_state::open) out.emplace_back(key);
  std::ranges::sort(out);
  return out;
}

}  // namespace lspbridge
