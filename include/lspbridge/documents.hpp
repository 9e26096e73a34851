#pragma once

/**
 * @file documents.hpp
 * @brief Which files the server has been told about, and at what version.
 *
 * Per file: unopened -> open -> closed.  Every file-addressing request goes
 * through ensure_open() first, so the server never sees a URI it wasn't
 * given with didOpen.  A closed document stays closed until somebody calls
 * open_file() on it explicitly.
 */

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lspbridge/logger.hpp"
#include "lspbridge/rpc.hpp"

namespace lspbridge {

enum class document_state : std::uint8_t { unopened, open, closed };

// Replace lines [start_line, end_line] (1-indexed, inclusive) with
// new_text.  An empty new_text deletes the lines.
struct line_edit {
  int start_line{1};
  int end_line{1};
  std::string new_text;
};

// "cpp", "python", ... from the file extension, "plaintext" if unknown.
std::string_view language_id_for(const std::filesystem::path& path);

class document_manager {
 public:
  document_manager(rpc_engine& rpc, logger& log);

  document_manager(const document_manager&) = delete;
  document_manager& operator=(const document_manager&) = delete;

  // Read @p path and send didOpen with version 1.  No-op if already open.
  // Throws document_error if the file can't be read.
  void open_file(const std::filesystem::path& path);

  // Like open_file(), but a closed document is refused with
  // document_error instead of reopened.  Returns the document URI.
  std::string ensure_open(const std::filesystem::path& path);

  // Replace the whole content of an open document: version + 1, didChange.
  // Nothing is written to disk.  Returns the new version.
  int change_file(const std::filesystem::path& path, std::string content);

  // Apply @p edits bottom-up, write the result to disk and resynchronize.
  // Opens the document first if needed.  Overlapping or out of range
  // edits throw document_error and leave everything untouched.  Returns
  // the new version.
  int apply_text_edits(
      const std::filesystem::path& path, std::vector<line_edit> edits);

  // didClose.  No-op unless open.
  void close_file(const std::filesystem::path& path);

  // didClose for everything still open, giving up at @p deadline.  A
  // caller stuck sending under the document lock makes this a no-op.
  void close_all(std::chrono::steady_clock::time_point deadline);

  document_state state(const std::filesystem::path& path) const;
  bool is_open(const std::filesystem::path& path) const;
  // Throw document_error unless open.
  int version(const std::filesystem::path& path) const;
  std::string content(const std::filesystem::path& path) const;

  std::vector<std::filesystem::path> open_documents() const;

 private:
  struct document {
    std::string uri;
    std::string language_id;
    int version{};
    std::string content;
    document_state state{document_state::unopened};
  };

  document& open_locked(const std::filesystem::path& path, bool reopen);
  const document& require_open_locked(const std::filesystem::path& path) const;
  document& require_open_locked(const std::filesystem::path& path);
  void send_did_change(const document& doc);

  rpc_engine* rpc;
  logger* log;

  mutable std::timed_mutex mtx;
  std::unordered_map<std::string, document> docs;  // by absolute path
};

}  // namespace lspbridge
