#pragma once

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "lspbridge/client.hpp"
#include "lspbridge/logger.hpp"
#include "lspbridge/uri.hpp"
#include "test_config.h"

namespace fs = std::filesystem;

namespace lspbridge::test {

inline logger& test_logger() {
  static logger lg{logging::level::warning};
  return lg;
}

// A private copy of test/fixture/project, removed afterwards.
struct scratch_workspace {
  fs::path root;

  scratch_workspace() {
    static std::atomic<int> counter{0};
    root = fs::temp_directory_path() /
           ("lspbridge-test-" + std::to_string(::getpid()) + "-" +
            std::to_string(++counter));
    fs::remove_all(root);
    fs::create_directories(root);
    fs::copy(
        fs::path{TEST_FIXTURE_DIR} / "project", root,
        fs::copy_options::recursive);
  }

  scratch_workspace(const scratch_workspace&) = delete;
  scratch_workspace& operator=(const scratch_workspace&) = delete;
  ~scratch_workspace() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  fs::path file(std::string_view rel) const { return root / rel; }
  std::string uri(std::string_view rel) const { return path_to_uri(root / rel); }
};

inline client_options fakels_options(
    const scratch_workspace& ws, std::string_view script,
    std::vector<std::string> extra = {}) {
  client_options opts{};
  opts.command = FAKELS_PATH;
  opts.args = {
    "--script", (fs::path{TEST_FIXTURE_DIR} / script).string(), "--workspace",
    ws.root.string()};
  opts.args.insert(opts.args.end(), extra.begin(), extra.end());
  opts.workspace_root = ws.root;
  return opts;
}

}  // namespace lspbridge::test
