#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lspbridge/protocol.hpp"

namespace fs = std::filesystem;

namespace lspbridge::cli {

struct query_options {
  std::optional<fs::path> workspace{};
  bool capabilities{false};
  std::optional<std::string> definition{};
  std::optional<std::string> references{};
  std::optional<fs::path> diagnostics{};
  std::optional<fs::path> document_symbols{};
  std::optional<std::string> call_hierarchy{};
  std::string direction{"incoming"};
  std::optional<std::string> hover{};
  int wait_diagnostics_ms{3000};
  std::vector<std::string> server_command{};
};

struct file_position {
  fs::path file;
  user_position pos;
};

// "src/foo.cpp:12:5", relative paths taken against @p base.  Throws
// std::invalid_argument on anything else.
file_position parse_file_position(std::string_view arg, const fs::path& base);

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, query_options& qopts,
    bool& json_output);

}  // namespace lspbridge::cli
