#include "options.hpp"

#include <re2/re2.h>

#include <CLI/CLI.hpp>
#include <optional>
#include <stdexcept>

namespace lspbridge::cli {

file_position parse_file_position(std::string_view arg, const fs::path& base) {
  static const RE2 re{R"((.+):(\d+):(\d+))"};
  std::string file;
  int line{};
  int column{};
  re2::StringPiece text{arg.data(), arg.size()};
  if (!RE2::FullMatch(text, re, &file, &line, &column) || line < 1 ||
      column < 1)
    throw std::invalid_argument{
      "Expected FILE:LINE:COL with 1-based LINE and COL, got '" +
      std::string{arg} + "'"};
  fs::path p{file};
  if (p.is_relative()) p = base / p;
  return {p.lexically_normal(), {line, column}};
}

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, query_options& qopts,
    bool& json_output) {
  CLI::App app{"Ask a language server about a code base"};

  app.add_option(
      "-w,--workspace", qopts.workspace,
      "Workspace root (defaults to the current directory)");
  app.add_option(
      "-d, --debug",
      loglevel,
      "Debug log level (3=INFO)")
    ->capture_default_str();
  app.add_flag(
      "--json", json_output,
      "Output results in JSON format")
    ->capture_default_str();
  app.add_option(
      "--wait-diagnostics", qopts.wait_diagnostics_ms,
      "How long to wait for diagnostics to be pushed, in ms")
    ->capture_default_str();
  app.add_option(
      "--direction", qopts.direction,
      "Call hierarchy direction")
    ->check(CLI::IsMember({"incoming", "outgoing"}))
    ->capture_default_str();

  auto* query = app.add_option_group("query", "What to ask");
  query->add_flag(
      "--capabilities", qopts.capabilities,
      "Show what the server declared it supports");
  query->add_option(
      "--definition", qopts.definition,
      "Find where SYMBOL is defined");
  query->add_option(
      "--references", qopts.references,
      "Find references to SYMBOL");
  query->add_option(
      "--diagnostics", qopts.diagnostics,
      "Show diagnostics for FILE");
  query->add_option(
      "--document-symbols", qopts.document_symbols,
      "Show the symbol outline of FILE");
  query->add_option(
      "--call-hierarchy", qopts.call_hierarchy,
      "Show callers or callees of the symbol at FILE:LINE:COL");
  query->add_option(
      "--hover", qopts.hover,
      "Show hover information at FILE:LINE:COL");
  query->require_option(1);

  app.add_option(
      "server-command", qopts.server_command,
      "Language server command line, after --")
    ->required();

  try {
    (app).parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI ::ParseError& e) {
    return (app).exit(e);
  };

  return std::nullopt;
}

}  // namespace lspbridge::cli
