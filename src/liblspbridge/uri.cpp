#include "lspbridge/uri.hpp"

#include <fmt/format.h>

#include <cctype>
#include <stdexcept>

#include "utils.hpp"

namespace lspbridge {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view file_scheme{"file://"};

bool unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' ||
         c == '/';
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string path_to_uri(const fs::path& path) {
  std::string res{file_scheme};
  for (unsigned char c : path.generic_string()) {
    if (unreserved(c))
      res += static_cast<char>(c);
    else
      res += fmt::format("%{:02X}", c);
  }
  return res;
}

fs::path uri_to_path(std::string_view uri) {
  if (!uri.starts_with(file_scheme))
    utils::throwf<std::invalid_argument>("Not a file URI: {}", uri);
  uri.remove_prefix(file_scheme.size());

  std::string res;
  res.reserve(uri.size());
  for (std::size_t i = 0; i < uri.size(); ++i) {
    if (uri[i] == '%' && i + 2 < uri.size()) {
      int hi = hex_value(uri[i + 1]);
      int lo = hex_value(uri[i + 2]);
      if (hi >= 0 && lo >= 0) {
        res += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    res += uri[i];
  }
  return res;
}

std::string canonical_uri(std::string_view uri) {
  if (!uri.starts_with(file_scheme)) return std::string{uri};
  return path_to_uri(uri_to_path(uri));
}

}  // namespace lspbridge
