#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace lspbridge {

// file:// URIs for absolute paths.  Characters outside the unreserved set
// and '/' are percent-encoded.
std::string path_to_uri(const std::filesystem::path& path);

// Inverse of path_to_uri.  Throws std::invalid_argument for anything that
// isn't a file:// URI.
std::filesystem::path uri_to_path(std::string_view uri);

// The spelling path_to_uri would give the same file, so URIs that differ
// only in which characters were escaped compare equal.  Anything that isn't
// a file:// URI comes back unchanged.
std::string canonical_uri(std::string_view uri);

}  // namespace lspbridge
