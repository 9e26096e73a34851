#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lspbridge/protocol.hpp"

namespace lspbridge {

// Last diagnostics pushed by the server, per document URI.  URIs are
// compared in canonical_uri() form on both sides.
class diagnostics_store {
 public:
  // Replaces whatever was there for @p uri.  An empty set clears it.
  void publish(const std::string& uri, std::vector<diagnostic> diags);

  // A copy of the current set, empty if nothing was ever pushed.
  std::vector<diagnostic> get(std::string_view uri) const;

  // Number of pushes seen for @p uri, including empty ones.
  std::size_t generation(std::string_view uri) const;

 private:
  struct entry {
    std::vector<diagnostic> diags;
    std::size_t generation{};
  };
  mutable std::mutex mtx;
  std::unordered_map<std::string, entry> entries;
};

}  // namespace lspbridge
