#include "lspbridge/diagnostics.hpp"

#include "lspbridge/uri.hpp"

namespace lspbridge {

void diagnostics_store::publish(const std::string& uri, std::vector<diagnostic> diags) {
  std::scoped_lock lk{mtx};
  auto& e = entries[canonical_uri(uri)];
  e.diags = std::move(diags);
  ++e.generation;
}

std::vector<diagnostic> diagnostics_store::get(std::string_view uri) const {
  std::scoped_lock lk{mtx};
  if (auto it = entries.find(canonical_uri(uri)); it != entries.end())
    return it->second.diags;
  return {};
}

std::size_t diagnostics_store::generation(std::string_view uri) const {
  std::scoped_lock lk{mtx};
  if (auto it = entries.find(canonical_uri(uri)); it != entries.end())
    return it->second.generation;
  return 0;
}

}  // namespace lspbridge
