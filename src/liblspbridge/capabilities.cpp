#include "lspbridge/capabilities.hpp"

namespace lspbridge {

namespace {

struct feature_decl {
  std::string_view key;
  capability_encoding encoding;
};

using enum capability_encoding;

// Indexed by feature
constexpr std::array<feature_decl, feature_count> declarations{{
  {"definitionProvider", nullable_wrapper},
  {"referencesProvider", nullable_wrapper},
  {"hoverProvider", nullable_wrapper},
  {"documentSymbolProvider", nullable_wrapper},
  {"callHierarchyProvider", nullable_wrapper},
  {"workspaceSymbolProvider", nullable_wrapper},
  {"renameProvider", plain_optional},
  {"codeActionProvider", plain_optional},
  {"signatureHelpProvider", plain_optional},
  {"codeLensProvider", plain_optional},
  {"completionProvider", plain_optional},
}};

capability_value decode_field(const json::object& caps, const feature_decl& decl) {
  auto* v = caps.if_contains(decl.key);
  if (!v) return capability::absent{};
  if (v->is_null()) {
    if (decl.encoding == nullable_wrapper) return capability::present_null{};
    return capability::absent{};
  }
  return *v;
}

}  // namespace

std::string_view capability_key(feature f) {
  return declarations.at(static_cast<std::size_t>(f)).key;
}

capability_encoding encoding_of(feature f) {
  return declarations.at(static_cast<std::size_t>(f)).encoding;
}

capabilities::capabilities() { fields.fill(capability::absent{}); }

capabilities::capabilities(const json::object& server_capabilities)
    : raw_caps{server_capabilities} {
  for (std::size_t i = 0; i < feature_count; ++i)
    fields[i] = decode_field(server_capabilities, declarations[i]);
}

const capability_value& capabilities::field(feature f) const {
  return fields.at(static_cast<std::size_t>(f));
}

bool capabilities::supports(feature f) const {
  const auto& v = field(f);
  switch (encoding_of(f)) {
    case nullable_wrapper:
      return std::holds_alternative<json::value>(v);
    case plain_optional:
      return !std::holds_alternative<capability::absent>(v);
  }
  return false;
}

bool capabilities::has_definition_support() const {
  return supports(feature::definition) && supports(feature::workspace_symbol);
}

}  // namespace lspbridge
