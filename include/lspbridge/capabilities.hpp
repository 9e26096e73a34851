#pragma once

/**
 * @file capabilities.hpp
 * @brief What the server said it can do, captured once at initialize time.
 *
 * The protocol declares a feature either as a nullable wrapper ("field not
 * sent", "sent as null", "sent with a value") or as a plain optional value
 * (a boolean or an options object, or nothing).  Every field is kept as an
 * explicit tri-state so that the two shapes can apply their own presence
 * rule:
 *
 *  - nullable wrapper: supported iff the field is present with a non-null
 *    value (@c true, @c false or an options object all count);
 *  - plain optional: supported iff the field is present at all.  A JSON
 *    null here means "not sent", there is no null alternative to keep.
 */

#include <array>
#include <boost/json.hpp>
#include <cstdint>
#include <string_view>
#include <variant>

namespace lspbridge {

namespace json = boost::json;

namespace capability {
struct absent {
  bool operator==(const absent&) const = default;
};
struct present_null {
  bool operator==(const present_null&) const = default;
};
}  // namespace capability

using capability_value =
    std::variant<capability::absent, capability::present_null, json::value>;

enum class capability_encoding : std::uint8_t { nullable_wrapper, plain_optional };

enum class feature : std::uint8_t {
  definition,
  references,
  hover,
  document_symbol,
  call_hierarchy,
  workspace_symbol,
  rename,
  code_action,
  signature_help,
  code_lens,
  completion,
};

inline constexpr std::size_t feature_count{11};

// "definitionProvider" and friends
std::string_view capability_key(feature f);
capability_encoding encoding_of(feature f);

class capabilities {
 public:
  // Nothing declared.
  capabilities();
  // From the "capabilities" member of an initialize result.
  explicit capabilities(const json::object& server_capabilities);

  const capability_value& field(feature f) const;
  bool supports(feature f) const;

  bool has_definition_support() const;  // definition and workspace symbol
  bool has_references_support() const { return supports(feature::references); }
  bool has_hover_support() const { return supports(feature::hover); }
  bool has_document_symbol_support() const {
    return supports(feature::document_symbol);
  }
  bool has_call_hierarchy_support() const {
    return supports(feature::call_hierarchy);
  }
  bool has_workspace_symbol_support() const {
    return supports(feature::workspace_symbol);
  }
  bool has_rename_support() const { return supports(feature::rename); }
  bool has_code_action_support() const { return supports(feature::code_action); }
  bool has_signature_help_support() const {
    return supports(feature::signature_help);
  }
  bool has_code_lens_support() const { return supports(feature::code_lens); }
  bool has_completion_support() const { return supports(feature::completion); }

  // Text synchronization is mandatory for every server, and diagnostics are
  // pushed without any declaration.
  static constexpr bool has_edit_support() { return true; }
  static constexpr bool has_diagnostics_support() { return true; }

  const json::object& raw() const { return raw_caps; }

 private:
  std::array<capability_value, feature_count> fields;
  json::object raw_caps;
};

}  // namespace lspbridge
