#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <climits>
#include <string>
#include <stdexcept>
#include <variant>

#include "lspbridge/capabilities.hpp"
#include "lspbridge/diagnostics.hpp"
#include "lspbridge/errors.hpp"
#include "lspbridge/protocol.hpp"
#include "lspbridge/uri.hpp"

namespace json = boost::json;
using namespace lspbridge;

TEST_CASE("coordinate-translation") {
  // Line 5, column 3 as a user counts is 4:2 on the wire
  auto p = to_protocol(user_position{5, 3});
  CHECK(p.line == 4);
  CHECK(p.character == 2);
  CHECK(to_user(p) == user_position{5, 3});

  auto r = to_user(decode_range(json::parse(
      R"({"start": {"line": 0, "character": 0}, "end": {"line": 9, "character": 17}})")));
  CHECK(r.start == user_position{1, 1});
  CHECK(r.end == user_position{10, 18});

  CHECK_THROWS_AS(to_protocol(user_position{0, 1}), std::invalid_argument);
  CHECK_THROWS_AS(to_protocol(user_position{1, 0}), std::invalid_argument);
}

TEST_CASE("coordinates-at-the-top-of-the-range") {
  CHECK(
      to_user(position{.line = 2147483647, .character = 4294967295}) ==
      user_position{INT_MAX, INT_MAX});
  CHECK(to_user(position{.line = 2147483646, .character = 0}) ==
        user_position{INT_MAX, 1});

  auto pos = [](std::string_view line) {
    return decode_position(json::parse(
        std::string{R"({"line": )"} + std::string{line} + R"(, "character": 0})"));
  };
  CHECK(pos("4294967295").line == 4294967295u);
  CHECK_THROWS_AS(pos("4294967296"), protocol_error);
  CHECK_THROWS_AS(pos("-1"), protocol_error);
}

TEST_CASE("uri-round-trip") {
  CHECK(path_to_uri("/tmp/a b/c#d.cpp") == "file:///tmp/a%20b/c%23d.cpp");
  CHECK(uri_to_path("file:///tmp/a%20b/c%23d.cpp") == "/tmp/a b/c#d.cpp");
  CHECK(uri_to_path("file:///usr/include/stdio.h") == "/usr/include/stdio.h");
  CHECK_THROWS_AS(uri_to_path("untitled:Untitled-1"), std::invalid_argument);
}

TEST_CASE("uri-canonical-spelling") {
  CHECK(canonical_uri("file:///tmp/c++/v@2/a.cpp") == "file:///tmp/c%2B%2B/v%402/a.cpp");
  CHECK(canonical_uri("file:///tmp/c%2b%2b/a.cpp") == "file:///tmp/c%2B%2B/a.cpp");
  CHECK(canonical_uri(path_to_uri("/tmp/c++/a.cpp")) == path_to_uri("/tmp/c++/a.cpp"));
  CHECK(canonical_uri("untitled:Untitled-1") == "untitled:Untitled-1");
}

TEST_CASE("definition-result-shapes") {
  auto loc = R"({"uri": "file:///a.cpp",
                 "range": {"start": {"line": 1, "character": 2},
                           "end": {"line": 1, "character": 5}}})";

  SUBCASE("single location") {
    auto locs = decode_locations(json::parse(loc));
    REQUIRE(locs.size() == 1);
    CHECK(locs[0].uri == "file:///a.cpp");
    CHECK(locs[0].range.start == position{1, 2});
  }
  SUBCASE("location array") {
    auto locs = decode_locations(json::parse(std::string{"["} + loc + "," + loc + "]"));
    CHECK(locs.size() == 2);
  }
  SUBCASE("location links use the target") {
    auto locs = decode_locations(json::parse(R"([{
      "originSelectionRange": {"start": {"line": 0, "character": 0}, "end": {"line": 0, "character": 1}},
      "targetUri": "file:///b.cpp",
      "targetRange": {"start": {"line": 7, "character": 0}, "end": {"line": 9, "character": 1}},
      "targetSelectionRange": {"start": {"line": 7, "character": 4}, "end": {"line": 7, "character": 8}}}])"));
    REQUIRE(locs.size() == 1);
    CHECK(locs[0].uri == "file:///b.cpp");
    CHECK(locs[0].range.start == position{7, 0});
  }
  SUBCASE("null") { CHECK(decode_locations(nullptr).empty()); }
  SUBCASE("garbage") {
    CHECK_THROWS_AS(decode_locations(json::parse("42")), protocol_error);
  }
}

TEST_CASE("workspace-symbol-without-range") {
  auto syms = decode_workspace_symbols(json::parse(R"([
    {"name": "Foo", "kind": 5, "location": {"uri": "file:///foo.go"}}])"));
  REQUIRE(syms.size() == 1);
  CHECK(syms[0].kind == symbol_kind::class_);
  CHECK(syms[0].container_name.empty());
  CHECK(syms[0].loc.range == text_range{});
}

TEST_CASE("document-symbols-tree-or-flat") {
  auto tree = decode_document_symbols(json::parse(R"([
    {"name": "ns", "kind": 3,
     "range": {"start": {"line": 0, "character": 0}, "end": {"line": 9, "character": 0}},
     "selectionRange": {"start": {"line": 0, "character": 10}, "end": {"line": 0, "character": 12}},
     "children": [
       {"name": "f", "kind": 12,
        "range": {"start": {"line": 2, "character": 0}, "end": {"line": 4, "character": 1}},
        "selectionRange": {"start": {"line": 2, "character": 5}, "end": {"line": 2, "character": 6}}}]}])"));
  REQUIRE(std::holds_alternative<std::vector<document_symbol>>(tree));
  const auto& roots = std::get<std::vector<document_symbol>>(tree);
  REQUIRE(roots.size() == 1);
  REQUIRE(roots[0].children.size() == 1);
  CHECK(roots[0].children[0].kind == symbol_kind::function);

  auto flat = decode_document_symbols(json::parse(R"([
    {"name": "f", "kind": 12, "location": {"uri": "file:///x.c",
       "range": {"start": {"line": 2, "character": 0}, "end": {"line": 4, "character": 1}}}}])"));
  CHECK(std::holds_alternative<std::vector<symbol_information>>(flat));
}

TEST_CASE("code-action-or-command") {
  auto actions = decode_code_actions(json::parse(R"([
    {"title": "Fix it", "kind": "quickfix", "isPreferred": true, "edit": {"changes": {}}},
    {"title": "Organize", "command": "tool.organize", "arguments": [1]},
    {"title": "Via command", "kind": "source",
     "command": {"title": "Do", "command": "tool.do", "arguments": []}},
    {"what": "is this"}])"));
  REQUIRE(actions.size() == 4);

  REQUIRE(std::holds_alternative<code_action>(actions[0]));
  const auto& fix = std::get<code_action>(actions[0]);
  CHECK(fix.title == "Fix it");
  CHECK(fix.kind == "quickfix");
  CHECK(fix.has_edit);
  CHECK(fix.is_preferred);
  CHECK_FALSE(fix.command);

  REQUIRE(std::holds_alternative<server_command>(actions[1]));
  CHECK(std::get<server_command>(actions[1]).command == "tool.organize");

  REQUIRE(std::holds_alternative<code_action>(actions[2]));
  REQUIRE(std::get<code_action>(actions[2]).command);
  CHECK(std::get<code_action>(actions[2]).command->command == "tool.do");

  CHECK(std::holds_alternative<unrecognized_action>(actions[3]));
}

TEST_CASE("hover-contents") {
  CHECK(decode_hover(nullptr).empty());
  CHECK(decode_hover(json::parse(R"({"contents": {"kind": "markdown", "value": "**x**"}})")) == "**x**");
  CHECK(decode_hover(json::parse(R"({"contents": "plain"})")) == "plain");
  CHECK(
      decode_hover(json::parse(
          R"({"contents": [{"language": "cpp", "value": "int x"}, "doc"]})")) ==
      "int x\ndoc");
}

TEST_CASE("symbol-kind-names") {
  CHECK(symbol_kind_name(symbol_kind::file) == "File");
  CHECK(symbol_kind_name(symbol_kind::method) == "Method");
  CHECK(symbol_kind_name(symbol_kind::type_parameter) == "TypeParameter");
  CHECK(symbol_kind_name(static_cast<symbol_kind>(200)) == "Unknown");
}

/// Capabilities

TEST_CASE("nullable-wrapper-capabilities") {
  for (auto f : {feature::definition, feature::references, feature::hover,
                 feature::document_symbol, feature::call_hierarchy,
                 feature::workspace_symbol}) {
    CAPTURE(capability_key(f));
    REQUIRE(encoding_of(f) == capability_encoding::nullable_wrapper);

    capabilities absent{json::object{}};
    CHECK(std::holds_alternative<capability::absent>(absent.field(f)));
    CHECK_FALSE(absent.supports(f));

    json::object with_null;
    with_null[capability_key(f)] = nullptr;
    capabilities null_caps{with_null};
    CHECK(std::holds_alternative<capability::present_null>(null_caps.field(f)));
    CHECK_FALSE(null_caps.supports(f));

    json::object with_true;
    with_true[capability_key(f)] = true;
    CHECK(capabilities{with_true}.supports(f));

    json::object with_options;
    with_options[capability_key(f)] = json::object{{"workDoneProgress", true}};
    capabilities options_caps{with_options};
    CHECK(std::holds_alternative<json::value>(options_caps.field(f)));
    CHECK(options_caps.supports(f));
  }
}

TEST_CASE("plain-optional-capabilities") {
  for (auto f : {feature::rename, feature::code_action, feature::signature_help,
                 feature::code_lens, feature::completion}) {
    CAPTURE(capability_key(f));
    REQUIRE(encoding_of(f) == capability_encoding::plain_optional);

    CHECK_FALSE(capabilities{json::object{}}.supports(f));

    json::object with_true;
    with_true[capability_key(f)] = true;
    CHECK(capabilities{with_true}.supports(f));

    json::object with_options;
    with_options[capability_key(f)] = json::object{{"resolveProvider", false}};
    CHECK(capabilities{with_options}.supports(f));

    // No null alternative on this shape: null reads as not sent
    json::object with_null;
    with_null[capability_key(f)] = nullptr;
    capabilities null_caps{with_null};
    CHECK(std::holds_alternative<capability::absent>(null_caps.field(f)));
    CHECK_FALSE(null_caps.supports(f));
  }
}

TEST_CASE("compound-definition-capability") {
  auto caps = [](json::object o) { return capabilities{o}; };
  CHECK(caps({{"definitionProvider", true}, {"workspaceSymbolProvider", true}})
            .has_definition_support());
  CHECK_FALSE(caps({{"definitionProvider", true}}).has_definition_support());
  CHECK_FALSE(caps({{"workspaceSymbolProvider", true}}).has_definition_support());
  CHECK_FALSE(
      caps({{"definitionProvider", nullptr}, {"workspaceSymbolProvider", true}})
          .has_definition_support());
}

TEST_CASE("always-supported-capabilities") {
  capabilities nothing;
  CHECK(nothing.has_edit_support());
  CHECK(nothing.has_diagnostics_support());
  CHECK_FALSE(nothing.has_hover_support());
  CHECK_FALSE(nothing.has_completion_support());
}

TEST_CASE("diagnostic-codes-keep-their-type") {
  auto diag = [](std::string_view code) {
    return decode_diagnostic(json::parse(
        std::string{R"({"range": {"start": {"line": 0, "character": 0},
                                   "end": {"line": 0, "character": 1}},
                        "message": "m", "code": )"} +
        std::string{code} + "}"));
  };

  auto numeric = diag("1234");
  REQUIRE(numeric.code);
  CHECK(std::get<std::int64_t>(*numeric.code) == 1234);
  CHECK(to_json(numeric).at("code") == 1234);
  CHECK(to_json(numeric).at("code").is_int64());

  auto named = diag(R"("unused-variable")");
  REQUIRE(named.code);
  CHECK(std::get<std::string>(*named.code) == "unused-variable");
  CHECK(to_json(named).at("code") == "unused-variable");

  CHECK_THROWS_AS(diag("1.5"), protocol_error);
}

TEST_CASE("completion-result-shapes") {
  CHECK(decode_completion(nullptr).items.empty());
  auto list = decode_completion(json::parse(
      R"({"isIncomplete": false, "items": [{"label": "push_back", "kind": 2,
          "documentation": "Appends"}]})"));
  REQUIRE(list.items.size() == 1);
  CHECK(list.items[0].kind == 2);
  CHECK(list.items[0].documentation == "Appends");
  CHECK(decode_completion(json::parse(R"([{"label": "a"}, {"label": "b"}])"))
            .items.size() == 2);
  CHECK_THROWS_AS(decode_completion(json::parse(R"({"items": 3})")), protocol_error);
  CHECK_THROWS_AS(decode_completion(json::parse("7")), protocol_error);
}

TEST_CASE("signature-parameter-labels") {
  auto help = decode_signature_help(json::parse(
      R"({"signatures": [{"label": "f(int a, char b)",
                          "parameters": [{"label": [2, 7]}, {"label": "char b"}]}],
          "activeSignature": 4})"));
  REQUIRE(help);
  CHECK(help->active_signature == 0);
  CHECK_FALSE(help->active_parameter);
  CHECK(help->signatures[0].parameters[0].label == "int a");
  CHECK(help->signatures[0].parameters[1].label == "char b");

  CHECK_FALSE(decode_signature_help(nullptr));
  CHECK_THROWS_AS(
      decode_signature_help(json::parse(
          R"({"signatures": [{"label": "f()", "parameters": [{"label": [2, 9]}]}]})")),
      protocol_error);
}

TEST_CASE("workspace-edit-shapes") {
  auto edit = decode_workspace_edit(json::parse(R"({"changes": {"file:///a.cpp": [
      {"range": {"start": {"line": 1, "character": 0}, "end": {"line": 1, "character": 3}},
       "newText": "int"}]}})"));
  REQUIRE(edit.changes.size() == 1);
  CHECK(
      edit.changes.at("file:///a.cpp") ==
      std::vector<text_edit>{
        {.range = {{1, 0}, {1, 3}}, .new_text = "int"}});

  CHECK(decode_workspace_edit(nullptr).changes.empty());
  CHECK_THROWS_AS(
      decode_workspace_edit(json::parse(R"({"changes": {"file:///a.cpp": [{"newText": "x"}]}})")),
      protocol_error);
}

/// Diagnostics store

TEST_CASE("diagnostics-store-replaces-wholesale") {
  diagnostics_store store;
  CHECK(store.get("file:///a.cpp").empty());
  CHECK(store.generation("file:///a.cpp") == 0);

  diagnostic one{.severity = diagnostic_severity::error, .message = "one"};
  diagnostic two{.severity = diagnostic_severity::warning, .message = "two"};
  store.publish("file:///a.cpp", {one, two});
  REQUIRE(store.get("file:///a.cpp").size() == 2);

  store.publish("file:///a.cpp", {two});
  auto now = store.get("file:///a.cpp");
  REQUIRE(now.size() == 1);
  CHECK(now[0].message == "two");
  CHECK(store.generation("file:///a.cpp") == 2);

  // Copies, not views
  now[0].message = "changed";
  CHECK(store.get("file:///a.cpp")[0].message == "two");

  store.publish("file:///a.cpp", {});
  CHECK(store.get("file:///a.cpp").empty());
  CHECK(store.get("file:///b.cpp").empty());
}

TEST_CASE("diagnostics-store-matches-differently-escaped-uris") {
  diagnostics_store store;
  diagnostic d{.severity = diagnostic_severity::error, .message = "bad"};
  // As a server that leaves '+' and '@' alone would send it
  store.publish("file:///tmp/c++/v@2/a.cpp", {d});

  auto ours = path_to_uri("/tmp/c++/v@2/a.cpp");
  CHECK(ours == "file:///tmp/c%2B%2B/v%402/a.cpp");
  REQUIRE(store.get(ours).size() == 1);
  CHECK(store.get(ours)[0].message == "bad");
  CHECK(store.generation(ours) == 1);
  CHECK(store.get("file:///tmp/c%2b%2b/v%402/a.cpp").size() == 1);
}
