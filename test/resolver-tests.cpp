#include <doctest/doctest.h>

#include <string>

#include "helpers.hpp"
#include "lspbridge/client.hpp"
#include "lspbridge/resolver.hpp"
#include "lspbridge/uri.hpp"

using namespace lspbridge;
using lspbridge::test::fakels_options;
using lspbridge::test::scratch_workspace;
using lspbridge::test::test_logger;

TEST_CASE("symbol-matching") {
  SUBCASE("exact") {
    CHECK(symbol_matches("area", "area", symbol_kind::method, "shapes::Widget"));
    CHECK(symbol_matches("Foo::bar", "Foo::bar", symbol_kind::method, ""));
  }
  SUBCASE("qualified queries match exactly or not at all") {
    CHECK_FALSE(
        symbol_matches("shapes::area", "shapes::areaTotal", symbol_kind::function, ""));
    CHECK_FALSE(symbol_matches("a.b", "x.a.b", symbol_kind::method, "x"));
  }
  SUBCASE("qualified names") {
    CHECK(symbol_matches("method", "TestClass::method", symbol_kind::method, ""));
    CHECK(symbol_matches("method", "TestClass.method", symbol_kind::method, ""));
    CHECK_FALSE(symbol_matches("method", "TestClass::methods", symbol_kind::method, ""));
    CHECK_FALSE(symbol_matches("method", "Testmethod", symbol_kind::function, ""));
  }
  SUBCASE("types by substring or case") {
    CHECK(symbol_matches("vector", "std::vector<int>", symbol_kind::class_, "std"));
    CHECK(symbol_matches("widget", "Widget", symbol_kind::struct_, ""));
    CHECK(symbol_matches("Color", "ColorMode", symbol_kind::enum_, ""));
    CHECK_FALSE(symbol_matches("widget", "Widget", symbol_kind::function, ""));
  }
  SUBCASE("constants by last component") {
    CHECK(symbol_matches("kMax", "ns::kMax", symbol_kind::constant, "ns"));
    CHECK(symbol_matches("kMax", "ns::kMax", symbol_kind::variable, "ns"));
    CHECK_FALSE(symbol_matches("kMax", "ns::kMaxWidgets", symbol_kind::constant, "ns"));
  }
  SUBCASE("prefixes are not enough") {
    CHECK_FALSE(symbol_matches("area", "areaTotal", symbol_kind::function, "shapes"));
    CHECK_FALSE(
        symbol_matches("area", "shapes::areaTotal", symbol_kind::function, ""));
  }
}

TEST_CASE("line-numbering") {
  CHECK(add_line_numbers({"a", "b"}, 1) == "1|a\n2|b\n");
  CHECK(add_line_numbers({"x", "y", "z"}, 9) == " 9|x\n10|y\n11|z\n");
  CHECK(add_line_numbers({}, 3).empty());
}

TEST_CASE("resolve-definitions") {
  scratch_workspace ws;
  client c{fakels_options(ws, "basic.json"), test_logger()};
  c.initialize();
  REQUIRE(c.server_capabilities().has_definition_support());

  SUBCASE("method reached twice is reported once") {
    auto r = resolve_definition(c, "area");
    REQUIRE(r.matches.size() == 1);
    const auto& m = r.matches[0];
    CHECK(m.symbol == "area");
    CHECK(m.kind == symbol_kind::method);
    CHECK(m.container == "shapes::Widget");
    CHECK(m.file == ws.file("widget.cpp").string());
    CHECK(to_user(m.range) == user_range{{7, 1}, {9, 2}});
    REQUIRE(m.lines.size() == 3);
    CHECK(m.lines[0] == "int Widget::area() const {");
    CHECK(m.lines[2] == "}");

    CHECK(
        format_definitions(r) ==
        "---\n\n"
        "Symbol: area\n"
        "File: " + ws.file("widget.cpp").string() + "\n"
        "Kind: Method\n"
        "Container Name: shapes::Widget\n"
        "Range: L7:C1 - L9:C2\n\n"
        "7|int Widget::area() const {\n"
        "8|  return size_ * size_;\n"
        "9|}\n\n");
  }
  SUBCASE("class body comes from the document outline") {
    auto r = resolve_definition(c, "Widget");
    REQUIRE(r.matches.size() == 1);
    CHECK(r.matches[0].symbol == "shapes::Widget");
    CHECK(to_user(r.matches[0].range).start.line == 5);
    CHECK(to_user(r.matches[0].range).end.line == 12);
    REQUIRE(r.matches[0].lines.size() == 8);
    CHECK(r.matches[0].lines.front() == "class Widget {");
    CHECK(r.matches[0].lines.back() == "};");
  }
  SUBCASE("constant") {
    auto r = resolve_definition(c, "kMaxWidgets");
    REQUIRE(r.matches.size() == 1);
    REQUIRE(r.matches[0].lines.size() == 1);
    CHECK(r.matches[0].lines[0] == "constexpr int kMaxWidgets = 16;");
  }
  SUBCASE("nothing found") {
    auto r = resolve_definition(c, "Nope");
    CHECK_FALSE(r.found());
    CHECK(format_definitions(r) == "Nope not found");
  }
  SUBCASE("qualified query with no exact symbol") {
    CHECK_FALSE(resolve_definition(c, "shapes::area").found());
  }
  SUBCASE("references, deduplicated and sorted") {
    auto r = find_references(c, "area");
    REQUIRE(r.locations.size() == 2);
    CHECK(r.locations[0].uri == ws.uri("main.cpp"));
    CHECK(to_user(r.locations[0].range.start) == user_position{5, 12});
    CHECK(r.locations[1].uri == ws.uri("widget.hpp"));
    CHECK(to_user(r.locations[1].range.start) == user_position{8, 7});
    CHECK(
        format_references(r) ==
        "---\n\nFile: " + ws.file("main.cpp").string() + "\n  L5:C12\n"
        "---\n\nFile: " + ws.file("widget.hpp").string() + "\n  L8:C7\n");
  }

  CHECK_FALSE(c.close().forced);
}

TEST_CASE("failing-definition-lookup-is-not-fatal") {
  scratch_workspace ws;
  client c{fakels_options(ws, "broken.json"), test_logger()};
  c.initialize();

  definition_result r;
  CHECK_NOTHROW(r = resolve_definition(c, "area"));
  CHECK_FALSE(r.found());
  CHECK(c.state() == lifecycle_state::ready);
}
