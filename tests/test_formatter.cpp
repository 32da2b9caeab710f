#include <catch2/catch.hpp>

#include "msg_formatter.h"
#include "msg_parser.h"

#include <limits>
#include <memory>
#include <ostream>

namespace {
MsgAst parse_ok(const std::string& src) {
  MsgAst ast;
  MsgError err;
  REQUIRE(MsgParser::parse(src, ast, err));
  return ast;
}

std::string render_ok(const std::string& src, const MsgValues<std::string>& values) {
  std::string out;
  MsgError err;
  REQUIRE(render_message(src, values, out, err));
  REQUIRE(err.ok());
  return out;
}

// Stellvertreter für ein UI-Element, das Kinder einpackt
struct Link {
  std::string href;
  std::string label;
};

std::ostream& operator<<(std::ostream& os, const Link& l) {
  return os << "[" << l.label << "](" << l.href << ")";
}
} // namespace

TEST_CASE("Formatter - plain text round trip", "[formatter]") {
  const std::string s = "Nothing to substitute here.";
  REQUIRE(render_ok(s, {}) == s);
}

TEST_CASE("Formatter - tag with function value wraps children", "[formatter]") {
  MsgValues<std::string> values = {
    { "b", [](const std::string& children) { return "<" + children + ">"; } },
  };
  REQUIRE(render_ok("a <b>c</b> d", values) == "a <c> d");
}

TEST_CASE("Formatter - tag with text value replaces children", "[formatter]") {
  MsgValues<std::string> values = { { "b", "REPLACED" } };
  REQUIRE(render_ok("a <b>c</b> d", values) == "a REPLACED d");
}

TEST_CASE("Formatter - placeholders take text and numbers", "[formatter]") {
  MsgValues<std::string> values = {
    { "name", "Alice" },
    { "count", 42 },
    { "ratio", 2.5 },
    { "big", 1234567890123LL },
  };
  REQUIRE(render_ok("%name% has %count% items, %ratio%x, %big%", values) ==
          "Alice has 42 items, 2.5x, 1234567890123");
}

TEST_CASE("Formatter - large unsigned values do not wrap", "[formatter]") {
  MsgValues<std::string> values = {
    { "max", std::numeric_limits<unsigned long long>::max() },
    { "size", (unsigned long)4000000000ul },
  };
  REQUIRE(render_ok("%max% / %size%", values) == "18446744073709551615 / 4000000000");
}

TEST_CASE("Formatter - real numbers render without trailing zeros", "[formatter]") {
  REQUIRE(msg_real_to_text(3.0) == "3");
  REQUIRE(msg_real_to_text(0.1) == "0.1");
  REQUIRE(msg_real_to_text(-12.75) == "-12.75");
}

TEST_CASE("Formatter - void tag value", "[formatter]") {
  MsgValues<std::string> values = { { "br", "\n" } };
  REQUIRE(render_ok("one<br/>two", values) == "one\ntwo");
}

TEST_CASE("Formatter - void tag with function gets empty children", "[formatter]") {
  std::string seen = "unset";
  MsgValues<std::string> values = {
    { "hr", [&seen](const std::string& children) { seen = children; return std::string("----"); } },
  };
  REQUIRE(render_ok("a<hr/>b", values) == "a----b");
  REQUIRE(seen.empty());
}

TEST_CASE("Formatter - nested tags render inside out", "[formatter]") {
  MsgValues<std::string> values = {
    { "a", [](const std::string& c) { return "[" + c + "]"; } },
    { "b", [](const std::string& c) { return "*" + c + "*"; } },
    { "n", 7 },
  };
  REQUIRE(render_ok("<a>x <b>y %n%</b></a>!", values) == "[x *y 7*]!");
}

TEST_CASE("Formatter - missing placeholder value fails", "[formatter]") {
  std::string out = "stale";
  MsgError err;
  REQUIRE_FALSE(render_message("%x%", {}, out, err));
  REQUIRE(err.code == MsgErrorCode::MISSING_VALUE);
  REQUIRE(err.detail == "x");
  REQUIRE(err.message.find("x") != std::string::npos);
  REQUIRE(out.empty());
}

TEST_CASE("Formatter - missing tag value fails even with children", "[formatter]") {
  MsgValues<std::string> values = { { "n", 1 } };
  std::string out;
  MsgError err;
  REQUIRE_FALSE(render_message("<link>%n%</link>", values, out, err));
  REQUIRE(err.code == MsgErrorCode::MISSING_VALUE);
  REQUIRE(err.detail == "link");
}

TEST_CASE("Formatter - missing value inside a tag is reported", "[formatter]") {
  MsgValues<std::string> values = { { "b", "x" } };
  std::string out;
  MsgError err;
  REQUIRE_FALSE(render_message("<b>%inner%</b>", values, out, err));
  REQUIRE(err.detail == "inner");
}

TEST_CASE("Formatter - non-string results are kept as parts", "[formatter]") {
  const MsgAst ast = parse_ok("See <link>the docs</link> for %what%.");
  MsgValues<Link> values = {
    { "link", [](const std::string& children) { return Link{ "https://example.org", children }; } },
    { "what", "details" },
  };

  MsgFormatter<Link>::Parts parts;
  MsgError err;
  REQUIRE(MsgFormatter<Link>::format(ast, values, parts, err));
  REQUIRE(parts.size() == 5);
  REQUIRE(parts[0].is_text());
  REQUIRE(parts[0].text() == "See ");
  REQUIRE_FALSE(parts[1].is_text());
  REQUIRE(parts[1].value().label == "the docs");
  REQUIRE(parts[1].value().href == "https://example.org");
  REQUIRE(parts[3].text() == "details");
  REQUIRE(parts[4].text() == ".");
}

TEST_CASE("Formatter - nested non-string results are stringified for the parent", "[formatter]") {
  const MsgAst ast = parse_ok("<outer><inner>x</inner></outer>");
  MsgValues<Link> values = {
    { "inner", [](const std::string& c) { return Link{ "u", c }; } },
    { "outer", [](const std::string& c) { return Link{ "v", c }; } },
  };

  MsgFormatter<Link>::Parts parts;
  MsgError err;
  REQUIRE(MsgFormatter<Link>::format(ast, values, parts, err));
  REQUIRE(parts.size() == 1);
  REQUIRE(parts[0].value().label == "[x](u)");
}
