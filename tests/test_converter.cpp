#include <catch2/catch.hpp>
#include "markup/converter.hpp"

using namespace markguard;

// ── Emphasis ─────────────────────────────────────────────────────

TEST_CASE("markdown_to_html: bold and single-asterisk bold", "[converter]") {
    REQUIRE(markdown_to_html("**bold** and *italic*") == "<b>bold</b> and <b>italic</b>");
}

TEST_CASE("markdown_to_html: underscore italic", "[converter]") {
    REQUIRE(markdown_to_html("an _it_ word") == "an <i>it</i> word");
}

TEST_CASE("markdown_to_html: italic nested in bold", "[converter]") {
    REQUIRE(markdown_to_html("**bold _it_**") == "<b>bold <i>it</i></b>");
}

TEST_CASE("markdown_to_html: crossing markers never produce overlapping tags", "[converter]") {
    REQUIRE(markdown_to_html("**a _b** c_") == "<b>a _b</b> c_");
}

TEST_CASE("markdown_to_html: emphasis does not span lines", "[converter]") {
    REQUIRE(markdown_to_html("*a\nb*") == "*a\nb*");
}

TEST_CASE("markdown_to_html: unmatched marker stays literal", "[converter]") {
    REQUIRE(markdown_to_html("Hello *world") == "Hello *world");
}

// ── Escaping ─────────────────────────────────────────────────────

TEST_CASE("markdown_to_html: escapes HTML metacharacters", "[converter]") {
    REQUIRE(markdown_to_html("a < b & c > d") == "a &lt; b &amp; c &gt; d");
}

TEST_CASE("markdown_to_html: raw tags in input are escaped", "[converter]") {
    REQUIRE(markdown_to_html("<b>hi</b>") == "&lt;b&gt;hi&lt;/b&gt;");
}

// ── Code ─────────────────────────────────────────────────────────

TEST_CASE("markdown_to_html: inline code is escaped, not formatted", "[converter]") {
    REQUIRE(markdown_to_html("Use `a<b>` here") == "Use <code>a&lt;b&gt;</code> here");
    REQUIRE(markdown_to_html("`[a](b)`") == "<code>[a](b)</code>");
}

TEST_CASE("markdown_to_html: code block drops info line", "[converter]") {
    REQUIRE(markdown_to_html("```python\nx = 1 < 2\n```") == "<pre>x = 1 &lt; 2\n</pre>");
}

TEST_CASE("markdown_to_html: markers inside code block are literal", "[converter]") {
    REQUIRE(markdown_to_html("```\n**x**\n```") == "<pre>**x**\n</pre>");
}

TEST_CASE("markdown_to_html: inline code inside bold", "[converter]") {
    REQUIRE(markdown_to_html("*see `x`*") == "<b>see <code>x</code></b>");
}

TEST_CASE("markdown_to_html: unterminated fence is literal", "[converter]") {
    REQUIRE(markdown_to_html("```\nopen") == "```\nopen");
}

// ── Links ────────────────────────────────────────────────────────

TEST_CASE("markdown_to_html: link with underscores in url", "[converter]") {
    REQUIRE(markdown_to_html("[docs](https://x.io/a_b_c)") ==
            "<a href=\"https://x.io/a_b_c\">docs</a>");
}

TEST_CASE("markdown_to_html: link url is attribute-escaped", "[converter]") {
    REQUIRE(markdown_to_html("[q](http://x?a=1&b=2)") ==
            "<a href=\"http://x?a=1&amp;b=2\">q</a>");
    REQUIRE(markdown_to_html("[x](a\"b)") == "<a href=\"a&quot;b\">x</a>");
}

TEST_CASE("markdown_to_html: link label gets emphasis", "[converter]") {
    REQUIRE(markdown_to_html("[**hi**](u)") == "<a href=\"u\"><b>hi</b></a>");
}

TEST_CASE("markdown_to_html: inline code as link label", "[converter]") {
    REQUIRE(markdown_to_html("[`cmd`](http://x)") ==
            "<a href=\"http://x\"><code>cmd</code></a>");
}

// ── Edge cases ───────────────────────────────────────────────────

TEST_CASE("markdown_to_html: empty input", "[converter]") {
    REQUIRE(markdown_to_html("").empty());
}

TEST_CASE("markdown_to_html: NUL bytes are dropped", "[converter]") {
    std::string in = std::string("*a") + '\0' + "*";
    REQUIRE(markdown_to_html(in) == "<b>a</b>");
}

TEST_CASE("markdown_to_html: multibyte text passes through", "[converter]") {
    std::string in = "\xd0\xbf\xd1\x80\xd0\xb8 *\xf0\x9f\x98\x80*";
    REQUIRE(markdown_to_html(in) == "\xd0\xbf\xd1\x80\xd0\xb8 <b>\xf0\x9f\x98\x80</b>");
}
