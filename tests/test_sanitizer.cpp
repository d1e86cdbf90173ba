#include <catch2/catch.hpp>
#include "markup/sanitizer.hpp"

using namespace markguard;

// ── Unbalanced emphasis ──────────────────────────────────────────

TEST_CASE("sanitize_markdown: closes dangling bold marker", "[sanitizer]") {
    REQUIRE(sanitize_markdown("Hello *world") == "Hello *world*");
}

TEST_CASE("sanitize_markdown: closes dangling italic marker", "[sanitizer]") {
    REQUIRE(sanitize_markdown("a_b_c_") == "a_b_c__");
}

TEST_CASE("sanitize_markdown: balanced text unchanged", "[sanitizer]") {
    REQUIRE(sanitize_markdown("*bold* and _it_") == "*bold* and _it_");
    REQUIRE(sanitize_markdown("plain text") == "plain text");
}

TEST_CASE("sanitize_markdown: closes both markers, asterisk first", "[sanitizer]") {
    REQUIRE(sanitize_markdown("_*x") == "_*x*_");
}

// ── Code ─────────────────────────────────────────────────────────

TEST_CASE("sanitize_markdown: closes unterminated fence", "[sanitizer]") {
    REQUIRE(sanitize_markdown("```\ncode\nopen") == "```\ncode\nopen\n```");
    REQUIRE(sanitize_markdown("```a") == "```a\n```");
}

TEST_CASE("sanitize_markdown: markers inside code are not counted", "[sanitizer]") {
    REQUIRE(sanitize_markdown("```\n*x_\n```") == "```\n*x_\n```");
    REQUIRE(sanitize_markdown("`code *` and *x") == "`code *` and *x*");
}

TEST_CASE("sanitize_markdown: fence formed by a closing backtick is closed too", "[sanitizer]") {
    REQUIRE(sanitize_markdown("`x ``") == "`x ```\n````");
}

TEST_CASE("sanitize_markdown: closes dangling backtick", "[sanitizer]") {
    REQUIRE(sanitize_markdown("run `ls") == "run `ls`");
    REQUIRE(sanitize_markdown("a`") == "a``");
}

// ── Brackets ─────────────────────────────────────────────────────

TEST_CASE("sanitize_markdown: unterminated link loses its brackets", "[sanitizer]") {
    REQUIRE(sanitize_markdown("[text](url") == "text(url");
    REQUIRE(sanitize_markdown("[x") == "x");
}

TEST_CASE("sanitize_markdown: bare bracket pairs removed", "[sanitizer]") {
    REQUIRE(sanitize_markdown("see [note] here") == "see note here");
}

TEST_CASE("sanitize_markdown: complete links kept", "[sanitizer]") {
    REQUIRE(sanitize_markdown("[a](b) and [c") == "[a](b) and c");
    REQUIRE(sanitize_markdown("[a_b](u_v) *") == "[a_b](u_v) **");
}

// ── Edge cases ───────────────────────────────────────────────────

TEST_CASE("sanitize_markdown: empty input", "[sanitizer]") {
    REQUIRE(sanitize_markdown("").empty());
}

TEST_CASE("sanitize_markdown: NUL bytes are dropped", "[sanitizer]") {
    std::string in = std::string("a") + '\0' + "*b";
    REQUIRE(sanitize_markdown(in) == "a*b*");
}

TEST_CASE("sanitize_markdown: idempotent", "[sanitizer]") {
    const char* inputs[] = {
        "Hello *world",
        "_*`[",
        "a`",
        "[x",
        "```a",
        "see [note] here",
        "[a](b) and [c",
        "a_b_c_",
        "```\ncode\nopen",
        "**bold _it",
        "`x ``",
        "`]`]`",
    };
    for (const char* in : inputs) {
        std::string once = sanitize_markdown(in);
        INFO("input: " << in);
        REQUIRE(sanitize_markdown(once) == once);
    }
}

TEST_CASE("sanitize_markdown: repairs code, then emphasis", "[sanitizer]") {
    REQUIRE(sanitize_markdown("_*`[") == "_*`[`*_");
}
