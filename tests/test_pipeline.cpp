#include <catch2/catch.hpp>
#include "pipeline.hpp"
#include "util.hpp"
#include "mock_transport.hpp"

using namespace markguard;

using Chunks = std::vector<std::string>;

// ── prepare_*_parts ──────────────────────────────────────────────

TEST_CASE("prepare_html_parts: converts then splits", "[pipeline]") {
    REQUIRE(prepare_html_parts("**a** & b") == Chunks{"<b>a</b> &amp; b"});
}

TEST_CASE("prepare_html_parts: split happens before conversion", "[pipeline]") {
    auto parts = prepare_html_parts("**aaaa**\n\n**bbbb**", 12);
    REQUIRE(parts == Chunks{"<b>aaaa</b>", "<b>bbbb</b>"});
}

// Every '<' opens a tag we emit and every '&' starts an entity we emit
static bool whole_tags_and_entities(const std::string& html) {
    static const char* tokens[] = {"<b>", "</b>", "<i>", "</i>", "<code>", "</code>",
                                   "<pre>", "</pre>", "</a>", "<a href=\"",
                                   "&amp;", "&lt;", "&gt;", "&quot;"};
    for (size_t i = 0; i < html.size(); i++) {
        if (html[i] == '>') return false;
        if (html[i] != '<' && html[i] != '&') continue;
        size_t len = 0;
        for (const char* tok : tokens) {
            std::string t(tok);
            if (html.compare(i, t.size(), t) == 0) {
                len = t.size();
                break;
            }
        }
        if (len == 0) return false;
        if (html.compare(i, 9, "<a href=\"") == 0) {
            size_t close = html.find("\">", i + len);
            if (close == std::string::npos) return false;
            len = close + 2 - i;
        }
        i += len - 1;
    }
    return true;
}

TEST_CASE("prepare_html_parts: long link never cut inside a tag", "[pipeline]") {
    auto parts = prepare_html_parts("[aaaa bbbb cccc](http://example.com/x)", 10);
    REQUIRE(parts.size() > 1);
    for (const auto& p : parts) {
        INFO("part: " << p);
        REQUIRE(whole_tags_and_entities(p));
    }
}

TEST_CASE("prepare_html_parts: escaped ampersands never cut", "[pipeline]") {
    auto parts = prepare_html_parts("xxxxxxxxxxxxxxxxxxx&&&&&&&&&&", 12);
    REQUIRE(parts.size() > 1);
    std::string joined;
    for (const auto& p : parts) {
        INFO("part: " << p);
        REQUIRE(whole_tags_and_entities(p));
        joined += p;
    }
    REQUIRE(joined == "xxxxxxxxxxxxxxxxxxx&amp;&amp;&amp;&amp;&amp;&amp;&amp;&amp;&amp;&amp;");
}

TEST_CASE("prepare_markdown_parts: same as prepare_html_parts", "[pipeline]") {
    std::string text = "*x* `y` [z](http://z)";
    REQUIRE(prepare_markdown_parts(text) == prepare_html_parts(text));
}

TEST_CASE("prepare_parts: short text is one sanitized part", "[pipeline]") {
    REQUIRE(prepare_parts("Hello *world", 100, OutputFormat::Markdown) ==
            Chunks{"Hello *world*"});
    REQUIRE(prepare_parts("Hello *world", 100, OutputFormat::Html) ==
            Chunks{"Hello <b>world</b>"});
}

TEST_CASE("prepare_parts: each chunk repaired after split", "[pipeline]") {
    std::string text = "*start of bold\n\nsecond para*";
    REQUIRE(prepare_parts(text, 16, OutputFormat::Markdown) ==
            Chunks{"*start of bold*", "second para**"});
    REQUIRE(prepare_parts(text, 16, OutputFormat::Html) ==
            Chunks{"<b>start of bold</b>", "second para**"});
}

// ── deliver ──────────────────────────────────────────────────────

TEST_CASE("deliver: blank text sends nothing", "[pipeline]") {
    MockTransport t;
    REQUIRE(deliver(t, "42", "  \n ").empty());
    REQUIRE(t.calls.empty());
}

TEST_CASE("deliver: sends HTML with parse mode", "[pipeline]") {
    MockTransport t;
    auto results = deliver(t, "42", "Hello *world");

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].ok);
    REQUIRE(t.calls.size() == 1);
    REQUIRE(t.calls[0].method == "sendMessage");
    REQUIRE(t.calls[0].chat_id == "42");
    REQUIRE(t.calls[0].text == "Hello <b>world</b>");
    REQUIRE(t.calls[0].options.parse_mode == ParseMode::Html);
}

TEST_CASE("deliver: one message per part, reply only on first", "[pipeline]") {
    MockTransport t;
    t.result_queue = {{true, 10, 200, ""}, {true, 11, 200, ""}};

    DeliveryOptions opts;
    opts.max_len = 16;
    opts.reply_to_message_id = 7;
    opts.disable_web_page_preview = true;
    auto results = deliver(t, "42", "*start of bold\n\nsecond para*", opts);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].message_id == 10);
    REQUIRE(results[1].message_id == 11);
    REQUIRE(t.calls.size() == 2);
    REQUIRE(t.calls[0].text == "<b>start of bold</b>");
    REQUIRE(t.calls[0].options.reply_to_message_id == 7);
    REQUIRE_FALSE(t.calls[1].options.reply_to_message_id.has_value());
    REQUIRE(t.calls[1].options.disable_web_page_preview);
}

TEST_CASE("deliver: rejected part resent as plain text", "[pipeline]") {
    MockTransport t;
    t.result_queue = {{false, 0, 400, "Bad Request: can't parse entities"},
                      {true, 5, 200, ""}};

    auto results = deliver(t, "42", "Hello *world");

    REQUIRE(t.calls.size() == 2);
    REQUIRE(t.calls[1].options.parse_mode == ParseMode::None);
    REQUIRE(t.calls[1].text == "Hello *world*");
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].ok);
    REQUIRE(results[0].message_id == 5);
}

TEST_CASE("deliver: failure of the fallback is reported", "[pipeline]") {
    MockTransport t;
    t.next_result = {false, 0, 403, "Forbidden: bot was blocked by the user"};

    auto results = deliver(t, "42", "hi");

    REQUIRE(t.calls.size() == 2);
    REQUIRE(results.size() == 1);
    REQUIRE_FALSE(results[0].ok);
    REQUIRE(results[0].status_code == 403);
}

TEST_CASE("deliver: oversized code block still sent", "[pipeline]") {
    MockTransport t;
    DeliveryOptions opts;
    opts.max_len = 10;
    auto results = deliver(t, "42", "```\nlong code line\n```", opts);

    REQUIRE(results.size() == 1);
    REQUIRE(t.calls[0].text == "<pre>long code line\n</pre>");
    REQUIRE(utf16_length(t.calls[0].text) > 10);
}
