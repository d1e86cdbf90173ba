#include "markup/sanitizer.hpp"
#include "markup/protector.hpp"

#include <algorithm>
#include <utility>

namespace markguard {

namespace {

size_t count_outside_tokens(const std::string& text, char marker) {
    size_t count = 0;
    size_t i = 0;
    while (i < text.size()) {
        size_t skip = EntityProtector::token_end(text, i);
        if (skip != i) {
            i = skip;
            continue;
        }
        if (text[i] == marker) count++;
        i++;
    }
    return count;
}

// Keeps [..](..) candidates verbatim and drops every other bracket
std::string strip_orphan_brackets(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        char ch = text[i];
        if (ch == '[') {
            size_t close = text.find(']', i + 1);
            if (close != std::string::npos && close + 1 < text.size() && text[close + 1] == '(') {
                size_t paren = text.find(')', close + 2);
                if (paren != std::string::npos) {
                    out.append(text, i, paren + 1 - i);
                    i = paren + 1;
                    continue;
                }
            }
            i++;
            continue;
        }
        if (ch == ']') {
            i++;
            continue;
        }
        out += ch;
        i++;
    }
    return out;
}

std::string close_unbalanced(const std::string& text, char marker) {
    if (count_outside_tokens(text, marker) % 2 == 0) return text;
    return text + marker;
}

// One round of repairs over scrubbed text
std::string repair(const std::string& input) {
    std::string text = input;
    const auto& p = patterns();
    EntityProtector protector;

    text = protector.protect(text, p.code_block, SpanKind::CodeBlock);
    if (text.find("```") != std::string::npos) {
        text += "\n```";
        text = protector.protect(text, p.code_block, SpanKind::CodeBlock);
    }

    text = protector.protect(text, p.inline_code, SpanKind::InlineCode);
    if (count_outside_tokens(text, '`') % 2 != 0) {
        text += '`';
        text = protector.protect(text, p.inline_code, SpanKind::InlineCode);
    }

    text = protector.protect(text, p.link, SpanKind::Link);
    text = strip_orphan_brackets(text);

    text = close_unbalanced(text, '*');
    text = close_unbalanced(text, '_');

    return protector.restore(text);
}

// A closing backtick appended after "``", or a bracket dropped between
// backticks, forms a new fence that only the next round sees. Rounds repeat
// until one changes nothing. Only brackets and backticks start a new round,
// so their count plus two bounds the rounds needed.
size_t max_repair_rounds(const std::string& text) {
    return 2 + static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return c == '[' || c == ']' || c == '`';
    }));
}

} // namespace

std::string sanitize_markdown(const std::string& input) {
    std::string text = EntityProtector::scrub(input);
    if (text.empty()) return text;

    size_t max_rounds = max_repair_rounds(text);
    for (size_t round = 0; round < max_rounds; round++) {
        std::string next = repair(text);
        if (next == text) break;
        text = std::move(next);
    }
    return text;
}

} // namespace markguard
