#pragma once
#include "markup/pattern.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace markguard {

enum class SpanKind {
    CodeBlock,
    InlineCode,
    Link,
};

// A substring taken out of the text by EntityProtector::protect().
// `raw` may itself contain tokens of spans protected earlier.
struct ProtectedSpan {
    SpanKind kind;
    std::string raw;
    std::vector<std::string> groups;
};

using SpanRenderer = std::function<std::string(const ProtectedSpan&)>;

// Replaces pattern matches with placeholder tokens (SENTINEL index TERMINATOR)
// and puts them back later. Passes share one table, restoration walks it
// in reverse so outer spans are expanded before the tokens they contain.
// A token ends with its own terminator byte, so a token search can never
// match across two adjacent tokens.
class EntityProtector {
public:
    static constexpr char SENTINEL = '\0';
    static constexpr char TERMINATOR = '\x01';

    // Input must go through scrub() before the first protect() so that no
    // literal sentinel or terminator can be mistaken for part of a token.
    static std::string scrub(const std::string& text);

    static std::string token(size_t index);

    // Position after the token starting at `pos`, or `pos` if there is none
    static size_t token_end(const std::string& text, size_t pos);

    // Replace `needle` with `mask` inside every match of `pattern`;
    // the matches themselves stay in the text.
    static std::string mask_within(const std::string& text, const Pattern& pattern,
                                   const std::string& needle, const std::string& mask);

    std::string protect(const std::string& text, const Pattern& pattern, SpanKind kind);

    std::string restore(const std::string& text) const;

    // Tokens left in render()'s output are restored by later steps of the walk
    std::string restore(const std::string& text, const SpanRenderer& render) const;

    const std::vector<ProtectedSpan>& spans() const { return spans_; }
    size_t size() const { return spans_.size(); }

private:
    std::vector<ProtectedSpan> spans_;
};

} // namespace markguard
