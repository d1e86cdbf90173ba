#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace markguard {

struct PatternMatch {
    size_t begin = 0;
    size_t end = 0;                  // one past the last matched byte
    std::vector<std::string> groups; // pattern-specific captures
};

// A span matcher. Implementations are immutable and safe to share
// between threads.
class Pattern {
public:
    virtual ~Pattern() = default;

    virtual std::string name() const = 0;

    // Leftmost match starting at or after `from`
    virtual std::optional<PatternMatch> find(const std::string& text, size_t from) const = 0;
};

// `open` ... `close`, shortest body, may span lines.
// With skip_info, an optional word-character info line right after `open`
// ("```python\n") is matched but kept out of the body group.
class FencePattern : public Pattern {
public:
    FencePattern(std::string name, std::string open, std::string close, bool skip_info = false);

    std::string name() const override { return name_; }
    std::optional<PatternMatch> find(const std::string& text, size_t from) const override;

private:
    std::string name_;
    std::string open_;
    std::string close_;
    bool skip_info_;
};

// `body` with one or more non-backtick characters
class InlineCodePattern : public Pattern {
public:
    std::string name() const override { return "inline_code"; }
    std::optional<PatternMatch> find(const std::string& text, size_t from) const override;
};

// [label](url); groups are {label, url}
class LinkPattern : public Pattern {
public:
    std::string name() const override { return "link"; }
    std::optional<PatternMatch> find(const std::string& text, size_t from) const override;
};

// delim + one or more characters without a newline + delim, shortest body
class DelimitedPattern : public Pattern {
public:
    DelimitedPattern(std::string name, std::string delim);

    std::string name() const override { return name_; }
    std::optional<PatternMatch> find(const std::string& text, size_t from) const override;

private:
    std::string name_;
    std::string delim_;
};

struct PatternSet {
    FencePattern code_block{"code_block", "```", "```"};
    FencePattern code_block_with_info{"code_block_with_info", "```", "```", true};
    FencePattern pre_block{"pre_block", "<pre>", "</pre>"};
    InlineCodePattern inline_code;
    LinkPattern link;
    DelimitedPattern bold_double{"bold_double", "**"};
    DelimitedPattern bold_single{"bold_single", "*"};
    DelimitedPattern italic{"italic", "_"};
};

// Process-wide pattern set, built on first use and read-only afterwards
const PatternSet& patterns();

} // namespace markguard
