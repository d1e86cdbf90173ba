#include "markup/pattern.hpp"

#include <cctype>
#include <utility>

namespace markguard {

// ── FencePattern ────────────────────────────────────────────────

FencePattern::FencePattern(std::string name, std::string open, std::string close, bool skip_info)
    : name_(std::move(name)), open_(std::move(open)), close_(std::move(close)),
      skip_info_(skip_info)
{}

std::optional<PatternMatch> FencePattern::find(const std::string& text, size_t from) const {
    size_t open = text.find(open_, from);
    if (open == std::string::npos) return std::nullopt;

    // The first opener has the most room; if it has no closer, none do.
    size_t body = open + open_.size();
    size_t close = text.find(close_, body);
    if (close == std::string::npos) return std::nullopt;

    if (skip_info_) {
        size_t i = body;
        while (i < text.size() &&
               (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '_')) {
            i++;
        }
        if (i < text.size() && text[i] == '\n' && i < close) {
            body = i + 1;
        }
    }

    PatternMatch m;
    m.begin = open;
    m.end = close + close_.size();
    m.groups.push_back(text.substr(body, close - body));
    return m;
}

// ── InlineCodePattern ───────────────────────────────────────────

std::optional<PatternMatch> InlineCodePattern::find(const std::string& text, size_t from) const {
    size_t i = text.find('`', from);
    while (i != std::string::npos) {
        if (i + 1 < text.size() && text[i + 1] != '`') {
            size_t close = text.find('`', i + 1);
            if (close == std::string::npos) return std::nullopt;
            PatternMatch m;
            m.begin = i;
            m.end = close + 1;
            m.groups.push_back(text.substr(i + 1, close - i - 1));
            return m;
        }
        i = text.find('`', i + 1);
    }
    return std::nullopt;
}

// ── LinkPattern ─────────────────────────────────────────────────

std::optional<PatternMatch> LinkPattern::find(const std::string& text, size_t from) const {
    size_t i = text.find('[', from);
    while (i != std::string::npos) {
        size_t close = text.find(']', i + 1);
        if (close == std::string::npos) return std::nullopt;
        if (close > i + 1 && close + 1 < text.size() && text[close + 1] == '(') {
            size_t paren = text.find(')', close + 2);
            if (paren == std::string::npos) return std::nullopt;
            if (paren > close + 2) {
                PatternMatch m;
                m.begin = i;
                m.end = paren + 1;
                m.groups.push_back(text.substr(i + 1, close - i - 1));
                m.groups.push_back(text.substr(close + 2, paren - close - 2));
                return m;
            }
        }
        i = text.find('[', i + 1);
    }
    return std::nullopt;
}

// ── DelimitedPattern ────────────────────────────────────────────

DelimitedPattern::DelimitedPattern(std::string name, std::string delim)
    : name_(std::move(name)), delim_(std::move(delim))
{}

std::optional<PatternMatch> DelimitedPattern::find(const std::string& text, size_t from) const {
    const size_t d = delim_.size();
    size_t i = text.find(delim_, from);
    while (i != std::string::npos) {
        size_t body = i + d;
        size_t close = text.find(delim_, body + 1);
        if (close == std::string::npos) return std::nullopt;
        size_t nl = text.find('\n', body);
        if (nl == std::string::npos || nl >= close) {
            PatternMatch m;
            m.begin = i;
            m.end = close + d;
            m.groups.push_back(text.substr(body, close - body));
            return m;
        }
        i = text.find(delim_, i + 1);
    }
    return std::nullopt;
}

const PatternSet& patterns() {
    static const PatternSet set;
    return set;
}

} // namespace markguard
