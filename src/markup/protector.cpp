#include "markup/protector.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace markguard {

std::string EntityProtector::scrub(const std::string& text) {
    if (text.find_first_of(std::string{SENTINEL, TERMINATOR}) == std::string::npos) return text;
    std::string out;
    out.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(out),
                 [](char c) { return c != SENTINEL && c != TERMINATOR; });
    return out;
}

std::string EntityProtector::token(size_t index) {
    std::string t(1, SENTINEL);
    t += std::to_string(index);
    t += TERMINATOR;
    return t;
}

size_t EntityProtector::token_end(const std::string& text, size_t pos) {
    if (pos >= text.size() || text[pos] != SENTINEL) return pos;
    size_t i = pos + 1;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) i++;
    if (i == pos + 1 || i >= text.size() || text[i] != TERMINATOR) return pos;
    return i + 1;
}

std::string EntityProtector::mask_within(const std::string& text, const Pattern& pattern,
                                         const std::string& needle, const std::string& mask) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (auto m = pattern.find(text, pos)) {
        out.append(text, pos, m->begin - pos);
        out += replace_all(text.substr(m->begin, m->end - m->begin), needle, mask);
        pos = m->end;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

std::string EntityProtector::protect(const std::string& text, const Pattern& pattern,
                                     SpanKind kind) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (auto m = pattern.find(text, pos)) {
        out.append(text, pos, m->begin - pos);
        out += token(spans_.size());
        spans_.push_back({kind, text.substr(m->begin, m->end - m->begin), std::move(m->groups)});
        pos = m->end;
    }
    if (pos == 0) return text;
    out.append(text, pos, std::string::npos);
    return out;
}

std::string EntityProtector::restore(const std::string& text) const {
    return restore(text, [](const ProtectedSpan& span) { return span.raw; });
}

std::string EntityProtector::restore(const std::string& text, const SpanRenderer& render) const {
    std::string out = text;
    for (size_t i = spans_.size(); i-- > 0;) {
        std::string tok = token(i);
        size_t pos = out.find(tok);
        if (pos == std::string::npos) continue;
        out.replace(pos, tok.size(), render(spans_[i]));
    }
    return out;
}

} // namespace markguard
