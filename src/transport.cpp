#include "transport.hpp"

#include <algorithm>
#include <cctype>

namespace markguard {

std::string parse_mode_name(ParseMode mode) {
    switch (mode) {
        case ParseMode::None: return "";
        case ParseMode::Markdown: return "Markdown";
        case ParseMode::MarkdownV2: return "MarkdownV2";
        case ParseMode::Html: return "HTML";
    }
    return "";
}

std::optional<ParseMode> parse_mode_from_name(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower.empty() || lower == "none") return ParseMode::None;
    if (lower == "markdown") return ParseMode::Markdown;
    if (lower == "markdownv2") return ParseMode::MarkdownV2;
    if (lower == "html") return ParseMode::Html;
    return std::nullopt;
}

} // namespace markguard
