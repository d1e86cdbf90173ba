#pragma once
#include "split.hpp"
#include "transport.hpp"
#include <string>
#include <vector>

namespace markguard {

enum class OutputFormat {
    Markdown, // sanitized legacy Markdown, for ParseMode::Markdown
    Html,     // Telegram HTML, for ParseMode::Html
};

// Same as prepare_parts(text, max_len, OutputFormat::Html).
std::vector<std::string> prepare_html_parts(const std::string& text,
                                            size_t max_len = MAX_MESSAGE_LEN);

// Older name for prepare_html_parts(), kept for existing callers.
std::vector<std::string> prepare_markdown_parts(const std::string& text,
                                                size_t max_len = MAX_MESSAGE_LEN);

// sanitize -> split (if over max_len) -> sanitize each chunk -> convert.
// Chunks are measured before conversion; escaping may add a few units,
// which is what the safety margin below the hard limit is for.
std::vector<std::string> prepare_parts(const std::string& text, size_t max_len,
                                       OutputFormat format);

struct DeliveryOptions {
    size_t max_len = MAX_MESSAGE_LEN;
    bool disable_web_page_preview = false;
    std::optional<int64_t> reply_to_message_id; // first part only
};

// Send `text` as consecutive HTML messages. A part the API rejects is
// resent once as plain text. Returns one result per part, in order;
// blank text sends nothing.
std::vector<SendResult> deliver(MessageTransport& transport, const std::string& chat_id,
                                const std::string& text,
                                const DeliveryOptions& options = {});

} // namespace markguard
