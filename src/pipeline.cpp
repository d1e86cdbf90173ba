#include "pipeline.hpp"
#include "markup/converter.hpp"
#include "markup/sanitizer.hpp"
#include "util.hpp"

#include <iostream>

namespace markguard {

static std::vector<std::string> sanitized_chunks(const std::string& text, size_t max_len) {
    std::string clean = sanitize_markdown(text);
    if (utf16_length(clean) <= max_len) return {clean};

    // Cutting between paragraphs can strand a marker; repair each side
    std::vector<std::string> chunks = split_message_safe(clean, max_len);
    for (auto& chunk : chunks) chunk = sanitize_markdown(chunk);
    return chunks;
}

std::vector<std::string> prepare_parts(const std::string& text, size_t max_len,
                                       OutputFormat format) {
    std::vector<std::string> chunks = sanitized_chunks(text, max_len);
    if (format == OutputFormat::Html) {
        for (auto& chunk : chunks) chunk = markdown_to_html(chunk);
    }
    return chunks;
}

// Split before converting, so no cut lands inside a tag or an entity
std::vector<std::string> prepare_html_parts(const std::string& text, size_t max_len) {
    return prepare_parts(text, max_len, OutputFormat::Html);
}

std::vector<std::string> prepare_markdown_parts(const std::string& text, size_t max_len) {
    return prepare_html_parts(text, max_len);
}

std::vector<SendResult> deliver(MessageTransport& transport, const std::string& chat_id,
                                const std::string& text, const DeliveryOptions& options) {
    std::vector<SendResult> results;
    if (trim(text).empty()) return results;

    std::vector<std::string> chunks = sanitized_chunks(text, options.max_len);

    for (size_t i = 0; i < chunks.size(); i++) {
        const std::string& chunk = chunks[i];
        size_t len = utf16_length(chunk);
        if (len > options.max_len) {
            std::cerr << "[deliver] Warning: part " << (i + 1) << "/" << chunks.size()
                      << " exceeds max_len (" << len << " > " << options.max_len
                      << "), sending unsplit code block\n";
        }

        SendOptions send_opts;
        send_opts.parse_mode = ParseMode::Html;
        send_opts.disable_web_page_preview = options.disable_web_page_preview;
        if (i == 0) send_opts.reply_to_message_id = options.reply_to_message_id;

        SendResult result = transport.send_message(chat_id, markdown_to_html(chunk), send_opts);

        // If HTML fails, fall back to plain text
        if (!result.ok) {
            std::cerr << "[deliver] Warning: part " << (i + 1) << "/" << chunks.size()
                      << " rejected as HTML, resending as plain text\n";
            send_opts.parse_mode = ParseMode::None;
            result = transport.send_message(chat_id, chunk, send_opts);
        }
        results.push_back(std::move(result));
    }
    return results;
}

} // namespace markguard
