#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace markguard {

// Bot API parse_mode values
enum class ParseMode {
    None,
    Markdown,   // legacy toggle-style Markdown
    MarkdownV2,
    Html,
};

// "" for None, otherwise the Bot API spelling ("Markdown", "HTML", ...)
std::string parse_mode_name(ParseMode mode);

// Case-insensitive; "" and "none" map to ParseMode::None
std::optional<ParseMode> parse_mode_from_name(const std::string& name);

struct SendOptions {
    ParseMode parse_mode = ParseMode::None;
    bool disable_web_page_preview = false;
    std::optional<int64_t> reply_to_message_id;
};

struct SendResult {
    bool ok = false;
    int64_t message_id = 0;
    long status_code = 0;
    std::string description; // error text from the API, if any
};

// Outbound side of a messaging transport
class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    virtual SendResult send_message(const std::string& chat_id, const std::string& text,
                                    const SendOptions& options) = 0;

    virtual SendResult edit_message_text(const std::string& chat_id, int64_t message_id,
                                         const std::string& text,
                                         const SendOptions& options) = 0;
};

} // namespace markguard
