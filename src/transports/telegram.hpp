#pragma once
#include "../config.hpp"
#include "../http.hpp"
#include "../transport.hpp"
#include <memory>
#include <string>

namespace markguard {

struct TelegramConfig {
    std::string bot_token;
    std::string api_base_url = "https://api.telegram.org";
    long timeout_seconds = 30;
    bool disable_web_page_preview = false; // applied when options leave it off
};

// Telegram Bot API client for sendMessage / editMessageText.
// Payloads go out as given; wrap in SafeTransport to convert legacy Markdown.
class TelegramTransport : public MessageTransport {
public:
    TelegramTransport(const TelegramConfig& config, HttpClient& http);

    // Build from the "telegram" transport section.
    // Throws std::runtime_error when bot_token is missing.
    static std::unique_ptr<TelegramTransport> from_config(const Config& config, HttpClient& http);

    bool health_check();

    SendResult send_message(const std::string& chat_id, const std::string& text,
                            const SendOptions& options) override;

    SendResult edit_message_text(const std::string& chat_id, int64_t message_id,
                                 const std::string& text,
                                 const SendOptions& options) override;

    // Build Telegram API URL for a method
    std::string api_url(const std::string& method) const;

    // Interpret a Bot API reply; never throws
    static SendResult parse_response(const HttpResponse& resp);

private:
    SendResult call(const std::string& method, nlohmann::json body, const SendOptions& options);

    TelegramConfig config_;
    HttpClient& http_;
};

} // namespace markguard
