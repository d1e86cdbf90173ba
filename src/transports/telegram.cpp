#include "transports/telegram.hpp"
#include <iostream>
#include <stdexcept>

namespace markguard {

TelegramTransport::TelegramTransport(const TelegramConfig& config, HttpClient& http)
    : config_(config), http_(http)
{}

std::unique_ptr<TelegramTransport> TelegramTransport::from_config(const Config& config,
                                                                  HttpClient& http) {
    auto tc = config.transport_config("telegram");
    if (!tc.contains("bot_token") || !tc["bot_token"].is_string() ||
        tc["bot_token"].get<std::string>().empty()) {
        throw std::runtime_error("Telegram bot_token not configured");
    }
    TelegramConfig tg;
    tg.bot_token = tc["bot_token"].get<std::string>();
    tg.api_base_url = tc.value("api_base_url", std::string{"https://api.telegram.org"});
    tg.timeout_seconds = tc.value("timeout_seconds", 30L);
    tg.disable_web_page_preview = tc.value("disable_web_page_preview", false);
    return std::make_unique<TelegramTransport>(tg, http);
}

std::string TelegramTransport::api_url(const std::string& method) const {
    std::string base = config_.api_base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/bot" + config_.bot_token + "/" + method;
}

bool TelegramTransport::health_check() {
    auto resp = http_.post(api_url("getMe"), "",
                           {{"Content-Type", "application/json"}}, 10);
    return parse_response(resp).ok;
}

SendResult TelegramTransport::parse_response(const HttpResponse& resp) {
    SendResult result;
    result.status_code = resp.status_code;
    if (resp.status_code == 0) {
        result.description = "no response";
        return result;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error&) {
        result.description = "invalid JSON response";
        return result;
    }
    if (!j.is_object()) {
        result.description = "unexpected response";
        return result;
    }

    result.ok = resp.status_code == 200 && j.value("ok", false);
    if (j.contains("description") && j["description"].is_string())
        result.description = j["description"].get<std::string>();

    // editMessageText on inline messages returns `true` instead of a Message
    if (j.contains("result") && j["result"].is_object()) {
        const auto& msg = j["result"];
        if (msg.contains("message_id") && msg["message_id"].is_number_integer())
            result.message_id = msg["message_id"].get<int64_t>();
    }
    return result;
}

SendResult TelegramTransport::call(const std::string& method, nlohmann::json body,
                                   const SendOptions& options) {
    std::string mode = parse_mode_name(options.parse_mode);
    if (!mode.empty()) body["parse_mode"] = mode;
    if (options.disable_web_page_preview || config_.disable_web_page_preview)
        body["disable_web_page_preview"] = true;
    if (options.reply_to_message_id)
        body["reply_to_message_id"] = *options.reply_to_message_id;

    // Invalid UTF-8 in the text must not abort the send
    std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto resp = http_.post(api_url(method), payload,
                           {{"Content-Type", "application/json"}}, config_.timeout_seconds);

    SendResult result = parse_response(resp);
    if (!result.ok) {
        std::cerr << "[telegram] Warning: " << method << " failed (HTTP "
                  << result.status_code << "): " << result.description << "\n";
    }
    return result;
}

SendResult TelegramTransport::send_message(const std::string& chat_id, const std::string& text,
                                           const SendOptions& options) {
    nlohmann::json body = {
        {"chat_id", chat_id},
        {"text", text}
    };
    return call("sendMessage", std::move(body), options);
}

SendResult TelegramTransport::edit_message_text(const std::string& chat_id, int64_t message_id,
                                                const std::string& text,
                                                const SendOptions& options) {
    nlohmann::json body = {
        {"chat_id", chat_id},
        {"message_id", message_id},
        {"text", text}
    };
    SendResult result = call("editMessageText", std::move(body), options);
    if (result.ok && result.message_id == 0) result.message_id = message_id;
    return result;
}

} // namespace markguard
