#include "transports/safe_transport.hpp"
#include "markup/converter.hpp"

namespace markguard {

std::pair<std::string, SendOptions> SafeTransport::intercept(const std::string& text,
                                                             const SendOptions& options) {
    if (options.parse_mode != ParseMode::Markdown) return {text, options};
    SendOptions rewritten = options;
    rewritten.parse_mode = ParseMode::Html;
    return {markdown_to_html(text), rewritten};
}

SendResult SafeTransport::send_message(const std::string& chat_id, const std::string& text,
                                       const SendOptions& options) {
    auto [payload, opts] = intercept(text, options);
    return inner_.send_message(chat_id, payload, opts);
}

SendResult SafeTransport::edit_message_text(const std::string& chat_id, int64_t message_id,
                                            const std::string& text,
                                            const SendOptions& options) {
    auto [payload, opts] = intercept(text, options);
    return inner_.edit_message_text(chat_id, message_id, payload, opts);
}

} // namespace markguard
