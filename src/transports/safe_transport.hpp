#pragma once
#include "../transport.hpp"
#include <string>
#include <utility>

namespace markguard {

// Transport-level Markdown -> HTML intercept.
//
// Legacy Markdown fails hard on unbalanced entities ("can't parse entities"),
// HTML does not: anything that is not a tag we emit is escaped. Requests
// with ParseMode::Markdown are converted with markdown_to_html() and sent
// as ParseMode::Html; every other mode passes through untouched.
// Stateless; errors from the wrapped transport are returned as-is.
class SafeTransport : public MessageTransport {
public:
    explicit SafeTransport(MessageTransport& inner) : inner_(inner) {}

    SendResult send_message(const std::string& chat_id, const std::string& text,
                            const SendOptions& options) override;

    SendResult edit_message_text(const std::string& chat_id, int64_t message_id,
                                 const std::string& text,
                                 const SendOptions& options) override;

    // The rewrite applied to every outgoing payload
    static std::pair<std::string, SendOptions> intercept(const std::string& text,
                                                         const SendOptions& options);

private:
    MessageTransport& inner_;
};

} // namespace markguard
