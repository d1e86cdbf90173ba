#pragma once
#include <string>

namespace markguard {

// Repair markup for Telegram's legacy Markdown parser, which treats *, _ and
// ` as toggles and rejects a message with an unclosed entity.
//
// Closes an unterminated ``` fence and an unpaired backtick, drops brackets
// that are not part of a [label](url) link, and makes the number of * and _
// outside code even by appending the missing marker at the end. Code spans
// and links are never altered. The result of a second pass is unchanged.
std::string sanitize_markdown(const std::string& text);

} // namespace markguard
