#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace markguard {

// Telegram rejects messages over 4096 UTF-16 code units; keep headroom
// for entity overhead.
constexpr size_t HARD_MESSAGE_LIMIT = 4096;
constexpr size_t MAX_MESSAGE_LEN = 4000;

constexpr const char* DEFAULT_TRUNCATE_SUFFIX = "\n\n... (truncated)";

// Split text into chunks of at most max_len UTF-16 code units, preferring
// paragraph, then line, then word boundaries, and hard-cutting only words
// that are longer than max_len. Works on raw Markdown (``` blocks) and on
// Telegram HTML (<pre> blocks): a code block is never cut, a paragraph
// holding one is sent whole even when it is over max_len.
// Throws std::invalid_argument if max_len is 0.
std::vector<std::string> split_message_safe(const std::string& text,
                                            size_t max_len = MAX_MESSAGE_LEN);

// Cut at the last paragraph, line or word boundary that leaves room for
// `suffix`, then append it. Text that already fits is returned unchanged.
std::string truncate_safe(const std::string& text, size_t max_len = MAX_MESSAGE_LEN,
                          const std::string& suffix = DEFAULT_TRUNCATE_SUFFIX);

} // namespace markguard
