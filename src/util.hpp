#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace markguard {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by a (possibly multi-char) separator; empty pieces are kept
std::vector<std::string> split_on(const std::string& s, const std::string& sep);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Escape &, < and > for Telegram HTML
std::string html_escape(const std::string& s);

// html_escape plus '"', for attribute values
std::string html_escape_attr(const std::string& s);

// Length in UTF-16 code units (what Telegram counts).
// Invalid UTF-8 bytes count as one unit each.
size_t utf16_length(const std::string& s);

// Number of bytes, starting at `pos`, that fit into `units` UTF-16 code units
// without cutting a UTF-8 sequence. Returns at least one code point when
// `pos` is not at the end, even if that code point alone exceeds `units`.
size_t utf8_prefix_bytes(const std::string& s, size_t pos, size_t units);

// Last occurrence of `needle` lying entirely before byte offset `end`
size_t rfind_before(const std::string& s, const std::string& needle, size_t end);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename; creates parent directories
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace markguard
