#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace markguard {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split_on(const std::string& s, const std::string& sep) {
    std::vector<std::string> result;
    if (sep.empty()) {
        result.push_back(s);
        return result;
    }
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(sep, start)) != std::string::npos) {
        result.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    result.push_back(s.substr(start));
    return result;
}

std::string replace_all(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

std::string html_escape(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': r += "&amp;"; break;
            case '<': r += "&lt;"; break;
            case '>': r += "&gt;"; break;
            default: r += c;
        }
    }
    return r;
}

std::string html_escape_attr(const std::string& s) {
    return replace_all(html_escape(s), "\"", "&quot;");
}

// Width of the code point starting at `pos`: bytes consumed and UTF-16 units.
// Malformed input degrades to one byte / one unit.
static void utf8_step(const std::string& s, size_t pos, size_t& bytes, size_t& units) {
    auto c = static_cast<unsigned char>(s[pos]);
    size_t len = 1;
    units = 1;
    if (c >= 0xC0 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
    } else if (c >= 0xF0 && c <= 0xF7) {
        len = 4;
        units = 2;
    }
    if (pos + len > s.size()) len = 0;
    for (size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(s[pos + k]) & 0xC0) != 0x80) {
            len = 0;
            break;
        }
    }
    if (len == 0) {
        len = 1;
        units = 1;
    }
    bytes = len;
}

size_t utf16_length(const std::string& s) {
    size_t total = 0;
    size_t pos = 0;
    while (pos < s.size()) {
        size_t bytes = 0;
        size_t units = 0;
        utf8_step(s, pos, bytes, units);
        pos += bytes;
        total += units;
    }
    return total;
}

size_t utf8_prefix_bytes(const std::string& s, size_t pos, size_t units) {
    size_t start = pos;
    size_t used = 0;
    while (pos < s.size()) {
        size_t bytes = 0;
        size_t w = 0;
        utf8_step(s, pos, bytes, w);
        if (used + w > units && pos > start) break;
        pos += bytes;
        used += w;
        if (used >= units) break;
    }
    return pos - start;
}

size_t rfind_before(const std::string& s, const std::string& needle, size_t end) {
    if (needle.empty() || end < needle.size()) return std::string::npos;
    return s.rfind(needle, end - needle.size());
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) return false;
        out << content;
        if (!out.good()) return false;
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace markguard
