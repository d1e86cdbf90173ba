#include "split.hpp"
#include "markup/protector.hpp"
#include "util.hpp"

#include <stdexcept>

namespace markguard {

namespace {

// Stands in for "\n\n" inside code blocks while paragraphs are split.
// Same length as what it replaces, so measurements stay exact.
const std::string PARAGRAPH_MASK(2, EntityProtector::SENTINEL);

// Greedy accumulator: joins pieces with `sep` while the result fits
class ChunkBuffer {
public:
    ChunkBuffer(size_t max_len, std::vector<std::string>& out)
        : max_len_(max_len), out_(out) {}

    bool try_append(const std::string& piece, size_t piece_len, const std::string& sep) {
        size_t candidate = text_.empty() ? piece_len : len_ + sep.size() + piece_len;
        if (candidate > max_len_) return false;
        if (!text_.empty()) text_ += sep;
        text_ += piece;
        len_ = candidate;
        return true;
    }

    void flush() {
        if (text_.empty()) return;
        out_.push_back(std::move(text_));
        text_.clear();
        len_ = 0;
    }

private:
    size_t max_len_;
    std::vector<std::string>& out_;
    std::string text_;
    size_t len_ = 0;
};

void hard_split(const std::string& word, size_t max_len, std::vector<std::string>& out) {
    size_t pos = 0;
    while (pos < word.size()) {
        size_t n = utf8_prefix_bytes(word, pos, max_len);
        out.push_back(word.substr(pos, n));
        pos += n;
    }
}

void split_words(const std::string& line, size_t max_len, std::vector<std::string>& out) {
    ChunkBuffer buf(max_len, out);
    for (const auto& word : split_on(line, " ")) {
        size_t len = utf16_length(word);
        if (buf.try_append(word, len, " ")) continue;
        buf.flush();
        if (len > max_len) {
            hard_split(word, max_len, out);
            continue;
        }
        buf.try_append(word, len, " ");
    }
    buf.flush();
}

bool holds_code_block(const std::string& para) {
    return para.find(PARAGRAPH_MASK) != std::string::npos ||
           para.find("```") != std::string::npos ||
           para.find("<pre>") != std::string::npos;
}

} // namespace

std::vector<std::string> split_message_safe(const std::string& input, size_t max_len) {
    if (max_len == 0) {
        throw std::invalid_argument("split_message_safe: max_len must be positive");
    }
    if (utf16_length(input) <= max_len) return {input};

    const auto& p = patterns();
    std::string text = EntityProtector::scrub(input);
    text = EntityProtector::mask_within(text, p.code_block, "\n\n", PARAGRAPH_MASK);
    text = EntityProtector::mask_within(text, p.pre_block, "\n\n", PARAGRAPH_MASK);

    std::vector<std::string> chunks;
    ChunkBuffer current(max_len, chunks);

    for (const auto& para : split_on(text, "\n\n")) {
        size_t para_len = utf16_length(para);
        if (current.try_append(para, para_len, "\n\n")) continue;
        current.flush();

        if (para_len <= max_len) {
            current.try_append(para, para_len, "\n\n");
            continue;
        }

        // Oversized code block: sending it long beats breaking it
        if (holds_code_block(para)) {
            chunks.push_back(para);
            continue;
        }

        for (const auto& line : split_on(para, "\n")) {
            size_t line_len = utf16_length(line);
            if (current.try_append(line, line_len, "\n")) continue;
            current.flush();

            if (line_len <= max_len) {
                current.try_append(line, line_len, "\n");
                continue;
            }
            split_words(line, max_len, chunks);
        }
    }
    current.flush();

    for (auto& chunk : chunks) {
        chunk = replace_all(chunk, PARAGRAPH_MASK, "\n\n");
    }
    if (chunks.empty()) {
        chunks.push_back(input.substr(0, utf8_prefix_bytes(input, 0, max_len)));
    }
    return chunks;
}

std::string truncate_safe(const std::string& text, size_t max_len, const std::string& suffix) {
    if (utf16_length(text) <= max_len) return text;

    size_t suffix_len = utf16_length(suffix);
    size_t target = 0;
    if (max_len > suffix_len) {
        target = utf8_prefix_bytes(text, 0, max_len - suffix_len);
    }

    size_t cut = rfind_before(text, "\n\n", target);
    if (cut == std::string::npos) cut = rfind_before(text, "\n", target);
    if (cut == std::string::npos) cut = rfind_before(text, " ", target);
    if (cut == std::string::npos) cut = target;

    return text.substr(0, cut) + suffix;
}

} // namespace markguard
