#include "config.hpp"
#include "http.hpp"
#include "pipeline.hpp"
#include "split.hpp"
#include "util.hpp"
#include "markup/converter.hpp"
#include "markup/sanitizer.hpp"
#include "transports/safe_transport.hpp"
#include "transports/telegram.hpp"
#include <cstring>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

static void print_usage() {
    std::cout << "Usage: markguard [options] < input.md\n"
              << "\n"
              << "Reads Markdown from stdin. Without options, prints Telegram HTML.\n"
              << "\n"
              << "Options:\n"
              << "  --html                 Print Telegram HTML (default)\n"
              << "  --sanitize             Print repaired legacy Markdown\n"
              << "  --split N              Print chunks of at most N units (0 = configured limit)\n"
              << "  --parts                Print sanitized, split and converted HTML parts\n"
              << "  --truncate N           Print text cut to N units\n"
              << "  --suffix TEXT          Suffix for --truncate (default from config)\n"
              << "  --send CHAT_ID         Deliver to a Telegram chat as HTML parts\n"
              << "  --edit CHAT_ID MSG_ID  Replace the text of an existing message\n"
              << "  --parse-mode MODE      Mode for --edit: markdown (default), html, none\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TELEGRAM_BOT_TOKEN       Telegram bot token (for --send, --edit)\n"
              << "  TELEGRAM_API_BASE_URL    Bot API server (default: https://api.telegram.org)\n"
              << "  MARKGUARD_HARD_LIMIT     Transport payload limit (default: 4096)\n"
              << "  MARKGUARD_SAFETY_MARGIN  Units kept free below the limit (default: 96)\n";
}

static void print_parts(const std::vector<std::string>& parts) {
    for (size_t i = 0; i < parts.size(); i++) {
        if (parts.size() > 1) {
            std::cout << "----- part " << (i + 1) << "/" << parts.size() << " ("
                      << markguard::utf16_length(parts[i]) << " units) -----\n";
        }
        std::cout << parts[i] << "\n";
    }
}

static int run_telegram(const markguard::Config& config, const std::string& input,
                        const std::string& chat_id, std::optional<int64_t> edit_id,
                        markguard::ParseMode mode) {
    markguard::http_init();
    markguard::CurlHttpClient http_client;

    std::unique_ptr<markguard::TelegramTransport> telegram;
    try {
        telegram = markguard::TelegramTransport::from_config(config, http_client);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        markguard::http_cleanup();
        return 1;
    }

    bool ok = true;
    if (!edit_id) {
        markguard::DeliveryOptions opts;
        opts.max_len = config.limits.max_len();
        auto results = markguard::deliver(*telegram, chat_id, input, opts);
        for (const auto& r : results) {
            if (!r.ok) ok = false;
            else std::cout << "sent message_id=" << r.message_id << "\n";
        }
    } else {
        markguard::SafeTransport safe(*telegram);
        markguard::SendOptions opts;
        opts.parse_mode = mode;
        auto r = safe.edit_message_text(chat_id, *edit_id, input, opts);
        ok = r.ok;
        if (ok) std::cout << "edited message_id=" << r.message_id << "\n";
    }

    markguard::http_cleanup();
    return ok ? 0 : 1;
}

int main(int argc, char* argv[]) try {
    enum class Mode { Html, Sanitize, Split, Parts, Truncate, Telegram };
    Mode mode = Mode::Html;
    size_t limit = 0;
    std::string suffix;
    bool has_suffix = false;
    std::string chat_id;
    std::optional<int64_t> edit_id;
    markguard::ParseMode parse_mode = markguard::ParseMode::Markdown;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--html") == 0) {
            mode = Mode::Html;
        } else if (std::strcmp(argv[i], "--sanitize") == 0) {
            mode = Mode::Sanitize;
        } else if (std::strcmp(argv[i], "--parts") == 0) {
            mode = Mode::Parts;
        } else if (std::strcmp(argv[i], "--split") == 0 && i + 1 < argc) {
            mode = Mode::Split;
            limit = std::stoul(argv[++i]);
        } else if (std::strcmp(argv[i], "--truncate") == 0 && i + 1 < argc) {
            mode = Mode::Truncate;
            limit = std::stoul(argv[++i]);
        } else if (std::strcmp(argv[i], "--suffix") == 0 && i + 1 < argc) {
            suffix = argv[++i];
            has_suffix = true;
        } else if (std::strcmp(argv[i], "--send") == 0 && i + 1 < argc) {
            mode = Mode::Telegram;
            chat_id = argv[++i];
        } else if (std::strcmp(argv[i], "--edit") == 0 && i + 2 < argc) {
            mode = Mode::Telegram;
            chat_id = argv[++i];
            try {
                edit_id = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid message id: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--parse-mode") == 0 && i + 1 < argc) {
            auto parsed = markguard::parse_mode_from_name(argv[++i]);
            if (!parsed) {
                std::cerr << "Unknown parse mode: " << argv[i] << "\n";
                return 1;
            }
            parse_mode = *parsed;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = markguard::Config::load();
    if (limit == 0) limit = config.limits.max_len();
    if (!has_suffix) suffix = config.limits.truncate_suffix;

    std::string input((std::istreambuf_iterator<char>(std::cin)),
                      std::istreambuf_iterator<char>());

    switch (mode) {
        case Mode::Html:
            std::cout << markguard::markdown_to_html(input) << "\n";
            break;
        case Mode::Sanitize:
            std::cout << markguard::sanitize_markdown(input) << "\n";
            break;
        case Mode::Split:
            print_parts(markguard::split_message_safe(input, limit));
            break;
        case Mode::Parts:
            print_parts(markguard::prepare_parts(input, limit, markguard::OutputFormat::Html));
            break;
        case Mode::Truncate:
            std::cout << markguard::truncate_safe(input, limit, suffix) << "\n";
            break;
        case Mode::Telegram:
            return run_telegram(config, input, chat_id, edit_id, parse_mode);
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
