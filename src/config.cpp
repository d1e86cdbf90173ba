#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace markguard {

size_t LimitsConfig::max_len() const {
    if (hard_limit <= safety_margin) return 1;
    return hard_limit - safety_margin;
}

nlohmann::json Config::defaults_json() {
    return {
        {"limits", {
            {"hard_limit", 4096},
            {"safety_margin", 96},
            {"truncate_suffix", "\n\n... (truncated)"}
        }},
        {"transports", {
            {"telegram", {
                {"bot_token", ""},
                {"api_base_url", "https://api.telegram.org"},
                {"timeout_seconds", 30},
                {"disable_web_page_preview", false}
            }}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool fits_uint32(int64_t v) {
    return v >= 0 && v <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max());
}

// Unsigned env override; a bad value is reported and ignored
static void env_uint(const char* name, uint32_t& target) {
    const char* v = std::getenv(name);
    if (!v) return;
    long long parsed = 0;
    try {
        parsed = std::stoll(v);
    } catch (const std::exception&) {
        std::cerr << "[config] Warning: ignoring " << name << "=" << v
                  << " (not a number)\n";
        return;
    }
    if (!fits_uint32(parsed)) {
        std::cerr << "[config] Warning: ignoring " << name << "=" << v
                  << " (out of range)\n";
        return;
    }
    target = static_cast<uint32_t>(parsed);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("limits") && j["limits"].is_object()) {
        auto& l = j["limits"];
        if (l.contains("hard_limit") && l["hard_limit"].is_number_integer() &&
            fits_uint32(l["hard_limit"].get<int64_t>()))
            cfg.limits.hard_limit = l["hard_limit"].get<uint32_t>();
        if (l.contains("safety_margin") && l["safety_margin"].is_number_integer() &&
            fits_uint32(l["safety_margin"].get<int64_t>()))
            cfg.limits.safety_margin = l["safety_margin"].get<uint32_t>();
        if (l.contains("truncate_suffix") && l["truncate_suffix"].is_string())
            cfg.limits.truncate_suffix = l["truncate_suffix"].get<std::string>();
    }

    // Transport configurations: store raw JSON per transport name
    if (j.contains("transports") && j["transports"].is_object()) {
        for (auto& [name, obj] : j["transports"].items()) {
            if (obj.is_object())
                cfg.transports[name] = obj;
        }
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.markguard/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Warning: " << config_path << " is malformed ("
                      << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    env_uint("MARKGUARD_HARD_LIMIT", cfg.limits.hard_limit);
    env_uint("MARKGUARD_SAFETY_MARGIN", cfg.limits.safety_margin);
    if (const char* v = std::getenv("TELEGRAM_BOT_TOKEN"))
        cfg.transports["telegram"]["bot_token"] = v;
    if (const char* v = std::getenv("TELEGRAM_API_BASE_URL"))
        cfg.transports["telegram"]["api_base_url"] = v;

    return cfg;
}

nlohmann::json Config::transport_config(const std::string& name) const {
    auto it = transports.find(name);
    if (it != transports.end()) return it->second;
    return nlohmann::json::object();
}

} // namespace markguard
