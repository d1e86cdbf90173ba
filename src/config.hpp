#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace markguard {

struct LimitsConfig {
    uint32_t hard_limit = 4096;    // transport's own payload limit
    uint32_t safety_margin = 96;   // headroom for entity/markup overhead
    std::string truncate_suffix = "\n\n... (truncated)";

    // Working chunk size: hard_limit - safety_margin, never below 1
    size_t max_len() const;
};

struct Config {
    LimitsConfig limits;
    std::unordered_map<std::string, nlohmann::json> transports;

    // Load from ~/.markguard/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already-merged config document (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Get JSON config for a transport name (empty object if absent)
    nlohmann::json transport_config(const std::string& name) const;
};

} // namespace markguard
