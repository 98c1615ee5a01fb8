#include "config.hpp"

#include "log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;

namespace xiangqi {
namespace {

template <typename T>
static void read_field(const json& in, const char* key, T& out) {
    auto it = in.find(key);
    if (it == in.end() || it->is_null()) return;
    if constexpr (std::is_same<T, bool>::value) {
        if (it->is_boolean()) out = it->get<bool>();
    } else if constexpr (std::is_same<T, std::string>::value) {
        if (it->is_string()) out = it->get<std::string>();
    } else {
        if (it->is_number()) out = it->get<T>();
    }
}

static void read_tier(const json& tiers, const char* key, TierSettings& out) {
    auto it = tiers.find(key);
    if (it == tiers.end() || !it->is_object()) return;
    read_field(*it, "depth", out.depth);
    read_field(*it, "time_ms", out.time_ms);
}

static int parse_port(const char* text, int fallback) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || v <= 0 || v > 65535) return fallback;
    return (int)v;
}

} // namespace

const TierSettings& Config::tier(Difficulty d) const {
    switch (d) {
        case Difficulty::Easy: return easy;
        case Difficulty::Hard: return hard;
        default:               return normal;
    }
}

Config parse_config(const std::string& text, std::string* error) {
    Config cfg;
    json in = json::parse(text, nullptr, false);
    if (in.is_discarded() || !in.is_object()) {
        if (error) *error = "config is not a JSON object";
        return cfg;
    }

    read_field(in, "port", cfg.port);
    read_field(in, "log_level", cfg.log_level);
    read_field(in, "tt_size_mb", cfg.tt_size_mb);
    read_field(in, "invite_ttl_seconds", cfg.invite_ttl_seconds);
    read_field(in, "sweep_interval_seconds", cfg.sweep_interval_seconds);
    read_field(in, "idle_timeout_hours", cfg.idle_timeout_hours);
    read_field(in, "ai_grace_ms", cfg.ai_grace_ms);

    auto tiers = in.find("tiers");
    if (tiers != in.end() && tiers->is_object()) {
        read_tier(*tiers, "easy", cfg.easy);
        read_tier(*tiers, "normal", cfg.normal);
        read_tier(*tiers, "hard", cfg.hard);
    }

    auto book = in.find("cloud_book");
    if (book != in.end() && book->is_object()) {
        read_field(*book, "enabled", cfg.cloud_book.enabled);
        read_field(*book, "url", cfg.cloud_book.url);
        read_field(*book, "timeout_ms", cfg.cloud_book.timeout_ms);
    }

    if (cfg.tt_size_mb == 0 || cfg.tt_size_mb > 4096) cfg.tt_size_mb = 32;
    if (cfg.sweep_interval_seconds < 1) cfg.sweep_interval_seconds = 1;
    return cfg;
}

Config load_config(const std::string& path, std::string* error) {
    std::ifstream f(path);
    if (!f) {
        if (error) *error = "cannot open " + path;
        return Config{};
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return parse_config(ss.str(), error);
}

Config load_config_from_env() {
    Config cfg;
    if (const char* path = std::getenv("XIANGQI_CONFIG")) {
        std::string err;
        cfg = load_config(path, &err);
        if (!err.empty()) log_warn("config", err + ", using defaults");
    }
    if (const char* p = std::getenv("PORT")) cfg.port = parse_port(p, cfg.port);
    return cfg;
}

} // namespace xiangqi
