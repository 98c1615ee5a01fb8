#pragma once

#include "search.hpp"

#include <string>

namespace xiangqi {

struct CloudBookConfig {
    bool enabled = false;
    std::string url = "http://www.chessdb.cn/chessdb.php";
    int timeout_ms = 3000;
};

struct Config {
    int port = 8080;
    std::string log_level = "info";
    size_t tt_size_mb = 32;
    int invite_ttl_seconds = 300;
    int sweep_interval_seconds = 60;
    int idle_timeout_hours = 12;
    int ai_grace_ms = 500;

    TierSettings easy{5, 2500};
    TierSettings normal{9, 3000};
    TierSettings hard{12, 8000};

    CloudBookConfig cloud_book{};

    const TierSettings& tier(Difficulty d) const;
};

// Fields missing from the file keep their defaults. A file that cannot be
// read or parsed is reported on `error` and yields the defaults.
Config parse_config(const std::string& text, std::string* error = nullptr);
Config load_config(const std::string& path, std::string* error = nullptr);

// XIANGQI_CONFIG names the file (optional); PORT overrides the port.
Config load_config_from_env();

} // namespace xiangqi
