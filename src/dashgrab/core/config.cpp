// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/core/config.hpp>
#include <dashgrab/core/error.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace dashgrab::core {

std::expected<AppConfig, std::error_code>
AppConfig::from_json(std::string_view json_text) noexcept {
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::config_invalid));
        }

        AppConfig cfg;

        if (j.contains("workers")) {
            cfg.workers = j["workers"].get<std::uint32_t>();
        }
        if (j.contains("connect_timeout_sec")) {
            cfg.connect_timeout_sec = j["connect_timeout_sec"].get<std::uint32_t>();
        }
        if (j.contains("stall_timeout_sec")) {
            cfg.stall_timeout_sec = j["stall_timeout_sec"].get<std::uint32_t>();
        }
        if (j.contains("output_dir")) {
            cfg.output_dir = j["output_dir"].get<std::string>();
        }
        if (j.contains("resolution")) {
            cfg.resolution = j["resolution"].get<std::string>();
        }
        if (j.contains("ffmpeg")) {
            cfg.ffmpeg = j["ffmpeg"].get<std::string>();
        }
        if (j.contains("temp_dir")) {
            cfg.temp_dir = j["temp_dir"].get<std::string>();
        }
        if (j.contains("log_level")) {
            cfg.log_level = j["log_level"].get<std::string>();
        }

        if (cfg.workers == 0 || cfg.workers > MAX_WORKERS) {
            return std::unexpected(make_error_code(DownloadErrc::config_invalid));
        }

        return cfg;
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::config_invalid));
    }
}

std::expected<AppConfig, std::error_code>
AppConfig::load(const std::string& path) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error_code(DownloadErrc::config_invalid));
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    return from_json(ss.str());
}

} // namespace dashgrab::core
