// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/core/config.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace icnx::core {

// Engine settings, persisted as JSON
struct EngineConfig {
    std::uint32_t max_concurrent{DEFAULT_MAX_CONCURRENT};
    std::uint32_t retries{DEFAULT_RETRIES};
    std::chrono::milliseconds backoff{DEFAULT_BACKOFF};
    std::string user_agent{DEFAULT_USER_AGENT};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
    bool retry_filesystem_errors{false};
    std::optional<std::filesystem::path> app_data_dir;
    std::string log_level{"info"};
};

void to_json(nlohmann::json& j, const EngineConfig& cfg);
void from_json(const nlohmann::json& j, EngineConfig& cfg);

// Load settings; a missing or malformed file yields the defaults
[[nodiscard]] EngineConfig load_config(const std::filesystem::path& path);

[[nodiscard]] std::error_code save_config(const EngineConfig& cfg,
                                          const std::filesystem::path& path);

// Per-user data directory: configured value, else $XDG_DATA_HOME/icnx,
// else $HOME/.local/share/icnx
[[nodiscard]] std::optional<std::filesystem::path> resolve_app_data_dir(const EngineConfig& cfg);

} // namespace icnx::core
