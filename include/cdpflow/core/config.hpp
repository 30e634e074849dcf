#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cdpflow {

using json = nlohmann::json;

struct FlowConfig {
    int retry_tick_ms = 50;               // wait_until polling tick
    std::string navigate_wait = "load";   // "load", "navigated", "none"

    [[nodiscard]] auto retry_tick() const -> std::chrono::milliseconds {
        return std::chrono::milliseconds(retry_tick_ms);
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(FlowConfig, retry_tick_ms, navigate_wait)

struct BrowserConfig {
    std::string ws_url;      // page-level DevTools WebSocket URL
    int timeout_ms = 30000;  // deadline of each CLI command
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BrowserConfig, ws_url, timeout_ms)

struct Config {
    FlowConfig flow;
    BrowserConfig browser;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, flow, browser, log_level)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace cdpflow
