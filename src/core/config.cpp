#include "cdpflow/core/config.hpp"
#include "cdpflow/core/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>

namespace cdpflow {

namespace {

/// Resolve `${VAR}` references in every string value, recursively.
void resolve_env_refs_in(json& j) {
    if (j.is_string()) {
        j = resolve_env_refs(j.get<std::string>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& item : j) {
            resolve_env_refs_in(item);
        }
    }
}

auto env_int(const char* name) -> std::optional<int> {
    auto* val = std::getenv(name);
    if (!val) return std::nullopt;
    try {
        return std::stoi(val);
    } catch (const std::exception& e) {
        LOG_WARN("Config: ignoring {}='{}': {}", name, val, e.what());
        return std::nullopt;
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        resolve_env_refs_in(j);

        auto config = j.get<Config>();
        if (config.flow.retry_tick_ms <= 0) {
            LOG_WARN("Config: flow.retry_tick_ms must be positive, using 50");
            config.flow.retry_tick_ms = FlowConfig{}.retry_tick_ms;
        }
        if (config.browser.timeout_ms <= 0) {
            LOG_WARN("Config: browser.timeout_ms must be positive, using 30000");
            config.browser.timeout_ms = BrowserConfig{}.timeout_ms;
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("CDPFLOW_WS_URL")) {
        config.browser.ws_url = val;
    }
    if (auto* val = std::getenv("CDPFLOW_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("CDPFLOW_NAVIGATE_WAIT")) {
        config.flow.navigate_wait = val;
    }
    if (auto val = env_int("CDPFLOW_TIMEOUT_MS"); val && *val > 0) {
        config.browser.timeout_ms = *val;
    }
    if (auto val = env_int("CDPFLOW_RETRY_TICK_MS"); val && *val > 0) {
        config.flow.retry_tick_ms = *val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Escaped: $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }
    return result;
}

} // namespace cdpflow
