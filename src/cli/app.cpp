#include "cdpflow/cli/app.hpp"
#include "cdpflow/core/logger.hpp"

#include <filesystem>

// Version string; typically injected by CMake via -DCDPFLOW_VERSION_STRING=...
#ifndef CDPFLOW_VERSION_STRING
#define CDPFLOW_VERSION_STRING "0.1.0-dev"
#endif

namespace cdpflow::cli {

App::App()
    : cli_("cdpflow", "Drive a Chrome page over the DevTools protocol")
{
    cli_.set_version_flag("--version", CDPFLOW_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("CDPFLOW_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    Logger::init("cdpflow", log_level_.empty() ? "info" : log_level_);

    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        config_ = load_config(std::filesystem::path(config_path_));
    } else {
        config_ = load_config_from_env();
    }

    // The command line wins over the configuration.
    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }
    Logger::set_level(config_.log_level);

    if (!selected_) {
        LOG_ERROR("No command selected");
        return 1;
    }
    auto code = selected_(config_);
    Logger::flush();
    return code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    register_navigate_command(cli_, selected_);
    register_cookies_command(cli_, selected_);
    register_screenshot_command(cli_, selected_);
    register_version_command(cli_, selected_);
}

} // namespace cdpflow::cli
