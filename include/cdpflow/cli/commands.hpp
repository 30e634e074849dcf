#pragma once

#include <functional>

#include <CLI/CLI.hpp>

#include "cdpflow/core/config.hpp"

namespace cdpflow::cli {

/// Runs a parsed subcommand against the final configuration and returns
/// the process exit code.
using CommandHandler = std::function<int(const Config&)>;

/// Register the `navigate` subcommand.
/// Navigates the page, waits for it to load and prints the new location.
void register_navigate_command(CLI::App& app, CommandHandler& selected);

/// Register the `cookies` subcommand.
/// Prints every cookie of the browser as JSON.
void register_cookies_command(CLI::App& app, CommandHandler& selected);

/// Register the `screenshot` subcommand.
/// Saves a PNG screenshot of the viewport.
void register_screenshot_command(CLI::App& app, CommandHandler& selected);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app, CommandHandler& selected);

} // namespace cdpflow::cli
