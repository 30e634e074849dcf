#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "cdpflow/cli/commands.hpp"
#include "cdpflow/core/config.hpp"

namespace cdpflow::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration
/// (from --config, or the environment), initializes logging and then runs
/// the selected subcommand.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// The configuration the last run() used.
    [[nodiscard]] auto config() const -> const Config&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    CommandHandler selected_;
};

} // namespace cdpflow::cli
