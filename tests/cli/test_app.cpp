#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "cdpflow/cli/app.hpp"

namespace {

auto run_app(std::vector<std::string> args) -> int {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    cdpflow::cli::App app;
    return app.run(static_cast<int>(argv.size()), argv.data());
}

} // anonymous namespace

TEST_CASE("version command succeeds", "[cli]") {
    CHECK(run_app({"cdpflow", "version"}) == 0);
}

TEST_CASE("navigate requires a URL", "[cli]") {
    CHECK(run_app({"cdpflow", "navigate"}) != 0);
}

TEST_CASE("browser commands need a DevTools URL", "[cli]") {
    unsetenv("CDPFLOW_WS_URL");
    unsetenv("CDPFLOW_CONFIG");
    CHECK(run_app({"cdpflow", "cookies"}) == 1);
    CHECK(run_app({"cdpflow", "navigate", "--url", "https://example.com"}) == 1);
}

TEST_CASE("navigate rejects an unknown wait mode", "[cli]") {
    CHECK(run_app({"cdpflow", "navigate", "--url", "https://example.com",
                   "--ws-url", "ws://127.0.0.1:1/devtools/page/X", "--wait", "idle"}) == 1);
}

TEST_CASE("config file feeds the command", "[cli]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "cdpflow_test_cli_config.json";
    {
        std::ofstream out(tmp);
        out << R"({"log_level": "warn", "flow": {"navigate_wait": "navigated"}})";
    }

    cdpflow::cli::App app;
    std::vector<std::string> args = {"cdpflow", "--config", tmp.string(), "version"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());

    CHECK(app.run(static_cast<int>(argv.size()), argv.data()) == 0);
    CHECK(app.config().log_level == "warn");
    CHECK(app.config().flow.navigate_wait == "navigated");

    fs::remove(tmp);
}
