#include "cdpflow/cli/commands.hpp"
#include "cdpflow/browser/cdp_client.hpp"
#include "cdpflow/browser/cookies.hpp"
#include "cdpflow/browser/navigation.hpp"
#include "cdpflow/core/logger.hpp"
#include "cdpflow/flow/nav_wait.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>

#include <nlohmann/json.hpp>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef CDPFLOW_VERSION_STRING
#define CDPFLOW_VERSION_STRING "0.1.0-dev"
#endif

namespace cdpflow::cli {

using json = nlohmann::json;

namespace {

/// Options shared by every command that talks to a browser.
struct BrowserOptions {
    std::string ws_url;
    int timeout_ms = 0;

    void add_to(CLI::App* sub) {
        sub->add_option("--ws-url", ws_url, "Page DevTools WebSocket URL (overrides config)");
        sub->add_option("--timeout-ms", timeout_ms, "Overall deadline in milliseconds")
            ->check(CLI::NonNegativeNumber);
    }
};

using Body = std::function<awaitable<Result<void>>(browser::CdpClient&, Scope)>;

/// Connect to the page, run `body` under a deadline scope on a thread pool,
/// and disconnect again. Returns the process exit code.
auto run_with_browser(const Config& config, const BrowserOptions& opts,
                      std::string_view command, Body body) -> int {
    auto ws_url = opts.ws_url.empty() ? config.browser.ws_url : opts.ws_url;
    if (ws_url.empty()) {
        LOG_ERROR("{}: no DevTools URL (use --ws-url or CDPFLOW_WS_URL)", command);
        return 1;
    }
    auto timeout = std::chrono::milliseconds(
        opts.timeout_ms > 0 ? opts.timeout_ms : config.browser.timeout_ms);

    boost::asio::thread_pool pool(2);

    auto future = boost::asio::co_spawn(pool,
        [&ws_url, timeout, &body]() -> awaitable<Result<void>> {
            auto executor = co_await boost::asio::this_coro::executor;
            browser::CdpClient client(executor);

            auto connected = co_await client.connect(ws_url);
            if (!connected) {
                co_return make_fail(connected.error());
            }

            auto scope = Scope().derive_with_timeout(executor, timeout);
            auto result = co_await body(client, scope);
            scope.cancel();

            co_await client.disconnect();
            co_return result;
        },
        boost::asio::use_future);

    Result<void> result = ok_result();
    try {
        result = future.get();
    } catch (const std::exception& e) {
        result = std::unexpected(make_error(ErrorCode::InternalError,
                                            std::string(command) + " crashed", e.what()));
    }
    pool.join();

    if (!result) {
        LOG_ERROR("{} failed [{}]: {}", command,
                  error_code_to_string(result.error().code()), result.error().what());
        return 1;
    }
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// navigate command
// ---------------------------------------------------------------------------

void register_navigate_command(CLI::App& app, CommandHandler& selected) {
    auto* sub = app.add_subcommand("navigate", "Navigate the page and wait for it");

    struct Options {
        BrowserOptions browser;
        std::string url;
        std::string wait;
    };
    auto opts = std::make_shared<Options>();

    opts->browser.add_to(sub);
    sub->add_option("-u,--url", opts->url, "URL to navigate to")->required();
    sub->add_option("-w,--wait", opts->wait, "What to wait for: load, navigated or none");

    sub->callback([&selected, opts]() {
        selected = [opts](const Config& config) -> int {
            auto wait = flow::parse_nav_wait(
                opts->wait.empty() ? config.flow.navigate_wait : opts->wait);
            if (!wait) {
                LOG_ERROR("navigate: {}", wait.error().what());
                return 1;
            }

            return run_with_browser(config, opts->browser, "navigate",
                [opts, wait = std::move(*wait), tick = config.flow.retry_tick()](
                    browser::CdpClient& client, Scope scope) -> awaitable<Result<void>> {
                    browser::Navigator nav(client, tick);
                    std::string location;

                    auto navigate = nav.navigate(opts->url, wait);
                    auto navigated = co_await navigate->run(scope);
                    if (!navigated) {
                        co_return make_fail(navigated.error());
                    }
                    // Without an event to wait for, poll until the page has
                    // left about:blank.
                    auto read_location = wait.enabled()
                        ? nav.location(&location)
                        : nav.wait_not_location("about:blank", &location);
                    auto located = co_await read_location->run(scope);
                    if (!located) {
                        co_return make_fail(located.error());
                    }

                    std::cout << location << std::endl;
                    co_return ok_result();
                });
        };
    });
}

// ---------------------------------------------------------------------------
// cookies command
// ---------------------------------------------------------------------------

void register_cookies_command(CLI::App& app, CommandHandler& selected) {
    auto* sub = app.add_subcommand("cookies", "Print all browser cookies as JSON");

    auto opts = std::make_shared<BrowserOptions>();
    opts->add_to(sub);

    sub->callback([&selected, opts]() {
        selected = [opts](const Config& config) -> int {
            return run_with_browser(config, *opts, "cookies",
                [](browser::CdpClient& client, Scope scope) -> awaitable<Result<void>> {
                    std::vector<browser::Cookie> cookies;
                    auto action = browser::get_cookies(client, &cookies);
                    auto result = co_await action->run(scope);
                    if (!result) {
                        co_return make_fail(result.error());
                    }

                    std::cout << json(cookies).dump(2) << std::endl;
                    co_return ok_result();
                });
        };
    });
}

// ---------------------------------------------------------------------------
// screenshot command
// ---------------------------------------------------------------------------

void register_screenshot_command(CLI::App& app, CommandHandler& selected) {
    auto* sub = app.add_subcommand("screenshot", "Save a PNG screenshot of the viewport");

    struct Options {
        BrowserOptions browser;
        std::string out;
    };
    auto opts = std::make_shared<Options>();

    opts->browser.add_to(sub);
    sub->add_option("-o,--out", opts->out, "Output PNG file")->required();

    sub->callback([&selected, opts]() {
        selected = [opts](const Config& config) -> int {
            return run_with_browser(config, opts->browser, "screenshot",
                [opts](browser::CdpClient& client, Scope scope) -> awaitable<Result<void>> {
                    browser::Navigator nav(client);
                    std::string png;

                    auto capture = nav.capture_screenshot(&png);
                    auto result = co_await capture->run(scope);
                    if (!result) {
                        co_return make_fail(result.error());
                    }

                    std::ofstream file(opts->out, std::ios::binary | std::ios::trunc);
                    file.write(png.data(), static_cast<std::streamsize>(png.size()));
                    if (!file) {
                        co_return make_fail(make_error(ErrorCode::IoError,
                                                       "Cannot write screenshot", opts->out));
                    }
                    LOG_INFO("Saved {} byte screenshot to {}", png.size(), opts->out);
                    co_return ok_result();
                });
        };
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app, CommandHandler& selected) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([&selected]() {
        selected = [](const Config&) -> int {
            std::cout << "cdpflow " << CDPFLOW_VERSION_STRING << std::endl;
            return 0;
        };
    });
}

} // namespace cdpflow::cli
