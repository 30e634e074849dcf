#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>

#include "cdpflow/flow/nav_wait.hpp"
#include "support/async.hpp"

using namespace cdpflow;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

/// EventSource that only counts subscriptions.
class CountingSource final : public flow::EventSource {
public:
    void listen(Scope, flow::EventCallback) override { listens.fetch_add(1); }

    std::atomic<int> listens{0};
};

/// Spin until `bus` has `count` listeners or two seconds pass.
auto await_listeners(const flow::EventBus& bus, std::size_t count) -> bool {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (bus.listener_count() < count) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

auto spawn_wait(boost::asio::thread_pool& pool, Scope scope, flow::EventBus& bus,
                flow::NavWait wait) -> std::future<Result<void>> {
    return boost::asio::co_spawn(pool,
        [scope, &bus, wait]() -> awaitable<Result<void>> {
            co_return co_await flow::wait_nav_event(scope, bus, wait);
        },
        boost::asio::use_future);
}

} // anonymous namespace

TEST_CASE("wait_nav_event unblocks on the matching event only", "[flow][nav_wait]") {
    boost::asio::thread_pool pool(2);
    flow::EventBus bus;
    std::atomic<int> evaluated{0};

    auto wait = flow::NavWait::custom("x-only",
        [&evaluated](const Scope&, const flow::Event& ev) {
            evaluated.fetch_add(1);
            return ev.method == "X" ? flow::Outcome::success() : flow::Outcome::not_matched();
        });

    auto future = spawn_wait(pool, Scope(), bus, wait);
    REQUIRE(await_listeners(bus, 1));

    bus.publish(flow::Event{"Y", json::object()});
    CHECK(future.wait_for(50ms) == std::future_status::timeout);

    bus.publish(flow::Event{"X", json::object()});
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(future.get().has_value());
    CHECK(evaluated.load() == 2);

    // The listener is gone once the wait has matched.
    CHECK(bus.listener_count() == 0);
    CHECK(bus.publish(flow::Event{"X", json::object()}) == 0);
}

TEST_CASE("NavWait::none resolves without subscribing", "[flow][nav_wait]") {
    boost::asio::thread_pool pool(1);
    CountingSource source;

    auto result = test::run_on(pool, [&source]() -> awaitable<Result<void>> {
        co_return co_await flow::wait_nav_event(Scope(), source, flow::NavWait::none());
    });

    CHECK(result.has_value());
    CHECK(source.listens.load() == 0);
}

TEST_CASE("wait_nav_event defaults to the load event", "[flow][nav_wait]") {
    boost::asio::thread_pool pool(2);
    flow::EventBus bus;

    auto future = spawn_wait(pool, Scope(), bus, flow::NavWait::load_event_fired());
    REQUIRE(await_listeners(bus, 1));

    bus.publish(flow::Event{std::string(flow::kFrameNavigated), json::object()});
    CHECK(future.wait_for(50ms) == std::future_status::timeout);

    bus.publish(flow::Event{std::string(flow::kLoadEventFired), {{"timestamp", 1.5}}});
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(future.get().has_value());
}

TEST_CASE("wait_nav_event keeps listening after a failing predicate", "[flow][nav_wait]") {
    boost::asio::thread_pool pool(2);
    flow::EventBus bus;

    auto wait = flow::NavWait::custom("picky",
        [](const Scope&, const flow::Event& ev) {
            if (ev.params.value("ok", false)) {
                return flow::Outcome::success();
            }
            return flow::Outcome::failure(make_error(ErrorCode::BrowserError, "not yet"));
        });

    auto future = spawn_wait(pool, Scope(), bus, wait);
    REQUIRE(await_listeners(bus, 1));

    bus.publish(flow::Event{"Page.lifecycleEvent", {{"ok", false}}});
    CHECK(future.wait_for(50ms) == std::future_status::timeout);

    bus.publish(flow::Event{"Page.lifecycleEvent", {{"ok", true}}});
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(future.get().has_value());
}

TEST_CASE("wait_nav_event keeps listening after a throwing predicate", "[flow][nav_wait]") {
    boost::asio::thread_pool pool(2);
    flow::EventBus bus;

    // value() throws type_error when "ok" is not a boolean.
    auto wait = flow::NavWait::custom("strict",
        [](const Scope&, const flow::Event& ev) {
            return ev.params.value("ok", false) ? flow::Outcome::success()
                                                : flow::Outcome::not_matched();
        });

    auto future = spawn_wait(pool, Scope(), bus, wait);
    REQUIRE(await_listeners(bus, 1));

    CHECK_NOTHROW(bus.publish(flow::Event{"Page.lifecycleEvent", {{"ok", "yes"}}}));
    CHECK(future.wait_for(50ms) == std::future_status::timeout);
    CHECK(bus.listener_count() == 1);

    bus.publish(flow::Event{"Page.lifecycleEvent", {{"ok", true}}});
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(future.get().has_value());
}

TEST_CASE("wait_nav_event completes once when matches arrive together", "[flow][nav_wait]") {
    boost::asio::thread_pool pool(2);
    flow::EventBus bus;
    std::atomic<int> arrived{0};
    std::atomic<int> matched{0};

    // Hold every evaluation until both publishers are inside the predicate,
    // so both pass the early "already matched" check.
    auto wait = flow::NavWait::custom("together",
        [&arrived, &matched](const Scope&, const flow::Event&) {
            arrived.fetch_add(1);
            auto deadline = std::chrono::steady_clock::now() + 500ms;
            while (arrived.load() < 2 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::yield();
            }
            matched.fetch_add(1);
            return flow::Outcome::success();
        });

    auto future = spawn_wait(pool, Scope(), bus, wait);
    REQUIRE(await_listeners(bus, 1));

    std::atomic<std::size_t> delivered{0};
    auto publisher = [&bus, &delivered] {
        delivered.fetch_add(bus.publish(flow::Event{"X", json::object()}));
    };
    std::thread first(publisher);
    std::thread second(publisher);
    first.join();
    second.join();

    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(future.get().has_value());
    CHECK(delivered.load() == 2);
    CHECK(matched.load() == 2);
    CHECK(bus.listener_count() == 0);
}

TEST_CASE("wait_nav_event returns the scope error when the scope ends", "[flow][nav_wait]") {
    boost::asio::thread_pool pool(2);
    flow::EventBus bus;
    Scope scope;

    auto future = spawn_wait(pool, scope, bus, flow::NavWait::load_event_fired());
    REQUIRE(await_listeners(bus, 1));

    scope.cancel(make_error(ErrorCode::DeadlineExceeded, "page never loaded"));
    REQUIRE(future.wait_for(2s) == std::future_status::ready);

    auto result = future.get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::DeadlineExceeded);
    CHECK(bus.listener_count() == 0);
}

TEST_CASE("An event fired before the wait starts is missed", "[flow][nav_wait]") {
    boost::asio::thread_pool pool(2);
    flow::EventBus bus;

    bus.publish(flow::Event{std::string(flow::kLoadEventFired), json::object()});

    auto result = test::run_on(pool, [&bus]() -> awaitable<Result<void>> {
        auto executor = co_await boost::asio::this_coro::executor;
        auto scope = Scope().derive_with_timeout(executor, 50ms);
        co_return co_await flow::wait_nav_event(scope, bus);
    });

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::DeadlineExceeded);
}

TEST_CASE("parse_nav_wait", "[flow][nav_wait]") {
    auto load = flow::parse_nav_wait("load");
    REQUIRE(load.has_value());
    CHECK(load->name() == flow::kLoadEventFired);
    CHECK(load->enabled());

    auto navigated = flow::parse_nav_wait("  Navigated ");
    REQUIRE(navigated.has_value());
    CHECK(navigated->name() == flow::kFrameNavigated);

    auto none = flow::parse_nav_wait("NONE");
    REQUIRE(none.has_value());
    CHECK_FALSE(none->enabled());

    auto bad = flow::parse_nav_wait("networkidle");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("wait_navigate wraps the waiter as an action", "[flow][nav_wait]") {
    boost::asio::thread_pool pool(2);
    flow::EventBus bus;

    auto action = flow::wait_navigate(bus, flow::NavWait::frame_navigated());
    auto future = boost::asio::co_spawn(pool,
        [action]() -> awaitable<Result<void>> {
            co_return co_await action->run(Scope());
        },
        boost::asio::use_future);

    REQUIRE(await_listeners(bus, 1));
    bus.publish(flow::Event{std::string(flow::kFrameNavigated), json::object()});
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(future.get().has_value());
}
