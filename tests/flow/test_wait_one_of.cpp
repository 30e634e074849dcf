#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>

#include "cdpflow/flow/race.hpp"
#include "support/async.hpp"

using namespace cdpflow;
using namespace std::chrono_literals;

namespace {

/// Blocks until its scope ends, counting how many saw the cancellation.
auto blocker(std::atomic<int>& observed) -> flow::ActionPtr {
    return flow::make_action([&observed](Scope scope) -> awaitable<Result<void>> {
        auto err = co_await scope.wait_cancelled();
        observed.fetch_add(1);
        co_return make_fail(err);
    });
}

auto succeed_after(std::chrono::milliseconds d) -> flow::ActionPtr {
    return flow::make_action([d](Scope scope) -> awaitable<Result<void>> {
        co_return co_await sleep_for(scope, d);
    });
}

auto fail_after(std::chrono::milliseconds d, ErrorCode code) -> flow::ActionPtr {
    return flow::make_action([d, code](Scope scope) -> awaitable<Result<void>> {
        auto slept = co_await sleep_for(scope, d);
        if (!slept) {
            co_return make_fail(slept.error());
        }
        co_return make_fail(make_error(code, "deliberate failure"));
    });
}

} // anonymous namespace

TEST_CASE("wait_one_of returns the first failure", "[flow][wait_one_of]") {
    boost::asio::thread_pool pool(4);
    std::atomic<int> observed{0};

    auto race = flow::wait_one_of(nullptr, {
        blocker(observed),
        fail_after(10ms, ErrorCode::BrowserError),
        blocker(observed),
    });

    auto result = test::run_on(pool, [race]() -> awaitable<Result<void>> {
        co_return co_await race->run(Scope());
    });

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::BrowserError);
    // Every loser was cancelled and had finished before the race returned.
    CHECK(observed.load() == 2);
}

TEST_CASE("wait_one_of reports the winner index", "[flow][wait_one_of]") {
    boost::asio::thread_pool pool(4);

    for (int k = 0; k < 4; ++k) {
        std::atomic<int> observed{0};
        std::vector<flow::ActionPtr> actions;
        for (int i = 0; i < 4; ++i) {
            actions.push_back(i == k ? succeed_after(5ms) : blocker(observed));
        }

        int winner = -1;
        auto race = flow::wait_one_of(&winner, std::move(actions));
        auto result = test::run_on(pool, [race]() -> awaitable<Result<void>> {
            co_return co_await race->run(Scope());
        });

        REQUIRE(result.has_value());
        CHECK(winner == k);
        CHECK(observed.load() == 3);
    }
}

TEST_CASE("wait_one_of joins every executor", "[flow][wait_one_of]") {
    boost::asio::thread_pool pool(4);
    std::atomic<int> live{0};
    Scope parent;
    auto baseline = parent.pending_callbacks();

    auto tracked = [&live](flow::ActionPtr inner) {
        return flow::make_action([&live, inner](Scope scope) -> awaitable<Result<void>> {
            live.fetch_add(1);
            auto result = co_await inner->run(scope);
            live.fetch_sub(1);
            co_return result;
        });
    };

    for (int round = 0; round < 20; ++round) {
        std::atomic<int> observed{0};
        auto race = flow::wait_one_of(nullptr, {
            tracked(blocker(observed)),
            tracked(succeed_after(1ms)),
            tracked(blocker(observed)),
        });

        auto result = test::run_on(pool, [race, parent]() -> awaitable<Result<void>> {
            co_return co_await race->run(parent);
        });

        REQUIRE(result.has_value());
        CHECK(live.load() == 0);
        CHECK(parent.pending_callbacks() == baseline);
    }
}

TEST_CASE("wait_one_of ends with the caller's scope", "[flow][wait_one_of]") {
    boost::asio::thread_pool pool(4);
    std::atomic<int> observed{0};
    int winner = -1;

    auto race = flow::wait_one_of(&winner, {blocker(observed), blocker(observed)});
    auto result = test::run_on(pool, [race]() -> awaitable<Result<void>> {
        auto executor = co_await boost::asio::this_coro::executor;
        auto scope = Scope().derive_with_timeout(executor, 30ms);
        co_return co_await race->run(scope);
    });

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::DeadlineExceeded);
    CHECK(winner == -1);
    CHECK(observed.load() == 2);
}

TEST_CASE("wait_one_of turns exceptions into failures", "[flow][wait_one_of]") {
    boost::asio::thread_pool pool(2);
    std::atomic<int> observed{0};

    auto thrower = flow::make_action([](Scope) -> awaitable<Result<void>> {
        throw std::runtime_error("kaboom");
        co_return ok_result();
    });
    auto race = flow::wait_one_of(nullptr, {thrower, blocker(observed)});

    auto result = test::run_on(pool, [race]() -> awaitable<Result<void>> {
        co_return co_await race->run(Scope());
    });

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::ActionFailed);
    CHECK(result.error().detail() == "kaboom");
}

TEST_CASE("wait_one_of survives exceptions of any type", "[flow][wait_one_of]") {
    boost::asio::thread_pool pool(2);
    std::atomic<int> observed{0};

    auto thrower = flow::make_action([](Scope) -> awaitable<Result<void>> {
        throw 42;
        co_return ok_result();
    });
    auto race = flow::wait_one_of(nullptr, {thrower, blocker(observed)});

    auto future = boost::asio::co_spawn(pool,
        [race]() -> awaitable<Result<void>> {
            co_return co_await race->run(Scope());
        },
        boost::asio::use_future);

    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    auto result = future.get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::ActionFailed);
    CHECK(result.error().detail() == "unknown exception");
    CHECK(observed.load() == 1);
}

TEST_CASE("wait_one_of rejects bad input", "[flow][wait_one_of]") {
    CHECK_THROWS_AS(flow::wait_one_of(nullptr, {}), std::invalid_argument);
    CHECK_THROWS_AS(flow::wait_one_of(nullptr, {succeed_after(1ms), nullptr}),
                    std::invalid_argument);
}
