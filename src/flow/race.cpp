#include "cdpflow/flow/race.hpp"
#include "cdpflow/core/logger.hpp"
#include "cdpflow/core/notifier.hpp"

#include <atomic>
#include <stdexcept>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace cdpflow::flow {

namespace {

namespace net = boost::asio;

/// Capacity-1 slot for the first outcome. Senders that find it taken drop
/// their outcome without blocking.
using slot_t = net::experimental::concurrent_channel<
    void(boost::system::error_code, std::size_t, Result<void>)>;

/// Countdown of running executors; wakes the joiner when the last one ends.
struct JoinCounter {
    JoinCounter(net::any_io_executor executor, std::size_t count)
        : joined(std::make_shared<Notifier>(std::move(executor))), running(count) {}

    void finished() {
        if (running.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            joined->notify();
        }
    }

    std::shared_ptr<Notifier> joined;
    std::atomic<std::size_t> running;
};

auto run_guarded(ActionPtr action, Scope scope) -> awaitable<Result<void>> {
    try {
        co_return co_await action->run(std::move(scope));
    } catch (const std::exception& e) {
        co_return make_fail(make_error(ErrorCode::ActionFailed,
                                       "action threw an exception", e.what()));
    } catch (...) {
        co_return make_fail(make_error(ErrorCode::ActionFailed,
                                       "action threw an exception", "unknown exception"));
    }
}

class RaceAction final : public Action {
public:
    RaceAction(int* winner, std::vector<ActionPtr> actions)
        : winner_(winner), actions_(std::move(actions)) {}

    auto run(Scope scope) -> awaitable<Result<void>> override {
        auto executor = co_await net::this_coro::executor;
        auto race_scope = scope.derive();
        auto slot = std::make_shared<slot_t>(executor, 1);
        auto join = std::make_shared<JoinCounter>(executor, actions_.size());

        // The caller's cancellation reaches race_scope and fills the slot
        // with an aborted marker unless a winner got there first.
        auto wake = race_scope.on_cancel([slot](const Error&) {
            slot->try_send(make_error_code(net::error::operation_aborted),
                           std::size_t{0}, Result<void>{});
        });

        LOG_DEBUG("wait_one_of: racing {} action(s)", actions_.size());
        for (std::size_t idx = 0; idx < actions_.size(); ++idx) {
            net::co_spawn(executor,
                [action = actions_[idx], race_scope, slot, join, idx]() -> awaitable<void> {
                    auto outcome = co_await run_guarded(action, race_scope);
                    if (race_scope.is_cancelled() ||
                        !slot->try_send(boost::system::error_code{}, idx, std::move(outcome))) {
                        LOG_TRACE("wait_one_of: action {} finished after the race ended", idx);
                    }
                    join->finished();
                },
                net::detached);
        }

        auto [ec, winner, result] = co_await slot->async_receive(
            net::as_tuple(net::use_awaitable));
        race_scope.cancel();
        co_await join->joined->wait();

        if (ec) {
            auto err = scope.error().value_or(
                make_error(ErrorCode::Cancelled, "race ended without a result"));
            LOG_DEBUG("wait_one_of: no winner: {}", err.what());
            co_return make_fail(std::move(err));
        }
        if (!result) {
            LOG_DEBUG("wait_one_of: action {} failed first: {}", winner, result.error().what());
            co_return make_fail(result.error());
        }

        LOG_DEBUG("wait_one_of: action {} won", winner);
        if (winner_ != nullptr) {
            *winner_ = static_cast<int>(winner);
        }
        co_return ok_result();
    }

private:
    int* winner_;
    std::vector<ActionPtr> actions_;
};

} // anonymous namespace

auto wait_one_of(int* winner, std::vector<ActionPtr> actions) -> ActionPtr {
    if (actions.empty()) {
        throw std::invalid_argument("wait_one_of actions cannot be empty");
    }
    for (const auto& action : actions) {
        if (!action) {
            throw std::invalid_argument("wait_one_of actions cannot contain null");
        }
    }
    return std::make_shared<RaceAction>(winner, std::move(actions));
}

} // namespace cdpflow::flow
