#include "cdpflow/flow/wait.hpp"
#include "cdpflow/core/logger.hpp"

#include <stdexcept>

namespace cdpflow::flow {

namespace {

class RetryAction final : public Action {
public:
    RetryAction(Predicate predicate, std::chrono::steady_clock::duration tick)
        : predicate_(std::move(predicate)), tick_(tick) {}

    auto run(Scope scope) -> awaitable<Result<void>> override {
        std::size_t attempts = 0;
        for (;;) {
            auto slept = co_await sleep_for(scope, tick_);
            if (!slept) {
                LOG_DEBUG("wait_until: stopped after {} attempt(s): {}",
                          attempts, slept.error().what());
                co_return make_fail(slept.error());
            }

            ++attempts;
            auto outcome = co_await predicate_(scope);
            switch (outcome.kind()) {
                case OutcomeKind::Continue:
                    continue;
                case OutcomeKind::Success:
                    LOG_TRACE("wait_until: done after {} attempt(s)", attempts);
                    co_return ok_result();
                case OutcomeKind::Failure:
                    co_return make_fail(outcome.error());
                case OutcomeKind::NotMatched:
                    co_return make_fail(make_error(
                        ErrorCode::UnexpectedOutcome,
                        "wait_until predicate returned an unsupported outcome",
                        std::string(outcome_kind_to_string(outcome.kind()))));
            }
        }
    }

private:
    Predicate predicate_;
    std::chrono::steady_clock::duration tick_;
};

class IntervalAction final : public Action {
public:
    IntervalAction(std::chrono::steady_clock::duration interval, ActionPtr action)
        : interval_(interval), action_(std::move(action)) {}

    auto run(Scope scope) -> awaitable<Result<void>> override {
        std::size_t runs = 0;
        for (;;) {
            auto slept = co_await sleep_for(scope, interval_);
            if (!slept) {
                LOG_DEBUG("interval_run: stopped after {} run(s): {}",
                          runs, slept.error().what());
                co_return make_fail(slept.error());
            }

            auto result = co_await action_->run(scope);
            ++runs;
            if (!result) {
                LOG_DEBUG("interval_run: run {} failed: {}", runs, result.error().what());
                co_return make_fail(result.error());
            }
        }
    }

private:
    std::chrono::steady_clock::duration interval_;
    ActionPtr action_;
};

} // anonymous namespace

auto wait_until(Predicate predicate, std::chrono::steady_clock::duration tick) -> ActionPtr {
    if (!predicate) {
        throw std::invalid_argument("wait_until predicate cannot be empty");
    }
    return std::make_shared<RetryAction>(std::move(predicate), tick);
}

auto interval_run(std::chrono::steady_clock::duration interval, ActionPtr action) -> ActionPtr {
    if (!action) {
        throw std::invalid_argument("interval_run action cannot be null");
    }
    return std::make_shared<IntervalAction>(interval, std::move(action));
}

} // namespace cdpflow::flow
