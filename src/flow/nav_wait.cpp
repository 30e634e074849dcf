#include "cdpflow/flow/nav_wait.hpp"
#include "cdpflow/core/logger.hpp"
#include "cdpflow/core/notifier.hpp"
#include "cdpflow/core/utils.hpp"

#include <atomic>
#include <exception>
#include <memory>

#include <boost/asio/this_coro.hpp>

namespace cdpflow::flow {

namespace {

/// One evaluation of the wait predicate against one event.
auto evaluate_event(const NavWait& wait, const Scope& scope, const Event& event) -> bool {
    Outcome outcome = Outcome::not_matched();
    try {
        outcome = wait.predicate()(scope, event);
    } catch (const std::exception& e) {
        outcome = Outcome::failure(make_error(
            ErrorCode::ActionFailed, "wait predicate threw an exception", e.what()));
    }
    if (outcome.is_failure()) {
        LOG_DEBUG("wait {}: predicate failed on {}: {}",
                  wait.name(), event.method, outcome.error().what());
    }
    return outcome.is_success();
}

} // anonymous namespace

auto NavWait::load_event_fired() -> NavWait {
    return event(std::string(kLoadEventFired));
}

auto NavWait::frame_navigated() -> NavWait {
    return event(std::string(kFrameNavigated));
}

auto NavWait::event(std::string method) -> NavWait {
    auto name = method;
    return NavWait(std::move(name),
        [method = std::move(method)](const Scope&, const Event& ev) {
            return ev.method == method ? Outcome::success() : Outcome::not_matched();
        });
}

auto NavWait::none() -> NavWait {
    return NavWait("none", nullptr);
}

auto NavWait::custom(std::string name, EventPredicate predicate) -> NavWait {
    return NavWait(std::move(name), std::move(predicate));
}

auto parse_nav_wait(std::string_view text) -> Result<NavWait> {
    auto mode = utils::to_lower(utils::trim(text));
    if (mode == "load") return NavWait::load_event_fired();
    if (mode == "navigated") return NavWait::frame_navigated();
    if (mode == "none") return NavWait::none();
    return std::unexpected(make_error(
        ErrorCode::InvalidArgument,
        "Unknown navigation wait mode (expected load, navigated or none)",
        std::string(text)));
}

auto wait_nav_event(Scope scope, EventSource& events, NavWait wait)
    -> awaitable<Result<void>> {
    if (!wait.enabled()) {
        co_return ok_result();
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto listen_scope = scope.derive();
    auto done = std::make_shared<Notifier>(executor);
    auto matched = std::make_shared<std::atomic<bool>>(false);

    auto wake = scope.on_cancel([done](const Error&) { done->notify(); });

    events.listen(listen_scope,
        [wait, scope, listen_scope, done, matched](const Event& event) {
            if (matched->load(std::memory_order_acquire)) {
                return;
            }
            if (!evaluate_event(wait, scope, event)) {
                return;
            }
            // Several matching events may arrive at once; only one completes.
            if (matched->exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            listen_scope.cancel();
            done->notify();
        });

    co_await done->wait();
    listen_scope.cancel();

    if (matched->load(std::memory_order_acquire)) {
        LOG_DEBUG("wait {}: matched", wait.name());
        co_return ok_result();
    }
    auto err = scope.error().value_or(
        make_error(ErrorCode::Cancelled, "navigation wait ended without a match"));
    LOG_DEBUG("wait {}: {}", wait.name(), err.what());
    co_return make_fail(std::move(err));
}

auto wait_navigate(EventSource& events, NavWait wait) -> ActionPtr {
    return make_action([&events, wait = std::move(wait)](Scope scope) -> awaitable<Result<void>> {
        co_return co_await wait_nav_event(std::move(scope), events, wait);
    });
}

} // namespace cdpflow::flow
