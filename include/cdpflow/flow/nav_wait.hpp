#pragma once

#include <functional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>

#include "cdpflow/core/error.hpp"
#include "cdpflow/core/scope.hpp"
#include "cdpflow/flow/action.hpp"
#include "cdpflow/flow/event.hpp"
#include "cdpflow/flow/outcome.hpp"

namespace cdpflow::flow {

inline constexpr std::string_view kLoadEventFired = "Page.loadEventFired";
inline constexpr std::string_view kFrameNavigated = "Page.frameNavigated";

/// Success means "this is the event we wait for"; anything else means
/// "irrelevant, keep listening".
using EventPredicate = std::function<Outcome(const Scope&, const Event&)>;

/// What a navigation waits for after it has been triggered.
/// Chosen once before the wait and never modified.
class NavWait {
public:
    /// Wait for Page.loadEventFired. This is the default.
    static auto load_event_fired() -> NavWait;

    /// Wait for Page.frameNavigated.
    static auto frame_navigated() -> NavWait;

    /// Wait for the first event whose method equals `method`.
    static auto event(std::string method) -> NavWait;

    /// Do not wait at all.
    static auto none() -> NavWait;

    /// Wait until `predicate` returns Success.
    static auto custom(std::string name, EventPredicate predicate) -> NavWait;

    [[nodiscard]] auto enabled() const noexcept -> bool { return static_cast<bool>(predicate_); }
    [[nodiscard]] auto name() const noexcept -> std::string_view { return name_; }
    [[nodiscard]] auto predicate() const noexcept -> const EventPredicate& { return predicate_; }

private:
    NavWait(std::string name, EventPredicate predicate)
        : name_(std::move(name)), predicate_(std::move(predicate)) {}

    std::string name_;
    EventPredicate predicate_;
};

/// Parse "load", "navigated" or "none" (case-insensitive).
auto parse_nav_wait(std::string_view text) -> Result<NavWait>;

/// Block until `wait` matches an event from `events`, or `scope` ends.
///
/// Call this after triggering the navigation. The listener is registered
/// only then, so an event that fires before registration is missed and the
/// wait lasts until the scope's deadline. Registering before the trigger
/// would instead risk matching a stale event left over from an earlier
/// navigation, which is worse; CDP events carry nothing to correlate them
/// with the command that caused them.
auto wait_nav_event(Scope scope, EventSource& events,
                    NavWait wait = NavWait::load_event_fired()) -> awaitable<Result<void>>;

/// wait_nav_event() as an action. `events` must outlive the action.
auto wait_navigate(EventSource& events, NavWait wait = NavWait::load_event_fired()) -> ActionPtr;

} // namespace cdpflow::flow
