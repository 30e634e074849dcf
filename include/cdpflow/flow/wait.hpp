#pragma once

#include <chrono>
#include <functional>

#include <boost/asio/awaitable.hpp>

#include "cdpflow/flow/action.hpp"
#include "cdpflow/flow/outcome.hpp"

namespace cdpflow::flow {

inline constexpr std::chrono::milliseconds kDefaultRetryTick{50};

using Predicate = std::function<awaitable<Outcome>(Scope)>;

/// Poll `predicate` once per `tick` until it stops returning Continue.
///
/// Each round sleeps one tick first (returning the scope's error if it is
/// cancelled meanwhile), then invokes the predicate. Continue schedules the
/// next round with no retry limit; bound the total time with the scope.
/// Success and Failure end the loop. NotMatched is reported as
/// ErrorCode::UnexpectedOutcome.
///
/// Throws std::invalid_argument if `predicate` is empty.
auto wait_until(Predicate predicate,
                std::chrono::steady_clock::duration tick = kDefaultRetryTick) -> ActionPtr;

/// Run `action` once per `interval` until it fails or the scope ends.
/// Runs never overlap: the next interval starts after the previous run.
///
/// Throws std::invalid_argument if `action` is null.
auto interval_run(std::chrono::steady_clock::duration interval, ActionPtr action) -> ActionPtr;

} // namespace cdpflow::flow
