#pragma once

#include <vector>

#include "cdpflow/flow/action.hpp"

namespace cdpflow::flow {

/// Run all `actions` concurrently and finish with the first one to finish.
///
/// Every action runs in its own coroutine, spawned on the caller's executor,
/// under a scope derived from the caller's. The first action to finish
/// decides the race: its failure fails the race; on success its 0-based
/// position is written to `*winner` (when `winner` is not null). The
/// remaining actions are then cancelled, and the race returns only after
/// every spawned coroutine has finished. If the caller's scope ends first,
/// the race fails with that scope's error.
///
/// Actions only run in parallel if the caller's executor has more than one
/// thread. Which of two near-simultaneous finishers wins is unspecified.
///
/// Throws std::invalid_argument if `actions` is empty or holds a null.
auto wait_one_of(int* winner, std::vector<ActionPtr> actions) -> ActionPtr;

} // namespace cdpflow::flow
