#pragma once

#include <functional>
#include <memory>

#include <boost/asio/awaitable.hpp>

#include "cdpflow/core/error.hpp"
#include "cdpflow/core/scope.hpp"

namespace cdpflow::flow {

using boost::asio::awaitable;

/// A unit of cancellable work that may fail.
///
/// Coordinators only ever call run(); they never know what an action does.
/// Implementations should return promptly once `scope` is cancelled.
class Action {
public:
    virtual ~Action() = default;

    virtual auto run(Scope scope) -> awaitable<Result<void>> = 0;
};

using ActionPtr = std::shared_ptr<Action>;

using ActionFn = std::function<awaitable<Result<void>>(Scope)>;

/// Adapts a callable (usually a coroutine lambda) to Action. The callable
/// lives as long as the action, so its captures stay valid while it runs.
class FuncAction final : public Action {
public:
    explicit FuncAction(ActionFn fn);

    auto run(Scope scope) -> awaitable<Result<void>> override;

private:
    ActionFn fn_;
};

/// Throws std::invalid_argument if `fn` is empty.
auto make_action(ActionFn fn) -> ActionPtr;

} // namespace cdpflow::flow
