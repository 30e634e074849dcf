#include "cdpflow/flow/action.hpp"

#include <stdexcept>

namespace cdpflow::flow {

FuncAction::FuncAction(ActionFn fn) : fn_(std::move(fn)) {
    if (!fn_) {
        throw std::invalid_argument("action function cannot be empty");
    }
}

auto FuncAction::run(Scope scope) -> awaitable<Result<void>> {
    co_return co_await fn_(std::move(scope));
}

auto make_action(ActionFn fn) -> ActionPtr {
    return std::make_shared<FuncAction>(std::move(fn));
}

} // namespace cdpflow::flow
