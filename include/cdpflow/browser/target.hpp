#pragma once

#include <string>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "cdpflow/core/error.hpp"
#include "cdpflow/core/scope.hpp"
#include "cdpflow/flow/event.hpp"

namespace cdpflow::browser {

using boost::asio::awaitable;
using json = nlohmann::json;

/// A page-level DevTools target: a source of CDP events that also accepts
/// CDP commands.
class Target : public flow::EventSource {
public:
    /// Send `method` with `params` and await the command's result object.
    /// Returns the scope's error if `scope` is cancelled before the reply.
    virtual auto send_command(Scope scope, std::string method, json params)
        -> awaitable<Result<json>> = 0;
};

} // namespace cdpflow::browser
