#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>

#include "cdpflow/browser/target.hpp"
#include "support/async.hpp"

namespace cdpflow::test {

using json = nlohmann::json;

/// In-memory Target. Commands are recorded and answered by per-method
/// handlers; events can be emitted a little while after a command, the way
/// a browser fires Page.loadEventFired after Page.navigate.
class FakeTarget final : public browser::Target {
public:
    using Handler = std::function<Result<json>(const json& params)>;

    struct Command {
        std::string method;
        json params;
    };

    void on(std::string method, Handler handler) {
        std::lock_guard lock(mutex_);
        handlers_[std::move(method)] = std::move(handler);
    }

    /// After each `method` command, publish `event` once `after` has passed.
    void emit_after(std::string method, flow::Event event,
                    std::chrono::milliseconds after = std::chrono::milliseconds(20)) {
        std::lock_guard lock(mutex_);
        triggers_[std::move(method)] = Trigger{std::move(event), after};
    }

    auto send_command(Scope scope, std::string method, json params)
        -> awaitable<Result<json>> override {
        if (auto err = scope.error()) {
            co_return make_fail(*err);
        }

        Handler handler;
        std::optional<Trigger> trigger;
        {
            std::lock_guard lock(mutex_);
            commands_.push_back(Command{method, params});
            if (auto it = handlers_.find(method); it != handlers_.end()) {
                handler = it->second;
            }
            if (auto it = triggers_.find(method); it != triggers_.end()) {
                trigger = it->second;
            }
        }

        if (trigger) {
            auto executor = co_await boost::asio::this_coro::executor;
            boost::asio::co_spawn(executor,
                [this, trigger = *trigger]() -> awaitable<void> {
                    co_await delay(trigger.after);
                    bus_.publish(trigger.event);
                },
                boost::asio::detached);
        }

        if (handler) {
            co_return handler(params);
        }
        co_return json::object();
    }

    void listen(Scope scope, flow::EventCallback callback) override {
        bus_.listen(std::move(scope), std::move(callback));
    }

    auto publish(const flow::Event& event) -> std::size_t { return bus_.publish(event); }

    [[nodiscard]] auto listener_count() const -> std::size_t { return bus_.listener_count(); }

    [[nodiscard]] auto commands() const -> std::vector<Command> {
        std::lock_guard lock(mutex_);
        return commands_;
    }

    [[nodiscard]] auto methods() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        std::vector<std::string> out;
        for (const auto& c : commands_) out.push_back(c.method);
        return out;
    }

private:
    struct Trigger {
        flow::Event event;
        std::chrono::milliseconds after;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
    std::map<std::string, Trigger> triggers_;
    std::vector<Command> commands_;
    flow::EventBus bus_;
};

} // namespace cdpflow::test
