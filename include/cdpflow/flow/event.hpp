#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "cdpflow/core/scope.hpp"

namespace cdpflow::flow {

using json = nlohmann::json;

/// An asynchronous notification, e.g. a CDP "Page.loadEventFired".
struct Event {
    std::string method;
    json params = json::object();
};

using EventCallback = std::function<void(const Event&)>;

/// Subscription contract: invoke `callback` once per event until `scope`
/// is cancelled. Stopping after cancellation may lag slightly, but must
/// happen eventually.
class EventSource {
public:
    virtual ~EventSource() = default;

    virtual void listen(Scope scope, EventCallback callback) = 0;
};

/// In-process EventSource. publish() may be called from any thread;
/// callbacks run on the publishing thread, outside the bus lock.
class EventBus final : public EventSource {
public:
    EventBus();
    ~EventBus() override;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void listen(Scope scope, EventCallback callback) override;

    /// Deliver `event` to every listener whose scope is still live.
    /// Returns the number of callbacks invoked.
    auto publish(const Event& event) -> std::size_t;

    [[nodiscard]] auto listener_count() const -> std::size_t;

private:
    struct Registry;
    std::shared_ptr<Registry> registry_;
};

} // namespace cdpflow::flow
