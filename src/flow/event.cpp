#include "cdpflow/flow/event.hpp"
#include "cdpflow/core/logger.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <vector>

namespace cdpflow::flow {

namespace {

struct Listener {
    std::uint64_t id = 0;
    Scope scope;
    EventCallback callback;
    Scope::Registration removal;
};

} // anonymous namespace

struct EventBus::Registry {
    mutable std::mutex mutex;
    std::uint64_t next_id = 1;
    std::vector<std::shared_ptr<Listener>> listeners;

    void remove(std::uint64_t id) {
        std::shared_ptr<Listener> removed;
        {
            std::lock_guard lock(mutex);
            auto it = std::find_if(listeners.begin(), listeners.end(),
                [id](const auto& l) { return l->id == id; });
            if (it == listeners.end()) {
                return;
            }
            removed = std::move(*it);
            listeners.erase(it);
        }
        // `removed` is released here, outside the lock.
    }
};

EventBus::EventBus() : registry_(std::make_shared<Registry>()) {}

EventBus::~EventBus() = default;

void EventBus::listen(Scope scope, EventCallback callback) {
    if (!callback || scope.is_cancelled()) {
        return;
    }

    auto listener = std::make_shared<Listener>();
    listener->scope = scope;
    listener->callback = std::move(callback);
    {
        std::lock_guard lock(registry_->mutex);
        listener->id = registry_->next_id++;
        registry_->listeners.push_back(listener);
    }

    // Registered outside the lock: if the scope was cancelled meanwhile the
    // callback runs right away and needs the lock itself.
    std::weak_ptr<Registry> weak = registry_;
    listener->removal = scope.on_cancel([weak, id = listener->id](const Error&) {
        if (auto registry = weak.lock()) {
            registry->remove(id);
        }
    });
    LOG_TRACE("EventBus: listener {} registered", listener->id);
}

auto EventBus::publish(const Event& event) -> std::size_t {
    std::vector<std::shared_ptr<Listener>> snapshot;
    {
        std::lock_guard lock(registry_->mutex);
        snapshot = registry_->listeners;
    }

    std::size_t delivered = 0;
    for (const auto& listener : snapshot) {
        if (listener->scope.is_cancelled()) {
            continue;
        }
        // A throwing listener must not starve the ones after it.
        try {
            listener->callback(event);
            ++delivered;
        } catch (const std::exception& e) {
            LOG_WARN("EventBus: listener {} threw on {}: {}", listener->id, event.method, e.what());
        } catch (...) {
            LOG_WARN("EventBus: listener {} threw on {}", listener->id, event.method);
        }
    }
    LOG_TRACE("EventBus: {} delivered to {} listener(s)", event.method, delivered);
    return delivered;
}

auto EventBus::listener_count() const -> std::size_t {
    std::lock_guard lock(registry_->mutex);
    return registry_->listeners.size();
}

} // namespace cdpflow::flow
