#include "cdpflow/core/scope.hpp"
#include "cdpflow/core/logger.hpp"
#include "cdpflow/core/notifier.hpp"

#include <map>
#include <mutex>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace cdpflow {

namespace detail {

struct ScopeState {
    ScopeState() = default;
    ScopeState(const ScopeState&) = delete;
    ScopeState& operator=(const ScopeState&) = delete;

    ~ScopeState() {
        // A dropped deadline scope must not keep its executor busy.
        if (deadline_timer) {
            auto timer = std::move(deadline_timer);
            boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
        }
    }

    std::mutex mutex;
    std::optional<Error> error;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, Scope::CancelCallback> callbacks;

    // Keeps the parent (and its deadline timer) alive as long as a child
    // can still be cancelled through it.
    std::shared_ptr<ScopeState> parent;
    Scope::Registration parent_link;
    Scope::Registration deadline_link;
    std::shared_ptr<boost::asio::steady_timer> deadline_timer;
};

} // namespace detail

namespace {

using detail::ScopeState;

void cancel_state(const std::shared_ptr<ScopeState>& state, const Error& reason) {
    std::map<std::uint64_t, Scope::CancelCallback> callbacks;
    Scope::Registration parent_link;
    std::shared_ptr<ScopeState> parent;
    {
        std::lock_guard lock(state->mutex);
        if (state->error) {
            return;
        }
        state->error = reason;
        callbacks.swap(state->callbacks);
        // A cancelled child no longer needs its parent.
        parent_link = std::move(state->parent_link);
        parent = std::move(state->parent);
    }

    // Outside the lock: callbacks may cancel children or unregister.
    for (auto& [id, callback] : callbacks) {
        callback(reason);
    }
}

auto cancelled_error() -> Error {
    return make_error(ErrorCode::Cancelled, "scope cancelled");
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Scope::Registration
// ---------------------------------------------------------------------------

Scope::Registration::Registration(std::weak_ptr<ScopeState> state, std::uint64_t id)
    : state_(std::move(state)), id_(id) {}

Scope::Registration::~Registration() {
    reset();
}

Scope::Registration::Registration(Registration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

Scope::Registration& Scope::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void Scope::Registration::reset() {
    if (auto state = state_.lock()) {
        std::lock_guard lock(state->mutex);
        state->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

// ---------------------------------------------------------------------------
// Scope
// ---------------------------------------------------------------------------

Scope::Scope() : state_(std::make_shared<ScopeState>()) {}

Scope::Scope(std::shared_ptr<ScopeState> state) : state_(std::move(state)) {}

auto Scope::derive() const -> Scope {
    auto child = std::make_shared<ScopeState>();
    child->parent = state_;

    std::weak_ptr<ScopeState> weak = child;
    child->parent_link = on_cancel([weak](const Error& reason) {
        if (auto state = weak.lock()) {
            cancel_state(state, reason);
        }
    });
    return Scope(std::move(child));
}

auto Scope::derive_with_timeout(boost::asio::any_io_executor executor,
                                std::chrono::steady_clock::duration timeout) const -> Scope {
    auto scope = derive();

    auto timer = std::make_shared<boost::asio::steady_timer>(
        boost::asio::make_strand(executor), timeout);

    std::weak_ptr<ScopeState> weak = scope.state_;
    timer->async_wait([weak, timer](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto state = weak.lock()) {
            cancel_state(state, make_error(ErrorCode::DeadlineExceeded,
                                           "scope deadline exceeded"));
        }
    });

    // Release the timer early when the scope ends some other way.
    auto link = scope.on_cancel([timer](const Error&) {
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
    });
    {
        std::lock_guard lock(scope.state_->mutex);
        scope.state_->deadline_link = std::move(link);
        scope.state_->deadline_timer = timer;
    }
    return scope;
}

void Scope::cancel() const {
    cancel_state(state_, cancelled_error());
}

void Scope::cancel(Error reason) const {
    cancel_state(state_, reason);
}

auto Scope::is_cancelled() const -> bool {
    std::lock_guard lock(state_->mutex);
    return state_->error.has_value();
}

auto Scope::error() const -> std::optional<Error> {
    std::lock_guard lock(state_->mutex);
    return state_->error;
}

auto Scope::on_cancel(CancelCallback callback) const -> Registration {
    std::optional<Error> reason;
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->error) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return Registration(state_, id);
        }
        reason = state_->error;
    }
    callback(*reason);
    return {};
}

auto Scope::wait_cancelled() const -> awaitable<Error> {
    Scope self = *this;
    auto executor = co_await boost::asio::this_coro::executor;

    auto notifier = std::make_shared<Notifier>(executor);
    auto registration = self.on_cancel([notifier](const Error&) {
        notifier->notify();
    });
    co_await notifier->wait();

    co_return self.error().value_or(cancelled_error());
}

auto Scope::pending_callbacks() const -> std::size_t {
    std::lock_guard lock(state_->mutex);
    return state_->callbacks.size();
}

// ---------------------------------------------------------------------------
// sleep_for
// ---------------------------------------------------------------------------

auto sleep_for(Scope scope, std::chrono::steady_clock::duration duration)
    -> awaitable<Result<void>> {
    if (auto err = scope.error()) {
        co_return make_fail(*err);
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto strand = boost::asio::make_strand(executor);
    auto timer = std::make_shared<boost::asio::steady_timer>(strand, duration);

    // The cancel is posted to the timer's strand, which also runs the wait
    // below, so the two never race on the timer.
    auto registration = scope.on_cancel([timer](const Error&) {
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
    });

    co_await boost::asio::co_spawn(strand,
        [timer, scope]() -> awaitable<void> {
            if (scope.is_cancelled()) {
                co_return;
            }
            // operation_aborted is the scope's cancellation, reported below.
            auto [ec] = co_await timer->async_wait(
                boost::asio::as_tuple(boost::asio::use_awaitable));
            if (ec && ec != boost::asio::error::operation_aborted) {
                LOG_DEBUG("sleep_for: timer error: {}", ec.message());
            }
        },
        boost::asio::use_awaitable);

    if (auto err = scope.error()) {
        co_return make_fail(*err);
    }
    co_return ok_result();
}

} // namespace cdpflow
