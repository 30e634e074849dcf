#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "cdpflow/core/error.hpp"

namespace cdpflow {

using boost::asio::awaitable;

namespace detail {
struct ScopeState;
} // namespace detail

/// Cancellable execution scope.
///
/// A Scope is a cheap handle onto shared cancellation state. Scopes form a
/// tree: derive() creates a child that is cancelled whenever its parent is,
/// while cancelling a child leaves the parent untouched. Once cancelled a
/// scope stays cancelled and reports the first reason it was given.
///
/// Cancellation is advisory. Work running under a scope observes it through
/// is_cancelled(), on_cancel() or wait_cancelled().
class Scope {
public:
    using CancelCallback = std::function<void(const Error&)>;

    /// RAII handle for an on_cancel() callback. Destroying it unregisters
    /// the callback if it has not run yet.
    class Registration {
    public:
        Registration() = default;
        ~Registration();

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;

        /// Unregister now instead of at destruction.
        void reset();

    private:
        friend class Scope;

        Registration(std::weak_ptr<detail::ScopeState> state, std::uint64_t id);

        std::weak_ptr<detail::ScopeState> state_;
        std::uint64_t id_ = 0;
    };

    /// A fresh root scope that is only ever cancelled explicitly.
    Scope();

    /// Child scope, cancelled together with this one.
    [[nodiscard]] auto derive() const -> Scope;

    /// Child scope that additionally cancels itself with DeadlineExceeded
    /// once `timeout` has elapsed. The timer runs on `executor`.
    [[nodiscard]] auto derive_with_timeout(boost::asio::any_io_executor executor,
                                           std::chrono::steady_clock::duration timeout) const
        -> Scope;

    /// Cancel with ErrorCode::Cancelled. No-op if already cancelled.
    void cancel() const;

    /// Cancel with a specific reason. No-op if already cancelled.
    void cancel(Error reason) const;

    [[nodiscard]] auto is_cancelled() const -> bool;

    /// The cancellation reason, or nullopt while the scope is live.
    [[nodiscard]] auto error() const -> std::optional<Error>;

    /// Run `callback` once when the scope is cancelled. If it already is,
    /// the callback runs before on_cancel() returns. Callbacks run on the
    /// thread that cancels and must not block.
    [[nodiscard]] auto on_cancel(CancelCallback callback) const -> Registration;

    /// Suspend the calling coroutine until the scope is cancelled and
    /// return the cancellation reason.
    auto wait_cancelled() const -> awaitable<Error>;

    /// Number of callbacks currently registered on this scope.
    [[nodiscard]] auto pending_callbacks() const -> std::size_t;

private:
    explicit Scope(std::shared_ptr<detail::ScopeState> state);

    std::shared_ptr<detail::ScopeState> state_;
};

/// Sleep for `duration` unless `scope` is cancelled first. Returns the
/// scope's error when cancelled, before or during the sleep.
auto sleep_for(Scope scope, std::chrono::steady_clock::duration duration)
    -> awaitable<Result<void>>;

} // namespace cdpflow
