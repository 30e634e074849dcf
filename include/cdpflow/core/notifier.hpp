#pragma once

#include <atomic>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

namespace cdpflow {

using boost::asio::awaitable;

/// One-shot wake-up signal.
///
/// notify() may be called from any thread, any number of times; only the
/// first call has an effect. wait() suspends the calling coroutine until
/// notify() has been called and returns immediately afterwards.
///
/// Nothing is ever sent on the underlying channel: notify() closes it, which
/// completes every pending and future receive.
class Notifier : public std::enable_shared_from_this<Notifier> {
public:
    explicit Notifier(boost::asio::any_io_executor executor);

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    void notify();

    [[nodiscard]] auto notified() const noexcept -> bool {
        return notified_.load(std::memory_order_acquire);
    }

    auto wait() -> awaitable<void>;

private:
    using channel_t = boost::asio::experimental::concurrent_channel<
        void(boost::system::error_code)>;

    channel_t channel_;
    std::atomic<bool> notified_{false};
};

} // namespace cdpflow
