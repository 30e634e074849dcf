#include "cdpflow/core/notifier.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace cdpflow {

Notifier::Notifier(boost::asio::any_io_executor executor)
    : channel_(std::move(executor), 0)
{
}

void Notifier::notify() {
    if (notified_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    channel_.close();
}

auto Notifier::wait() -> awaitable<void> {
    auto self = shared_from_this();
    // Completes with channel_closed once notify() has run.
    auto [ec] = co_await self->channel_.async_receive(
        boost::asio::as_tuple(boost::asio::use_awaitable));
    (void)ec;
}

} // namespace cdpflow
