#include "cdpflow/browser/cdp_client.hpp"
#include "cdpflow/browser/cdp_message.hpp"
#include "cdpflow/core/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace cdpflow::browser {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

auto parse_ws_url(std::string_view ws_url) -> Result<WsEndpoint> {
    std::string url_str(ws_url);

    if (url_str.starts_with("wss://")) {
        return std::unexpected(make_error(
            ErrorCode::ConnectionFailed, "wss:// DevTools endpoints are not supported", url_str));
    }
    if (!url_str.starts_with("ws://")) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "DevTools URL must start with ws://", url_str));
    }

    constexpr size_t start = 5;
    auto path_pos = url_str.find('/', start);
    auto host_port = url_str.substr(start, path_pos - start);

    WsEndpoint ep;
    ep.target = (path_pos != std::string::npos) ? url_str.substr(path_pos) : "/";

    auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        ep.host = host_port.substr(0, colon_pos);
        ep.port = host_port.substr(colon_pos + 1);
    } else {
        ep.host = host_port;
        ep.port = "9222";
    }

    if (ep.host.empty() || ep.port.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "DevTools URL has no host or port", url_str));
    }
    return ep;
}

// ---------------------------------------------------------------------------
// Pending command: the read loop sends the reply, send_command receives it
// ---------------------------------------------------------------------------

using reply_channel_t = net::experimental::concurrent_channel<
    void(boost::system::error_code, Result<json>)>;

struct PendingCommand {
    std::shared_ptr<reply_channel_t> reply;
};

// ---------------------------------------------------------------------------
// CdpClient::Impl
// ---------------------------------------------------------------------------

struct CdpClient::Impl : std::enable_shared_from_this<CdpClient::Impl> {
    net::any_io_executor executor;
    // Every operation on the stream, and the outbox, belong to this strand.
    net::strand<net::any_io_executor> strand;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws;
    std::string url;
    std::atomic<bool> connected{false};
    std::atomic<std::int64_t> next_id{1};

    std::deque<std::string> outbox;
    bool writing = false;

    std::mutex pending_mutex;
    std::unordered_map<std::int64_t, PendingCommand> pending_commands;

    flow::EventBus events;

    explicit Impl(net::any_io_executor ex)
        : executor(std::move(ex)), strand(net::make_strand(executor)) {}

    auto allocate_id() -> std::int64_t {
        return next_id.fetch_add(1, std::memory_order_relaxed);
    }

    void complete(std::int64_t id, Result<json> result) {
        PendingCommand cmd;
        {
            std::lock_guard lock(pending_mutex);
            auto it = pending_commands.find(id);
            if (it == pending_commands.end()) {
                LOG_DEBUG("CDP reply for unknown command id {}", id);
                return;
            }
            cmd = std::move(it->second);
            pending_commands.erase(it);
        }
        cmd.reply->try_send(boost::system::error_code{}, std::move(result));
    }

    void fail_all(const Error& err) {
        std::unordered_map<std::int64_t, PendingCommand> failed;
        {
            std::lock_guard lock(pending_mutex);
            failed.swap(pending_commands);
        }
        for (auto& [id, cmd] : failed) {
            cmd.reply->try_send(boost::system::error_code{}, Result<json>(std::unexpected(err)));
        }
    }

    void dispatch_message(std::string_view msg) {
        auto parsed = parse_cdp_message(msg);
        if (!parsed) {
            LOG_WARN("Dropping CDP message: {}", parsed.error().what());
            return;
        }

        if (auto* response = std::get_if<CdpResponse>(&*parsed)) {
            complete(response->id, std::move(response->result));
            return;
        }

        auto& event = std::get<flow::Event>(*parsed);
        auto delivered = events.publish(event);
        LOG_TRACE("CDP event {} delivered to {} listener(s)", event.method, delivered);
    }

    // Runs on the strand.
    void enqueue(std::string frame) {
        outbox.push_back(std::move(frame));
        if (writing) {
            return;
        }
        writing = true;
        net::co_spawn(strand,
            [self = shared_from_this()]() -> awaitable<void> {
                co_await self->write_loop();
            },
            net::detached);
    }

    auto write_loop() -> awaitable<void> {
        while (!outbox.empty()) {
            try {
                co_await ws->async_write(net::buffer(outbox.front()), net::use_awaitable);
                outbox.pop_front();
            } catch (const beast::system_error& se) {
                LOG_ERROR("CDP write error: {}", se.what());
                outbox.clear();
                connected = false;
                fail_all(make_error(ErrorCode::ConnectionClosed,
                                    "CDP connection closed", se.what()));
                beast::get_lowest_layer(*ws).close();
            }
        }
        writing = false;
    }

    auto read_loop() -> awaitable<void> {
        beast::flat_buffer buffer;
        while (connected) {
            try {
                co_await ws->async_read(buffer, net::use_awaitable);
                auto msg = beast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());
                dispatch_message(msg);
            } catch (const beast::system_error& se) {
                if (se.code() != websocket::error::closed &&
                    se.code() != net::error::operation_aborted) {
                    LOG_ERROR("CDP read error: {}", se.what());
                }
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("CDP message handling failed: {}", e.what());
                beast::get_lowest_layer(*ws).close();
                break;
            }
        }

        connected = false;
        fail_all(make_error(ErrorCode::ConnectionClosed, "CDP connection closed"));
        LOG_DEBUG("CDP read loop for {} finished", url);
    }
};

// ---------------------------------------------------------------------------
// CdpClient
// ---------------------------------------------------------------------------

CdpClient::CdpClient(boost::asio::any_io_executor executor)
    : impl_(std::make_shared<Impl>(std::move(executor))) {}

CdpClient::~CdpClient() {
    if (impl_->connected.exchange(false)) {
        // Closing the socket ends the read loop, which holds its own
        // reference to the Impl.
        net::post(impl_->strand, [impl = impl_] {
            if (impl->ws) {
                beast::get_lowest_layer(*impl->ws).close();
            }
        });
    }
}

auto CdpClient::connect(std::string_view ws_url) -> awaitable<Result<void>> {
    if (impl_->connected) {
        co_return make_fail(make_error(
            ErrorCode::InvalidArgument, "CDP client already connected", impl_->url));
    }

    auto endpoint = parse_ws_url(ws_url);
    if (!endpoint) {
        co_return make_fail(endpoint.error());
    }
    impl_->url = std::string(ws_url);

    try {
        tcp::resolver resolver(impl_->executor);
        auto results = co_await resolver.async_resolve(
            endpoint->host, endpoint->port, net::use_awaitable);

        impl_->ws = std::make_unique<websocket::stream<beast::tcp_stream>>(impl_->strand);

        beast::get_lowest_layer(*impl_->ws).expires_after(std::chrono::seconds(30));

        auto ep = co_await beast::get_lowest_layer(*impl_->ws).async_connect(
            results, net::use_awaitable);

        auto host_str = endpoint->host + ":" + std::to_string(ep.port());

        // The WebSocket layer has its own ping/pong timeouts
        beast::get_lowest_layer(*impl_->ws).expires_never();

        impl_->ws->set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::client));

        impl_->ws->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "cdpflow/1.0");
            }));

        co_await impl_->ws->async_handshake(host_str, endpoint->target, net::use_awaitable);
    } catch (const beast::system_error& se) {
        co_return make_fail(make_error(
            ErrorCode::ConnectionFailed, "Failed to connect to CDP", se.what()));
    }

    impl_->connected = true;
    LOG_INFO("CDP connected to {}", impl_->url);

    net::co_spawn(impl_->strand,
        [impl = impl_]() -> awaitable<void> {
            co_await impl->read_loop();
        },
        net::detached);

    co_return ok_result();
}

auto CdpClient::disconnect() -> awaitable<void> {
    if (!impl_->connected.exchange(false)) {
        co_return;
    }

    co_await net::co_spawn(impl_->strand,
        [impl = impl_]() -> awaitable<void> {
            try {
                co_await impl->ws->async_close(websocket::close_code::normal,
                                               net::use_awaitable);
            } catch (const beast::system_error& se) {
                LOG_DEBUG("CDP close: {}", se.what());
                beast::get_lowest_layer(*impl->ws).close();
            }
        },
        net::use_awaitable);

    LOG_INFO("CDP disconnected from {}", impl_->url);
}

auto CdpClient::send_command(Scope scope, std::string method, json params)
    -> awaitable<Result<json>> {
    if (auto err = scope.error()) {
        co_return make_fail(*err);
    }
    if (!impl_->connected) {
        co_return make_fail(make_error(
            ErrorCode::ConnectionClosed, "CDP client not connected"));
    }

    auto id = impl_->allocate_id();
    auto reply = std::make_shared<reply_channel_t>(co_await net::this_coro::executor, 1);

    {
        std::lock_guard lock(impl_->pending_mutex);
        impl_->pending_commands[id] = PendingCommand{reply};
    }
    // The read loop may have failed every pending command just before.
    if (!impl_->connected) {
        std::lock_guard lock(impl_->pending_mutex);
        impl_->pending_commands.erase(id);
        co_return make_fail(make_error(
            ErrorCode::ConnectionClosed, "CDP client not connected"));
    }

    // Whichever of the reply and the cancellation arrives first fills the slot.
    auto wake = scope.on_cancel([reply](const Error& reason) {
        reply->try_send(boost::system::error_code{}, Result<json>(std::unexpected(reason)));
    });

    LOG_TRACE("CDP -> {} {}", id, method);
    net::post(impl_->strand,
        [impl = impl_, frame = make_cdp_command(id, method, params)]() mutable {
            impl->enqueue(std::move(frame));
        });

    auto [ec, result] = co_await reply->async_receive(net::as_tuple(net::use_awaitable));

    {
        // Still registered when we were woken by cancellation
        std::lock_guard lock(impl_->pending_mutex);
        impl_->pending_commands.erase(id);
    }

    if (ec) {
        co_return make_fail(make_error(
            ErrorCode::ConnectionClosed, "CDP reply channel closed", ec.message()));
    }
    co_return std::move(result);
}

void CdpClient::listen(Scope scope, flow::EventCallback callback) {
    impl_->events.listen(std::move(scope), std::move(callback));
}

auto CdpClient::is_connected() const -> bool {
    return impl_->connected;
}

auto CdpClient::ws_url() const -> std::string {
    return impl_->url;
}

} // namespace cdpflow::browser
