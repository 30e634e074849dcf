#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "cdpflow/browser/target.hpp"
#include "cdpflow/core/error.hpp"

namespace cdpflow::browser {

using boost::asio::awaitable;
using json = nlohmann::json;

/// Host, port and request target of a ws:// DevTools URL.
struct WsEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

/// Split "ws://host[:port]/path". The port defaults to 9222.
/// wss:// is rejected with ConnectionFailed.
auto parse_ws_url(std::string_view ws_url) -> Result<WsEndpoint>;

/// Chrome DevTools Protocol WebSocket client for one page target.
/// Events received from the browser are delivered to every listen()er.
class CdpClient final : public Target {
public:
    explicit CdpClient(boost::asio::any_io_executor executor);
    ~CdpClient() override;

    CdpClient(const CdpClient&) = delete;
    CdpClient& operator=(const CdpClient&) = delete;

    /// Connect to the page's DevTools WebSocket endpoint.
    auto connect(std::string_view ws_url) -> awaitable<Result<void>>;

    /// Close the connection. Pending commands fail with ConnectionClosed.
    auto disconnect() -> awaitable<void>;

    auto send_command(Scope scope, std::string method, json params)
        -> awaitable<Result<json>> override;

    void listen(Scope scope, flow::EventCallback callback) override;

    [[nodiscard]] auto is_connected() const -> bool;

    /// The WebSocket URL passed to connect().
    [[nodiscard]] auto ws_url() const -> std::string;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace cdpflow::browser
