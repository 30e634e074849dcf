#include "cdpflow/browser/cdp_message.hpp"

#include <limits>

namespace cdpflow::browser {

auto parse_cdp_message(std::string_view text) -> Result<CdpMessage> {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::ProtocolError, "Malformed CDP message", e.what()));
    }

    if (!j.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::ProtocolError, "CDP message is not an object"));
    }

    // Responses to our commands carry the command id
    if (j.contains("id")) {
        if (!j["id"].is_number_integer()) {
            return std::unexpected(make_error(
                ErrorCode::ProtocolError, "CDP message id is not an integer",
                j["id"].dump()));
        }

        if (j["id"].is_number_unsigned() &&
            j["id"].get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::unexpected(make_error(
                ErrorCode::ProtocolError, "CDP message id is out of range",
                j["id"].dump()));
        }

        CdpResponse response{j["id"].get<std::int64_t>(), json::object()};
        if (j.contains("error")) {
            const auto& err = j["error"];
            std::string message = "CDP error";
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                message = err["message"].get<std::string>();
            }
            std::string detail;
            if (err.is_object() && err.contains("data")) {
                detail = err["data"].is_string() ? err["data"].get<std::string>()
                                                 : err["data"].dump();
            }
            response.result = std::unexpected(
                make_error(ErrorCode::BrowserError, std::move(message), std::move(detail)));
        } else if (j.contains("result")) {
            response.result = std::move(j["result"]);
        }
        return CdpMessage{std::move(response)};
    }

    // Otherwise it is an event notification
    if (j.contains("method") && j["method"].is_string()) {
        flow::Event event;
        event.method = j["method"].get<std::string>();
        if (j.contains("params") && j["params"].is_object()) {
            event.params = std::move(j["params"]);
        }
        return CdpMessage{std::move(event)};
    }

    return std::unexpected(make_error(
        ErrorCode::ProtocolError, "CDP message has neither id nor method"));
}

auto make_cdp_command(std::int64_t id, std::string_view method, const json& params) -> std::string {
    json message = {
        {"id", id},
        {"method", std::string(method)},
        {"params", params.is_null() ? json::object() : params},
    };
    return message.dump();
}

} // namespace cdpflow::browser
