#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "cdpflow/core/error.hpp"
#include "cdpflow/flow/event.hpp"

namespace cdpflow::browser {

using json = nlohmann::json;

/// Reply to a command we sent. `result` holds the "result" object, or a
/// BrowserError built from the "error" object.
struct CdpResponse {
    std::int64_t id = 0;
    Result<json> result;
};

using CdpMessage = std::variant<CdpResponse, flow::Event>;

/// Classify one WebSocket text frame from the browser.
/// Frames that are not JSON objects carrying an "id" or a "method" are
/// ProtocolErrors.
auto parse_cdp_message(std::string_view text) -> Result<CdpMessage>;

/// Serialize a command frame.
auto make_cdp_command(std::int64_t id, std::string_view method, const json& params) -> std::string;

} // namespace cdpflow::browser
