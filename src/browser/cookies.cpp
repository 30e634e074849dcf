#include "cdpflow/browser/cookies.hpp"
#include "cdpflow/core/logger.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace cdpflow::browser {

void to_json(json& j, const Cookie& c) {
    j = json{
        {"name", c.name},
        {"value", c.value},
        {"domain", c.domain},
        {"path", c.path},
        {"expires", c.expires},
        {"size", c.size},
        {"httpOnly", c.http_only},
        {"secure", c.secure},
        {"session", c.session},
    };
    if (!c.same_site.empty()) j["sameSite"] = c.same_site;
    if (!c.priority.empty()) j["priority"] = c.priority;
}

void from_json(const json& j, Cookie& c) {
    c.name = j.value("name", "");
    c.value = j.value("value", "");
    c.domain = j.value("domain", "");
    c.path = j.value("path", "");
    c.expires = j.value("expires", -1.0);
    c.size = j.value("size", 0);
    c.http_only = j.value("httpOnly", false);
    c.secure = j.value("secure", false);
    c.session = j.value("session", false);
    c.same_site = j.value("sameSite", "");
    c.priority = j.value("priority", "");
}

auto cookie_params_from_cookies(const std::vector<Cookie>& cookies) -> json {
    auto params = json::array();
    for (const auto& c : cookies) {
        json p = {
            {"name", c.name},
            {"value", c.value},
            {"domain", c.domain},
            {"path", c.path},
            {"secure", c.secure},
            {"httpOnly", c.http_only},
        };
        if (!c.same_site.empty()) {
            p["sameSite"] = c.same_site;
        }
        if (!c.session && c.expires >= 0) {
            p["expires"] = static_cast<std::int64_t>(std::trunc(c.expires));
        }
        params.push_back(std::move(p));
    }
    return params;
}

auto set_cookies(Target& target, std::vector<Cookie> cookies) -> flow::ActionPtr {
    return flow::make_action([&target, cookies = std::move(cookies)](
                                 Scope scope) -> awaitable<Result<void>> {
        auto result = co_await target.send_command(
            scope, "Network.setCookies", {{"cookies", cookie_params_from_cookies(cookies)}});
        if (!result) {
            co_return make_fail(result.error());
        }
        LOG_DEBUG("Set {} cookie(s)", cookies.size());
        co_return ok_result();
    });
}

auto get_cookies(Target& target, std::vector<Cookie>* cookies) -> flow::ActionPtr {
    if (cookies == nullptr) {
        throw std::invalid_argument("cookies cannot be null");
    }

    return flow::make_action([&target, cookies](Scope scope) -> awaitable<Result<void>> {
        auto result = co_await target.send_command(scope, "Network.getAllCookies",
                                                   json::object());
        if (!result) {
            co_return make_fail(result.error());
        }

        try {
            *cookies = result->value("cookies", json::array()).get<std::vector<Cookie>>();
        } catch (const json::exception& e) {
            co_return make_fail(make_error(ErrorCode::ProtocolError,
                                           "Malformed cookie list", e.what()));
        }
        co_return ok_result();
    });
}

} // namespace cdpflow::browser
