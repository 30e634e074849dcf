#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cdpflow/browser/target.hpp"
#include "cdpflow/flow/action.hpp"

namespace cdpflow::browser {

using json = nlohmann::json;

/// A browser cookie as reported by Network.getAllCookies.
struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path;
    double expires = -1;       // seconds since the epoch, -1 for session cookies
    int size = 0;
    bool http_only = false;
    bool secure = false;
    bool session = false;
    std::string same_site;     // "Strict", "Lax", "None" or empty
    std::string priority;      // "Low", "Medium", "High" or empty
};

void to_json(json& j, const Cookie& c);
void from_json(const json& j, Cookie& c);

/// Network.setCookies "cookies" parameter for `cookies`. Expiry is
/// truncated to whole seconds and left out for session cookies.
auto cookie_params_from_cookies(const std::vector<Cookie>& cookies) -> json;

/// Network.setCookies. `target` must outlive the action.
auto set_cookies(Target& target, std::vector<Cookie> cookies) -> flow::ActionPtr;

/// Network.getAllCookies into `*cookies`. `target` must outlive the action.
/// Throws std::invalid_argument if `cookies` is null.
auto get_cookies(Target& target, std::vector<Cookie>* cookies) -> flow::ActionPtr;

} // namespace cdpflow::browser
