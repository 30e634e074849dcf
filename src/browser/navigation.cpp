#include "cdpflow/browser/navigation.hpp"
#include "cdpflow/core/logger.hpp"
#include "cdpflow/core/utils.hpp"

#include <stdexcept>

namespace cdpflow::browser {

void to_json(json& j, const NavigationEntry& e) {
    j = json{
        {"id", e.id},
        {"url", e.url},
        {"userTypedURL", e.user_typed_url},
        {"title", e.title},
        {"transitionType", e.transition_type},
    };
}

void from_json(const json& j, NavigationEntry& e) {
    e.id = j.value("id", std::int64_t{0});
    e.url = j.value("url", "");
    e.user_typed_url = j.value("userTypedURL", "");
    e.title = j.value("title", "");
    e.transition_type = j.value("transitionType", "");
}

namespace {

using flow::ActionPtr;
using flow::make_action;

struct History {
    std::int64_t current_index = -1;
    std::vector<NavigationEntry> entries;
};

auto get_history(Target& target, Scope scope) -> awaitable<Result<History>> {
    auto result = co_await target.send_command(scope, "Page.getNavigationHistory", json::object());
    if (!result) {
        co_return make_fail(result.error());
    }

    try {
        History history;
        history.current_index = result->value("currentIndex", std::int64_t{-1});
        if (result->contains("entries")) {
            history.entries = (*result)["entries"].get<std::vector<NavigationEntry>>();
        }
        co_return history;
    } catch (const json::exception& e) {
        co_return make_fail(make_error(
            ErrorCode::ProtocolError, "Malformed navigation history", e.what()));
    }
}

/// Runtime.evaluate `expression` and return its value as a string.
auto evaluate_string(Target& target, Scope scope, std::string expression)
    -> awaitable<Result<std::string>> {
    auto result = co_await target.send_command(scope, "Runtime.evaluate", {
        {"expression", expression},
        {"returnByValue", true},
    });
    if (!result) {
        co_return make_fail(result.error());
    }

    if (result->contains("exceptionDetails")) {
        const auto& exc = (*result)["exceptionDetails"];
        std::string text = exc.value("text", "Unknown exception");
        if (exc.contains("exception") && exc["exception"].contains("description")) {
            text = exc["exception"]["description"].get<std::string>();
        }
        co_return make_fail(make_error(ErrorCode::BrowserError,
                                       "Evaluation of '" + expression + "' threw", text));
    }

    if (result->contains("result")) {
        const auto& remote_obj = (*result)["result"];
        if (remote_obj.contains("value") && remote_obj["value"].is_string()) {
            co_return remote_obj["value"].get<std::string>();
        }
    }
    co_return std::string{};
}

/// Send `method`, then wait for the navigation it triggers.
auto command_then_wait(Target& target, Scope scope, std::string method, json params,
                       const flow::NavWait& wait) -> awaitable<Result<void>> {
    auto result = co_await target.send_command(scope, method, std::move(params));
    if (!result) {
        co_return make_fail(result.error());
    }
    co_return co_await flow::wait_nav_event(scope, target, wait);
}

template <typename T>
void require_output(T* out, const char* what) {
    if (out == nullptr) {
        throw std::invalid_argument(std::string(what) + " cannot be null");
    }
}

} // anonymous namespace

Navigator::Navigator(Target& target, std::chrono::steady_clock::duration retry_tick)
    : target_(target), retry_tick_(retry_tick) {}

auto Navigator::navigate(std::string url, flow::NavWait wait) const -> ActionPtr {
    return make_action([&target = target_, url = std::move(url), wait = std::move(wait)](
                           Scope scope) -> awaitable<Result<void>> {
        auto result = co_await target.send_command(scope, "Page.navigate", {{"url", url}});
        if (!result) {
            co_return make_fail(result.error());
        }
        if (result->contains("errorText") && (*result)["errorText"].is_string()) {
            co_return make_fail(make_error(ErrorCode::NavigationError, "Navigation failed",
                                           (*result)["errorText"].get<std::string>()));
        }

        auto waited = co_await flow::wait_nav_event(scope, target, wait);
        if (!waited) {
            co_return make_fail(waited.error());
        }
        LOG_DEBUG("Navigated to: {}", url);
        co_return ok_result();
    });
}

auto Navigator::wait_navigate(flow::NavWait wait) const -> ActionPtr {
    return flow::wait_navigate(target_, std::move(wait));
}

auto Navigator::navigation_entries(std::int64_t* current_index,
                                   std::vector<NavigationEntry>* entries) const -> ActionPtr {
    require_output(current_index, "current_index");
    require_output(entries, "entries");

    return make_action([&target = target_, current_index, entries](
                           Scope scope) -> awaitable<Result<void>> {
        auto history = co_await get_history(target, scope);
        if (!history) {
            co_return make_fail(history.error());
        }
        *current_index = history->current_index;
        *entries = std::move(history->entries);
        co_return ok_result();
    });
}

auto Navigator::navigate_to_history_entry(std::int64_t entry_id, flow::NavWait wait) const
    -> ActionPtr {
    return make_action([&target = target_, entry_id, wait = std::move(wait)](
                           Scope scope) -> awaitable<Result<void>> {
        co_return co_await command_then_wait(target, scope, "Page.navigateToHistoryEntry",
                                             {{"entryId", entry_id}}, wait);
    });
}

auto Navigator::navigate_back(flow::NavWait wait) const -> ActionPtr {
    return make_action([&target = target_, wait = std::move(wait)](
                           Scope scope) -> awaitable<Result<void>> {
        auto history = co_await get_history(target, scope);
        if (!history) {
            co_return make_fail(history.error());
        }

        auto cur = history->current_index;
        auto count = static_cast<std::int64_t>(history->entries.size());
        if (cur <= 0 || cur > count - 1) {
            co_return make_fail(make_error(ErrorCode::NavigationError,
                                           "invalid navigation entry",
                                           "no previous history entry"));
        }

        auto entry_id = history->entries[static_cast<size_t>(cur - 1)].id;
        co_return co_await command_then_wait(target, scope, "Page.navigateToHistoryEntry",
                                             {{"entryId", entry_id}}, wait);
    });
}

auto Navigator::navigate_forward(flow::NavWait wait) const -> ActionPtr {
    return make_action([&target = target_, wait = std::move(wait)](
                           Scope scope) -> awaitable<Result<void>> {
        auto history = co_await get_history(target, scope);
        if (!history) {
            co_return make_fail(history.error());
        }

        auto cur = history->current_index;
        auto count = static_cast<std::int64_t>(history->entries.size());
        if (cur < 0 || cur >= count - 1) {
            co_return make_fail(make_error(ErrorCode::NavigationError,
                                           "invalid navigation entry",
                                           "no next history entry"));
        }

        auto entry_id = history->entries[static_cast<size_t>(cur + 1)].id;
        co_return co_await command_then_wait(target, scope, "Page.navigateToHistoryEntry",
                                             {{"entryId", entry_id}}, wait);
    });
}

auto Navigator::reload(flow::NavWait wait) const -> ActionPtr {
    return make_action([&target = target_, wait = std::move(wait)](
                           Scope scope) -> awaitable<Result<void>> {
        co_return co_await command_then_wait(target, scope, "Page.reload", json::object(), wait);
    });
}

auto Navigator::stop() const -> ActionPtr {
    return make_action([&target = target_](Scope scope) -> awaitable<Result<void>> {
        auto result = co_await target.send_command(scope, "Page.stopLoading", json::object());
        if (!result) {
            co_return make_fail(result.error());
        }
        co_return ok_result();
    });
}

auto Navigator::capture_screenshot(std::string* out) const -> ActionPtr {
    require_output(out, "out");

    return make_action([&target = target_, out](Scope scope) -> awaitable<Result<void>> {
        auto result = co_await target.send_command(scope, "Page.captureScreenshot",
                                                   {{"format", "png"}});
        if (!result) {
            co_return make_fail(result.error());
        }
        if (!result->contains("data") || !(*result)["data"].is_string()) {
            co_return make_fail(make_error(ErrorCode::ProtocolError,
                                           "Screenshot reply has no data"));
        }

        auto bytes = utils::base64_decode((*result)["data"].get<std::string>());
        if (!bytes) {
            co_return make_fail(bytes.error());
        }
        *out = std::move(*bytes);
        co_return ok_result();
    });
}

auto Navigator::location(std::string* out) const -> ActionPtr {
    require_output(out, "out");

    return make_action([&target = target_, out](Scope scope) -> awaitable<Result<void>> {
        auto value = co_await evaluate_string(target, scope, "document.location.toString()");
        if (!value) {
            co_return make_fail(value.error());
        }
        *out = std::move(*value);
        co_return ok_result();
    });
}

auto Navigator::title(std::string* out) const -> ActionPtr {
    require_output(out, "out");

    return make_action([&target = target_, out](Scope scope) -> awaitable<Result<void>> {
        auto value = co_await evaluate_string(target, scope, "document.title");
        if (!value) {
            co_return make_fail(value.error());
        }
        *out = std::move(*value);
        co_return ok_result();
    });
}

auto Navigator::wait_not_location(std::string not_url, std::string* ret) const -> ActionPtr {
    return flow::wait_until(
        [&target = target_, not_url = std::move(not_url), ret](
            Scope scope) -> awaitable<flow::Outcome> {
            auto current = co_await evaluate_string(target, scope, "document.location.toString()");
            if (!current) {
                LOG_TRACE("wait_not_location: location read failed: {}",
                          current.error().what());
                co_return flow::Outcome::continue_waiting();
            }
            if (*current == not_url) {
                co_return flow::Outcome::continue_waiting();
            }
            if (ret != nullptr) {
                *ret = std::move(*current);
            }
            co_return flow::Outcome::success();
        },
        retry_tick_);
}

auto Navigator::wait_location_changed(std::string* ret) const -> ActionPtr {
    return make_action([nav = *this, ret](Scope scope) -> awaitable<Result<void>> {
        auto initial = co_await evaluate_string(nav.target_, scope, "document.location.toString()");
        std::string from;
        if (initial) {
            from = std::move(*initial);
        } else {
            LOG_DEBUG("wait_location_changed: initial location unknown: {}",
                      initial.error().what());
        }
        auto waiter = nav.wait_not_location(std::move(from), ret);
        co_return co_await waiter->run(scope);
    });
}

} // namespace cdpflow::browser
