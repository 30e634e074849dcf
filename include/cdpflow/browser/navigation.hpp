#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cdpflow/browser/target.hpp"
#include "cdpflow/flow/action.hpp"
#include "cdpflow/flow/nav_wait.hpp"
#include "cdpflow/flow/wait.hpp"

namespace cdpflow::browser {

using json = nlohmann::json;

/// One entry of Page.getNavigationHistory.
struct NavigationEntry {
    std::int64_t id = 0;
    std::string url;
    std::string user_typed_url;
    std::string title;
    std::string transition_type;
};

void to_json(json& j, const NavigationEntry& e);
void from_json(const json& j, NavigationEntry& e);

/// Builds navigation and page-inspection actions against one target.
/// The target must outlive every action built here. Output pointers are
/// written only when the action succeeds, and must stay valid until then.
class Navigator {
public:
    /// `retry_tick` paces the location polling of wait_not_location().
    explicit Navigator(Target& target,
                       std::chrono::steady_clock::duration retry_tick = flow::kDefaultRetryTick);

    /// Page.navigate to `url`, then wait. An errorText in the reply is a
    /// NavigationError.
    [[nodiscard]] auto navigate(std::string url,
                                flow::NavWait wait = flow::NavWait::load_event_fired()) const
        -> flow::ActionPtr;

    /// Only wait, for a navigation triggered some other way.
    [[nodiscard]] auto wait_navigate(flow::NavWait wait = flow::NavWait::load_event_fired()) const
        -> flow::ActionPtr;

    /// Throws std::invalid_argument if either pointer is null.
    [[nodiscard]] auto navigation_entries(std::int64_t* current_index,
                                          std::vector<NavigationEntry>* entries) const
        -> flow::ActionPtr;

    [[nodiscard]] auto navigate_to_history_entry(
        std::int64_t entry_id, flow::NavWait wait = flow::NavWait::load_event_fired()) const
        -> flow::ActionPtr;

    /// Fails with NavigationError when there is no previous entry.
    [[nodiscard]] auto navigate_back(flow::NavWait wait = flow::NavWait::load_event_fired()) const
        -> flow::ActionPtr;

    /// Fails with NavigationError when there is no next entry.
    [[nodiscard]] auto navigate_forward(flow::NavWait wait = flow::NavWait::load_event_fired()) const
        -> flow::ActionPtr;

    [[nodiscard]] auto reload(flow::NavWait wait = flow::NavWait::load_event_fired()) const
        -> flow::ActionPtr;

    /// Page.stopLoading.
    [[nodiscard]] auto stop() const -> flow::ActionPtr;

    /// Viewport screenshot as raw PNG bytes.
    /// Throws std::invalid_argument if `out` is null.
    [[nodiscard]] auto capture_screenshot(std::string* out) const -> flow::ActionPtr;

    /// document.location. Throws std::invalid_argument if `out` is null.
    [[nodiscard]] auto location(std::string* out) const -> flow::ActionPtr;

    /// document.title. Throws std::invalid_argument if `out` is null.
    [[nodiscard]] auto title(std::string* out) const -> flow::ActionPtr;

    /// Poll the location every retry tick until it differs from `not_url`,
    /// then store it in `*ret` if `ret` is not null. Failed reads keep polling.
    [[nodiscard]] auto wait_not_location(std::string not_url, std::string* ret) const
        -> flow::ActionPtr;

    /// Read the current location, then wait_not_location() with it.
    [[nodiscard]] auto wait_location_changed(std::string* ret) const -> flow::ActionPtr;

private:
    Target& target_;
    std::chrono::steady_clock::duration retry_tick_;
};

} // namespace cdpflow::browser
