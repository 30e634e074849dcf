#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

#include "cdpflow/flow/event.hpp"

using namespace cdpflow;
using json = nlohmann::json;

TEST_CASE("EventBus delivers to live listeners", "[flow][event_bus]") {
    flow::EventBus bus;
    Scope scope;
    std::vector<std::string> seen;

    bus.listen(scope, [&seen](const flow::Event& ev) { seen.push_back(ev.method); });
    CHECK(bus.listener_count() == 1);

    CHECK(bus.publish(flow::Event{"Page.frameNavigated", json::object()}) == 1);
    CHECK(bus.publish(flow::Event{"Page.loadEventFired", json::object()}) == 1);

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "Page.frameNavigated");
    CHECK(seen[1] == "Page.loadEventFired");
}

TEST_CASE("EventBus drops listeners when their scope ends", "[flow][event_bus]") {
    flow::EventBus bus;
    Scope root;
    auto a = root.derive();
    auto b = root.derive();
    int a_calls = 0;
    int b_calls = 0;

    bus.listen(a, [&a_calls](const flow::Event&) { ++a_calls; });
    bus.listen(b, [&b_calls](const flow::Event&) { ++b_calls; });
    CHECK(bus.listener_count() == 2);

    a.cancel();
    CHECK(bus.listener_count() == 1);
    CHECK(bus.publish(flow::Event{"E", json::object()}) == 1);
    CHECK(a_calls == 0);
    CHECK(b_calls == 1);

    root.cancel();
    CHECK(bus.listener_count() == 0);
    CHECK(bus.publish(flow::Event{"E", json::object()}) == 0);
}

TEST_CASE("EventBus ignores dead subscriptions", "[flow][event_bus]") {
    flow::EventBus bus;

    SECTION("cancelled scope") {
        Scope scope;
        scope.cancel();
        bus.listen(scope, [](const flow::Event&) {});
        CHECK(bus.listener_count() == 0);
    }

    SECTION("empty callback") {
        bus.listen(Scope(), nullptr);
        CHECK(bus.listener_count() == 0);
    }
}

TEST_CASE("A listener may cancel its own scope while handling an event", "[flow][event_bus]") {
    flow::EventBus bus;
    Scope scope;
    int calls = 0;

    bus.listen(scope, [&calls, scope](const flow::Event&) {
        ++calls;
        scope.cancel();
    });

    bus.publish(flow::Event{"E", json::object()});
    bus.publish(flow::Event{"E", json::object()});
    CHECK(calls == 1);
    CHECK(bus.listener_count() == 0);
}

TEST_CASE("EventBus outliving scopes is safe", "[flow][event_bus]") {
    Scope scope;
    {
        flow::EventBus bus;
        bus.listen(scope, [](const flow::Event&) {});
    }
    scope.cancel();
    CHECK(scope.is_cancelled());
}

TEST_CASE("A throwing listener does not starve the others", "[flow][event_bus]") {
    flow::EventBus bus;
    Scope scope;
    int second_calls = 0;

    bus.listen(scope, [](const flow::Event&) { throw std::runtime_error("listener failed"); });
    bus.listen(scope, [&second_calls](const flow::Event&) { ++second_calls; });

    std::size_t delivered = 0;
    CHECK_NOTHROW(delivered = bus.publish(flow::Event{"E", json::object()}));
    CHECK(delivered == 1);
    CHECK(second_calls == 1);
    CHECK(bus.listener_count() == 2);
}
