#include <catch2/catch.hpp>

#include <stdexcept>
#include <variant>
#include <vector>

#include "core/GameEvents.hpp"

using namespace blockfall::core;

namespace {

GameEvent levelUp(int level) {
    return GameEvent{GameEventKind::LevelUp, 1, LevelUpEvent{level, 1000 - (level - 1) * 50}};
}

} // namespace

TEST_CASE("EventDispatcher delivers to every subscriber in order", "[events]") {
    EventDispatcher dispatcher;
    std::vector<int> calls;

    dispatcher.subscribe([&](const GameEvent&) { calls.push_back(1); });
    dispatcher.subscribe([&](const GameEvent& e) {
        calls.push_back(2);
        REQUIRE(e.kind == GameEventKind::LevelUp);
        const auto* payload = std::get_if<LevelUpEvent>(&e.payload);
        REQUIRE(payload != nullptr);
        CHECK(payload->level == 3);
        CHECK(payload->dropIntervalMs == 900);
    });

    REQUIRE(dispatcher.subscriberCount() == 2);

    dispatcher.emit(levelUp(3));
    REQUIRE(calls == std::vector<int>{1, 2});
}

TEST_CASE("EventDispatcher unsubscribe stops delivery", "[events]") {
    EventDispatcher dispatcher;
    int count = 0;

    const auto id = dispatcher.subscribe([&](const GameEvent&) { ++count; });
    dispatcher.emit(levelUp(2));
    REQUIRE(count == 1);

    REQUIRE(dispatcher.unsubscribe(id));
    REQUIRE_FALSE(dispatcher.unsubscribe(id));

    dispatcher.emit(levelUp(2));
    REQUIRE(count == 1);
    REQUIRE(dispatcher.subscriberCount() == 0);
}

TEST_CASE("A handler can unsubscribe itself while being called", "[events]") {
    EventDispatcher dispatcher;
    int selfCount = 0;
    int otherCount = 0;

    EventDispatcher::SubscriptionId self = 0;
    self = dispatcher.subscribe([&](const GameEvent&) {
        ++selfCount;
        dispatcher.unsubscribe(self);
    });
    dispatcher.subscribe([&](const GameEvent&) { ++otherCount; });

    dispatcher.emit(levelUp(2));
    dispatcher.emit(levelUp(3));

    REQUIRE(selfCount == 1);
    REQUIRE(otherCount == 2);
}

TEST_CASE("Empty handlers are refused", "[events]") {
    EventDispatcher dispatcher;
    REQUIRE_THROWS_AS(dispatcher.subscribe(EventDispatcher::Handler{}), std::invalid_argument);
}
