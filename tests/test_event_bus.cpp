/**
 * @file test_event_bus.cpp
 * @brief Unit tests for EventBus.
 */

#include <catch2/catch_test_macros.hpp>
#include <thread>
#include <vector>
#include "../libpdfshrink/include/event_bus.hpp"
#include "../libpdfshrink/include/events.hpp"

using namespace pdfshrink;

TEST_CASE("Events reach subscribers of their type only", "[event_bus]") {
    EventBus bus;
    std::vector<unsigned> progress;
    int exits = 0;

    bus.subscribe<ProgressEvent>([&](const ProgressEvent& e) { progress.push_back(e.percent); });
    bus.subscribe<EngineExitEvent>([&](const EngineExitEvent&) { ++exits; });

    bus.publish(ProgressEvent{5, false});
    bus.publish(ProgressEvent{10, false});
    bus.publish(EngineLaunchEvent{"gs", {}});

    REQUIRE(progress == std::vector<unsigned>{5, 10});
    REQUIRE(exits == 0);
}

TEST_CASE("Handlers run in subscription order", "[event_bus]") {
    EventBus bus;
    std::string order;
    bus.subscribe<CompressionErrorEvent>([&](const CompressionErrorEvent&) { order += "a"; });
    bus.subscribe<CompressionErrorEvent>([&](const CompressionErrorEvent&) { order += "b"; });

    bus.publish(CompressionErrorEvent{ErrorKind::OutputMissing, "missing"});
    REQUIRE(order == "ab");
}

TEST_CASE("Publishing without subscribers is harmless", "[event_bus]") {
    EventBus bus;
    REQUIRE_NOTHROW(bus.publish(ProgressEvent{1, false}));
}

TEST_CASE("Concurrent publishers are serialized", "[event_bus]") {
    EventBus bus;
    int count = 0; // unsynchronized on purpose: the bus serializes handlers
    bus.subscribe<ProgressEvent>([&](const ProgressEvent&) { ++count; });

    std::thread a([&] { for (int i = 0; i < 1000; ++i) bus.publish(ProgressEvent{1, false}); });
    std::thread b([&] { for (int i = 0; i < 1000; ++i) bus.publish(ProgressEvent{2, false}); });
    a.join();
    b.join();

    REQUIRE(count == 2000);
}
