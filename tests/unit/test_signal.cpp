/**
 * @file test_signal.cpp
 * @brief Unit tests for Signal connect/disconnect/emit
 */

#include <catch2/catch_test_macros.hpp>
#include <statusind/signal.h>
#include <vector>

using namespace statusind;

TEST_CASE("Signal basics", "[unit][signal]") {
    Signal<int> signal;
    std::vector<int> received;

    SECTION("emit calls slots in connection order") {
        signal.connect([&](int v) { received.push_back(v); });
        signal.connect([&](int v) { received.push_back(v * 10); });
        signal.emit(3);
        REQUIRE(received == std::vector<int>{3, 30});
    }

    SECTION("disconnect removes a slot") {
        ConnectionId id = signal.connect([&](int v) { received.push_back(v); });
        REQUIRE(signal.isConnected(id));
        REQUIRE(signal.disconnect(id));
        REQUIRE_FALSE(signal.isConnected(id));
        REQUIRE_FALSE(signal.disconnect(id));
        signal.emit(1);
        REQUIRE(received.empty());
    }

    SECTION("ids are never invalid and unique across signals") {
        Signal<> other;
        ConnectionId a = signal.connect([](int) {});
        ConnectionId b = other.connect([]() {});
        REQUIRE(a != INVALID_CONNECTION);
        REQUIRE(b != INVALID_CONNECTION);
        REQUIRE(a != b);
        REQUIRE_FALSE(other.disconnect(a));
    }

    SECTION("disconnectAll") {
        signal.connect([](int) {});
        signal.connect([](int) {});
        REQUIRE(signal.size() == 2);
        signal.disconnectAll();
        REQUIRE(signal.empty());
    }
}

TEST_CASE("Signal reentrancy", "[unit][signal]") {
    Signal<> signal;
    int first = 0;
    int second = 0;
    ConnectionId secondId = INVALID_CONNECTION;

    SECTION("a slot disconnected during emit is skipped") {
        signal.connect([&]() { ++first; signal.disconnect(secondId); });
        secondId = signal.connect([&]() { ++second; });
        signal.emit();
        REQUIRE(first == 1);
        REQUIRE(second == 0);
    }

    SECTION("a slot connected during emit waits for the next emit") {
        signal.connect([&]() {
            ++first;
            if (first == 1) signal.connect([&]() { ++second; });
        });
        signal.emit();
        REQUIRE(second == 0);
        signal.emit();
        REQUIRE(second == 1);
    }
}
