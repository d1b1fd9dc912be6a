#include <catch2/catch_test_macros.hpp>
#include <unlock/location/location_port.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace unlock;
using namespace unlock::location;
using namespace std::chrono_literals;

namespace {

Position position_at(double latitude, double longitude) {
    Position p;
    p.coordinate = core::Coordinate{latitude, longitude};
    p.horizontal_accuracy_m = 5.0;
    return p;
}

} // anonymous namespace

TEST_CASE("PositionRequest settles exactly once", "[location][request]") {
    std::atomic<int> calls{0};
    std::optional<Position> delivered;
    PositionRequest request([&](const std::optional<Position>& p) {
        delivered = p;
        calls++;
    });

    REQUIRE_FALSE(request.ready());

    SECTION("First settle wins") {
        REQUIRE(request.settle(position_at(1.0, 2.0)));
        REQUIRE_FALSE(request.settle(position_at(3.0, 4.0)));
        REQUIRE_FALSE(request.settle(std::nullopt));

        REQUIRE(calls == 1);
        REQUIRE(delivered.has_value());
        REQUIRE(delivered->coordinate.latitude == 1.0);
        REQUIRE(request.wait()->coordinate.latitude == 1.0);
    }

    SECTION("Timeout-style settle with nullopt") {
        REQUIRE(request.settle(std::nullopt));
        REQUIRE(request.ready());
        REQUIRE_FALSE(request.wait().has_value());
        REQUIRE(calls == 1);
    }

    SECTION("Cancel suppresses the callback") {
        REQUIRE(request.cancel());
        REQUIRE(request.cancelled());
        REQUIRE(request.ready());
        REQUIRE_FALSE(request.settle(position_at(1.0, 2.0)));
        REQUIRE(calls == 0);
        REQUIRE_FALSE(request.cancel());
    }

    SECTION("Cancel after settle is a no-op") {
        request.settle(position_at(1.0, 2.0));
        REQUIRE_FALSE(request.cancel());
        REQUIRE_FALSE(request.cancelled());
        REQUIRE(calls == 1);
    }
}

TEST_CASE("PositionRequest races resolve once", "[location][request]") {
    std::atomic<int> calls{0};
    auto request = std::make_shared<PositionRequest>([&](const std::optional<Position>&) { calls++; });

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            bool won = (i % 2 == 0) ? request->settle(position_at(i, i)) : request->settle(std::nullopt);
            if (won) winners++;
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(winners == 1);
    REQUIRE(calls == 1);
}

TEST_CASE("PositionRequest wait_for", "[location][request]") {
    PositionRequest request;

    SECTION("Times out while pending") {
        REQUIRE_FALSE(request.wait_until_resolved(10ms));
        REQUIRE_FALSE(request.wait_for(10ms).has_value());
        REQUIRE_FALSE(request.ready());
    }

    SECTION("Wakes when settled from another thread") {
        std::thread settler([&] {
            std::this_thread::sleep_for(10ms);
            request.settle(position_at(5.0, 6.0));
        });
        auto result = request.wait_for(5s);
        settler.join();

        REQUIRE(result.has_value());
        REQUIRE(result->coordinate.longitude == 6.0);
    }

    SECTION("Stop token ends the wait") {
        std::stop_source stop;
        stop.request_stop();
        REQUIRE_FALSE(request.wait_until_resolved(stop.get_token(), 5s));
    }
}
