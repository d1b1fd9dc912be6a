#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <unlock/badges/badge_engine.hpp>
#include <unlock/location/timed_location_port.hpp>
#include "test_fakes.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace unlock;
using namespace unlock::badges;
using namespace unlock::testing;
using progress::ProgressState;
using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

class BadgeFixture {
protected:
    BadgeFixture()
        : content({
              make_site("giza", GIZA, {"great_pyramid", "sphinx"}),
              make_site("saqqara", core::offset_by(GIZA, 15000.0, 180.0), {"step_pyramid"}),
              make_site("karnak", KARNAK, {"hypostyle_hall"}, "Luxor", "New Kingdom"),
          })
        , store(storage)
        , catalog(achievements::default_catalog())
        , achievements(store, catalog, content, clock)
        , badges(store, achievements, content, clock) {}

    location::Position near(core::Coordinate site, double meters) const {
        return make_position(core::offset_by(site, meters, 45.0), clock.now());
    }

    progress::MemoryKeyValueStore storage;
    content::StaticContentProvider content;
    core::ManualClock clock;
    progress::ProgressStore store;
    achievements::AchievementCatalog catalog;
    achievements::AchievementEngine achievements;
    BadgeEngine badges;
};

TEST_CASE_METHOD(BadgeFixture, "Verified visit awards a discovery key", "[badges][visit]") {
    auto result = badges.verify_visit("giza", near(GIZA, 150.0));

    REQUIRE(result.outcome == VisitOutcome::Verified);
    REQUIRE(result.points_awarded == 50);
    REQUIRE(store.total_points() == 50);

    auto state = store.snapshot();
    REQUIRE(state.has_explorer_badge("giza"));
    REQUIRE_FALSE(state.is_self_reported("giza"));
    REQUIRE(state.verified_visits.at("giza") == clock.now());
}

TEST_CASE_METHOD(BadgeFixture, "Visits that cannot be verified change nothing", "[badges][visit]") {
    uint64_t generation = store.generation();

    SECTION("Too far away") {
        auto result = badges.verify_visit("giza", near(GIZA, 250.0));
        REQUIRE(result.outcome == VisitOutcome::TooFar);
        REQUIRE_THAT(result.distance_km, WithinAbs(0.25, 0.001));
        REQUIRE(result.points_awarded == 0);
    }

    SECTION("No position") {
        auto result = badges.verify_visit("giza", std::nullopt);
        REQUIRE(result.outcome == VisitOutcome::NoLocation);
        REQUIRE_FALSE(result.message.empty());
    }

    SECTION("Unknown site") {
        auto result = badges.verify_visit("atlantis", near(GIZA, 0.0));
        REQUIRE(result.outcome == VisitOutcome::UnknownSite);
    }

    SECTION("Self-report of an unknown site") {
        auto result = badges.self_report_visit("atlantis");
        REQUIRE(result.outcome == VisitOutcome::UnknownSite);
        REQUIRE(result.points_awarded == 0);
        REQUIRE_FALSE(store.has_explorer_badge("atlantis"));
    }

    REQUIRE(store.total_points() == 0);
    REQUIRE(store.generation() == generation);
    REQUIRE(store.snapshot().is_empty());
}

TEST_CASE_METHOD(BadgeFixture, "Self-reported visits", "[badges][self-report]") {
    auto result = badges.self_report_visit("karnak");

    REQUIRE(result.outcome == VisitOutcome::SelfReported);
    REQUIRE(result.points_awarded == 30);
    REQUIRE(store.total_points() == 30);
    REQUIRE(store.has_explorer_badge("karnak"));
    REQUIRE(store.is_self_reported("karnak"));

    SECTION("Second self-report is refused") {
        auto again = badges.self_report_visit("karnak");
        REQUIRE(again.outcome == VisitOutcome::AlreadySelfReported);
        REQUIRE(again.points_awarded == 0);
        REQUIRE(store.total_points() == 30);
    }

    SECTION("On-site verification upgrades for +20") {
        clock.advance(2h);
        auto upgrade = badges.verify_visit("karnak", near(KARNAK, 40.0));

        REQUIRE(upgrade.outcome == VisitOutcome::Upgraded);
        REQUIRE(upgrade.points_awarded == 20);
        REQUIRE(store.total_points() == 50);
        REQUIRE(store.has_explorer_badge("karnak"));
        REQUIRE_FALSE(store.is_self_reported("karnak"));
        REQUIRE(store.snapshot().verified_visits.at("karnak") == clock.now());
    }
}

TEST_CASE_METHOD(BadgeFixture, "Revisit cooldown", "[badges][cooldown]") {
    REQUIRE(badges.verify_visit("giza", near(GIZA, 10.0)).outcome == VisitOutcome::Verified);

    SECTION("Re-verifying inside 30 days is blocked") {
        clock.advance_days(29);
        auto result = badges.verify_visit("giza", near(GIZA, 10.0));

        REQUIRE(result.outcome == VisitOutcome::Blocked);
        REQUIRE(result.days_remaining == 1);
        REQUIRE(result.points_awarded == 0);
        REQUIRE(store.total_points() == 50);
    }

    SECTION("Blocked even without a position") {
        auto result = badges.verify_visit("giza", std::nullopt);
        REQUIRE(result.outcome == VisitOutcome::Blocked);
        REQUIRE(result.days_remaining == 30);
    }

    SECTION("Re-verifying after 30 days pays again") {
        clock.advance_days(30);
        auto result = badges.verify_visit("giza", near(GIZA, 10.0));

        REQUIRE(result.outcome == VisitOutcome::Verified);
        REQUIRE(result.points_awarded == 50);
        REQUIRE(store.total_points() == 100);
    }

    SECTION("check_cooldown reports the remaining days") {
        clock.advance(36h);
        auto blocked = badges.check_cooldown("giza");
        REQUIRE(blocked.has_value());
        REQUIRE(blocked->days_remaining == 29);
        REQUIRE_FALSE(badges.check_cooldown("karnak").has_value());
    }
}

TEST_CASE_METHOD(BadgeFixture, "Scenario: verify then self-report", "[badges][scenario]") {
    auto verified = badges.verify_visit("giza", near(GIZA, 150.0));
    REQUIRE(verified.outcome == VisitOutcome::Verified);
    REQUIRE(store.total_points() == 50);

    auto reported = badges.self_report_visit("giza");
    REQUIRE_FALSE(reported.is_success());
    REQUIRE(reported.outcome == VisitOutcome::Blocked);
    REQUIRE(reported.points_awarded == 0);
    REQUIRE(store.total_points() == 50);
    REQUIRE_FALSE(store.is_self_reported("giza"));
}

TEST_CASE_METHOD(BadgeFixture, "Self-report after the revisit cooldown", "[badges][cooldown]") {
    REQUIRE(badges.verify_visit("giza", near(GIZA, 50.0)).outcome == VisitOutcome::Verified);
    clock.advance_days(30);

    auto reported = badges.self_report_visit("giza");
    REQUIRE(reported.outcome == VisitOutcome::SelfReported);
    REQUIRE(reported.points_awarded == 30);
    REQUIRE(store.total_points() == 80);
    REQUIRE(store.is_self_reported("giza"));
    REQUIRE(store.has_explorer_badge("giza"));

    clock.advance(1h);
    auto upgraded = badges.verify_visit("giza", near(GIZA, 50.0));
    REQUIRE(upgraded.outcome == VisitOutcome::Upgraded);
    REQUIRE(upgraded.points_awarded == 20);
    REQUIRE(store.total_points() == 100);
    REQUIRE_FALSE(store.is_self_reported("giza"));
}

TEST_CASE_METHOD(BadgeFixture, "Scenario: self-report then upgrade", "[badges][scenario]") {
    auto reported = badges.self_report_visit("karnak");
    REQUIRE(reported.outcome == VisitOutcome::SelfReported);
    REQUIRE(store.is_self_reported("karnak"));

    auto upgraded = badges.verify_visit("karnak", near(KARNAK, 100.0));
    REQUIRE(upgraded.outcome == VisitOutcome::Upgraded);

    // +30 then +20, never +80
    REQUIRE(store.total_points() == 50);
}

TEST_CASE_METHOD(BadgeFixture, "Knowledge keys, quizzes and discoveries", "[badges][awards]") {
    SECTION("Scholar badge is idempotent") {
        auto first = badges.award_scholar_badge("great_pyramid");
        REQUIRE(first.awarded);
        REQUIRE(first.points_awarded == 1);
        REQUIRE(first.unlocked_achievements == std::vector<std::string>{"first_secret"});
        REQUIRE(first.achievement_points == 10);
        REQUIRE(store.total_points() == 11);

        auto second = badges.award_scholar_badge("great_pyramid");
        REQUIRE_FALSE(second.awarded);
        REQUIRE(second.points_awarded == 0);
        REQUIRE(store.total_points() == 11);
    }

    SECTION("Quiz points once per quiz") {
        REQUIRE(badges.record_correct_quiz("giza_q1").points_awarded == 10);
        REQUIRE_FALSE(badges.record_correct_quiz("giza_q1").awarded);
        // 10 for the quiz, 10 for quiz_starter
        REQUIRE(store.total_points() == 20);
    }

    SECTION("Discovery points respect the cooldown") {
        REQUIRE(badges.discover_place("khan_el_khalili").awarded);
        clock.advance_days(10);
        REQUIRE_FALSE(badges.discover_place("khan_el_khalili").awarded);
        REQUIRE(badges.discover_place("al_azhar_park").awarded);
        clock.advance_days(20);
        REQUIRE(badges.discover_place("khan_el_khalili").awarded);
        REQUIRE(store.total_points() == 3);
    }
}

TEST_CASE_METHOD(BadgeFixture, "Achievements commit with the visit that earned them", "[badges][achievements]") {
    badges.award_scholar_badge("great_pyramid");
    badges.award_scholar_badge("sphinx");
    achievements.clear_notifications();
    int before = store.total_points();

    uint64_t generation = store.generation();
    auto result = badges.verify_visit("giza", near(GIZA, 20.0));
    auto changes = store.generation() - generation;

    REQUIRE(result.outcome == VisitOutcome::Verified);
    REQUIRE(result.unlocked_achievements == std::vector<std::string>{"first_discovery"});
    REQUIRE(result.achievement_points == 10);
    REQUIRE(store.total_points() == before + 60);
    REQUIRE(changes == 1u);
    REQUIRE(achievements.current_notification()->achievement_id == "first_discovery");

    SECTION("Re-verification later never pays the achievement twice") {
        clock.advance_days(31);
        auto again = badges.verify_visit("giza", near(GIZA, 20.0));
        REQUIRE(again.outcome == VisitOutcome::Verified);
        REQUIRE(again.unlocked_achievements.empty());
        REQUIRE(store.total_points() == before + 110);
    }
}

TEST_CASE_METHOD(BadgeFixture, "Concurrent awards are never lost", "[badges][threads]") {
    constexpr int kThreads = 4;
    constexpr int kKeysPerThread = 25;

    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([this, t] {
            for (int i = 0; i < kKeysPerThread; ++i) {
                badges.award_scholar_badge("sub_" + std::to_string(t) + "_" + std::to_string(i));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    // One point per key, plus first_secret, eager_learner and knowledge_seeker
    REQUIRE(store.snapshot().scholar_badges.size() == static_cast<size_t>(kThreads * kKeysPerThread));
    REQUIRE(store.total_points() == kThreads * kKeysPerThread + 10 + 25 + 50);
    REQUIRE(achievements.pending_notification_count() == 3u);
}

TEST_CASE_METHOD(BadgeFixture, "Persistence failures do not block rewards", "[badges][storage]") {
    FlakyKeyValueStore flaky;
    progress::ProgressStore flaky_store(flaky);
    achievements::AchievementEngine flaky_achievements(flaky_store, catalog, content, clock);
    BadgeEngine flaky_badges(flaky_store, flaky_achievements, content, clock);

    flaky.fail_writes = true;
    auto result = flaky_badges.self_report_visit("giza");

    REQUIRE(result.outcome == VisitOutcome::SelfReported);
    REQUIRE(flaky_store.total_points() == 30);
    REQUIRE(flaky_store.persist_failures() > 0);
    REQUIRE(flaky.size() == 0);
}

TEST_CASE_METHOD(BadgeFixture, "Policy values drive the rules", "[badges][policy]") {
    BadgePolicy policy;
    policy.verification_radius_m = 500.0;
    policy.verified_visit_points = 75;
    BadgeEngine generous(store, achievements, content, clock, policy);

    auto result = generous.verify_visit("giza", near(GIZA, 400.0));
    REQUIRE(result.outcome == VisitOutcome::Verified);
    REQUIRE(result.points_awarded == 75);
}

TEST_CASE_METHOD(BadgeFixture, "Request and verify through the location port", "[badges][location]") {
    ScriptedPositionSource source;
    location::TimedLocationPort port(source, clock);

    std::atomic<int> calls{0};
    VisitOutcome outcome = VisitOutcome::NoLocation;
    auto on_result = [&](const VisitResult& r) {
        outcome = r.outcome;
        calls++;
    };

    SECTION("Position in range verifies") {
        source.set_immediate(near(GIZA, 30.0));
        badges.request_and_verify("giza", port, 1000ms, on_result);

        REQUIRE(calls == 1);
        REQUIRE(outcome == VisitOutcome::Verified);
        REQUIRE(store.total_points() == 50);
    }

    SECTION("Cooldown is checked before asking for a position") {
        badges.verify_visit("giza", near(GIZA, 30.0));
        auto request = badges.request_and_verify("giza", port, 1000ms, on_result);

        REQUIRE(request == nullptr);
        REQUIRE(calls == 1);
        REQUIRE(outcome == VisitOutcome::Blocked);
        REQUIRE(source.request_count() == 0);
    }

    SECTION("Timeout falls back to NoLocation") {
        auto request = badges.request_and_verify("giza", port, 20ms, on_result);
        REQUIRE(request != nullptr);
        request->wait();

        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (calls == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(calls == 1);
        REQUIRE(outcome == VisitOutcome::NoLocation);
        REQUIRE(store.total_points() == 0);
    }

    SECTION("Destroying the engine abandons its requests") {
        auto short_lived = std::make_unique<BadgeEngine>(store, achievements, content, clock);
        auto request = short_lived->request_and_verify("giza", port, 10s, on_result);
        REQUIRE(request != nullptr);
        REQUIRE(short_lived->pending_requests() == 1u);

        short_lived.reset();
        REQUIRE(request->cancelled());

        source.deliver(near(GIZA, 30.0));
        REQUIRE(calls == 0);
        REQUIRE(store.total_points() == 0);
    }

    SECTION("Unknown site answers immediately") {
        auto request = badges.request_and_verify("atlantis", port, 1000ms, on_result);
        REQUIRE(request == nullptr);
        REQUIRE(outcome == VisitOutcome::UnknownSite);
    }
}
