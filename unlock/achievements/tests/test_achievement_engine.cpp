#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <unlock/achievements/achievement_engine.hpp>
#include <unlock/achievements/achievement_events.hpp>
#include "test_fakes.hpp"

using namespace unlock;
using namespace unlock::achievements;
using namespace unlock::testing;
using progress::ProgressState;
using Catch::Matchers::WithinAbs;

class AchievementFixture {
protected:
    AchievementFixture()
        : content({
              make_site("giza", GIZA, {"great_pyramid", "sphinx"}, "Cairo", "Old Kingdom"),
              make_site("saqqara", {29.8713, 31.2165}, {"step_pyramid"}, "Cairo", "Old Kingdom"),
              make_site("karnak", KARNAK, {"hypostyle_hall"}, "Luxor", "New Kingdom"),
          })
        , store(storage, &events)
        , catalog(default_catalog())
        , engine(store, catalog, content, clock, &events) {}

    // Discovery key plus every knowledge key, without evaluating
    void complete_site(const std::string& site_id) {
        auto site = content.find_site(site_id);
        store.transact([&](ProgressState& s) {
            s.explorer_badges.insert(site->id);
            for (const auto& sub : site->sub_locations) {
                s.scholar_badges.insert(sub.id);
            }
        });
    }

    progress::MemoryKeyValueStore storage;
    core::EventDispatcher events;
    content::StaticContentProvider content;
    core::ManualClock clock;
    progress::ProgressStore store;
    AchievementCatalog catalog;
    AchievementEngine engine;
};

TEST_CASE_METHOD(AchievementFixture, "First discovery unlocks exactly once", "[achievements][engine]") {
    complete_site("giza");
    int before = store.total_points();

    auto unlocked = engine.evaluate();

    // One fully completed site and two knowledge keys
    REQUIRE(unlocked == std::vector<std::string>{"first_discovery", "first_secret"});
    REQUIRE(store.total_points() == before + 20);
    REQUIRE(engine.is_unlocked("first_discovery"));
    REQUIRE(engine.unlock_date("first_discovery") == clock.now());

    SECTION("Re-evaluation neither unlocks nor pays again") {
        clock.advance_days(1);
        REQUIRE(engine.evaluate().empty());
        REQUIRE(store.total_points() == before + 20);
        REQUIRE(engine.unlock_date("first_discovery") == clock.now() - core::Days(1));
    }

    SECTION("Notifications queue in unlock order and dismiss once") {
        REQUIRE(engine.pending_notification_count() == 2);
        REQUIRE(engine.current_notification()->achievement_id == "first_discovery");
        REQUIRE(engine.current_notification()->message == "You've unlocked: First Discovery!");

        engine.dismiss_notification();
        REQUIRE(engine.current_notification()->achievement_id == "first_secret");
        engine.dismiss_notification();
        REQUIRE_FALSE(engine.has_pending_notification());
        engine.dismiss_notification();
        REQUIRE_FALSE(engine.current_notification().has_value());
    }
}

TEST_CASE_METHOD(AchievementFixture, "Unlock hooks fire after commit", "[achievements][engine]") {
    std::vector<std::string> hooked;
    std::vector<AchievementUnlockedEvent> published;
    engine.set_on_unlock([&](const AchievementDefinition& def) { hooked.push_back(def.achievement_id); });
    auto conn = events.subscribe<AchievementUnlockedEvent>([&](const AchievementUnlockedEvent& e) {
        published.push_back(e);
        // Store is readable again by the time listeners run
        REQUIRE(store.read([&](const ProgressState& s) { return s.is_achievement_unlocked(e.achievement_id); }));
    });

    store.transact([](ProgressState& s) { s.completed_quizzes.insert("q1"); });
    engine.evaluate();

    REQUIRE(hooked == std::vector<std::string>{"quiz_starter"});
    REQUIRE(published.size() == 1);
    REQUIRE(published[0].points == 10);
}

TEST_CASE_METHOD(AchievementFixture, "Composite requirements", "[achievements][engine]") {
    SECTION("One city complete needs every site of that city") {
        complete_site("giza");
        engine.evaluate();
        REQUIRE_FALSE(engine.is_unlocked("city_champion"));
        REQUIRE(engine.progress("city_champion").current == 0);

        complete_site("saqqara");
        engine.evaluate();
        REQUIRE(engine.is_unlocked("city_champion"));
        REQUIRE(engine.is_unlocked("era_expert"));
        REQUIRE_FALSE(engine.is_unlocked("master_explorer"));
    }

    SECTION("Era alone") {
        complete_site("karnak");
        engine.evaluate();
        REQUIRE(engine.is_unlocked("era_expert"));
        REQUIRE(engine.is_unlocked("city_champion"));
    }

    SECTION("All sites and full completion") {
        complete_site("giza");
        complete_site("saqqara");
        engine.evaluate();

        auto all = engine.progress("master_explorer");
        REQUIRE(all.current == 2);
        REQUIRE(all.required == 3);
        REQUIRE_THAT(engine.progress_percent("true_pharaoh"), WithinAbs(66.6667, 0.01));

        complete_site("karnak");
        engine.evaluate();
        REQUIRE(engine.is_unlocked("master_explorer"));
        REQUIRE(engine.is_unlocked("true_pharaoh"));
        REQUIRE(engine.is_unlocked("curious_traveler"));
    }

    SECTION("A discovery key without every knowledge key is not complete") {
        store.transact([](ProgressState& s) {
            s.explorer_badges.insert("giza");
            s.scholar_badges.insert("great_pyramid");
        });
        engine.evaluate();
        REQUIRE(engine.fully_completed_sites_count() == 0);
        REQUIRE_FALSE(engine.is_unlocked("first_discovery"));
        REQUIRE(engine.is_unlocked("first_secret"));
    }
}

TEST_CASE("An empty site catalog never completes", "[achievements][engine]") {
    progress::MemoryKeyValueStore storage;
    content::StaticContentProvider content;
    core::ManualClock clock;
    progress::ProgressStore store(storage);
    auto catalog = default_catalog();
    AchievementEngine engine(store, catalog, content, clock);

    engine.evaluate();
    REQUIRE(engine.unlocked_count() == 0);
    REQUIRE(engine.progress("master_explorer").required == 1);
    REQUIRE_FALSE(engine.progress("true_pharaoh").is_complete());
}

TEST_CASE_METHOD(AchievementFixture, "Achievement queries", "[achievements][engine]") {
    store.transact([](ProgressState& s) {
        s.completed_quizzes = {"q1", "q2"};
    });
    engine.evaluate();

    REQUIRE(engine.unlocked_ids() == std::vector<std::string>{"quiz_starter"});
    REQUIRE(engine.locked_ids().size() == 12);
    REQUIRE(engine.unlocked_count() == 1);
    REQUIRE(engine.total_count() == 13);
    REQUIRE(engine.unlocked_in_category(AchievementCategory::Mastery) == 1);
    REQUIRE(engine.unlocked_in_category(AchievementCategory::Exploration) == 0);
    REQUIRE(engine.by_category(AchievementCategory::Knowledge).size() == 3);
    REQUIRE(engine.earned_reward_points() == 10);

    auto apprentice = engine.progress("quiz_apprentice");
    REQUIRE(apprentice.current == 2);
    REQUIRE(apprentice.required == 5);
    REQUIRE_THAT(engine.progress_percent("quiz_apprentice"), WithinAbs(40.0, 0.001));
    REQUIRE_THAT(engine.progress_percent("quiz_starter"), WithinAbs(100.0, 0.001));
    REQUIRE_FALSE(engine.unlock_date("quiz_master").has_value());

    SECTION("Next achievement is the closest locked one") {
        REQUIRE(engine.next_achievement() == "quiz_apprentice");
    }

    SECTION("Unknown ids") {
        REQUIRE_FALSE(engine.is_unlocked("nope"));
        REQUIRE(engine.progress("nope").current == 0);
    }
}

TEST_CASE_METHOD(AchievementFixture, "Next achievement ties go to display order", "[achievements][engine]") {
    REQUIRE(engine.next_achievement() == "first_discovery");

    catalog.clear();
    engine.invalidate_cache();
    REQUIRE_FALSE(engine.next_achievement().has_value());
}

TEST_CASE_METHOD(AchievementFixture, "Cached counts follow every mutation", "[achievements][engine]") {
    REQUIRE(engine.fully_completed_sites_count() == 0);

    complete_site("karnak");
    REQUIRE(engine.fully_completed_sites_count() == 1);

    SECTION("Read-only access returns the cached value") {
        uint64_t generation = store.generation();
        REQUIRE(engine.fully_completed_sites_count() == 1);
        REQUIRE(store.generation() == generation);
    }

    SECTION("Site catalog refresh is picked up") {
        content.add_site(make_site("luxor_temple", {25.6995, 32.6391}, {}, "Luxor", "New Kingdom"));
        store.transact([](ProgressState&) {});
        REQUIRE(engine.fully_completed_sites_count() == 1);

        content.set_sites({make_site("karnak", KARNAK, {}, "Luxor", "New Kingdom")});
        REQUIRE(engine.fully_completed_sites_count() == 1);

        content.set_sites({});
        REQUIRE(engine.fully_completed_sites_count() == 0);
    }

    SECTION("Next achievement follows progress") {
        REQUIRE(engine.next_achievement() == "first_discovery");
        engine.evaluate();
        REQUIRE(engine.next_achievement() != "first_discovery");
    }
}
