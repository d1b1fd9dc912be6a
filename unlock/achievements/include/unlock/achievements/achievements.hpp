#pragma once

// ============================================================================
// Unlock Achievement System - Umbrella Header
// ============================================================================
//
// Static achievement catalog evaluated against the user's progress.
//
// Quick Start:
// ------------
// 1. Define achievements:
//    achievement()
//        .id("first_discovery")
//        .name("First Discovery")
//        .description("Unlock your first site")
//        .category(AchievementCategory::Exploration)
//        .count(Counter::FullyCompletedSites, 1)
//        .points(10)
//        .add_to(catalog);
//
// 2. Evaluate inside a progress transaction, announce after it commits:
//    auto unlocked = store.transact([&](ProgressState& s) { return engine.evaluate_in(s, now); });
//    engine.announce(unlocked);
//
// 3. Query status:
//    if (engine.is_unlocked("first_discovery")) { ... }
//    float percent = engine.progress_percent("curious_traveler");
//
// Requirement Kinds:
// ------------------
// - Count: a progress counter reaches a target
// - AllSites: every catalog site fully completed
// - CityComplete / EraComplete: every site of some city or era completed
// - FullCompletion: every site and every sub-location
//
// Unlock Hook:
// ------------
// engine.set_on_unlock([](const AchievementDefinition& def) {
//     // Forward to a platform service
// });
//
// ============================================================================

#include <unlock/achievements/achievement_definition.hpp>
#include <unlock/achievements/achievement_engine.hpp>
#include <unlock/achievements/achievement_events.hpp>
