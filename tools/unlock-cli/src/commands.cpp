#include "commands.hpp"
#include <unlock/core/log.hpp>
#include <chrono>
#include <iostream>
#include <format>

namespace unlock::cli {

namespace {

void print_unlocks(app::ProgressEngine& engine) {
    while (auto notification = engine.current_notification()) {
        std::cout << "  * " << notification->message << " (+" << notification->points << " pts)\n";
        engine.dismiss_notification();
    }
}

void print_award(app::ProgressEngine& engine, const badges::AwardResult& result, const std::string& what) {
    if (result.awarded) {
        std::cout << what << ": +" << result.points_awarded << " pts\n";
    } else {
        std::cout << what << ": nothing new to award\n";
    }
    print_unlocks(engine);
}

Result print_visit(app::ProgressEngine& engine, const badges::VisitResult& result) {
    std::cout << badges::visit_outcome_name(result.outcome) << ": " << result.message << "\n";
    print_unlocks(engine);

    if (result.outcome == badges::VisitOutcome::UnknownSite) {
        return Result::InvalidArgs;
    }
    return result.is_success() ? Result::Success : Result::Rejected;
}

} // anonymous namespace

Result open_session(const Options& options, Session& session) {
    if (!options.config_path.empty() && !config::load_config(options.config_path, session.config)) {
        return Result::FileError;
    }
    core::set_log_level(session.config.log_level);

    std::string sites_path = options.sites_path.empty() ? session.config.storage.sites_path : options.sites_path;
    if (!sites_path.empty() && !session.content.load_from_file(sites_path)) {
        std::cerr << "Error: could not load sites from " << sites_path << "\n";
        return Result::FileError;
    }

    achievements::AchievementCatalog catalog = achievements::default_catalog();
    if (!session.config.storage.achievements_path.empty()) {
        catalog.clear();
        if (catalog.load_from_file(session.config.storage.achievements_path) == 0) {
            std::cerr << "Error: no achievements loaded from " << session.config.storage.achievements_path << "\n";
            return Result::FileError;
        }
    }

    std::string store_path = options.store_path.empty() ? session.config.storage.progress_path : options.store_path;
    session.storage = std::make_unique<progress::JsonFileKeyValueStore>(store_path);
    session.engine = std::make_unique<app::ProgressEngine>(
        *session.storage, session.content, session.clock, session.config, std::move(catalog));
    session.engine->load();

    // Unlocks caught up during load are not news
    session.engine->achievements().clear_notifications();
    return Result::Success;
}

Result cmd_status(app::ProgressEngine& engine) {
    auto rank = engine.current_rank();
    std::cout << "Points:      " << engine.total_points() << "\n";
    std::cout << "Rank:        " << rank::rank_name(rank) << "\n";
    if (auto to_next = engine.points_to_next_rank()) {
        std::cout << std::format("Next rank:   {} pts to go ({:.0f}%)\n", *to_next, engine.rank_progress() * 100.0f);
    } else {
        std::cout << "Next rank:   highest rank reached\n";
    }
    std::cout << "Knowledge:   " << engine.scholar_badge_count() << " keys\n";
    std::cout << "Discovery:   " << engine.explorer_badge_count() << " keys\n";
    std::cout << "Completed:   " << engine.fully_completed_site_count() << " sites\n";
    std::cout << "Quizzes:     " << engine.completed_quiz_count() << "\n";
    std::cout << "Favorites:   " << engine.favorite_sites().size() << "\n";
    std::cout << "Achievements " << engine.achievements().unlocked_count() << "/"
              << engine.achievements().total_count() << "\n";
    return Result::Success;
}

Result cmd_scholar(app::ProgressEngine& engine, const std::string& sub_location_id) {
    print_award(engine, engine.badges().award_scholar_badge(sub_location_id), "Knowledge key");
    return Result::Success;
}

Result cmd_quiz(app::ProgressEngine& engine, const std::string& quiz_id) {
    print_award(engine, engine.badges().record_correct_quiz(quiz_id), "Quiz");
    return Result::Success;
}

Result cmd_discover(app::ProgressEngine& engine, const std::string& place_id) {
    print_award(engine, engine.badges().discover_place(place_id), "Discovery");
    return Result::Success;
}

Result cmd_verify(app::ProgressEngine& engine, const std::string& site_id,
                  double latitude, double longitude, double accuracy_m) {
    location::Position position;
    position.coordinate = core::Coordinate{latitude, longitude};
    position.horizontal_accuracy_m = accuracy_m;
    position.timestamp = std::chrono::system_clock::now();

    if (!position.coordinate.is_valid()) {
        std::cerr << "Error: invalid coordinate\n";
        return Result::InvalidArgs;
    }

    return print_visit(engine, engine.badges().verify_visit(site_id, position));
}

Result cmd_self_report(app::ProgressEngine& engine, const std::string& site_id) {
    return print_visit(engine, engine.badges().self_report_visit(site_id));
}

Result cmd_favorite(app::ProgressEngine& engine, const std::string& site_id) {
    bool favorite = engine.toggle_favorite(site_id);
    std::cout << site_id << (favorite ? " added to" : " removed from") << " favorites\n";
    return Result::Success;
}

Result cmd_achievements(app::ProgressEngine& engine) {
    auto& achievements = engine.achievements();
    auto next = achievements.next_achievement();

    for (const auto& def : achievements.catalog().all()) {
        auto progress = achievements.progress(def.achievement_id);
        bool unlocked = achievements.is_unlocked(def.achievement_id);
        std::cout << std::format("[{}] {:<20} {:>3}/{:<3} {:>4} pts  {}{}\n",
                                 unlocked ? 'x' : ' ', def.display_name,
                                 progress.current, progress.required, def.reward_points,
                                 def.description,
                                 next && *next == def.achievement_id ? "  <- next" : "");
    }

    std::cout << "Earned " << achievements.earned_reward_points() << " of "
              << achievements.catalog().total_reward_points() << " achievement points\n";
    return Result::Success;
}

Result cmd_reset(app::ProgressEngine& engine) {
    engine.reset_progress();
    std::cout << "All progress cleared\n";
    return Result::Success;
}

void cmd_help() {
    std::cout << R"(Unlock CLI - Progress & Rewards Engine

Usage: unlock-cli <command> [args] [options]

Commands:
  status                          Points, rank and key counts
  scholar <sub-location>          Award a knowledge key
  quiz <quiz-id>                  Record a correctly answered quiz
  discover <place-id>             Record a discovered place
  verify <site> <lat> <lon> [acc] Verify a visit from a position (accuracy in m)
  self-report <site>              Record a visit without a position
  favorite <site>                 Toggle a favorite site
  achievements                    List achievements and progress
  reset                           Clear all progress

  help                            Show this help message

Options:
  --sites <file>    Site catalog JSON
  --store <file>    Progress file (default: progress.json)
  --config <file>   Engine config JSON

Examples:
  unlock-cli verify giza 29.9792 31.1342 --sites sites.json
  unlock-cli self-report karnak --sites sites.json
)";
}

} // namespace unlock::cli
