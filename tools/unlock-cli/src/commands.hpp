#pragma once

#include <unlock/app/progress_engine.hpp>
#include <unlock/config/engine_config.hpp>
#include <unlock/content/content_provider.hpp>
#include <unlock/progress/key_value_store.hpp>
#include <unlock/core/clock.hpp>
#include <memory>
#include <optional>
#include <string>

namespace unlock::cli {

// Command result codes
enum class Result {
    Success = 0,
    InvalidArgs = 1,
    FileError = 2,
    Rejected = 3            // Valid request the badge rules turned down
};

struct Options {
    std::string sites_path;
    std::string store_path;
    std::string config_path;
};

// Everything a command runs against, wired from the options
struct Session {
    config::EngineConfig config;
    content::StaticContentProvider content;
    core::SystemClock clock;
    std::unique_ptr<progress::JsonFileKeyValueStore> storage;
    std::unique_ptr<app::ProgressEngine> engine;
};

// Loads config, site catalog and saved progress. FileError if a named
// config or catalog file can't be read.
Result open_session(const Options& options, Session& session);

// unlock status
Result cmd_status(app::ProgressEngine& engine);

// unlock scholar <sub-location-id>
Result cmd_scholar(app::ProgressEngine& engine, const std::string& sub_location_id);

// unlock quiz <quiz-id>
Result cmd_quiz(app::ProgressEngine& engine, const std::string& quiz_id);

// unlock discover <place-id>
Result cmd_discover(app::ProgressEngine& engine, const std::string& place_id);

// unlock verify <site-id> <lat> <lon> [accuracy-m]
Result cmd_verify(app::ProgressEngine& engine, const std::string& site_id,
                  double latitude, double longitude, double accuracy_m);

// unlock self-report <site-id>
Result cmd_self_report(app::ProgressEngine& engine, const std::string& site_id);

// unlock favorite <site-id>
Result cmd_favorite(app::ProgressEngine& engine, const std::string& site_id);

// unlock achievements
Result cmd_achievements(app::ProgressEngine& engine);

// unlock reset
Result cmd_reset(app::ProgressEngine& engine);

// unlock help
void cmd_help();

} // namespace unlock::cli
