#include <unlock/config/engine_config.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace unlock::config {

using json = nlohmann::json;

// ============================================================================
// Validation
// ============================================================================

void EngineConfig::validate() {
    badges.verification_radius_m = std::clamp(badges.verification_radius_m, 10.0, 5000.0);
    badges.visit_cooldown = std::clamp(badges.visit_cooldown, core::Days(0), core::Days(365));
    badges.discovery_cooldown = std::clamp(badges.discovery_cooldown, core::Days(0), core::Days(365));

    badges.scholar_points = std::max(badges.scholar_points, 0);
    badges.verified_visit_points = std::max(badges.verified_visit_points, 0);
    badges.upgrade_points = std::max(badges.upgrade_points, 0);
    badges.self_report_points = std::max(badges.self_report_points, 0);
    badges.discovery_points = std::max(badges.discovery_points, 0);
    badges.quiz_points = std::max(badges.quiz_points, 0);

    using std::chrono::milliseconds;
    location.request_timeout = std::clamp(location.request_timeout, milliseconds(100), milliseconds(120000));
    location.max_fix_age = std::clamp(location.max_fix_age, milliseconds(0), milliseconds(600000));
    location.max_accuracy_m = std::clamp(location.max_accuracy_m, 1.0, 10000.0);

    if (storage.progress_path.empty()) {
        storage.progress_path = "progress.json";
    }
}

// ============================================================================
// Load
// ============================================================================

bool load_config_from_string(const std::string& text, EngineConfig& config) {
    try {
        json j = json::parse(text);
        EngineConfig loaded = config;

        // Badges
        if (j.contains("badges")) {
            auto& b = j["badges"];
            if (b.contains("verification_radius_m")) loaded.badges.verification_radius_m = b["verification_radius_m"];
            if (b.contains("visit_cooldown_days")) loaded.badges.visit_cooldown = core::Days(b["visit_cooldown_days"].get<int>());
            if (b.contains("discovery_cooldown_days")) loaded.badges.discovery_cooldown = core::Days(b["discovery_cooldown_days"].get<int>());
            if (b.contains("scholar_points")) loaded.badges.scholar_points = b["scholar_points"];
            if (b.contains("verified_visit_points")) loaded.badges.verified_visit_points = b["verified_visit_points"];
            if (b.contains("upgrade_points")) loaded.badges.upgrade_points = b["upgrade_points"];
            if (b.contains("self_report_points")) loaded.badges.self_report_points = b["self_report_points"];
            if (b.contains("discovery_points")) loaded.badges.discovery_points = b["discovery_points"];
            if (b.contains("quiz_points")) loaded.badges.quiz_points = b["quiz_points"];
        }

        // Location
        if (j.contains("location")) {
            auto& l = j["location"];
            if (l.contains("request_timeout_ms")) loaded.location.request_timeout = std::chrono::milliseconds(l["request_timeout_ms"].get<int64_t>());
            if (l.contains("max_fix_age_ms")) loaded.location.max_fix_age = std::chrono::milliseconds(l["max_fix_age_ms"].get<int64_t>());
            if (l.contains("max_accuracy_m")) loaded.location.max_accuracy_m = l["max_accuracy_m"];
        }

        // Storage
        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("progress_path")) loaded.storage.progress_path = s["progress_path"];
            if (s.contains("sites_path")) loaded.storage.sites_path = s["sites_path"];
            if (s.contains("achievements_path")) loaded.storage.achievements_path = s["achievements_path"];
        }

        if (j.contains("log_level")) {
            std::string name = j["log_level"];
            if (!core::parse_log_level(name, loaded.log_level)) {
                core::log_warning("config", "Unknown log level '{}', keeping {}", name, core::log_level_name(loaded.log_level));
            }
        }

        loaded.validate();
        config = std::move(loaded);
        return true;

    } catch (const std::exception& e) {
        core::log_error("config", "Failed to parse config: {}", e.what());
        return false;
    }
}

bool load_config(const std::string& path, EngineConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        core::log_warning("config", "Could not open config file: {}", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_config_from_string(buffer.str(), config)) {
        return false;
    }

    core::log_info("config", "Loaded config from: {}", path);
    return true;
}

// ============================================================================
// Save
// ============================================================================

std::string config_to_string(const EngineConfig& config) {
    json j;

    j["badges"] = {
        {"verification_radius_m", config.badges.verification_radius_m},
        {"visit_cooldown_days", config.badges.visit_cooldown.count()},
        {"discovery_cooldown_days", config.badges.discovery_cooldown.count()},
        {"scholar_points", config.badges.scholar_points},
        {"verified_visit_points", config.badges.verified_visit_points},
        {"upgrade_points", config.badges.upgrade_points},
        {"self_report_points", config.badges.self_report_points},
        {"discovery_points", config.badges.discovery_points},
        {"quiz_points", config.badges.quiz_points}
    };

    j["location"] = {
        {"request_timeout_ms", config.location.request_timeout.count()},
        {"max_fix_age_ms", config.location.max_fix_age.count()},
        {"max_accuracy_m", config.location.max_accuracy_m}
    };

    j["storage"] = {
        {"progress_path", config.storage.progress_path},
        {"sites_path", config.storage.sites_path},
        {"achievements_path", config.storage.achievements_path}
    };

    j["log_level"] = core::log_level_name(config.log_level);

    return j.dump(4);
}

bool save_config(const std::string& path, const EngineConfig& config) {
    std::ofstream file(path);
    if (!file.is_open()) {
        core::log_error("config", "Could not open config file for writing: {}", path);
        return false;
    }

    file << config_to_string(config);
    if (!file.good()) {
        core::log_error("config", "Failed to write config: {}", path);
        return false;
    }

    core::log_info("config", "Saved config to: {}", path);
    return true;
}

} // namespace unlock::config
