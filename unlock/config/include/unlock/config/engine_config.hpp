#pragma once

#include <unlock/badges/badge_policy.hpp>
#include <unlock/location/timed_location_port.hpp>
#include <unlock/core/log.hpp>
#include <string>

namespace unlock::config {

// ============================================================================
// Storage Config
// ============================================================================

struct StorageConfig {
    std::string progress_path = "progress.json";
    std::string sites_path;                 // Empty: no catalog file
    std::string achievements_path;          // Empty: built-in catalog
};

// ============================================================================
// Engine Config
// ============================================================================

struct EngineConfig {
    badges::BadgePolicy badges;
    location::LocationPolicy location;
    StorageConfig storage;
    core::LogLevel log_level = core::LogLevel::Info;

    // Clamp everything into usable ranges
    void validate();
};

// Fields missing from the file keep their current value.
// Returns false (leaving `config` untouched) if the file can't be read or parsed.
bool load_config(const std::string& path, EngineConfig& config);
bool load_config_from_string(const std::string& text, EngineConfig& config);

bool save_config(const std::string& path, const EngineConfig& config);
std::string config_to_string(const EngineConfig& config);

} // namespace unlock::config
