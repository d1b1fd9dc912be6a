#include <unlock/progress/progress_codec.hpp>
#include <unlock/core/log.hpp>
#include <algorithm>
#include <nlohmann/json.hpp>

namespace unlock::progress {

using json = nlohmann::json;

namespace {

json encode_set(const std::set<std::string>& values) {
    return json(values);
}

json encode_timestamps(const std::map<std::string, Timestamp>& values) {
    json j = json::object();
    for (const auto& [id, when] : values) {
        j[id] = core::to_epoch_ms(when);
    }
    return j;
}

std::set<std::string> decode_set(const json& j) {
    return j.get<std::set<std::string>>();
}

std::map<std::string, Timestamp> decode_timestamps(const json& j) {
    std::map<std::string, Timestamp> result;
    for (auto& [id, ms] : j.items()) {
        result[id] = core::from_epoch_ms(ms.get<int64_t>());
    }
    return result;
}

} // namespace

EncodedProgress encode_progress(const ProgressState& state) {
    EncodedProgress out;

    out.emplace(keys::total_points, json(state.total_points).dump());
    out.emplace(keys::scholar_badges, encode_set(state.scholar_badges).dump());
    out.emplace(keys::explorer_badges, encode_set(state.explorer_badges).dump());
    out.emplace(keys::self_reported_sites, encode_set(state.self_reported_sites).dump());
    out.emplace(keys::verified_visits, encode_timestamps(state.verified_visits).dump());
    out.emplace(keys::completed_quizzes, encode_set(state.completed_quizzes).dump());
    out.emplace(keys::discovered_places, encode_timestamps(state.discovered_places).dump());

    json achievements;
    json unlocked = json::array();
    for (const auto& [id, when] : state.unlocked_achievements) {
        unlocked.push_back(id);
    }
    achievements["unlocked"] = unlocked;
    achievements["unlockDates"] = encode_timestamps(state.unlocked_achievements);
    out.emplace(keys::achievement_progress, achievements.dump());

    out.emplace(keys::favorite_sites, encode_set(state.favorite_sites).dump());
    return out;
}

ProgressState decode_progress(const EncodedProgress& encoded, DecodeReport* report) {
    ProgressState state;
    DecodeReport local;

    auto decode_group = [&](std::string_view key, auto&& apply) {
        auto it = encoded.find(key);
        if (it == encoded.end()) {
            ++local.groups_missing;
            return;
        }
        try {
            apply(json::parse(it->second));
            ++local.groups_loaded;
        } catch (const std::exception& e) {
            ++local.groups_malformed;
            core::log_warning("progress", "Discarding malformed '{}': {}", key, e.what());
        }
    };

    decode_group(keys::total_points, [&](const json& j) {
        state.total_points = std::max(0, j.get<int>());
    });
    decode_group(keys::scholar_badges, [&](const json& j) {
        state.scholar_badges = decode_set(j);
    });
    decode_group(keys::explorer_badges, [&](const json& j) {
        state.explorer_badges = decode_set(j);
    });
    decode_group(keys::self_reported_sites, [&](const json& j) {
        state.self_reported_sites = decode_set(j);
    });
    decode_group(keys::verified_visits, [&](const json& j) {
        state.verified_visits = decode_timestamps(j);
    });
    decode_group(keys::completed_quizzes, [&](const json& j) {
        state.completed_quizzes = decode_set(j);
    });
    decode_group(keys::discovered_places, [&](const json& j) {
        state.discovered_places = decode_timestamps(j);
    });
    decode_group(keys::achievement_progress, [&](const json& j) {
        auto dates = j.contains("unlockDates") ? decode_timestamps(j["unlockDates"])
                                               : std::map<std::string, Timestamp>{};
        std::map<std::string, Timestamp> unlocked;
        for (const auto& id : j.at("unlocked")) {
            auto name = id.get<std::string>();
            auto date = dates.find(name);
            unlocked[name] = date != dates.end() ? date->second : Timestamp{};
        }
        state.unlocked_achievements = std::move(unlocked);
    });
    decode_group(keys::favorite_sites, [&](const json& j) {
        state.favorite_sites = decode_set(j);
    });

    // A self-reported site always holds a discovery key
    for (const auto& site : state.self_reported_sites) {
        if (state.explorer_badges.insert(site).second) {
            core::log_warning("progress", "Restored missing discovery key for self-reported site '{}'", site);
        }
    }

    if (report) {
        *report = local;
    }
    return state;
}

} // namespace unlock::progress
