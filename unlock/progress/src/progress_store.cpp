#include <unlock/progress/progress_store.hpp>
#include <unlock/core/log.hpp>
#include <exception>

namespace unlock::progress {

ProgressStore::ProgressStore(IKeyValueStore& storage, core::EventDispatcher* events)
    : m_storage(storage)
    , m_events(events) {}

bool ProgressStore::load() {
    EncodedProgress encoded;
    for (auto key : keys::all) {
        if (auto value = m_storage.get(std::string(key))) {
            encoded.emplace(key, std::move(*value));
        }
    }

    DecodeReport report;
    ProgressState loaded = decode_progress(encoded, &report);

    std::optional<ProgressState> snapshot;
    uint64_t generation = 0;
    {
        std::unique_lock lock(m_mutex);
        m_state = std::move(loaded);
        m_persisted = std::move(encoded);
        generation = ++m_generation;
        snapshot = m_state;
    }

    if (report.groups_loaded == 0) {
        core::log_info("progress", "No saved progress found, starting fresh");
    } else {
        core::log_info("progress", "Loaded {} progress groups ({} malformed, {} points)",
                       report.groups_loaded, report.groups_malformed, snapshot->total_points);
    }

    publish(std::move(snapshot), generation);
    return report.groups_loaded > 0;
}

void ProgressStore::reset() {
    uint64_t generation = 0;
    {
        std::unique_lock lock(m_mutex);
        m_state = ProgressState{};
        m_persisted.clear();
        generation = ++m_generation;

        for (auto key : keys::all) {
            if (!m_storage.remove(std::string(key))) {
                ++m_persist_failures;
                core::log_warning("progress", "Could not clear stored '{}'", key);
            }
        }
    }

    core::log_info("progress", "Reset all progress");

    publish(ProgressState{}, generation);
    if (m_events) {
        m_events->dispatch(ProgressResetEvent{generation});
    }
}

ProgressState ProgressStore::snapshot() const {
    std::shared_lock lock(m_mutex);
    return m_state;
}

int ProgressStore::total_points() const {
    return read([](const ProgressState& s) { return s.total_points; });
}

bool ProgressStore::has_scholar_badge(const std::string& sub_location_id) const {
    return read([&](const ProgressState& s) { return s.has_scholar_badge(sub_location_id); });
}

bool ProgressStore::has_explorer_badge(const std::string& site_id) const {
    return read([&](const ProgressState& s) { return s.has_explorer_badge(site_id); });
}

bool ProgressStore::is_self_reported(const std::string& site_id) const {
    return read([&](const ProgressState& s) { return s.is_self_reported(site_id); });
}

bool ProgressStore::is_favorite(const std::string& site_id) const {
    return read([&](const ProgressState& s) { return s.favorite_sites.contains(site_id); });
}

bool ProgressStore::toggle_favorite(const std::string& site_id) {
    return transact([&](ProgressState& s) {
        if (s.favorite_sites.erase(site_id) > 0) {
            return false;
        }
        s.favorite_sites.insert(site_id);
        return true;
    });
}

void ProgressStore::persist_locked() {
    EncodedProgress encoded;
    try {
        encoded = encode_progress(m_state);
    } catch (const std::exception& e) {
        // Ids that are not valid UTF-8 cannot be written as JSON; the state stays in memory
        ++m_persist_failures;
        core::log_error("progress", "Failed to encode progress: {}", e.what());
        return;
    }

    for (auto& [key, value] : encoded) {
        auto previous = m_persisted.find(key);
        if (previous != m_persisted.end() && previous->second == value) {
            continue;
        }

        if (m_storage.set(key, value)) {
            m_persisted[key] = value;
        } else {
            // Leave m_persisted stale so the next commit retries this group
            ++m_persist_failures;
            core::log_warning("progress", "Failed to persist '{}', keeping in-memory state", key);
        }
    }
}

void ProgressStore::publish(std::optional<ProgressState> snapshot, uint64_t generation) {
    if (!snapshot || !m_events) {
        return;
    }
    m_events->dispatch(ProgressChangedEvent{std::move(*snapshot), generation});
}

} // namespace unlock::progress
