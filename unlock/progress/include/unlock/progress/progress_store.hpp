#pragma once

#include <unlock/progress/progress_state.hpp>
#include <unlock/progress/progress_codec.hpp>
#include <unlock/progress/key_value_store.hpp>
#include <unlock/core/event_dispatcher.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <utility>

namespace unlock::progress {

// ============================================================================
// Progress Events
// ============================================================================

struct ProgressChangedEvent {
    ProgressState snapshot;
    uint64_t generation = 0;
};

struct ProgressResetEvent {
    uint64_t generation = 0;
};

// ============================================================================
// Progress Store
// ============================================================================
//
// Owns the user's ProgressState. All writes go through transact(), which
// holds the exclusive lock for the whole user action, bumps the generation
// when the state changed, and persists the changed field groups before
// returning. Reads take a shared lock and see a consistent state.
//
// Persistence is best-effort: a failed write is logged, counted and retried
// on the next persist; the in-memory state stays authoritative.
// Change events are dispatched after the lock is released.

class ProgressStore {
public:
    explicit ProgressStore(IKeyValueStore& storage, core::EventDispatcher* events = nullptr);

    ProgressStore(const ProgressStore&) = delete;
    ProgressStore& operator=(const ProgressStore&) = delete;

    // Replace the in-memory state with what storage holds.
    // Returns false when nothing was stored (first run).
    bool load();

    // Clear all progress in memory and in storage
    void reset();

    ProgressState snapshot() const;
    uint64_t generation() const { return m_generation.load(); }

    // Run fn(const ProgressState&) under the shared lock
    template<typename F>
    decltype(auto) read(F&& fn) const {
        std::shared_lock lock(m_mutex);
        return std::forward<F>(fn)(std::as_const(m_state));
    }

    // Run fn(const ProgressState&, generation) under the shared lock
    template<typename F>
    decltype(auto) read_versioned(F&& fn) const {
        std::shared_lock lock(m_mutex);
        return std::forward<F>(fn)(std::as_const(m_state), m_generation.load());
    }

    // Run fn(ProgressState&) as one atomic user action. If fn throws, the
    // state is rolled back and the exception propagates.
    template<typename F>
    auto transact(F&& fn) -> std::invoke_result_t<F, ProgressState&>;

    // ========================================================================
    // Convenience reads
    // ========================================================================

    int total_points() const;
    bool has_scholar_badge(const std::string& sub_location_id) const;
    bool has_explorer_badge(const std::string& site_id) const;
    bool is_self_reported(const std::string& site_id) const;
    bool is_favorite(const std::string& site_id) const;

    // Favorites carry no points; returns the new favorite state
    bool toggle_favorite(const std::string& site_id);

    size_t persist_failures() const { return m_persist_failures.load(); }

private:
    void persist_locked();
    void publish(std::optional<ProgressState> snapshot, uint64_t generation);

    IKeyValueStore& m_storage;
    core::EventDispatcher* m_events;

    mutable std::shared_mutex m_mutex;
    ProgressState m_state;
    EncodedProgress m_persisted;        // Last successfully written value per key
    std::atomic<uint64_t> m_generation{1};
    std::atomic<size_t> m_persist_failures{0};
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename F>
auto ProgressStore::transact(F&& fn) -> std::invoke_result_t<F, ProgressState&> {
    using Result = std::invoke_result_t<F, ProgressState&>;

    std::optional<ProgressState> changed;
    uint64_t generation = 0;

    auto commit = [&](const ProgressState& before) {
        if (m_state != before) {
            generation = ++m_generation;
            persist_locked();
            changed = m_state;
        }
    };

    std::unique_lock lock(m_mutex);
    ProgressState before = m_state;

    if constexpr (std::is_void_v<Result>) {
        try {
            std::forward<F>(fn)(m_state);
        } catch (...) {
            m_state = std::move(before);
            throw;
        }
        commit(before);
        lock.unlock();
        publish(std::move(changed), generation);
    } else {
        std::optional<Result> result;
        try {
            result.emplace(std::forward<F>(fn)(m_state));
        } catch (...) {
            m_state = std::move(before);
            throw;
        }
        commit(before);
        lock.unlock();
        publish(std::move(changed), generation);
        return std::move(*result);
    }
}

} // namespace unlock::progress
