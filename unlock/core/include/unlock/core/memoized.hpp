#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace unlock::core {

// ============================================================================
// Memoized - value cached against a generation counter
// ============================================================================
//
// The only read path is get(generation, compute): a stored value is returned
// only when it was computed for the same generation. Owners bump the
// generation on every mutation of the inputs, so a stale value can never be
// observed. invalidate() drops the value for inputs that have no generation
// (e.g. a refreshed site catalog).

template<typename T>
class Memoized {
public:
    template<typename Compute>
    T get(uint64_t generation, Compute&& compute) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_value || m_generation != generation) {
            m_value.emplace(std::forward<Compute>(compute)());
            m_generation = generation;
            ++m_compute_count;
        }
        return *m_value;
    }

    void invalidate() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_value.reset();
    }

    bool is_valid_for(uint64_t generation) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_value.has_value() && m_generation == generation;
    }

    // Number of times the value was (re)computed
    uint64_t compute_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_compute_count;
    }

private:
    mutable std::mutex m_mutex;
    mutable std::optional<T> m_value;
    mutable uint64_t m_generation = 0;
    mutable uint64_t m_compute_count = 0;
};

} // namespace unlock::core
