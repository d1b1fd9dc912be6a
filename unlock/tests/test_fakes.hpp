#pragma once

#include <unlock/content/content_provider.hpp>
#include <unlock/location/timed_location_port.hpp>
#include <unlock/progress/key_value_store.hpp>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace unlock::testing {

// Memory store whose writes can be made to fail
class FlakyKeyValueStore final : public progress::IKeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) const override {
        return m_inner.get(key);
    }

    bool set(const std::string& key, const std::string& value) override {
        if (fail_writes) return false;
        return m_inner.set(key, value);
    }

    bool remove(const std::string& key) override {
        if (fail_writes) return false;
        return m_inner.remove(key);
    }

    size_t size() const { return m_inner.size(); }

    std::atomic<bool> fail_writes{false};

private:
    progress::MemoryKeyValueStore m_inner;
};

// Position source driven by the test: fixes are delivered by hand, or
// immediately from `immediate_fix`
class ScriptedPositionSource final : public location::IPositionSource {
public:
    location::Authorization authorization() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_authorization;
    }

    std::optional<location::Position> last_known() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_known;
    }

    void request_fix(location::PositionCallback on_fix) override {
        std::optional<location::Position> immediate;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_requests;
            if (!m_immediate) {
                m_pending.push_back(std::move(on_fix));
                return;
            }
            immediate = *m_immediate;
        }
        on_fix(immediate);
    }

    // Hand `fix` to every outstanding request_fix callback
    void deliver(const std::optional<location::Position>& fix) {
        std::vector<location::PositionCallback> pending;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pending = m_pending;
        }
        for (auto& callback : pending) {
            callback(fix);
        }
    }

    void set_authorization(location::Authorization authorization) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_authorization = authorization;
    }

    void set_last_known(std::optional<location::Position> position) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last_known = std::move(position);
    }

    // Answer every request_fix synchronously with `fix`
    void set_immediate(std::optional<std::optional<location::Position>> fix) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_immediate = std::move(fix);
    }

    int request_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

private:
    mutable std::mutex m_mutex;
    location::Authorization m_authorization = location::Authorization::Authorized;
    std::optional<location::Position> m_last_known;
    std::optional<std::optional<location::Position>> m_immediate;
    std::vector<location::PositionCallback> m_pending;
    int m_requests = 0;
};

inline content::Site make_site(const std::string& id, core::Coordinate coordinate,
                               std::vector<std::string> sub_ids = {},
                               const std::string& city = "Cairo", const std::string& era = "Old Kingdom") {
    content::Site site;
    site.id = id;
    site.name = id;
    site.city = city;
    site.era = era;
    site.coordinate = coordinate;
    for (auto& sub : sub_ids) {
        site.sub_locations.push_back({sub, sub});
    }
    return site;
}

inline location::Position make_position(core::Coordinate coordinate, core::Timestamp timestamp,
                                        double accuracy_m = 10.0) {
    location::Position position;
    position.coordinate = coordinate;
    position.horizontal_accuracy_m = accuracy_m;
    position.timestamp = timestamp;
    return position;
}

// Giza plateau and Karnak temple
constexpr core::Coordinate GIZA{29.9792, 31.1342};
constexpr core::Coordinate KARNAK{25.7188, 32.6573};

} // namespace unlock::testing
