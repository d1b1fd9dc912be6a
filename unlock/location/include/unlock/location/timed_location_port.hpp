#pragma once

#include <unlock/location/location_port.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace unlock::location {

// ============================================================================
// Position Source - the platform positioning collaborator
// ============================================================================

class IPositionSource {
public:
    virtual ~IPositionSource() = default;

    virtual Authorization authorization() const = 0;

    // Most recent fix the platform holds, if any
    virtual std::optional<Position> last_known() const = 0;

    // Ask for a fresh fix. `on_fix` may run on any thread, any number of
    // times (including zero); nullopt reports a failed fix.
    virtual void request_fix(PositionCallback on_fix) = 0;
};

struct LocationPolicy {
    std::chrono::milliseconds request_timeout{10000};
    std::chrono::milliseconds max_fix_age{30000};
    double max_accuracy_m = 100.0;
};

// ============================================================================
// TimedLocationPort
// ============================================================================
//
// ILocationPort over an IPositionSource. Each request that cannot be served
// from a fresh cached fix gets a watchdog thread that settles it with
// nullopt when the timeout elapses; the fix callback and the watchdog race
// on PositionRequest::settle, so only the first one counts. Destroying the
// port stops outstanding watchdogs, which cancel their requests.

class TimedLocationPort final : public ILocationPort {
public:
    TimedLocationPort(IPositionSource& source, const core::IClock& clock, LocationPolicy policy = {});
    ~TimedLocationPort() override;

    TimedLocationPort(const TimedLocationPort&) = delete;
    TimedLocationPort& operator=(const TimedLocationPort&) = delete;

    Authorization current_authorization() const override;

    std::shared_ptr<PositionRequest> request_position(
        std::chrono::milliseconds timeout, PositionCallback callback = {}) override;

    // Convenience overload using the policy's default timeout
    std::shared_ptr<PositionRequest> request_position(PositionCallback callback = {});

    bool is_fresh(const Position& position) const;
    bool is_accurate(const Position& position) const;

    const LocationPolicy& policy() const { return m_policy; }
    size_t active_watchdogs() const;

private:
    struct Watchdog {
        std::shared_ptr<PositionRequest> request;
        std::jthread thread;
    };

    void prune_watchdogs();

    IPositionSource& m_source;
    const core::IClock& m_clock;
    LocationPolicy m_policy;

    mutable std::mutex m_mutex;
    std::vector<Watchdog> m_watchdogs;
};

} // namespace unlock::location
