#include <unlock/location/timed_location_port.hpp>
#include <unlock/core/log.hpp>
#include <algorithm>
#include <iterator>

namespace unlock::location {

TimedLocationPort::TimedLocationPort(IPositionSource& source, const core::IClock& clock, LocationPolicy policy)
    : m_source(source)
    , m_clock(clock)
    , m_policy(policy) {}

TimedLocationPort::~TimedLocationPort() {
    std::vector<Watchdog> watchdogs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        watchdogs.swap(m_watchdogs);
    }
    // jthread destructors request stop and join
    watchdogs.clear();
}

Authorization TimedLocationPort::current_authorization() const {
    return m_source.authorization();
}

bool TimedLocationPort::is_fresh(const Position& position) const {
    auto age = m_clock.now() - position.timestamp;
    return age >= std::chrono::system_clock::duration::zero() && age < m_policy.max_fix_age;
}

bool TimedLocationPort::is_accurate(const Position& position) const {
    return position.horizontal_accuracy_m >= 0.0 &&
           position.horizontal_accuracy_m <= m_policy.max_accuracy_m;
}

std::shared_ptr<PositionRequest> TimedLocationPort::request_position(PositionCallback callback) {
    return request_position(m_policy.request_timeout, std::move(callback));
}

std::shared_ptr<PositionRequest> TimedLocationPort::request_position(
    std::chrono::milliseconds timeout, PositionCallback callback) {

    auto request = std::make_shared<PositionRequest>(std::move(callback));

    if (m_source.authorization() == Authorization::Denied) {
        core::log_info("location", "Position request refused: access denied");
        request->settle(std::nullopt);
        return request;
    }

    if (auto cached = m_source.last_known(); cached && is_fresh(*cached) && is_accurate(*cached)) {
        request->settle(*cached);
        return request;
    }

    prune_watchdogs();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_watchdogs.push_back(Watchdog{
            request,
            std::jthread([request, timeout](std::stop_token stop) {
                if (request->wait_until_resolved(stop, timeout)) {
                    return;
                }
                if (stop.stop_requested()) {
                    request->cancel();
                    return;
                }
                if (request->settle(std::nullopt)) {
                    core::log_info("location", "Position request timed out after {} ms", timeout.count());
                }
            })
        });
    }

    double max_accuracy = m_policy.max_accuracy_m;
    m_source.request_fix([request, max_accuracy](const std::optional<Position>& fix) {
        if (fix && fix->horizontal_accuracy_m >= 0.0 && fix->horizontal_accuracy_m <= max_accuracy) {
            request->settle(fix);
        } else {
            if (fix) {
                core::log_debug("location", "Discarding fix with accuracy {:.0f} m", fix->horizontal_accuracy_m);
            }
            request->settle(std::nullopt);
        }
    });

    return request;
}

size_t TimedLocationPort::active_watchdogs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_watchdogs.begin(), m_watchdogs.end(),
        [](const Watchdog& w) { return !w.request->ready(); }));
}

void TimedLocationPort::prune_watchdogs() {
    std::vector<Watchdog> finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto self = std::this_thread::get_id();
        auto it = std::stable_partition(m_watchdogs.begin(), m_watchdogs.end(),
            [self](const Watchdog& w) {
                // A watchdog cannot join itself when a callback re-requests from its thread
                return !w.request->ready() || w.thread.get_id() == self;
            });
        std::move(it, m_watchdogs.end(), std::back_inserter(finished));
        m_watchdogs.erase(it, m_watchdogs.end());
    }
    // Joined outside the lock
    finished.clear();
}

} // namespace unlock::location
