#pragma once

#include <unlock/core/clock.hpp>
#include <unlock/core/geo.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

namespace unlock::location {

enum class Authorization : uint8_t {
    Undetermined,
    Authorized,
    Denied
};

struct Position {
    core::Coordinate coordinate;
    double horizontal_accuracy_m = 0.0;
    core::Timestamp timestamp;
};

using PositionCallback = std::function<void(const std::optional<Position>&)>;

// ============================================================================
// PositionRequest - single-assignment result of a position request
// ============================================================================
//
// Exactly one settle() wins. The callback supplied at creation runs once,
// on the thread of the winning settle(), unless the request was cancelled
// first. Every later settle() or cancel() is a no-op.

class PositionRequest {
public:
    explicit PositionRequest(PositionCallback callback = {});

    PositionRequest(const PositionRequest&) = delete;
    PositionRequest& operator=(const PositionRequest&) = delete;

    // Returns true if this call resolved the request
    bool settle(std::optional<Position> position);

    // Abandon the request: resolves it to nullopt without invoking the callback.
    // Returns true if the request was still pending.
    bool cancel();

    bool ready() const;
    bool cancelled() const;

    std::optional<Position> wait() const;
    std::optional<Position> wait_for(std::chrono::milliseconds timeout) const;

    // Block until resolved or until `timeout` elapses, whichever is first
    bool wait_until_resolved(std::chrono::milliseconds timeout) const;
    bool wait_until_resolved(std::stop_token stop, std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable_any m_cv;
    bool m_resolved = false;
    bool m_cancelled = false;
    std::optional<Position> m_result;
    PositionCallback m_callback;
};

// ============================================================================
// Location Port
// ============================================================================

class ILocationPort {
public:
    virtual ~ILocationPort() = default;

    virtual Authorization current_authorization() const = 0;

    // Resolves exactly once within `timeout`. A nullopt result means
    // timeout, denial, failure or an unusable fix.
    virtual std::shared_ptr<PositionRequest> request_position(
        std::chrono::milliseconds timeout, PositionCallback callback = {}) = 0;
};

} // namespace unlock::location
