#include <unlock/location/location_port.hpp>

namespace unlock::location {

PositionRequest::PositionRequest(PositionCallback callback)
    : m_callback(std::move(callback)) {}

bool PositionRequest::settle(std::optional<Position> position) {
    PositionCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_resolved) {
            return false;
        }
        m_resolved = true;
        m_result = position;
        callback = std::move(m_callback);
        m_callback = nullptr;
    }
    m_cv.notify_all();

    // Outside the lock so the callback may query this request
    if (callback) {
        callback(position);
    }
    return true;
}

bool PositionRequest::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_resolved) {
            return false;
        }
        m_resolved = true;
        m_cancelled = true;
        m_result.reset();
        m_callback = nullptr;
    }
    m_cv.notify_all();
    return true;
}

bool PositionRequest::ready() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_resolved;
}

bool PositionRequest::cancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

std::optional<Position> PositionRequest::wait() const {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_resolved; });
    return m_result;
}

std::optional<Position> PositionRequest::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, timeout, [this] { return m_resolved; })) {
        return std::nullopt;
    }
    return m_result;
}

bool PositionRequest::wait_until_resolved(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return m_resolved; });
}

bool PositionRequest::wait_until_resolved(std::stop_token stop, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, stop, timeout, [this] { return m_resolved; });
}

} // namespace unlock::location
