#include <unlock/core/clock.hpp>

namespace unlock::core {

Timestamp ManualClock::now() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_now;
}

void ManualClock::set(Timestamp t) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now = t;
}

void ManualClock::advance(std::chrono::system_clock::duration d) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now += d;
}

int64_t to_epoch_ms(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp{std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::milliseconds(ms))};
}

int days_remaining(Timestamp since, Days window, Timestamp now) {
    auto deadline = since + window;
    if (now >= deadline) return 0;

    auto left = std::chrono::ceil<Days>(deadline - now);
    return static_cast<int>(left.count());
}

} // namespace unlock::core
