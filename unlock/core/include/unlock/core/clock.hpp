#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace unlock::core {

using Timestamp = std::chrono::system_clock::time_point;
using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

// Wall-clock source. Injected everywhere "now" matters so cooldown
// arithmetic can be driven from tests.
class IClock {
public:
    virtual ~IClock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock final : public IClock {
public:
    Timestamp now() const override { return std::chrono::system_clock::now(); }
};

// Clock that only moves when told to
class ManualClock final : public IClock {
public:
    explicit ManualClock(Timestamp start = Timestamp{std::chrono::hours(24 * 365 * 50)})
        : m_now(start) {}

    Timestamp now() const override;

    void set(Timestamp t);
    void advance(std::chrono::system_clock::duration d);
    void advance_days(int days) { advance(Days(days)); }

private:
    mutable std::mutex m_mutex;
    Timestamp m_now;
};

// Milliseconds since the Unix epoch, the persisted timestamp format
int64_t to_epoch_ms(Timestamp t);
Timestamp from_epoch_ms(int64_t ms);

// Whole days left until `since + window` is reached, rounded up; 0 once elapsed
int days_remaining(Timestamp since, Days window, Timestamp now);

} // namespace unlock::core
