#pragma once

#include <chrono>
#include <ctime>
#include <utility>

#include "../utils/time_format.hpp"

namespace time_window {

class Clock {
  public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
  public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

class FixedClock : public Clock {
  private:
    TimePoint current;

  public:
    explicit FixedClock(TimePoint t) : current(t) {}

    TimePoint now() const override { return current; }
    void set(TimePoint t) { current = t; }
    void advance(std::chrono::minutes m) { current += m; }
};

// Far-future upper bound for open ended range queries (year 9999).
inline TimePoint bigTime() {
    return std::chrono::system_clock::from_time_t(253402300799);
}

// Local weekday of `t`, 0 = Sunday.
inline int weekdayOf(TimePoint t) {
    std::time_t secs = std::chrono::system_clock::to_time_t(t);
    std::tm local{};
    localtime_r(&secs, &local);
    return local.tm_wday;
}

// [start, end) of the given weekday in the week (Sunday first) containing
// `now`, from local midnight to the following local midnight. Days earlier in
// the week than today are in the past.
inline std::pair<TimePoint, TimePoint> weekdayBounds(int day, TimePoint now) {
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&secs, &local);

    std::tm start_tm{};
    start_tm.tm_year  = local.tm_year;
    start_tm.tm_mon   = local.tm_mon;
    start_tm.tm_mday  = local.tm_mday + (day - local.tm_wday);
    start_tm.tm_isdst = -1;
    std::tm end_tm    = start_tm;
    end_tm.tm_mday += 1;

    // mktime normalizes out-of-range days and resolves DST for each midnight
    TimePoint start = std::chrono::system_clock::from_time_t(std::mktime(&start_tm));
    TimePoint end   = std::chrono::system_clock::from_time_t(std::mktime(&end_tm));
    return {start, end};
}

// Start of the timeslot within the day's window.
inline TimePoint timeslotStart(TimePoint window_start, int timeslot, int duration_minutes) {
    return window_start + std::chrono::minutes(static_cast<long long>(timeslot) * duration_minutes);
}

} // namespace time_window
