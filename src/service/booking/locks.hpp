#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace booking {

// Fixed table of mutexes picked by key hash. Two keys may share a stripe,
// which only costs contention; the table never grows.
template<typename Mutex, size_t Stripes = 64>
class StripedLocks {
  private:
    std::array<Mutex, Stripes> stripes;

  public:
    Mutex& forKey(const std::string& key) { return stripes[std::hash<std::string>{}(key) % Stripes]; }
};

// Locks guarding one queue. Acquire in the order day -> student -> timeslot.
class BookingLocks {
  private:
    StripedLocks<std::shared_mutex, 16> day_locks;
    StripedLocks<std::mutex> student_locks;
    StripedLocks<std::mutex> timeslot_locks;

  public:
    static std::string dayKey(const std::string& queue, int day) { return queue + "|day|" + std::to_string(day); }

    static std::string studentKey(const std::string& queue, const std::string& email) {
        return queue + "|student|" + email;
    }

    static std::string timeslotKey(const std::string& queue, long long window_start, int timeslot) {
        return queue + "|slot|" + std::to_string(window_start) + "|" + std::to_string(timeslot);
    }

    // Held shared by bookings of the day, exclusively by a schedule change.
    std::shared_lock<std::shared_mutex> bookDay(const std::string& queue, int day) {
        return std::shared_lock<std::shared_mutex>(day_locks.forKey(dayKey(queue, day)));
    }

    std::unique_lock<std::shared_mutex> changeDay(const std::string& queue, int day) {
        return std::unique_lock<std::shared_mutex>(day_locks.forKey(dayKey(queue, day)));
    }

    std::unique_lock<std::mutex> student(const std::string& queue, const std::string& email) {
        return std::unique_lock<std::mutex>(student_locks.forKey(studentKey(queue, email)));
    }

    std::unique_lock<std::mutex> timeslot(const std::string& queue, long long window_start, int timeslot) {
        return std::unique_lock<std::mutex>(timeslot_locks.forKey(timeslotKey(queue, window_start, timeslot)));
    }
};

} // namespace booking
