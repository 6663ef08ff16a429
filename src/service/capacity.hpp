#pragma once

#include <vector>

#include "../domain/appointment.hpp"
#include "../domain/schedule.hpp"

namespace capacity {

// Remaining room at a timeslot. Negative when the capacity digit was lowered
// after bookings were made; anything below 1 means no room.
inline int openSlots(int capacity_digit, const vector<AppointmentSlot>& appointments_at_timeslot) {
    int open = capacity_digit;
    for (const auto& a : appointments_at_timeslot) {
        if (a.isClaimed()) {
            open--;
        }
    }
    return open;
}

inline int openSlots(const AppointmentSchedule& schedule, int timeslot, const vector<AppointmentSlot>& appointments_at_timeslot) {
    return openSlots(schedule.capacityAt(timeslot), appointments_at_timeslot);
}

inline bool hasRoom(int open) { return open >= 1; }

} // namespace capacity
