#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "errors.hpp"

using json = nlohmann::json;
using namespace std;

// Weekly capacity profile for one weekday of a queue. Each character of
// `schedule` is the capacity of one timeslot, so a timeslot holds at most 9
// concurrent appointments.
struct AppointmentSchedule {
    string queue;
    int day      = 0;
    int duration = 0; // minutes per timeslot
    string schedule;

    AppointmentSchedule() = default;
    AppointmentSchedule(string q, int d, int dur, string s)
        : queue(std::move(q)), day(d), duration(dur), schedule(std::move(s)) {}

    int timeslots() const { return static_cast<int>(schedule.size()); }

    bool hasTimeslot(int timeslot) const { return timeslot >= 0 && timeslot < timeslots(); }

    // Capacity digit at the timeslot. Caller must check hasTimeslot first.
    int capacityAt(int timeslot) const { return schedule[timeslot] - '0'; }
};

inline void to_json(json& j, const AppointmentSchedule& s) {
    j = json{{"queue", s.queue}, {"day", s.day}, {"duration", s.duration}, {"schedule", s.schedule}};
}

inline void from_json(const json& j, AppointmentSchedule& s) {
    s.queue    = j.value("queue", string());
    s.day      = j.value("day", 0);
    s.duration = j.at("duration").get<int>();
    s.schedule = j.at("schedule").get<string>();
}

namespace schedule_model {

constexpr int kDaysPerWeek  = 7;
constexpr int kMaxCapacity  = 9;

inline bool isValidDay(int day) { return day >= 0 && day < kDaysPerWeek; }

// Checks a schedule is usable before it replaces the stored one.
inline void validateSchedule(const AppointmentSchedule& s) {
    if (s.duration <= 0) {
        throw BookingError(ErrorKind::BadRequest, "The schedule needs a positive slot duration.",
                           {{"duration", s.duration}});
    }
    for (size_t i = 0; i < s.schedule.size(); i++) {
        char c = s.schedule[i];
        if (c < '0' || c > '9') {
            throw BookingError(ErrorKind::BadRequest,
                               "Every timeslot capacity must be a single digit between 0 and " + to_string(kMaxCapacity) + ".",
                               {{"timeslot", i}, {"schedule", s.schedule}});
        }
    }
}

// Parses a capacity list like [2, 1, 1, 0] into the digit encoding "2110".
inline string encodeCapacities(const vector<int>& capacities) {
    string encoded;
    encoded.reserve(capacities.size());
    for (size_t i = 0; i < capacities.size(); i++) {
        if (capacities[i] < 0 || capacities[i] > kMaxCapacity) {
            throw BookingError(ErrorKind::BadRequest,
                               "Timeslot capacity " + to_string(capacities[i]) + " does not fit in one digit.",
                               {{"timeslot", i}, {"capacity", capacities[i]}});
        }
        encoded.push_back(static_cast<char>('0' + capacities[i]));
    }
    return encoded;
}

inline vector<int> decodeCapacities(const AppointmentSchedule& s) {
    vector<int> capacities;
    capacities.reserve(s.schedule.size());
    for (int i = 0; i < s.timeslots(); i++) {
        capacities.push_back(s.capacityAt(i));
    }
    return capacities;
}

} // namespace schedule_model
