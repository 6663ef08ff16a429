#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "../utils/time_format.hpp"

using json = nlohmann::json;
using namespace std;

// A booked or vacated claim. A slot without student_email is open.
struct AppointmentSlot {
    string id;
    string queue;
    int timeslot = 0;
    TimePoint scheduled_time{};
    int duration = 0;
    optional<string> student_email;
    optional<string> name;
    optional<string> description;
    optional<string> location;
    optional<float> map_x;
    optional<float> map_y;

    bool isClaimed() const { return student_email.has_value(); }
};

namespace appointment_json {

template<typename T>
void readOptional(const json& j, const char* key, optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
    } else {
        out = it->get<T>();
    }
}

template<typename T>
json writeOptional(const optional<T>& value) {
    if (value) return json(*value);
    return json(nullptr);
}

} // namespace appointment_json

inline void to_json(json& j, const AppointmentSlot& a) {
    j = json{{"id", a.id},
             {"queue", a.queue},
             {"timeslot", a.timeslot},
             {"scheduled_time", time_format::toRfc3339(a.scheduled_time)},
             {"duration", a.duration},
             {"student_email", appointment_json::writeOptional(a.student_email)},
             {"name", appointment_json::writeOptional(a.name)},
             {"description", appointment_json::writeOptional(a.description)},
             {"location", appointment_json::writeOptional(a.location)},
             {"map_x", appointment_json::writeOptional(a.map_x)},
             {"map_y", appointment_json::writeOptional(a.map_y)}};
}

// Lenient: a client payload carries only some of these fields, the rest are
// stamped by the coordinator.
inline void from_json(const json& j, AppointmentSlot& a) {
    a.id       = j.value("id", string());
    a.queue    = j.value("queue", string());
    a.timeslot = j.value("timeslot", 0);
    a.duration = j.value("duration", 0);
    if (j.contains("scheduled_time") && j["scheduled_time"].is_string()) {
        a.scheduled_time = time_format::fromRfc3339(j["scheduled_time"].get<string>());
    }
    appointment_json::readOptional(j, "student_email", a.student_email);
    appointment_json::readOptional(j, "name", a.name);
    appointment_json::readOptional(j, "description", a.description);
    appointment_json::readOptional(j, "location", a.location);
    appointment_json::readOptional(j, "map_x", a.map_x);
    appointment_json::readOptional(j, "map_y", a.map_y);
}
