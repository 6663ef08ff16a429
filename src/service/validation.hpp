#pragma once

#include <string>

#include "../domain/appointment.hpp"
#include "../domain/errors.hpp"
#include "../utils/time_format.hpp"

namespace validation {

inline bool isBlank(const optional<string>& field) { return !field || field->empty(); }

// name, description and location must be present and non-empty.
inline void validateAppointmentPayload(const AppointmentSlot& payload) {
    json missing = json::array();
    if (isBlank(payload.name))        missing.push_back("name");
    if (isBlank(payload.description)) missing.push_back("description");
    if (isBlank(payload.location))    missing.push_back("location");

    if (!missing.empty()) {
        throw BookingError(ErrorKind::BadRequest, "It looks like you left out some fields in the appointment.",
                           {{"missing_fields", missing}});
    }
}

// Stamps unset map coordinates to zero.
inline void defaultMapCoordinates(AppointmentSlot& a) {
    if (!a.map_x) a.map_x = 0.0f;
    if (!a.map_y) a.map_y = 0.0f;
}

// `action` completes "You can't ... someone else's appointment!"
inline BookingError notOwner(const AppointmentSlot& a, const string& action) {
    return BookingError(ErrorKind::Forbidden, "You can't " + action + " someone else's appointment!",
                        {{"appointment_id", a.id}});
}

inline bool isOwner(const AppointmentSlot& a, const string& email) {
    return a.student_email && *a.student_email == email;
}

inline void requireOwner(const AppointmentSlot& a, const string& email, const string& action) {
    if (!isOwner(a, email)) throw notOwner(a, action);
}

inline void requireAdmin(bool is_admin, const string& action) {
    if (!is_admin) {
        throw BookingError(ErrorKind::Forbidden, "Only queue admins can " + action + ".");
    }
}

inline BookingError inThePast(TimePoint target, const string& message) {
    return BookingError(ErrorKind::BadRequest, message, {{"time", time_format::toRfc3339(target)}});
}

inline void requireNotPast(TimePoint now, TimePoint target, const string& message) {
    if (now > target) throw inThePast(target, message);
}

} // namespace validation
