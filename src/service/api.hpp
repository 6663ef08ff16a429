#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../domain/appointment.hpp"
#include "../domain/errors.hpp"
#include "../domain/request_context.hpp"
#include "../domain/schedule.hpp"
#include "../persistence/store.hpp"
#include "../utils/ksuid.hpp"
#include "../utils/logger.hpp"
#include "booking/coordinator.hpp"

using json = nlohmann::json;

// Maps coordinator outcomes onto response statuses and bodies. Also resolves
// the raw path parameters a transport would hand over.
namespace api {

struct Response {
    int status = 200;
    json body  = nullptr;
};

inline int parseInt(const std::string& text, const std::string& what) {
    size_t used = 0;
    int value   = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw BookingError(ErrorKind::NotFound, "Invalid " + what + " \"" + text + "\"", {{what, text}});
    }
    return value;
}

inline int parseDay(const std::string& text) {
    int day = parseInt(text, "day");
    if (!schedule_model::isValidDay(day)) {
        throw BookingError(ErrorKind::NotFound, "Invalid day \"" + text + "\"", {{"day", text}});
    }
    return day;
}

inline int parseTimeslot(const std::string& text) { return parseInt(text, "timeslot"); }

inline std::string parseAppointmentId(const std::string& text) {
    if (!ksuid::isValid(text)) {
        throw BookingError(ErrorKind::NotFound, "I called for help, but I couldn't find that appointment anywhere.",
                           {{"appointment_id", text}});
    }
    return text;
}

inline Response errorResponse(const BookingError& e) {
    json body = {{"message", e.what()}, {"kind", e.kind()}};
    if (!e.details().empty()) body["details"] = e.details();
    if (e.retryable()) body["retryable"] = true;
    return {e.status(), body};
}

class Api {
  private:
    booking::BookingCoordinator& coordinator;
    persistence::AppointmentStore& store;
    Logger logger;

    template<typename Handler>
    Response guard(const RequestContext& ctx, Handler&& handler) {
        try {
            return handler();
        } catch (const BookingError& e) {
            return errorResponse(e);
        } catch (const std::exception& e) {
            logger.error("unhandled error", {{"request_id", ctx.request_id}, {"err", e.what()}});
            return {500, {{"message", "Something went wrong on our end."}, {"kind", ErrorKind::Internal}}};
        }
    }

    static AppointmentSlot readAppointment(const json& body) {
        try {
            return body.get<AppointmentSlot>();
        } catch (const std::exception&) {
            throw BookingError(ErrorKind::BadRequest, "We couldn't read your appointment in the request body.");
        }
    }

    static AppointmentSchedule readSchedule(const json& body) {
        try {
            return body.get<AppointmentSchedule>();
        } catch (const std::exception&) {
            throw BookingError(ErrorKind::BadRequest, "We couldn't read the schedule in the request body.");
        }
    }

  public:
    Api(booking::BookingCoordinator& c, persistence::AppointmentStore& s, Logger l)
        : coordinator(c), store(s), logger(std::move(l)) {}

    Response getAppointments(const RequestContext& ctx) {
        return guard(ctx, [&]() -> Response { return {200, coordinator.getAppointments(store, ctx)}; });
    }

    Response getAppointmentsForCurrentUser(const RequestContext& ctx) {
        return guard(ctx, [&]() -> Response { return {200, coordinator.getAppointmentsForCurrentUser(store, ctx)}; });
    }

    Response getAppointmentSchedule(const RequestContext& ctx) {
        return guard(ctx, [&]() -> Response { return {200, coordinator.getAppointmentSchedule(store, ctx)}; });
    }

    Response getAppointmentScheduleForDay(const RequestContext& ctx) {
        return guard(ctx, [&]() -> Response { return {200, coordinator.getAppointmentScheduleForDay(store, ctx)}; });
    }

    Response claimTimeslot(const RequestContext& ctx) {
        return guard(ctx, [&]() -> Response { return {201, coordinator.claimTimeslot(store, ctx)}; });
    }

    Response signupForAppointment(const RequestContext& ctx, const json& body) {
        return guard(ctx, [&]() -> Response {
            return {201, coordinator.signupForAppointment(store, ctx, readAppointment(body))};
        });
    }

    // 204 for an in-place edit, 201 with the new row for a move.
    Response updateAppointment(const RequestContext& ctx, const std::string& appointment_id, const json& body) {
        return guard(ctx, [&]() -> Response {
            std::string id = parseAppointmentId(appointment_id);
            booking::UpdateOutcome outcome = coordinator.updateAppointment(store, ctx, id, readAppointment(body));
            if (outcome.moved) return {201, outcome.appointment};
            return {204, nullptr};
        });
    }

    Response updateAppointmentSchedule(const RequestContext& ctx, const json& body) {
        return guard(ctx, [&]() -> Response {
            coordinator.updateAppointmentSchedule(store, ctx, readSchedule(body));
            return {204, nullptr};
        });
    }

    // 204 when a claim was removed, 200 when there was none left to remove.
    Response removeAppointmentSignup(const RequestContext& ctx, const std::string& appointment_id) {
        return guard(ctx, [&]() -> Response {
            bool removed = coordinator.removeAppointmentSignup(store, ctx, parseAppointmentId(appointment_id));
            return {removed ? 204 : 200, nullptr};
        });
    }

    Response unclaimAppointment(const RequestContext& ctx, const std::string& appointment_id) {
        return guard(ctx, [&]() -> Response {
            bool removed = coordinator.unclaimAppointment(store, ctx, parseAppointmentId(appointment_id));
            return {removed ? 204 : 200, nullptr};
        });
    }
};

} // namespace api
