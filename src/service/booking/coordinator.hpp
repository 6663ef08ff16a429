#pragma once

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "../../domain/appointment.hpp"
#include "../../domain/errors.hpp"
#include "../../domain/request_context.hpp"
#include "../../domain/schedule.hpp"
#include "../../persistence/store.hpp"
#include "../../utils/logger.hpp"
#include "../capacity.hpp"
#include "../time_window.hpp"
#include "../validation.hpp"
#include "locks.hpp"

namespace booking {

struct UpdateOutcome {
    bool moved = false; // true when a new row was created at another timeslot
    AppointmentSlot appointment;
};

// Creates, moves and cancels appointment claims. At most `capacity` claimed
// rows exist for a (queue, weekday, timeslot) at any time: signups, claims and
// moves read the capacity and write under that timeslot's lock. Signups, edits
// and cancels by one student run under the student's lock.
class BookingCoordinator {
  private:
    const time_window::Clock& clock;
    Logger logger;
    BookingLocks locks;

    Logger requestLogger(const RequestContext& ctx) const {
        json fields = {{"request_id", ctx.request_id}, {"queue_id", ctx.queue}};
        if (!ctx.email.empty()) fields["email"] = ctx.email;
        return logger.with(fields);
    }

    static long long epochSeconds(TimePoint t) {
        return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    }

    // Logs the store failure and hides its detail from the caller.
    static BookingError internal(const Logger& l, const std::string& what, const std::exception& e,
                                 json details = json::object(), bool retryable = false) {
        l.error("failed to " + what, {{"err", e.what()}});
        return BookingError(ErrorKind::Internal, "Something went wrong on our end while trying to " + what + ".",
                            std::move(details), retryable);
    }

    template<typename Call>
    static auto storeCall(const Logger& l, const std::string& what, Call&& call) -> decltype(call()) {
        try {
            return call();
        } catch (const BookingError&) {
            throw;
        } catch (const std::exception& e) {
            throw internal(l, what, e);
        }
    }

    static void requireValidDay(int day) {
        if (!schedule_model::isValidDay(day)) {
            throw BookingError(ErrorKind::NotFound, "Invalid day \"" + std::to_string(day) + "\"", {{"day", day}});
        }
    }

    AppointmentSchedule loadSchedule(persistence::DayScheduleReader& store, const Logger& l, const std::string& queue,
                                     int day) {
        try {
            return store.getAppointmentScheduleForDay(queue, day);
        } catch (const persistence::RecordNotFound&) {
            l.warn("no appointment schedule for day", {{"day", day}});
            throw BookingError(ErrorKind::NotFound, "This queue doesn't take appointments on that day.", {{"day", day}});
        } catch (const std::exception& e) {
            throw internal(l, "get appointment schedule", e);
        }
    }

    AppointmentSlot loadAppointment(persistence::AppointmentLookup& store, const Logger& l, const std::string& id) {
        try {
            return store.getAppointment(id);
        } catch (const persistence::RecordNotFound&) {
            l.warn("failed to get non-existent appointment", {{"appointment_id", id}});
            throw BookingError(ErrorKind::NotFound,
                               "I called for help, but I couldn't find that appointment anywhere. Was it just deleted?",
                               {{"appointment_id", id}});
        } catch (const std::exception& e) {
            throw internal(l, "get appointment", e);
        }
    }

    // Re-read under the student's lock; a concurrent move or cancel of the
    // same appointment may have released it.
    void requireStillClaimed(persistence::AppointmentLookup& store, const Logger& l, const std::string& id) {
        if (!loadAppointment(store, l, id).isClaimed()) {
            l.warn("appointment was released while waiting to change it");
            throw BookingError(ErrorKind::NotFound, "This appointment doesn't exist. Perhaps it was already deleted?",
                               {{"appointment_id", id}});
        }
    }

    static void requireTimeslot(const AppointmentSchedule& schedule, const Logger& l, int timeslot) {
        if (!schedule.hasTimeslot(timeslot)) {
            l.warn("attempted to use non-existent timeslot", {{"timeslot", timeslot}, {"num_slots", schedule.timeslots()}});
            throw BookingError(ErrorKind::NotFound, "That timeslot doesn't exist!",
                               {{"timeslot", timeslot}, {"num_slots", schedule.timeslots()}});
        }
    }

    // Caller holds the timeslot lock.
    void requireOpenSlot(persistence::TimeslotAppointmentsReader& store, const Logger& l, const AppointmentSchedule& schedule,
                         const std::string& queue, TimePoint start, TimePoint end, int timeslot) {
        std::vector<AppointmentSlot> at_timeslot = storeCall(l, "get appointments for timeslot", [&] {
            return store.getAppointmentsByTimeslot(queue, start, end, timeslot);
        });

        int open = capacity::openSlots(schedule, timeslot, at_timeslot);
        if (!capacity::hasRoom(open)) {
            l.warn("no appointment slots available at timeslot", {{"timeslot", timeslot}, {"open", open}});
            throw BookingError(ErrorKind::Conflict, "There are no slots open at that time!",
                               {{"timeslot", timeslot}, {"capacity", schedule.capacityAt(timeslot)}, {"open", open}});
        }
    }

  public:
    BookingCoordinator(const time_window::Clock& c, Logger l) : clock(c), logger(std::move(l)) {}

    // Admins see every row of the day, everyone else only their own.
    std::vector<AppointmentSlot> getAppointments(persistence::GetAppointmentsStore& store, const RequestContext& ctx) {
        requireValidDay(ctx.day);
        Logger l = requestLogger(ctx).with({{"day", ctx.day}});
        std::pair<TimePoint, TimePoint> window = time_window::weekdayBounds(ctx.day, clock.now());
        TimePoint start = window.first, end = window.second;

        if (ctx.is_admin) {
            return storeCall(l, "get appointments", [&] { return store.getAppointments(ctx.queue, start, end); });
        }
        return storeCall(l, "get appointments", [&] {
            return store.getAppointmentsForUser(ctx.queue, start, end, ctx.email);
        });
    }

    std::vector<AppointmentSlot> getAppointmentsForCurrentUser(persistence::UserAppointmentsReader& store,
                                                               const RequestContext& ctx) {
        requireValidDay(ctx.day);
        Logger l = requestLogger(ctx).with({{"day", ctx.day}});
        std::pair<TimePoint, TimePoint> window = time_window::weekdayBounds(ctx.day, clock.now());
        TimePoint start = window.first, end = window.second;
        return storeCall(l, "get appointments for user", [&] {
            return store.getAppointmentsForUser(ctx.queue, start, end, ctx.email);
        });
    }

    std::vector<AppointmentSchedule> getAppointmentSchedule(persistence::WeekScheduleReader& store, const RequestContext& ctx) {
        Logger l = requestLogger(ctx);
        return storeCall(l, "get appointment schedule", [&] { return store.getAppointmentSchedule(ctx.queue); });
    }

    AppointmentSchedule getAppointmentScheduleForDay(persistence::DayScheduleReader& store, const RequestContext& ctx) {
        requireValidDay(ctx.day);
        return loadSchedule(store, requestLogger(ctx).with({{"day", ctx.day}}), ctx.queue, ctx.day);
    }

    // Claims a pre-defined row at the timeslot. Shares the timeslot lock and
    // the capacity count with signups; rows that already started can't be
    // claimed.
    AppointmentSlot claimTimeslot(persistence::ClaimStore& store, const RequestContext& ctx) {
        requireValidDay(ctx.day);
        Logger l = requestLogger(ctx).with({{"day", ctx.day}, {"timeslot", ctx.timeslot}});

        auto day_lock                = locks.bookDay(ctx.queue, ctx.day);
        AppointmentSchedule schedule = loadSchedule(store, l, ctx.queue, ctx.day);
        requireTimeslot(schedule, l, ctx.timeslot);

        TimePoint now = clock.now();
        std::pair<TimePoint, TimePoint> window = time_window::weekdayBounds(ctx.day, now);
        TimePoint start = window.first, end = window.second;
        TimePoint from = std::max(start, now);

        auto slot_lock = locks.timeslot(ctx.queue, epochSeconds(start), ctx.timeslot);
        requireOpenSlot(store, l, schedule, ctx.queue, start, end, ctx.timeslot);

        try {
            AppointmentSlot claimed = store.claimTimeslot(ctx.queue, from, end, ctx.timeslot, ctx.email);
            l.info("appointment claimed", {{"appointment_id", claimed.id}});
            return claimed;
        } catch (const persistence::WriteConflict& e) {
            l.warn("failed to claim timeslot", {{"err", e.what()}});
            throw BookingError(ErrorKind::Conflict, "Failed to claim timeslot. Perhaps it has already been claimed?",
                               {{"timeslot", ctx.timeslot}});
        } catch (const std::exception& e) {
            throw internal(l, "claim timeslot", e);
        }
    }

    // Admin removal of a claim on a templated row. Repeats are no-ops.
    bool unclaimAppointment(persistence::UnclaimStore& store, const RequestContext& ctx, const std::string& appointment_id) {
        Logger l = requestLogger(ctx).with({{"appointment_id", appointment_id}});
        validation::requireAdmin(ctx.is_admin, "remove someone's claim");

        AppointmentSlot a = loadAppointment(store, l, appointment_id);
        if (!a.isClaimed()) {
            l.warn("attempted to unclaim appointment that has no claim");
            return false;
        }

        storeCall(l, "remove appointment claim", [&] { store.unclaimAppointment(a.id); });
        l.info("removed appointment claim", {{"student_email", *a.student_email}});
        return true;
    }

    AppointmentSlot signupForAppointment(persistence::SignupStore& store, const RequestContext& ctx, AppointmentSlot payload) {
        requireValidDay(ctx.day);
        Logger l = requestLogger(ctx).with({{"day", ctx.day}, {"timeslot", ctx.timeslot}});

        validation::validateAppointmentPayload(payload);

        auto day_lock                = locks.bookDay(ctx.queue, ctx.day);
        AppointmentSchedule schedule = loadSchedule(store, l, ctx.queue, ctx.day);
        requireTimeslot(schedule, l, ctx.timeslot);

        TimePoint now = clock.now();
        std::pair<TimePoint, TimePoint> window = time_window::weekdayBounds(ctx.day, now);
        TimePoint start = window.first, end = window.second;
        TimePoint slot_start = time_window::timeslotStart(start, ctx.timeslot, schedule.duration);
        validation::requireNotPast(now, slot_start, "You can't sign up for an appointment that already started!");

        auto student_lock = locks.student(ctx.queue, ctx.email);
        auto slot_lock    = locks.timeslot(ctx.queue, epochSeconds(start), ctx.timeslot);

        requireOpenSlot(store, l, schedule, ctx.queue, start, end, ctx.timeslot);

        // Anything not yet finished counts, including one in progress right now.
        TimePoint active_from = now - std::chrono::minutes(schedule.duration);
        std::vector<AppointmentSlot> active = storeCall(l, "get future appointments for user", [&] {
            return store.getAppointmentsForUser(ctx.queue, active_from, time_window::bigTime(), ctx.email);
        });
        if (!active.empty()) {
            l.warn("user attempted to sign up for appointment with one in future", {{"existing_appointment_id", active.front().id}});
            throw BookingError(ErrorKind::Conflict, "You already have an appointment in the future!",
                               {{"existing_appointment_id", active.front().id}});
        }

        payload.queue          = ctx.queue;
        payload.timeslot       = ctx.timeslot;
        payload.scheduled_time = slot_start;
        payload.duration       = schedule.duration;
        payload.student_email  = ctx.email;
        validation::defaultMapCoordinates(payload);

        AppointmentSlot created = storeCall(l, "sign up for appointment", [&] {
            return store.signupForAppointment(ctx.queue, payload);
        });
        l.info("new appointment sign up", {{"appointment_id", created.id}});
        return created;
    }

    // Edits the caller's appointment. A new timeslot is a move within today's
    // weekday: the new row is created before the old claim is removed, so a
    // failure in between leaves the student with two bookings rather than none.
    UpdateOutcome updateAppointment(persistence::UpdateAppointmentStore& store, const RequestContext& ctx,
                                    const std::string& appointment_id, AppointmentSlot payload) {
        Logger l = requestLogger(ctx).with({{"appointment_id", appointment_id}});
        AppointmentSlot a = loadAppointment(store, l, appointment_id);

        if (!a.isClaimed()) {
            l.warn("attempted to update deleted appointment");
            throw BookingError(ErrorKind::NotFound, "This appointment doesn't exist. Perhaps it was already deleted?",
                               {{"appointment_id", a.id}});
        }
        if (!validation::isOwner(a, ctx.email)) {
            l.warn("user attempted to update appointment with other email", {{"expected_email", *a.student_email}});
            throw validation::notOwner(a, "update");
        }
        validation::validateAppointmentPayload(payload);

        payload.queue         = a.queue;
        payload.duration      = a.duration;
        payload.student_email = ctx.email;
        validation::defaultMapCoordinates(payload);

        if (payload.timeslot == a.timeslot) {
            auto student_lock = locks.student(a.queue, ctx.email);
            requireStillClaimed(store, l, a.id);

            payload.scheduled_time = a.scheduled_time;
            storeCall(l, "update appointment", [&] { store.updateAppointment(a.id, payload); });
            l.info("updated appointment");

            payload.id = a.id;
            return {false, payload};
        }

        TimePoint now = clock.now();
        int day = time_window::weekdayOf(now);
        std::pair<TimePoint, TimePoint> window = time_window::weekdayBounds(day, now);
        TimePoint start = window.first, end = window.second;
        TimePoint new_time = time_window::timeslotStart(start, payload.timeslot, a.duration);
        payload.scheduled_time = new_time;

        if (now > new_time) {
            l.warn("user attempted to change appointment to past", {{"new_time", time_format::toRfc3339(new_time)}});
            throw validation::inThePast(new_time,
                                        "You can't change your appointment to the past! Let us know if you have a time machine.");
        }

        auto day_lock     = locks.bookDay(a.queue, day);
        auto student_lock = locks.student(a.queue, ctx.email);

        requireStillClaimed(store, l, a.id);

        AppointmentSlot created;
        {
            AppointmentSchedule schedule = loadSchedule(store, l, a.queue, day);
            requireTimeslot(schedule, l, payload.timeslot);

            auto slot_lock = locks.timeslot(a.queue, epochSeconds(start), payload.timeslot);
            requireOpenSlot(store, l, schedule, a.queue, start, end, payload.timeslot);

            // Add first so the student doesn't lose the appointment if this fails.
            created = storeCall(l, "create new appointment for update", [&] {
                return store.signupForAppointment(a.queue, payload);
            });
        }
        l.info("created appointment for update", {{"new_appointment_id", created.id}});

        try {
            store.removeAppointmentSignup(a.id);
        } catch (const std::exception& e) {
            throw internal(l, "remove appointment for update", e,
                           {{"appointment_id", a.id}, {"new_appointment_id", created.id}}, true);
        }
        l.info("removed appointment for update");

        return {true, created};
    }

    // Cancels the caller's claim. Returns false when there was nothing to
    // cancel; repeating a cancel is not an error.
    bool removeAppointmentSignup(persistence::RemoveSignupStore& store, const RequestContext& ctx,
                                 const std::string& appointment_id) {
        Logger l = requestLogger(ctx).with({{"appointment_id", appointment_id}});
        AppointmentSlot a = loadAppointment(store, l, appointment_id);

        if (!a.isClaimed()) {
            l.warn("attempted to remove signup for already deleted appointment");
            return false;
        }
        if (!validation::isOwner(a, ctx.email)) {
            l.warn("user attempted to delete appointment with other email", {{"expected_email", *a.student_email}});
            throw validation::notOwner(a, "delete");
        }
        if (clock.now() > a.scheduled_time) {
            l.warn("user attempted to delete appointment in the past");
            throw validation::inThePast(a.scheduled_time,
                                        "You can't delete an appointment that already happened! Let's try not to cause a paradox here.");
        }

        auto student_lock = locks.student(a.queue, ctx.email);
        if (!loadAppointment(store, l, a.id).isClaimed()) {
            l.warn("appointment was released while waiting to remove it");
            return false;
        }

        storeCall(l, "remove signup for appointment", [&] { store.removeAppointmentSignup(a.id); });
        l.info("removed signup for appointment");
        return true;
    }

    // Replaces a weekday's schedule. Refused while the day's window holds any
    // appointment row, claimed or vacated.
    void updateAppointmentSchedule(persistence::UpdateScheduleStore& store, const RequestContext& ctx,
                                   AppointmentSchedule schedule) {
        Logger l = requestLogger(ctx).with({{"day", ctx.day}});
        validation::requireAdmin(ctx.is_admin, "change the appointment schedule");
        requireValidDay(ctx.day);

        schedule.queue = ctx.queue;
        schedule.day   = ctx.day;
        schedule_model::validateSchedule(schedule);

        auto day_lock = locks.changeDay(ctx.queue, ctx.day);
        std::pair<TimePoint, TimePoint> window = time_window::weekdayBounds(ctx.day, clock.now());
        TimePoint start = window.first, end = window.second;
        std::vector<AppointmentSlot> existing = storeCall(l, "get appointments", [&] {
            return store.getAppointments(ctx.queue, start, end);
        });

        if (!existing.empty()) {
            l.warn("appointment schedule update attempted with existing appointments", {{"count", existing.size()}});
            throw BookingError(ErrorKind::Conflict,
                               "The schedule can't be changed with active appointments. Marty McFly...or something.",
                               {{"count", existing.size()}});
        }

        storeCall(l, "update appointment schedule", [&] { store.updateAppointmentSchedule(ctx.queue, ctx.day, schedule); });
        l.info("updated appointment schedule", {{"schedule", schedule.schedule}, {"duration", schedule.duration}});
    }
};

} // namespace booking
