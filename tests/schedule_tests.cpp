#include <string>
#include <vector>

#include "domain/appointment.hpp"
#include "domain/schedule.hpp"
#include "service/capacity.hpp"
#include "service/validation.hpp"
#include "test_support.hpp"

namespace {
    using test_support::ExpectEqual;
    using test_support::ExpectKind;
    using test_support::ExpectTrue;
    using test_support::TestCase;

    AppointmentSlot Claimed(const std::string &email) {
        AppointmentSlot a;
        a.student_email = email;
        return a;
    }

    AppointmentSlot Vacated() { return AppointmentSlot(); }

    AppointmentSlot CompletePayload() {
        AppointmentSlot a;
        a.name        = "Ada";
        a.description = "Question about recursion";
        a.location    = "Table 4";
        return a;
    }

    bool ScheduleExposesDigitCapacities() {
        AppointmentSchedule s("cs101", 2, 30, "2110");
        bool ok = ExpectEqual(s.timeslots(), 4, "four timeslots");
        ok &= ExpectEqual(s.capacityAt(0), 2, "capacity at 0");
        ok &= ExpectEqual(s.capacityAt(1), 1, "capacity at 1");
        ok &= ExpectEqual(s.capacityAt(3), 0, "capacity at 3");
        ok &= ExpectTrue(s.hasTimeslot(3), "last timeslot exists");
        ok &= ExpectTrue(!s.hasTimeslot(4), "timeslot past the end");
        ok &= ExpectTrue(!s.hasTimeslot(-1), "negative timeslot");
        return ok;
    }

    bool ScheduleValidationRejectsBadInput() {
        bool ok = ExpectKind([] { schedule_model::validateSchedule(AppointmentSchedule("q", 1, 0, "11")); },
                             ErrorKind::BadRequest, "zero duration");
        ok &= ExpectKind([] { schedule_model::validateSchedule(AppointmentSchedule("q", 1, -15, "11")); },
                         ErrorKind::BadRequest, "negative duration");
        ok &= ExpectKind([] { schedule_model::validateSchedule(AppointmentSchedule("q", 1, 15, "1a1")); },
                         ErrorKind::BadRequest, "non-digit capacity");
        ok &= ExpectKind([] { schedule_model::validateSchedule(AppointmentSchedule("q", 1, 15, "1 1")); },
                         ErrorKind::BadRequest, "space in capacities");

        schedule_model::validateSchedule(AppointmentSchedule("q", 1, 15, "0123456789"));
        schedule_model::validateSchedule(AppointmentSchedule("q", 1, 15, ""));
        return ok;
    }

    bool CapacitiesEncodeAsSingleDigits() {
        bool ok = ExpectEqual(schedule_model::encodeCapacities({2, 1, 1, 0}), std::string("2110"), "encode");
        ok &= ExpectKind([] { schedule_model::encodeCapacities({3, 10}); }, ErrorKind::BadRequest,
                         "capacity 10 does not fit");
        ok &= ExpectKind([] { schedule_model::encodeCapacities({-1}); }, ErrorKind::BadRequest, "negative capacity");

        std::vector<int> decoded = schedule_model::decodeCapacities(AppointmentSchedule("q", 3, 20, "907"));
        ok &= ExpectTrue(decoded == std::vector<int>({9, 0, 7}), "decode");
        return ok;
    }

    bool ScheduleJsonUsesWireFieldNames() {
        json j = AppointmentSchedule("cs101", 2, 30, "2110");
        bool ok = ExpectEqual(j["schedule"].get<std::string>(), std::string("2110"), "schedule field");
        ok &= ExpectEqual(j["duration"].get<int>(), 30, "duration field");
        ok &= ExpectEqual(j["day"].get<int>(), 2, "day field");

        AppointmentSchedule parsed = json::parse(R"({"duration": 10, "schedule": "12"})").get<AppointmentSchedule>();
        ok &= ExpectEqual(parsed.day, 0, "missing day defaults to zero");
        ok &= ExpectEqual(parsed.duration, 10, "duration parsed");
        return ok;
    }

    bool OpenSlotsCountsOnlyClaims() {
        std::vector<AppointmentSlot> rows = {Claimed("a@x.edu"), Vacated(), Claimed("b@x.edu")};
        bool ok = ExpectEqual(capacity::openSlots(3, rows), 1, "one seat left");
        ok &= ExpectEqual(capacity::openSlots(2, rows), 0, "full");
        ok &= ExpectEqual(capacity::openSlots(1, rows), -1, "capacity lowered after booking");
        ok &= ExpectEqual(capacity::openSlots(0, {}), 0, "closed timeslot");
        ok &= ExpectTrue(capacity::hasRoom(1), "one open is room");
        ok &= ExpectTrue(!capacity::hasRoom(0), "zero open is no room");
        ok &= ExpectTrue(!capacity::hasRoom(-1), "negative open is no room");

        AppointmentSchedule s("q", 2, 30, "2110");
        ok &= ExpectEqual(capacity::openSlots(s, 0, {Claimed("a@x.edu")}), 1, "schedule overload");
        return ok;
    }

    bool PayloadValidationRequiresTextFields() {
        validation::validateAppointmentPayload(CompletePayload());

        bool ok = ExpectKind([] {
            AppointmentSlot a = CompletePayload();
            a.name.reset();
            validation::validateAppointmentPayload(a);
        }, ErrorKind::BadRequest, "missing name");
        ok &= ExpectKind([] {
            AppointmentSlot a = CompletePayload();
            a.description = "";
            validation::validateAppointmentPayload(a);
        }, ErrorKind::BadRequest, "empty description");
        ok &= ExpectKind([] {
            AppointmentSlot a = CompletePayload();
            a.location.reset();
            validation::validateAppointmentPayload(a);
        }, ErrorKind::BadRequest, "missing location");

        try {
            validation::validateAppointmentPayload(AppointmentSlot());
            ok &= ExpectTrue(false, "empty payload rejected");
        } catch (const BookingError &e) {
            ok &= ExpectEqual(e.details()["missing_fields"].size(), 3u, "all three fields reported");
        }
        return ok;
    }

    bool MapCoordinatesDefaultToZero() {
        AppointmentSlot a;
        validation::defaultMapCoordinates(a);
        bool ok = ExpectTrue(a.map_x && *a.map_x == 0.0f, "map_x zero");
        ok &= ExpectTrue(a.map_y && *a.map_y == 0.0f, "map_y zero");

        AppointmentSlot b;
        b.map_x = 12.5f;
        validation::defaultMapCoordinates(b);
        ok &= ExpectTrue(*b.map_x == 12.5f, "set coordinate kept");
        ok &= ExpectTrue(b.map_y && *b.map_y == 0.0f, "unset coordinate zeroed");
        return ok;
    }

    bool OwnershipAndTimingChecks() {
        AppointmentSlot mine = Claimed("ada@school.edu");
        validation::requireOwner(mine, "ada@school.edu", "delete");

        bool ok = ExpectKind([&] { validation::requireOwner(mine, "alan@school.edu", "delete"); },
                             ErrorKind::Forbidden, "other student");
        ok &= ExpectKind([] { validation::requireOwner(Vacated(), "ada@school.edu", "update"); },
                         ErrorKind::Forbidden, "vacated row has no owner");
        ok &= ExpectKind([] { validation::requireAdmin(false, "change the schedule"); }, ErrorKind::Forbidden,
                         "non-admin");
        validation::requireAdmin(true, "change the schedule");

        ok &= ExpectTrue(validation::isOwner(mine, "ada@school.edu"), "owner recognised");
        ok &= ExpectTrue(!validation::isOwner(Vacated(), "ada@school.edu"), "nobody owns a vacated row");
        BookingError forbidden = validation::notOwner(mine, "update");
        ok &= ExpectEqual(forbidden.status(), 403, "not-owner status");
        ok &= ExpectEqual(std::string(forbidden.what()), std::string("You can't update someone else's appointment!"),
                          "not-owner message");

        TimePoint now = test_support::MondayMorning();
        BookingError late = validation::inThePast(now, "too late");
        ok &= ExpectEqual(late.status(), 400, "past status");
        ok &= ExpectEqual(late.details()["time"].get<std::string>(), std::string("2026-10-19T08:00:00Z"), "past time");
        validation::requireNotPast(now, now, "same instant is allowed");
        ok &= ExpectKind([&] { validation::requireNotPast(now, now - std::chrono::minutes(1), "past"); },
                         ErrorKind::BadRequest, "one minute ago");
        return ok;
    }

    bool AppointmentJsonRoundsNullableFields() {
        json j = json::parse(R"({
            "name": "Ada",
            "description": "Help",
            "location": "Lab",
            "timeslot": 3,
            "map_x": 1.5,
            "student_email": null,
            "scheduled_time": "2026-10-20T01:30:00Z"
        })");
        AppointmentSlot a = j.get<AppointmentSlot>();
        bool ok = ExpectEqual(a.timeslot, 3, "timeslot parsed");
        ok &= ExpectTrue(!a.student_email, "null email is unclaimed");
        ok &= ExpectTrue(a.map_x && *a.map_x == 1.5f, "map_x parsed");
        ok &= ExpectTrue(!a.map_y, "map_y absent");
        ok &= ExpectTrue(a.scheduled_time == test_support::At("2026-10-20T01:30:00Z"), "scheduled time parsed");

        json out = a;
        ok &= ExpectTrue(out["student_email"].is_null(), "unclaimed serialized as null");
        ok &= ExpectEqual(out["scheduled_time"].get<std::string>(), std::string("2026-10-20T01:30:00Z"),
                          "scheduled time serialized");
        return ok;
    }
}

int main() {
    std::vector<TestCase> tests{
        {"ScheduleExposesDigitCapacities", ScheduleExposesDigitCapacities},
        {"ScheduleValidationRejectsBadInput", ScheduleValidationRejectsBadInput},
        {"CapacitiesEncodeAsSingleDigits", CapacitiesEncodeAsSingleDigits},
        {"ScheduleJsonUsesWireFieldNames", ScheduleJsonUsesWireFieldNames},
        {"OpenSlotsCountsOnlyClaims", OpenSlotsCountsOnlyClaims},
        {"PayloadValidationRequiresTextFields", PayloadValidationRequiresTextFields},
        {"MapCoordinatesDefaultToZero", MapCoordinatesDefaultToZero},
        {"OwnershipAndTimingChecks", OwnershipAndTimingChecks},
        {"AppointmentJsonRoundsNullableFields", AppointmentJsonRoundsNullableFields}
    };
    return test_support::RunTests(tests);
}
