#include <chrono>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "service/time_window.hpp"
#include "test_support.hpp"
#include "utils/ksuid.hpp"
#include "utils/logger.hpp"
#include "utils/time_format.hpp"

namespace {
    using test_support::At;
    using test_support::ExpectEqual;
    using test_support::ExpectTrue;
    using test_support::TestCase;

    std::string Fmt(TimePoint t) { return time_format::toRfc3339(t); }

    bool WeekdayBoundsCoverTheCurrentWeek() {
        TimePoint now = test_support::MondayMorning();

        auto monday = time_window::weekdayBounds(1, now);
        bool ok = ExpectEqual(Fmt(monday.first), std::string("2026-10-19T00:00:00Z"), "today starts at midnight");
        ok &= ExpectEqual(Fmt(monday.second), std::string("2026-10-20T00:00:00Z"), "today ends at next midnight");

        auto sunday = time_window::weekdayBounds(0, now);
        ok &= ExpectEqual(Fmt(sunday.first), std::string("2026-10-18T00:00:00Z"), "sunday is yesterday");

        auto tuesday = time_window::weekdayBounds(2, now);
        ok &= ExpectEqual(Fmt(tuesday.first), std::string("2026-10-20T00:00:00Z"), "tuesday is tomorrow");

        auto saturday = time_window::weekdayBounds(6, now);
        ok &= ExpectEqual(Fmt(saturday.first), std::string("2026-10-24T00:00:00Z"), "saturday closes the week");
        ok &= ExpectEqual(Fmt(saturday.second), std::string("2026-10-25T00:00:00Z"), "saturday end");
        return ok;
    }

    bool WeekdayBoundsSpanOneDay() {
        bool ok = true;
        TimePoint now = At("2026-12-31T23:59:59Z"); // Thursday, windows cross the year
        for (int day = 0; day < 7; day++) {
            auto bounds = time_window::weekdayBounds(day, now);
            ok &= ExpectTrue(bounds.second - bounds.first == std::chrono::hours(24), "24 hours on day " + std::to_string(day));
        }
        ok &= ExpectEqual(Fmt(time_window::weekdayBounds(6, now).first), std::string("2027-01-02T00:00:00Z"),
                          "saturday in the next year");
        ok &= ExpectEqual(Fmt(time_window::weekdayBounds(0, now).first), std::string("2026-12-27T00:00:00Z"),
                          "sunday in the same year");
        return ok;
    }

    bool WeekdayBoundsAreStableWithinADay() {
        auto early = time_window::weekdayBounds(3, At("2026-10-19T00:00:00Z"));
        auto late  = time_window::weekdayBounds(3, At("2026-10-19T23:59:59Z"));
        bool ok = ExpectTrue(early == late, "same window all day");

        auto next_week = time_window::weekdayBounds(3, At("2026-10-25T12:00:00Z"));
        ok &= ExpectEqual(Fmt(next_week.first), std::string("2026-10-28T00:00:00Z"), "sunday starts a new week");
        return ok;
    }

    bool WeekdayOfUsesSundayZero() {
        bool ok = ExpectEqual(time_window::weekdayOf(test_support::MondayMorning()), 1, "monday");
        ok &= ExpectEqual(time_window::weekdayOf(At("2026-10-18T12:00:00Z")), 0, "sunday");
        ok &= ExpectEqual(time_window::weekdayOf(At("2026-10-24T23:00:00Z")), 6, "saturday");
        return ok;
    }

    bool TimeslotStartOffsetsByDuration() {
        TimePoint start = At("2026-10-20T00:00:00Z");
        bool ok = ExpectEqual(Fmt(time_window::timeslotStart(start, 0, 30)), std::string("2026-10-20T00:00:00Z"), "first");
        ok &= ExpectEqual(Fmt(time_window::timeslotStart(start, 3, 30)), std::string("2026-10-20T01:30:00Z"), "fourth");
        ok &= ExpectTrue(time_window::bigTime() > At("9000-01-01T00:00:00Z"), "big time is far away");
        return ok;
    }

    bool FixedClockAdvances() {
        time_window::FixedClock clock(test_support::MondayMorning());
        clock.advance(std::chrono::minutes(90));
        bool ok = ExpectEqual(Fmt(clock.now()), std::string("2026-10-19T09:30:00Z"), "advanced");
        clock.set(At("2026-10-21T10:00:00Z"));
        ok &= ExpectEqual(Fmt(clock.now()), std::string("2026-10-21T10:00:00Z"), "set");
        return ok;
    }

    bool Rfc3339ParsesOffsetsAndFractions() {
        bool ok = ExpectTrue(At("2026-10-20T09:30:00+02:00") == At("2026-10-20T07:30:00Z"), "positive offset");
        ok &= ExpectTrue(At("2026-10-20T09:30:00-05:30") == At("2026-10-20T15:00:00Z"), "negative offset");
        ok &= ExpectTrue(At("2026-10-20T09:30:00.250Z") == At("2026-10-20T09:30:00Z"), "fraction dropped");

        bool threw = false;
        try {
            At("next tuesday");
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        ok &= ExpectTrue(threw, "garbage rejected");

        threw = false;
        try {
            At("2026-10-20T09:30:00");
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        ok &= ExpectTrue(threw, "missing zone rejected");
        return ok;
    }

    bool KsuidsAreValidAndSortable() {
        ksuid::Generator ids;
        std::string first  = ids.next(At("2026-10-19T08:00:00Z"));
        std::string second = ids.next(At("2026-10-19T08:00:01Z"));
        std::string later  = ids.next(At("2027-01-01T00:00:00Z"));

        bool ok = ExpectEqual(first.size(), ksuid::kEncodedLength, "27 characters");
        ok &= ExpectTrue(ksuid::isValid(first), "generated id is valid");
        ok &= ExpectTrue(first < second && second < later, "ids sort by creation time");
        ok &= ExpectEqual(ksuid::timestampOf(first), 1792396800LL, "timestamp recovered");

        std::set<std::string> seen;
        for (int i = 0; i < 1000; i++) {
            seen.insert(ids.next(At("2026-10-19T08:00:00Z")));
        }
        ok &= ExpectEqual(seen.size(), 1000u, "unique within one second");
        return ok;
    }

    bool KsuidRejectsMalformedIds() {
        bool ok = ExpectTrue(!ksuid::isValid(""), "empty");
        ok &= ExpectTrue(!ksuid::isValid("0ujsswThIGTUYm2K8FjOOfXtY1"), "26 characters");
        ok &= ExpectTrue(!ksuid::isValid("0ujsswThIGTUYm2K8FjOOfXtY1K-"), "28 characters");
        ok &= ExpectTrue(!ksuid::isValid("0ujsswThIGTUYm2K8FjOOfXtY1-"), "bad character");
        ok &= ExpectTrue(!ksuid::isValid("zzzzzzzzzzzzzzzzzzzzzzzzzzz"), "overflows 160 bits");
        ok &= ExpectTrue(ksuid::isValid("0ujsswThIGTUYm2K8FjOOfXtY1K"), "known good id");
        ok &= ExpectTrue(ksuid::isValid("000000000000000000000000000"), "nil id");
        return ok;
    }

    bool LoggerWritesJsonLinesAboveLevel() {
        std::ostringstream out;
        Logger logger(out, LogLevel::Warn);
        Logger scoped = logger.with({{"request_id", "r-1"}, {"queue_id", "cs101"}});

        scoped.info("dropped");
        scoped.warn("kept", {{"timeslot", 3}});

        std::istringstream lines(out.str());
        std::string line;
        std::vector<json> parsed;
        while (std::getline(lines, line)) {
            parsed.push_back(json::parse(line));
        }

        bool ok = ExpectEqual(parsed.size(), 1u, "only the warning is written");
        if (parsed.size() == 1) {
            ok &= ExpectEqual(parsed[0]["level"].get<std::string>(), std::string("warn"), "level");
            ok &= ExpectEqual(parsed[0]["msg"].get<std::string>(), std::string("kept"), "message");
            ok &= ExpectEqual(parsed[0]["request_id"].get<std::string>(), std::string("r-1"), "bound field");
            ok &= ExpectEqual(parsed[0]["timeslot"].get<int>(), 3, "call field");
        }

        bool threw = false;
        try {
            parseLogLevel("loud");
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        ok &= ExpectTrue(threw, "unknown level rejected");
        ok &= ExpectTrue(parseLogLevel("debug") == LogLevel::Debug, "debug level");
        return ok;
    }
}

int main() {
    std::vector<TestCase> tests{
        {"WeekdayBoundsCoverTheCurrentWeek", WeekdayBoundsCoverTheCurrentWeek},
        {"WeekdayBoundsSpanOneDay", WeekdayBoundsSpanOneDay},
        {"WeekdayBoundsAreStableWithinADay", WeekdayBoundsAreStableWithinADay},
        {"WeekdayOfUsesSundayZero", WeekdayOfUsesSundayZero},
        {"TimeslotStartOffsetsByDuration", TimeslotStartOffsetsByDuration},
        {"FixedClockAdvances", FixedClockAdvances},
        {"Rfc3339ParsesOffsetsAndFractions", Rfc3339ParsesOffsetsAndFractions},
        {"KsuidsAreValidAndSortable", KsuidsAreValidAndSortable},
        {"KsuidRejectsMalformedIds", KsuidRejectsMalformedIds},
        {"LoggerWritesJsonLinesAboveLevel", LoggerWritesJsonLinesAboveLevel}
    };
    return test_support::RunTests(tests);
}
