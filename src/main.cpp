#include "domain/request_context.hpp"
#include "persistence/memory_store.hpp"
#include "service/api.hpp"
#include "service/booking/coordinator.hpp"
#include "utils/logger.hpp"
#include "utils/main_inlines.hpp"
#include "utils/parser.hpp"
#include "utils/test_data_generator.hpp"
#include <argparse/argparse.hpp>
#include <atomic>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

using json = nlohmann::json;
using namespace std;

// Fires concurrent signups from distinct students at one timeslot and reports
// how many got through against the timeslot's capacity.
json simulateRush(api::Api& service, persistence::InMemoryAppointmentStore& store, const RequestContext& base, int n_threads) {
    atomic<int> created{0};
    atomic<int> conflicts{0};
    vector<thread> workers;
    for (int i = 0; i < n_threads; i++) {
        workers.emplace_back([&, i] {
            RequestContext ctx = base;
            ctx.request_id     = base.request_id + "-" + to_string(i);
            ctx.email          = test_data_generator::generate_student_email(i);
            json payload       = {{"name", "Student " + to_string(i)}, {"description", "Homework help"}, {"location", "Lab"}};

            api::Response r = service.signupForAppointment(ctx, payload);
            if (r.status == 201) created++;
            if (r.status == 409) conflicts++;
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    json result = {{"attempts", n_threads}, {"created", created.load()}, {"conflicts", conflicts.load()}};
    try {
        AppointmentSchedule schedule = store.getAppointmentScheduleForDay(base.queue, base.day);
        if (schedule.hasTimeslot(base.timeslot)) {
            result["capacity"] = schedule.capacityAt(base.timeslot);
        }
    } catch (const persistence::RecordNotFound&) {
        result["capacity"] = nullptr;
    }
    return result;
}

int main(int argc, char const* argv[]) {
    argparse::ArgumentParser program("OfficeHoursBooking");
    parseArguments(argc, argv, program);

    LogLevel level;
    try {
        level = parseLogLevel(program.get<string>("--log-level"));
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    Logger logger(std::cerr, level);

    persistence::InMemoryAppointmentStore store;
    if (!parser::handleInput(program, store)) {
        return 1;
    }

    auto clock = makeClock(program);
    booking::BookingCoordinator coordinator(*clock, logger);
    api::Api service(coordinator, store, logger);

    string op = program.get<string>("--op");
    json payload;
    try {
        payload = json::parse(program.get<string>("--payload"));
    } catch (const json::parse_error&) {
        // the handlers report an unreadable body as a bad request
        payload = nullptr;
    }

    RequestContext ctx;
    ctx.request_id = program.get<string>("--request-id");
    ctx.queue      = program.get<string>("--queue");
    ctx.email      = program.get<string>("--email");
    ctx.is_admin   = program.get<bool>("--admin");
    string appointment_id = program.get<string>("--appointment");

    api::Response response;
    try {
        ctx.day      = api::parseDay(program.get<string>("--day"));
        ctx.timeslot = api::parseTimeslot(program.get<string>("--timeslot"));

        if      (op == "get-appointments")    response = service.getAppointments(ctx);
        else if (op == "get-my-appointments") response = service.getAppointmentsForCurrentUser(ctx);
        else if (op == "get-schedule")        response = service.getAppointmentSchedule(ctx);
        else if (op == "get-schedule-day")    response = service.getAppointmentScheduleForDay(ctx);
        else if (op == "claim")               response = service.claimTimeslot(ctx);
        else if (op == "signup")              response = service.signupForAppointment(ctx, payload);
        else if (op == "update")              response = service.updateAppointment(ctx, appointment_id, payload);
        else if (op == "update-schedule")     response = service.updateAppointmentSchedule(ctx, payload);
        else if (op == "remove")              response = service.removeAppointmentSignup(ctx, appointment_id);
        else if (op == "unclaim")             response = service.unclaimAppointment(ctx, appointment_id);
        else if (op == "simulate")            response = {200, simulateRush(service, store, ctx, program.get<int>("--threads"))};
        else {
            std::cerr << "Unknown --op: " << op << "\n";
            return 1;
        }
    } catch (const BookingError& e) {
        response = api::errorResponse(e);
    }

    std::cout << "status " << response.status << "\n";
    if (!response.body.is_null()) {
        std::cout << response.body.dump(4) << "\n";
    }

    auto fileToWrite = program.get<string>("--output");
    writeOutputFile(fileToWrite, json{{"status", response.status}, {"body", response.body}, {"state", parser::dumpState(store)}});

    return 0;
}
