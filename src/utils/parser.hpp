#ifndef PARSER_HPP
#define PARSER_HPP

#include <argparse/argparse.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "../domain/appointment.hpp"
#include "../domain/schedule.hpp"
#include "../persistence/memory_store.hpp"
#include "test_data_generator.hpp"

using json = nlohmann::json;
using namespace ::std;

namespace parser {

// Snapshot layout:
// {"queues": [{"id": "...", "schedules": [{"day", "duration", "schedule"}], "appointments": [...]}]}
inline void loadState(const json& data, persistence::InMemoryAppointmentStore& store) {
    if (!data.contains("queues") || !data["queues"].is_array()) {
        throw invalid_argument("JSON does not contain a valid 'queues' array.");
    }

    for (const auto& queue_json : data["queues"]) {
        string queue = queue_json.at("id").get<string>();

        // Parse "schedules"
        if (queue_json.contains("schedules") && queue_json["schedules"].is_array()) {
            for (const auto& schedule_json : queue_json["schedules"]) {
                AppointmentSchedule schedule = schedule_json.get<AppointmentSchedule>();
                if (!schedule_model::isValidDay(schedule.day)) {
                    throw invalid_argument("Schedule for queue " + queue + " has invalid day " + to_string(schedule.day));
                }
                schedule_model::validateSchedule(schedule);
                store.updateAppointmentSchedule(queue, schedule.day, schedule);
            }
        } else {
            std::cerr << "Queue " << queue << " does not contain a valid 'schedules' array.\n";
        }

        // Parse "appointments"
        if (queue_json.contains("appointments") && queue_json["appointments"].is_array()) {
            for (const auto& appointment_json : queue_json["appointments"]) {
                AppointmentSlot appointment = appointment_json.get<AppointmentSlot>();
                if (!ksuid::isValid(appointment.id)) {
                    throw invalid_argument("Appointment has invalid id: " + appointment.id);
                }
                appointment.queue = queue;
                store.putAppointment(appointment);
            }
        }
    }
}

inline json dumpState(persistence::InMemoryAppointmentStore& store) {
    json queues = json::array();
    for (const auto& queue : store.queues()) {
        queues.push_back({{"id", queue},
                          {"schedules", store.getAppointmentSchedule(queue)},
                          {"appointments", store.appointmentsOf(queue)}});
    }
    return json{{"queues", queues}};
}

// Reads the snapshot named by --input, or generates one with --test. Returns
// false when nothing usable could be loaded.
inline bool handleInput(const argparse::ArgumentParser& program, persistence::InMemoryAppointmentStore& store) {
    json data;
    bool useTestFile  = program.get<bool>("--test");
    string fileToRead = program.get<std::string>("--input");

    if (useTestFile) {
        data = test_data_generator::generate_request(
            3,  // queues
            5,  // open weekdays per queue
            16, // timeslots per day
            15  // _ min per timeslot
        );
    } else {
        if (fileToRead.empty()) {
            std::cerr << "No input file specified. Use -i <file_path>.\n";
            return false;
        }
        std::ifstream f(fileToRead);
        if (!f.is_open()) {
            std::cerr << "Error opening file: " << fileToRead << "\n";
            return false;
        }
        try {
            data = json::parse(f);
        } catch (const json::parse_error& e) {
            std::cerr << "Error parsing " << fileToRead << ": " << e.what() << "\n";
            return false;
        }
    }

    try {
        parser::loadState(data, store);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return false;
    }

    return true;
}

} // namespace parser

#endif
