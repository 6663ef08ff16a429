#pragma once

#include <argparse/argparse.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "../domain/request_context.hpp"
#include "../service/time_window.hpp"
#include "time_format.hpp"

inline void parseArguments(int argc, char const *argv[], argparse::ArgumentParser &program) {
    program.add_argument("-i", "--input")
            .help("Path to the input JSON state file")
            .default_value(std::string(""));
    program.add_argument("-o", "--output")
            .help("Path to the output JSON file")
            .default_value(std::string("output.json"));
    program.add_argument("--test")
            .help("Generate a random state instead of reading one")
            .default_value(false)
            .implicit_value(true);
    program.add_argument("--op")
            .help("get-appointments, get-my-appointments, get-schedule, get-schedule-day, claim, signup, "
                  "update, update-schedule, remove, unclaim or simulate")
            .default_value(std::string("get-schedule"));
    program.add_argument("--queue")
            .help("Queue id")
            .default_value(std::string("queue-1"));
    program.add_argument("--day")
            .help("Weekday, 0 = Sunday")
            .default_value(std::string("1"));
    program.add_argument("--timeslot")
            .help("Timeslot index within the day")
            .default_value(std::string("0"));
    program.add_argument("--appointment")
            .help("Appointment id")
            .default_value(std::string(""));
    program.add_argument("--email")
            .help("Caller email")
            .default_value(std::string(""));
    program.add_argument("--admin")
            .help("Caller is a queue admin")
            .default_value(false)
            .implicit_value(true);
    program.add_argument("--payload")
            .help("Request body as a JSON string")
            .default_value(std::string("{}"));
    program.add_argument("--request-id")
            .help("Request id attached to log lines")
            .default_value(std::string("cli"));
    program.add_argument("--threads")
            .help("Concurrent signups fired by the simulate op")
            .default_value(16)
            .scan<'i', int>();
    program.add_argument("--now")
            .help("Pin the clock to an RFC3339 time")
            .default_value(std::string(""));
    program.add_argument("--log-level")
            .help("debug, info, warn or error")
            .default_value(std::string("info"));

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception &e) {
        std::cerr << "Argument parsing error: " << e.what() << std::endl;
        std::cerr << program;
        exit(1);
    }
}

inline std::unique_ptr<time_window::Clock> makeClock(const argparse::ArgumentParser &program) {
    auto pinned = program.get<std::string>("--now");
    if (pinned.empty()) {
        return std::make_unique<time_window::SystemClock>();
    }
    try {
        return std::make_unique<time_window::FixedClock>(time_format::fromRfc3339(pinned));
    } catch (const std::exception &e) {
        std::cerr << "Invalid --now: " << e.what() << std::endl;
        exit(1);
    }
}

inline void writeOutputFile(const std::string &filename, const nlohmann::json &output_json) {
    std::ofstream out_file(filename);
    if (!out_file.is_open()) {
        std::cerr << "Error opening output file: " << filename << "\n";
        exit(1);
    }
    out_file << output_json.dump(4);
    out_file.close();
}
