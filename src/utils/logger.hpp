#pragma once

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "time_format.hpp"

using json = nlohmann::json;

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

inline const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

inline LogLevel parseLogLevel(const std::string& name) {
    if      (name == "debug") return LogLevel::Debug;
    else if (name == "info")  return LogLevel::Info;
    else if (name == "warn")  return LogLevel::Warn;
    else if (name == "error") return LogLevel::Error;
    throw std::invalid_argument("Invalid log level: " + name);
}

// Writes one JSON object per line. Copies made by with() share the sink, so a
// request-scoped child logger is cheap to create.
class Logger {
  private:
    struct Sink {
        std::ostream* out;
        LogLevel min_level;
        std::mutex mtx;

        Sink(std::ostream* o, LogLevel l) : out(o), min_level(l) {}
    };

    std::shared_ptr<Sink> sink;
    json fields;

    void write(LogLevel level, const std::string& msg, const json& extra) const {
        if (level < sink->min_level) return;

        json line = fields;
        line["ts"]    = time_format::toRfc3339(std::chrono::system_clock::now());
        line["level"] = levelName(level);
        line["msg"]   = msg;
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            line[it.key()] = it.value();
        }

        std::lock_guard<std::mutex> lock(sink->mtx);
        *sink->out << line.dump() << "\n";
    }

  public:
    explicit Logger(std::ostream& out = std::cerr, LogLevel min_level = LogLevel::Info)
        : sink(std::make_shared<Sink>(&out, min_level)), fields(json::object()) {}

    Logger with(const json& extra) const {
        Logger child = *this;
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            child.fields[it.key()] = it.value();
        }
        return child;
    }

    void debug(const std::string& msg, const json& extra = json::object()) const { write(LogLevel::Debug, msg, extra); }
    void info(const std::string& msg, const json& extra = json::object()) const { write(LogLevel::Info, msg, extra); }
    void warn(const std::string& msg, const json& extra = json::object()) const { write(LogLevel::Warn, msg, extra); }
    void error(const std::string& msg, const json& extra = json::object()) const { write(LogLevel::Error, msg, extra); }
};
