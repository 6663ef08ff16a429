#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "../utils/ksuid.hpp"
#include "store.hpp"

namespace persistence {

// Process-local backend. Rows are kept by id, which orders them by creation
// time. Every call is atomic with respect to the others.
class InMemoryAppointmentStore : public AppointmentStore {
  private:
    mutable std::mutex mtx;
    std::map<std::string, std::map<int, AppointmentSchedule>> schedules; // queue -> day -> schedule
    std::map<std::string, AppointmentSlot> appointments;                 // id -> row
    ksuid::Generator ids;

    template<typename Pred>
    std::vector<AppointmentSlot> select(Pred pred) const {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<AppointmentSlot> result;
        for (const auto& [id, a] : appointments) {
            if (pred(a)) {
                result.push_back(a);
            }
        }
        return result;
    }

    static bool inWindow(const AppointmentSlot& a, const std::string& queue, TimePoint from, TimePoint to) {
        return a.queue == queue && a.scheduled_time >= from && a.scheduled_time < to;
    }

    AppointmentSlot& rowLocked(const std::string& id) {
        auto it = appointments.find(id);
        if (it == appointments.end()) {
            throw RecordNotFound("no appointment with id " + id);
        }
        return it->second;
    }

  public:
    AppointmentSlot getAppointment(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mtx);
        return rowLocked(id);
    }

    std::vector<AppointmentSlot> getAppointments(const std::string& queue, TimePoint from, TimePoint to) override {
        return select([&](const AppointmentSlot& a) { return inWindow(a, queue, from, to); });
    }

    std::vector<AppointmentSlot> getAppointmentsForUser(const std::string& queue, TimePoint from, TimePoint to,
                                                        const std::string& email) override {
        return select([&](const AppointmentSlot& a) {
            return inWindow(a, queue, from, to) && a.student_email && *a.student_email == email;
        });
    }

    std::vector<AppointmentSlot> getAppointmentsByTimeslot(const std::string& queue, TimePoint from, TimePoint to,
                                                           int timeslot) override {
        return select([&](const AppointmentSlot& a) { return inWindow(a, queue, from, to) && a.timeslot == timeslot; });
    }

    std::vector<AppointmentSchedule> getAppointmentSchedule(const std::string& queue) override {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<AppointmentSchedule> week;
        auto it = schedules.find(queue);
        if (it != schedules.end()) {
            for (const auto& [day, s] : it->second) {
                week.push_back(s);
            }
        }
        return week;
    }

    AppointmentSchedule getAppointmentScheduleForDay(const std::string& queue, int day) override {
        std::lock_guard<std::mutex> lock(mtx);
        auto q = schedules.find(queue);
        if (q == schedules.end() || q->second.count(day) == 0) {
            throw RecordNotFound("no schedule for queue " + queue + " on day " + std::to_string(day));
        }
        return q->second.at(day);
    }

    AppointmentSlot claimTimeslot(const std::string& queue, TimePoint from, TimePoint to, int timeslot,
                                  const std::string& email) override {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto& [id, a] : appointments) {
            if (inWindow(a, queue, from, to) && a.timeslot == timeslot && !a.isClaimed()) {
                a.student_email = email;
                return a;
            }
        }
        throw WriteConflict("no open appointment slot at timeslot " + std::to_string(timeslot));
    }

    void unclaimAppointment(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mtx);
        rowLocked(id).student_email.reset();
    }

    AppointmentSlot signupForAppointment(const std::string& queue, const AppointmentSlot& appointment) override {
        AppointmentSlot row = appointment;
        row.id              = ids.next(std::chrono::system_clock::now());
        row.queue           = queue;

        std::lock_guard<std::mutex> lock(mtx);
        appointments.emplace(row.id, row);
        return row;
    }

    void removeAppointmentSignup(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mtx);
        rowLocked(id).student_email.reset();
    }

    void updateAppointment(const std::string& id, const AppointmentSlot& appointment) override {
        std::lock_guard<std::mutex> lock(mtx);
        AppointmentSlot& row = rowLocked(id);
        std::string queue    = row.queue;
        row                  = appointment;
        row.id               = id;
        row.queue            = queue;
    }

    void updateAppointmentSchedule(const std::string& queue, int day, const AppointmentSchedule& schedule) override {
        std::lock_guard<std::mutex> lock(mtx);
        AppointmentSchedule stored = schedule;
        stored.queue               = queue;
        stored.day                 = day;
        schedules[queue][day]      = stored;
    }

    // Loads a row as-is, keeping its id. Used when restoring a snapshot or
    // seeding templated slots.
    void putAppointment(const AppointmentSlot& appointment) {
        std::lock_guard<std::mutex> lock(mtx);
        appointments[appointment.id] = appointment;
    }

    std::vector<std::string> queues() const {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<std::string> names;
        for (const auto& [queue, days] : schedules) {
            names.push_back(queue);
        }
        for (const auto& [id, a] : appointments) {
            if (std::find(names.begin(), names.end(), a.queue) == names.end()) {
                names.push_back(a.queue);
            }
        }
        return names;
    }

    std::vector<AppointmentSlot> appointmentsOf(const std::string& queue) const {
        return select([&](const AppointmentSlot& a) { return a.queue == queue; });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return appointments.size();
    }
};

} // namespace persistence
