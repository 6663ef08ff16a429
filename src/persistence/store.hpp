#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "../domain/appointment.hpp"
#include "../domain/schedule.hpp"
#include "../utils/time_format.hpp"

// Capabilities the booking coordinator needs from the appointment and schedule
// stores. Each operation depends on the smallest set it uses, so tests can
// hand it a fake that implements just that set.
namespace persistence {

class StoreError : public std::runtime_error {
  public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

class RecordNotFound : public StoreError {
  public:
    explicit RecordNotFound(const std::string& msg) : StoreError(msg) {}
};

// A conditional write found its precondition no longer holds.
class WriteConflict : public StoreError {
  public:
    explicit WriteConflict(const std::string& msg) : StoreError(msg) {}
};

class AppointmentLookup {
  public:
    virtual ~AppointmentLookup() = default;
    // Throws RecordNotFound for unknown ids.
    virtual AppointmentSlot getAppointment(const std::string& id) = 0;
};

class WindowAppointmentsReader {
  public:
    virtual ~WindowAppointmentsReader() = default;
    // All rows of the queue with scheduled_time in [from, to), claimed or not.
    virtual std::vector<AppointmentSlot> getAppointments(const std::string& queue, TimePoint from, TimePoint to) = 0;
};

class UserAppointmentsReader {
  public:
    virtual ~UserAppointmentsReader() = default;
    virtual std::vector<AppointmentSlot> getAppointmentsForUser(const std::string& queue, TimePoint from, TimePoint to,
                                                                const std::string& email) = 0;
};

class TimeslotAppointmentsReader {
  public:
    virtual ~TimeslotAppointmentsReader() = default;
    virtual std::vector<AppointmentSlot> getAppointmentsByTimeslot(const std::string& queue, TimePoint from, TimePoint to,
                                                                   int timeslot) = 0;
};

class WeekScheduleReader {
  public:
    virtual ~WeekScheduleReader() = default;
    virtual std::vector<AppointmentSchedule> getAppointmentSchedule(const std::string& queue) = 0;
};

class DayScheduleReader {
  public:
    virtual ~DayScheduleReader() = default;
    // Throws RecordNotFound when the queue has no schedule for the day.
    virtual AppointmentSchedule getAppointmentScheduleForDay(const std::string& queue, int day) = 0;
};

class TimeslotClaimWriter {
  public:
    virtual ~TimeslotClaimWriter() = default;
    // Claims an open templated row at the timeslot in [from, to). Throws
    // WriteConflict when every row there is already claimed.
    virtual AppointmentSlot claimTimeslot(const std::string& queue, TimePoint from, TimePoint to, int timeslot,
                                          const std::string& email) = 0;
};

class ClaimReleaser {
  public:
    virtual ~ClaimReleaser() = default;
    virtual void unclaimAppointment(const std::string& id) = 0;
};

class SignupWriter {
  public:
    virtual ~SignupWriter() = default;
    // Inserts a new row and returns it with its generated id.
    virtual AppointmentSlot signupForAppointment(const std::string& queue, const AppointmentSlot& appointment) = 0;
};

class SignupRemover {
  public:
    virtual ~SignupRemover() = default;
    virtual void removeAppointmentSignup(const std::string& id) = 0;
};

class AppointmentWriter {
  public:
    virtual ~AppointmentWriter() = default;
    virtual void updateAppointment(const std::string& id, const AppointmentSlot& appointment) = 0;
};

class ScheduleWriter {
  public:
    virtual ~ScheduleWriter() = default;
    virtual void updateAppointmentSchedule(const std::string& queue, int day, const AppointmentSchedule& schedule) = 0;
};

class GetAppointmentsStore : public virtual WindowAppointmentsReader, public virtual UserAppointmentsReader {};

class SignupStore : public virtual DayScheduleReader,
                    public virtual UserAppointmentsReader,
                    public virtual TimeslotAppointmentsReader,
                    public virtual SignupWriter {};

class RemoveSignupStore : public virtual AppointmentLookup, public virtual SignupRemover {};

class UnclaimStore : public virtual AppointmentLookup, public virtual ClaimReleaser {};

class UpdateAppointmentStore : public virtual AppointmentLookup,
                               public virtual SignupStore,
                               public virtual SignupRemover,
                               public virtual AppointmentWriter {};

class ClaimStore : public virtual DayScheduleReader,
                   public virtual TimeslotAppointmentsReader,
                   public virtual TimeslotClaimWriter {};

class UpdateScheduleStore : public virtual WindowAppointmentsReader, public virtual ScheduleWriter {};

// Everything at once, for a concrete backend.
class AppointmentStore : public virtual GetAppointmentsStore,
                         public virtual RemoveSignupStore,
                         public virtual UnclaimStore,
                         public virtual UpdateAppointmentStore,
                         public virtual UpdateScheduleStore,
                         public virtual ClaimStore,
                         public virtual WeekScheduleReader {};

} // namespace persistence
