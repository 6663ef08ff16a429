#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

enum class ErrorKind
{
    BadRequest,
    Forbidden,
    NotFound,
    Conflict,
    Internal
};

inline int httpStatus(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest: return 400;
        case ErrorKind::Forbidden:  return 403;
        case ErrorKind::NotFound:   return 404;
        case ErrorKind::Conflict:   return 409;
        case ErrorKind::Internal:   return 500;
    }
    return 500;
}

inline void to_json(json& j, const ErrorKind& k) {
    switch (k) {
        case ErrorKind::BadRequest: j = "BadRequest"; break;
        case ErrorKind::Forbidden:  j = "Forbidden";  break;
        case ErrorKind::NotFound:   j = "NotFound";   break;
        case ErrorKind::Conflict:   j = "Conflict";   break;
        case ErrorKind::Internal:   j = "Internal";   break;
    }
}

// Failure of a booking operation. The message is safe to show to the caller,
// details carries ids and counts for the transport layer.
class BookingError : public std::runtime_error {
  private:
    ErrorKind error_kind;
    bool is_retryable;
    json error_details;

  public:
    BookingError(ErrorKind kind, const std::string& message, json details = json::object(), bool retryable = false)
        : std::runtime_error(message), error_kind(kind), is_retryable(retryable), error_details(std::move(details)) {}

    ErrorKind kind() const { return error_kind; }
    int status() const { return httpStatus(error_kind); }
    bool retryable() const { return is_retryable; }
    const json& details() const { return error_details; }
};
