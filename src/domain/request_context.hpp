#pragma once

#include <string>

// Everything the transport layer resolved about the caller and the target of a
// request, passed explicitly into each coordinator operation.
struct RequestContext {
    std::string request_id;
    std::string queue;
    std::string email;
    bool is_admin = false;
    int day       = 0;
    int timeslot  = 0;
};
