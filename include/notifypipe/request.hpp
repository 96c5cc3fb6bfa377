#pragma once

#include <notifypipe/common.hpp>

namespace notifypipe {

    // One delivery attempt. A redirect hop builds a new request with the same
    // payload, timeout and content type and a new destination.
    struct SendRequest {
        dp::String destination;
        Message payload;
        dp::u32 timeout_ms = 0; // 0 means no timeout
        bool content_is_json = false;
    };

} // namespace notifypipe
