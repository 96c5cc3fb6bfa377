#pragma once

#include <notifypipe/common.hpp>

namespace notifypipe {

    /// Error constructors for the notification path
    /// Every kind maps onto a datapod error code so callers can keep using res.error().code:
    ///   validation      -> invalid_argument (bad destination, raised before any I/O)
    ///   protocol        -> invalid_argument (non-http(s) scheme, bad proxy url, 307 without Location)
    ///   too many hops   -> io_error
    ///   serialization   -> io_error
    /// Transport failures come straight from the socket/curl layer (io_error, timeout, not_found).
    namespace error {

        inline dp::Error validation(std::string_view destination, const char *expected_format) {
            std::string msg;
            if (!is_blank(destination)) {
                msg += "Invalid URL '";
                msg += destination;
                msg += "'. ";
            }
            msg += "Use ";
            msg += expected_format;
            msg += " for endpoint URL";
            return dp::Error::invalid_argument(dp::String(msg.c_str()));
        }

        inline dp::Error protocol(const std::string &msg) { return dp::Error::invalid_argument(dp::String(msg.c_str())); }

        inline dp::Error too_many_redirects(dp::u32 limit, const std::string &last_location) {
            std::string msg = "too many redirects (" + std::to_string(limit) + "), last location: " + last_location;
            return dp::Error::io_error(dp::String(msg.c_str()));
        }

        inline dp::Error serialization(const char *cause) {
            return dp::Error::io_error(dp::String("serialization failed: ") + cause);
        }

    } // namespace error

} // namespace notifypipe
