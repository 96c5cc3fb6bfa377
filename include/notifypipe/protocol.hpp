#pragma once

#include <notifypipe/datagram/udp.hpp>
#include <notifypipe/error.hpp>
#include <notifypipe/http/http.hpp>
#include <notifypipe/stream/tcp.hpp>

namespace notifypipe {

    /// Wire transports a notification can travel over
    enum class Protocol : dp::u8 {
        Udp = 0,  // one datagram, fire and forget
        Tcp = 1,  // raw bytes over a fresh connection
        Http = 2, // POST, follows 307
    };

    /// Options that only some transports use
    using SendOptions = http::HttpOptions;

    inline const char *to_string(Protocol protocol) {
        switch (protocol) {
        case Protocol::Udp:
            return "UDP";
        case Protocol::Tcp:
            return "TCP";
        case Protocol::Http:
            return "HTTP";
        }
        return "UNKNOWN";
    }

    /// Select a transport by name ("UDP", "tcp", "Http", ...)
    inline dp::Res<Protocol> parse_protocol(std::string_view name) {
        std::string lowered = to_lower(trim(name));
        if (lowered == "udp") {
            return dp::result::ok(Protocol::Udp);
        }
        if (lowered == "tcp") {
            return dp::result::ok(Protocol::Tcp);
        }
        if (lowered == "http") {
            return dp::result::ok(Protocol::Http);
        }
        return dp::result::err(dp::Error::invalid_argument(dp::String("unknown protocol: ") + std::string(name).c_str()));
    }

    /// Format hint shown in validation messages
    inline const char *expected_format(Protocol protocol) {
        return protocol == Protocol::Http ? "http://hostname:port/path" : "hostname:port";
    }

    namespace detail {

        // Schemes a notification URL may be written with; only http and https can be sent
        inline bool is_known_url_scheme(const std::string &scheme) {
            static const char *const known[] = {"http", "https", "ftp", "file", "jar", "mailto"};
            for (const char *name : known) {
                if (scheme == name) {
                    return true;
                }
            }
            return false;
        }

    } // namespace detail

    /// Check a destination against the transport's address grammar, without any I/O
    /// HTTP destinations holding a '$' are unresolved placeholders and are not checked.
    inline dp::Res<void> validate(Protocol protocol, std::string_view destination) {
        switch (protocol) {
        case Protocol::Http: {
            if (destination.find('$') != std::string_view::npos) {
                echo::trace("skipping validation of templated url ", std::string(destination).c_str());
                return dp::result::ok();
            }
            auto url = http::parse_url(destination);
            if (url.is_err() || !detail::is_known_url_scheme(url.value().scheme)) {
                return dp::result::err(error::validation(destination, expected_format(protocol)));
            }
            return dp::result::ok();
        }
        case Protocol::Udp:
        case Protocol::Tcp:
            if (parse_endpoint(destination).is_err()) {
                return dp::result::err(error::validation(destination, expected_format(protocol)));
            }
            return dp::result::ok();
        }
        return dp::result::err(dp::Error::invalid_argument("unknown protocol"));
    }

    /// Validate, then deliver one payload. Synchronous; every call opens and closes its own socket or connection.
    /// A failed attempt is final, nothing is retried.
    inline dp::Res<void> send(Protocol protocol, const SendRequest &request, const SendOptions &options = {}) {
        echo::debug(to_string(protocol), " notification to ", request.destination.c_str(), " (",
                    request.payload.size(), " bytes)");

        auto valid = validate(protocol, request.destination.c_str());
        if (valid.is_err()) {
            echo::error(valid.error().message.c_str());
            return valid;
        }

        switch (protocol) {
        case Protocol::Udp:
            return send_udp(request);
        case Protocol::Tcp:
            return send_tcp(request);
        case Protocol::Http:
            return http::send_http(request, options);
        }
        return dp::result::err(dp::Error::invalid_argument("unknown protocol"));
    }

} // namespace notifypipe
