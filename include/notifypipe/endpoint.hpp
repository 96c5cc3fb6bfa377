#pragma once

#include <notifypipe/common.hpp>

namespace notifypipe {

    // Socket endpoint - host and port, used by the UDP and TCP transports
    struct Endpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }
    };

    // Parse "host:port" into an Endpoint
    // Also accepts URL-shaped input: an optional "scheme://" and "userinfo@" are skipped,
    // anything after the port starting with '/', '?' or '#' is ignored.
    inline dp::Res<Endpoint> parse_endpoint(std::string_view input) {
        std::string_view s = trim(input);
        if (s.empty()) {
            return dp::result::err(dp::Error::invalid_argument("empty endpoint"));
        }

        auto scheme_end = s.find("://");
        if (scheme_end != std::string_view::npos) {
            s.remove_prefix(scheme_end + 3);
        }

        // Authority ends at the first path, query or fragment delimiter
        auto authority_end = s.find_first_of("/?#");
        std::string_view authority = s.substr(0, authority_end);

        auto at = authority.rfind('@');
        if (at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }

        auto colon = authority.rfind(':');
        if (colon == std::string_view::npos) {
            echo::trace("endpoint has no port: ", std::string(input).c_str());
            return dp::result::err(dp::Error::invalid_argument("missing port"));
        }

        std::string_view host = authority.substr(0, colon);
        std::string_view port_str = authority.substr(colon + 1);
        if (host.empty()) {
            return dp::result::err(dp::Error::invalid_argument("missing host"));
        }
        if (port_str.empty() || port_str.size() > 5) {
            return dp::result::err(dp::Error::invalid_argument("invalid port"));
        }

        dp::u32 port = 0;
        for (char c : port_str) {
            if (c < '0' || c > '9') {
                return dp::result::err(dp::Error::invalid_argument("invalid port"));
            }
            port = port * 10 + static_cast<dp::u32>(c - '0');
        }
        if (port > 65535) {
            return dp::result::err(dp::Error::invalid_argument("port out of range"));
        }

        Endpoint endpoint{dp::String(std::string(host).c_str()), static_cast<dp::u16>(port)};
        echo::trace("parsed endpoint ", endpoint.to_string());
        return dp::result::ok(endpoint);
    }

} // namespace notifypipe
