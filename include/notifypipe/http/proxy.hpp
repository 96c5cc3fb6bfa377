#pragma once

#include <notifypipe/error.hpp>
#include <notifypipe/http/url.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace notifypipe {
    namespace http {

        constexpr dp::u16 DEFAULT_PROXY_PORT = 80;

        /// HTTP proxy to route notifications through
        /// Resolved once at the caller boundary and passed down explicitly.
        struct ProxyConfig {
            std::string host;
            dp::u16 port = DEFAULT_PROXY_PORT;
            // Hosts reached directly: exact names or "*.example.com" suffix patterns
            std::vector<std::string> no_proxy_hosts;

            inline std::string to_string() const { return "http://" + host + ":" + std::to_string(port); }

            inline bool bypasses(std::string_view target_host) const {
                std::string target = to_lower(target_host);
                for (const auto &pattern_raw : no_proxy_hosts) {
                    std::string pattern = to_lower(trim(pattern_raw));
                    if (pattern.empty()) {
                        continue;
                    }
                    if (pattern[0] == '*') {
                        std::string suffix = pattern.substr(1);
                        if (target.size() >= suffix.size() &&
                            target.compare(target.size() - suffix.size(), suffix.size(), suffix) == 0) {
                            return true;
                        }
                    } else if (pattern == target) {
                        return true;
                    }
                }
                return false;
            }
        };

        /// Build a proxy from a URL like "http://proxy.local:3128"
        /// Only http(s) proxy URLs are accepted, the port defaults to 80.
        inline dp::Res<ProxyConfig> proxy_from_url(std::string_view proxy_url) {
            auto parsed = parse_url(proxy_url);
            if (parsed.is_err()) {
                return dp::result::err(error::protocol("malformed proxy url '" + std::string(proxy_url) +
                                                       "': " + parsed.error().message.c_str()));
            }
            const Url &url = parsed.value();
            if (!url.is_http()) {
                return dp::result::err(error::protocol("not an http(s) url: " + std::string(proxy_url)));
            }
            if (url.host.empty()) {
                return dp::result::err(error::protocol("proxy url has no host: " + std::string(proxy_url)));
            }

            ProxyConfig proxy;
            proxy.host = url.host;
            proxy.port = url.has_explicit_port && url.port > 0 ? url.port : DEFAULT_PROXY_PORT;
            return dp::result::ok(std::move(proxy));
        }

        /// Proxy from the http_proxy environment variable, nullopt when unset or empty
        inline dp::Res<std::optional<ProxyConfig>> proxy_from_environment(const char *variable = "http_proxy") {
            const char *value = std::getenv(variable);
            if (value == nullptr || *value == '\0') {
                return dp::result::ok(std::optional<ProxyConfig>());
            }

            auto proxy = proxy_from_url(value);
            if (proxy.is_err()) {
                echo::error(variable, " is unusable: ", proxy.error().message.c_str());
                return dp::result::err(proxy.error());
            }
            echo::debug("using proxy ", proxy.value().to_string().c_str(), " from ", variable);
            return dp::result::ok(std::optional<ProxyConfig>(std::move(proxy.value())));
        }

        /// Proxy precedence: the hosting environment's configuration, then http_proxy, then direct
        inline dp::Res<std::optional<ProxyConfig>> resolve_proxy(const std::optional<ProxyConfig> &host_proxy) {
            if (host_proxy) {
                return dp::result::ok(std::optional<ProxyConfig>(host_proxy));
            }
            return proxy_from_environment();
        }

    } // namespace http
} // namespace notifypipe
