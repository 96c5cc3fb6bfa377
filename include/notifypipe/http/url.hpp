#pragma once

#include <notifypipe/common.hpp>

#include <curl/curl.h>

#include <memory>
#include <string>

namespace notifypipe {
    namespace http {

        /// Parsed absolute URL
        struct Url {
            std::string scheme;    // lower case, e.g. "http"
            std::string user_info; // "user:pass" as written in the URL, empty when absent
            std::string host;
            dp::u16 port = 0; // explicit port, or the scheme default for http/https, 0 otherwise
            bool has_explicit_port = false;
            std::string path;
            std::string full;                // normalized form, credentials included
            std::string without_credentials; // what actually goes on the wire

            inline bool is_http() const { return scheme == "http" || scheme == "https"; }
        };

        namespace detail {

            struct CurlUrlDeleter {
                void operator()(CURLU *h) const { curl_url_cleanup(h); }
            };
            using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

            // Read one part, empty string when the part is absent
            inline std::string get_part(CURLU *h, CURLUPart what, unsigned int flags = 0) {
                char *part = nullptr;
                if (curl_url_get(h, what, &part, flags) != CURLUE_OK || part == nullptr) {
                    return {};
                }
                std::string out(part);
                curl_free(part);
                return out;
            }

        } // namespace detail

        /// Parse an absolute URL with libcurl's URL API
        /// Any syntactically valid scheme is accepted, callers decide which schemes they support.
        inline dp::Res<Url> parse_url(std::string_view input) {
            std::string text(trim(input));
            if (text.empty()) {
                return dp::result::err(dp::Error::invalid_argument("empty url"));
            }

            detail::CurlUrlHandle h(curl_url());
            if (!h) {
                return dp::result::err(dp::Error::io_error("curl_url failed"));
            }

            CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, text.c_str(), CURLU_NON_SUPPORT_SCHEME);
            if (rc != CURLUE_OK) {
                echo::trace("url rejected: ", text.c_str(), " (", curl_url_strerror(rc), ")");
                return dp::result::err(dp::Error::invalid_argument(dp::String("malformed url: ") + curl_url_strerror(rc)));
            }

            Url url;
            url.scheme = to_lower(detail::get_part(h.get(), CURLUPART_SCHEME));
            url.host = detail::get_part(h.get(), CURLUPART_HOST);
            url.path = detail::get_part(h.get(), CURLUPART_PATH);

            std::string user = detail::get_part(h.get(), CURLUPART_USER);
            std::string password = detail::get_part(h.get(), CURLUPART_PASSWORD);
            if (!user.empty() || !password.empty()) {
                url.user_info = password.empty() ? user : user + ":" + password;
            }

            std::string explicit_port = detail::get_part(h.get(), CURLUPART_PORT);
            url.has_explicit_port = !explicit_port.empty();
            std::string port = url.has_explicit_port ? explicit_port
                                                     : detail::get_part(h.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
            if (!port.empty()) {
                url.port = static_cast<dp::u16>(std::stoul(port));
            }

            url.full = detail::get_part(h.get(), CURLUPART_URL);
            if (curl_url_set(h.get(), CURLUPART_USER, nullptr, 0) != CURLUE_OK ||
                curl_url_set(h.get(), CURLUPART_PASSWORD, nullptr, 0) != CURLUE_OK) {
                return dp::result::err(dp::Error::io_error("cannot strip credentials from url"));
            }
            url.without_credentials = detail::get_part(h.get(), CURLUPART_URL);

            return dp::result::ok(std::move(url));
        }

    } // namespace http
} // namespace notifypipe
