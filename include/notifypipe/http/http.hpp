#pragma once

#include <notifypipe/error.hpp>
#include <notifypipe/http/auth.hpp>
#include <notifypipe/http/proxy.hpp>
#include <notifypipe/http/url.hpp>
#include <notifypipe/request.hpp>

#include <curl/curl.h>

#include <memory>
#include <optional>
#include <string>

namespace notifypipe {
    namespace http {

        constexpr long STATUS_TEMPORARY_REDIRECT = 307;
        constexpr dp::u32 DEFAULT_MAX_REDIRECTS = 20;

        /// Settings for the HTTP transport
        struct HttpOptions {
            // Route through this proxy unless the target host is in its bypass list; nullopt connects directly
            std::optional<ProxyConfig> proxy;
            // 307 hops followed before giving up
            dp::u32 max_redirects = DEFAULT_MAX_REDIRECTS;
        };

        inline const char *content_type(bool is_json) {
            return is_json ? "application/json;charset=UTF-8" : "application/xml;charset=UTF-8";
        }

        namespace detail {

            // curl_global_init once per process, cleaned up at exit
            class CurlGlobal {
              private:
                CURLcode code_;

              public:
                CurlGlobal() : code_(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
                ~CurlGlobal() {
                    if (code_ == CURLE_OK) {
                        curl_global_cleanup();
                    }
                }
                CURLcode code() const { return code_; }
            };

            inline CURLcode ensure_curl_global() {
                static CurlGlobal global;
                return global.code();
            }

            struct CurlEasyDeleter {
                void operator()(CURL *h) const { curl_easy_cleanup(h); }
            };
            using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

            struct CurlSlistDeleter {
                void operator()(curl_slist *list) const { curl_slist_free_all(list); }
            };
            using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

            // Response bodies are not used
            inline size_t discard_body(char *, size_t size, size_t nmemb, void *) { return size * nmemb; }

            inline dp::Res<void> append_header(CurlHeaders &headers, const std::string &line) {
                curl_slist *next = curl_slist_append(headers.get(), line.c_str());
                if (next == nullptr) {
                    return dp::result::err(dp::Error::io_error("curl_slist_append failed"));
                }
                headers.release();
                headers.reset(next);
                return dp::result::ok();
            }

            inline dp::Error curl_error(const char *what, CURLcode code) {
                dp::String msg = dp::String(what) + ": " + curl_easy_strerror(code);
                switch (code) {
                case CURLE_OPERATION_TIMEDOUT:
                    return dp::Error::timeout(msg);
                case CURLE_COULDNT_CONNECT:
                case CURLE_SEND_ERROR:
                case CURLE_RECV_ERROR:
                case CURLE_GOT_NOTHING:
                    return dp::Error::not_found(msg);
                default:
                    return dp::Error::io_error(msg);
                }
            }

            /// Outcome of one POST
            struct Hop {
                long status = 0;
                std::string location; // set for 307 only
            };

            /// One POST of the payload to an already parsed http(s) URL.
            /// The curl handle and header list are released before returning, so a following
            /// redirect hop never overlaps with this connection.
            inline dp::Res<Hop> post_once(const Url &url, const SendRequest &request, const HttpOptions &options) {
                CurlEasy curl(curl_easy_init());
                if (!curl) {
                    return dp::result::err(dp::Error::io_error("curl_easy_init failed"));
                }
                CURL *h = curl.get();

                // Proxy selection: explicit proxy, unless bypassed. CURLOPT_PROXY "" and CURLOPT_NOPROXY ""
                // keep curl from reading http_proxy and no_proxy itself.
                std::string proxy;
                if (options.proxy && !options.proxy->bypasses(url.host)) {
                    proxy = options.proxy->to_string();
                    echo::debug("posting to ", url.host.c_str(), " through proxy ", proxy.c_str());
                }

                CurlHeaders headers;
                auto res = append_header(headers, std::string("Content-Type: ") + content_type(request.content_is_json));
                if (res.is_ok() && !url.user_info.empty()) {
                    res = append_header(headers, "Authorization: " + basic_authorization(url.user_info));
                }
                // Fixed length body, no "Expect: 100-continue" round trip, no default Accept
                if (res.is_ok()) {
                    res = append_header(headers, "Expect:");
                }
                if (res.is_ok()) {
                    res = append_header(headers, "Accept:");
                }
                if (res.is_err()) {
                    return dp::result::err(res.error());
                }

                static const char empty_body[] = "";
                const char *body = request.payload.empty() ? empty_body
                                                           : reinterpret_cast<const char *>(request.payload.data());

                CURLcode rc = CURLE_OK;
                auto set = [&](CURLoption option, auto value) {
                    if (rc == CURLE_OK) {
                        rc = curl_easy_setopt(h, option, value);
                    }
                };
                set(CURLOPT_URL, url.without_credentials.c_str());
                set(CURLOPT_PROTOCOLS_STR, "http,https");
                set(CURLOPT_PROXY, proxy.c_str());
                set(CURLOPT_NOPROXY, "");
                set(CURLOPT_PROXYTYPE, static_cast<long>(CURLPROXY_HTTP));
                set(CURLOPT_POST, 1L);
                set(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.payload.size()));
                set(CURLOPT_POSTFIELDS, body);
                set(CURLOPT_HTTPHEADER, headers.get());
                set(CURLOPT_FOLLOWLOCATION, 0L);
                set(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout_ms));
                set(CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
                set(CURLOPT_NOSIGNAL, 1L);
                set(CURLOPT_WRITEFUNCTION, &discard_body);
                if (rc != CURLE_OK) {
                    return dp::result::err(curl_error("curl_easy_setopt", rc));
                }

                echo::trace("POST ", url.without_credentials.c_str(), " len=", request.payload.size());
                rc = curl_easy_perform(h);
                if (rc != CURLE_OK) {
                    echo::error("POST ", url.without_credentials.c_str(), " failed: ", curl_easy_strerror(rc));
                    return dp::result::err(curl_error("POST failed", rc));
                }

                Hop hop;
                rc = curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &hop.status);
                if (rc != CURLE_OK) {
                    return dp::result::err(curl_error("reading response status", rc));
                }
                if (hop.status == STATUS_TEMPORARY_REDIRECT) {
                    char *location = nullptr;
                    if (curl_easy_getinfo(h, CURLINFO_REDIRECT_URL, &location) == CURLE_OK && location != nullptr) {
                        hop.location = location;
                    }
                }
                return dp::result::ok(std::move(hop));
            }

        } // namespace detail

        /// HTTP transport
        /// POSTs the payload and follows 307 Temporary Redirect responses with the same payload, timeout
        /// and content type. Every hop gets a fresh timeout budget; there is no overall deadline.
        /// Any status other than 307 finishes the delivery, 4xx and 5xx included.
        inline dp::Res<void> send_http(const SendRequest &request, const HttpOptions &options = {}) {
            CURLcode global = detail::ensure_curl_global();
            if (global != CURLE_OK) {
                return dp::result::err(detail::curl_error("curl_global_init", global));
            }

            std::string destination(request.destination.c_str());
            for (dp::u32 hop_count = 0;; ++hop_count) {
                auto parsed = parse_url(destination);
                if (parsed.is_err()) {
                    return dp::result::err(error::protocol("malformed url '" + destination +
                                                           "': " + parsed.error().message.c_str()));
                }
                const Url &url = parsed.value();
                if (!url.is_http() || url.host.empty()) {
                    echo::error("refusing to POST to ", destination.c_str());
                    return dp::result::err(error::protocol("not an http(s) url: " + destination));
                }

                auto hop = detail::post_once(url, request, options);
                if (hop.is_err()) {
                    return dp::result::err(hop.error());
                }

                long status = hop.value().status;
                if (status != STATUS_TEMPORARY_REDIRECT) {
                    if (status >= 400) {
                        echo::warn("POST ", url.without_credentials.c_str(), " answered ", status);
                    } else {
                        echo::info("notification delivered to ", url.without_credentials.c_str(), " (", status, ")");
                    }
                    return dp::result::ok();
                }

                if (hop.value().location.empty()) {
                    return dp::result::err(error::protocol("307 without Location from " + url.without_credentials));
                }
                if (hop_count >= options.max_redirects) {
                    echo::error("giving up after ", options.max_redirects, " redirects");
                    return dp::result::err(error::too_many_redirects(options.max_redirects, hop.value().location));
                }

                echo::debug("following 307 from ", url.without_credentials.c_str(), " to ", hop.value().location.c_str());
                destination = hop.value().location;
            }
        }

    } // namespace http
} // namespace notifypipe
