#pragma once

#include <notifypipe/common.hpp>

#include <openssl/evp.h>

#include <string>

namespace notifypipe {
    namespace http {

        // Standard base64 (RFC 4648) without line breaks
        inline std::string encode_base64(std::string_view input) {
            if (input.empty()) {
                return {};
            }
            std::string out(4 * ((input.size() + 2) / 3), '\0');
            int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                    reinterpret_cast<const unsigned char *>(input.data()), static_cast<int>(input.size()));
            out.resize(static_cast<std::size_t>(n));
            return out;
        }

        // "Authorization" header value for credentials embedded in a URL ("user:pass")
        inline std::string basic_authorization(std::string_view user_info) { return "Basic " + encode_base64(user_info); }

    } // namespace http
} // namespace notifypipe
