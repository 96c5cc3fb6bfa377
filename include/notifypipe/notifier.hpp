#pragma once

#include <notifypipe/format.hpp>
#include <notifypipe/protocol.hpp>

namespace notifypipe {

    constexpr dp::u32 DEFAULT_TIMEOUT_MS = 30000;

    /// One configured notification endpoint
    struct Target {
        Protocol protocol = Protocol::Http;
        Format format = Format::Json;
        dp::String url;
        dp::u32 timeout_ms = DEFAULT_TIMEOUT_MS;
    };

    /// Validate the target, encode the job in the target's format and deliver it
    inline dp::Res<void> notify(const Target &target, const JobState &job, const SendOptions &options = {}) {
        auto valid = validate(target.protocol, target.url.c_str());
        if (valid.is_err()) {
            echo::error("not notifying: ", valid.error().message.c_str());
            return valid;
        }

        auto payload = serialize(job, target.format);
        if (payload.is_err()) {
            return dp::result::err(payload.error());
        }

        SendRequest request{target.url, std::move(payload.value()), target.timeout_ms, content_is_json(target.format)};
        auto res = send(target.protocol, request, options);
        if (res.is_err()) {
            echo::error(to_string(target.protocol), " notification to ", target.url.c_str(),
                        " failed: ", res.error().message.c_str());
            return res;
        }

        echo::info(to_string(target.protocol), " notification sent to ", target.url.c_str());
        return dp::result::ok();
    }

} // namespace notifypipe
