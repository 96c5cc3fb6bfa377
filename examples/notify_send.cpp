#include <notifypipe/notifypipe.hpp>

#include <chrono>
#include <cstdlib>

// Send one job notification the way a CI server would at the end of a build.
//   notify_send <udp|tcp|http> <url> [json|xml] [job-name] [phase]
// The HTTP proxy is taken from the http_proxy environment variable.

static dp::Res<notifypipe::Phase> parse_phase(const std::string &name) {
    std::string lowered = notifypipe::to_lower(name);
    if (lowered == "queued") {
        return dp::result::ok(notifypipe::Phase::Queued);
    }
    if (lowered == "started") {
        return dp::result::ok(notifypipe::Phase::Started);
    }
    if (lowered == "completed") {
        return dp::result::ok(notifypipe::Phase::Completed);
    }
    if (lowered == "finalized") {
        return dp::result::ok(notifypipe::Phase::Finalized);
    }
    return dp::result::err(dp::Error::invalid_argument(dp::String("unknown phase: ") + name.c_str()));
}

int main(int argc, char **argv) {
    if (argc < 3) {
        echo::info("Usage: ", argv[0], " <udp|tcp|http> <url> [json|xml] [job-name] [phase]");
        return 1;
    }

    auto protocol = notifypipe::parse_protocol(argv[1]);
    if (protocol.is_err()) {
        echo::error(protocol.error().message.c_str());
        return 1;
    }

    notifypipe::Target target;
    target.protocol = protocol.value();
    target.url = argv[2];

    if (argc > 3) {
        auto format = notifypipe::parse_format(argv[3]);
        if (format.is_err()) {
            echo::error(format.error().message.c_str());
            return 1;
        }
        target.format = format.value();
    }

    auto phase = parse_phase(argc > 5 ? argv[5] : "completed");
    if (phase.is_err()) {
        echo::error(phase.error().message.c_str());
        return 1;
    }

    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();

    notifypipe::BuildState build;
    build.number = 1;
    build.queue_id = 1;
    build.timestamp = static_cast<dp::i64>(now);
    build.phase = phase.value();
    build.status = "SUCCESS";
    build.display_name = "#1";
    build.parameters["TRIGGER"] = "manual";

    notifypipe::JobState job;
    job.name = argc > 4 ? argv[4] : "example";
    job.display_name = job.name;
    job.build = build;

    notifypipe::SendOptions options;
    auto proxy = notifypipe::http::resolve_proxy(std::nullopt);
    if (proxy.is_err()) {
        echo::error(proxy.error().message.c_str());
        return 1;
    }
    options.proxy = proxy.value();
    if (options.proxy) {
        echo::info("Using proxy ", options.proxy->to_string().c_str());
    }

    echo::info("Notifying ", target.url.c_str(), " over ", notifypipe::to_string(target.protocol), " as ",
               notifypipe::to_string(target.format));

    auto res = notifypipe::notify(target, job, options);
    if (res.is_err()) {
        echo::error("Notification failed: ", res.error().message.c_str());
        return 1;
    }

    echo::info("Done");
    return 0;
}
