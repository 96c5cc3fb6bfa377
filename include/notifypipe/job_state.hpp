#pragma once

#include <notifypipe/common.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace notifypipe {

    /// Build lifecycle step a notification reports
    enum class Phase : dp::u8 { Queued = 0, Started = 1, Completed = 2, Finalized = 3 };

    inline const char *to_string(Phase phase) {
        switch (phase) {
        case Phase::Queued:
            return "QUEUED";
        case Phase::Started:
            return "STARTED";
        case Phase::Completed:
            return "COMPLETED";
        case Phase::Finalized:
            return "FINALIZED";
        }
        return "UNKNOWN";
    }

    using StringMap = std::map<std::string, std::string>;

    struct ScmState {
        std::optional<std::string> url;
        std::optional<std::string> branch;
        std::optional<std::string> commit;
        std::vector<std::string> changes;  // changed files
        std::vector<std::string> culprits; // authors of the changes
    };

    struct BuildState {
        std::optional<std::string> full_url;
        dp::i64 number = 0;
        dp::i64 queue_id = 0;
        dp::i64 timestamp = 0; // ms since epoch
        dp::i64 duration = 0;  // ms
        std::optional<Phase> phase;
        std::optional<std::string> status;
        std::optional<std::string> url;
        std::optional<std::string> display_name;
        std::optional<ScmState> scm;
        StringMap parameters;
        std::optional<std::string> log;
        std::optional<std::string> notes;
        std::map<std::string, StringMap> artifacts; // artifact name -> {"archive": url, ...}
    };

    /// Snapshot of a job handed to the formatter. Owned by the caller, never modified here.
    struct JobState {
        std::optional<std::string> name;
        std::optional<std::string> display_name;
        std::optional<std::string> url;
        std::optional<BuildState> build;
    };

    // Field lists in declaration order, named as identifiers (camelCase).
    // Serializers derive their tag or key from these names.

    template <typename Visitor> void visit_fields(const ScmState &scm, Visitor &v) {
        v.field("url", scm.url);
        v.field("branch", scm.branch);
        v.field("commit", scm.commit);
        v.field("changes", scm.changes);
        v.field("culprits", scm.culprits);
    }

    template <typename Visitor> void visit_fields(const BuildState &build, Visitor &v) {
        v.field("fullUrl", build.full_url);
        v.field("number", build.number);
        v.field("queueId", build.queue_id);
        v.field("timestamp", build.timestamp);
        v.field("duration", build.duration);
        v.field("phase", build.phase);
        v.field("status", build.status);
        v.field("url", build.url);
        v.field("displayName", build.display_name);
        v.field("scm", build.scm);
        v.field("parameters", build.parameters);
        v.field("log", build.log);
        v.field("notes", build.notes);
        v.field("artifacts", build.artifacts);
    }

    template <typename Visitor> void visit_fields(const JobState &job, Visitor &v) {
        v.field("name", job.name);
        v.field("displayName", job.display_name);
        v.field("url", job.url);
        v.field("build", job.build);
    }

} // namespace notifypipe
