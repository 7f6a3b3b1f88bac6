#pragma once

#include <cstdint>
#include <string>

#include "core/config.hpp"
#include "exec/search_backend.hpp"
#include "remote/http_transport.hpp"
#include "util/logger.hpp"

namespace blastbridge {

enum class RemoteJobStatus {
    kSubmitted,
    kWaiting,
    kReady,
    kFailed,
    kUnknown,
    kTimedOut,
};

const char* remote_job_status_name(RemoteJobStatus s);

// State of one NCBI BLAST job.
//   Submitted -> Waiting -> {Ready, Failed, Unknown}
//   Waiting -> Waiting                  re-poll within budget
//   Waiting -> TimedOut                 attempt or wall-clock budget spent
struct RemoteJob {
    std::string request_id;
    RemoteJobStatus status = RemoteJobStatus::kSubmitted;
    uint32_t attempts = 0;
    uint64_t started_at_ms = 0;  // PollTimer clock
};

// Clock and sleep used between status polls.
class PollTimer {
public:
    virtual ~PollTimer() = default;

    // Sleep for ms. Returns false, possibly early, if cancel is set.
    virtual bool wait(uint32_t ms, const CancelToken* cancel) = 0;

    // Monotonic milliseconds.
    virtual uint64_t now_ms() const = 0;
};

// std::chrono::steady_clock; sleeps in short slices so cancellation is
// noticed quickly.
class SteadyPollTimer : public PollTimer {
public:
    bool wait(uint32_t ms, const CancelToken* cancel) override;
    uint64_t now_ms() const override;
};

struct RemoteBackendOptions {
    std::string url = NCBI_BLAST_URL;
    uint32_t poll_interval_ms = REMOTE_POLL_INTERVAL_MS;
    uint32_t max_poll_attempts = REMOTE_MAX_POLL_ATTEMPTS;
    uint32_t max_wait_sec = REMOTE_MAX_WAIT_SEC;
    bool fetch_audit_text = true;  // also retrieve FORMAT_TYPE=Text
};

// Form body for CMD=Put.
std::string build_submit_body(const SearchRequest& req, const SequenceQuery& query);

// Find "RID = <token>" in a submission response.
bool extract_request_id(const std::string& body, std::string& request_id);

// Map a SearchInfo response to Waiting / Ready / Failed / Unknown.
// A response without a status marker is treated as Waiting.
RemoteJobStatus parse_job_status(const std::string& body);

// Drives the NCBI BLAST URL API: submit, poll until ready, retrieve XML.
class RemoteBackend : public SearchBackend {
public:
    RemoteBackend(HttpTransport& http, PollTimer& timer,
                  const RemoteBackendOptions& opts, const Logger& logger);

    ResultSource source() const override { return ResultSource::kRemote; }

    // Remote databases are named, not checked.
    bool prepare(const SearchRequest& req, const std::string& db_path,
                 SearchError& err) override;

    bool execute(const SearchRequest& req, const SequenceQuery& query,
                 const std::string& db_path, const ExecutionContext& ctx,
                 RawOutput& out, SearchError& err) override;

    // The three protocol steps, exposed for callers that manage jobs
    // themselves.
    bool submit(const SearchRequest& req, const SequenceQuery& query,
                RemoteJob& job, SearchError& err);
    bool poll(RemoteJob& job, const ExecutionContext& ctx, SearchError& err);
    bool retrieve(const RemoteJob& job, RawOutput& out, SearchError& err);

private:
    HttpTransport& http_;
    PollTimer& timer_;
    RemoteBackendOptions opts_;
    const Logger& logger_;
};

} // namespace blastbridge
