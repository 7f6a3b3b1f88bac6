#include "remote/remote_backend.hpp"

#include <chrono>
#include <cstdio>
#include <regex>
#include <thread>

namespace blastbridge {

const char* remote_job_status_name(RemoteJobStatus s) {
    switch (s) {
    case RemoteJobStatus::kSubmitted: return "Submitted";
    case RemoteJobStatus::kWaiting:   return "Waiting";
    case RemoteJobStatus::kReady:     return "Ready";
    case RemoteJobStatus::kFailed:    return "Failed";
    case RemoteJobStatus::kUnknown:   return "Unknown";
    case RemoteJobStatus::kTimedOut:  return "TimedOut";
    }
    return "?";
}

bool SteadyPollTimer::wait(uint32_t ms, const CancelToken* cancel) {
    constexpr uint32_t kSliceMs = 100;
    uint32_t remaining = ms;
    while (remaining > 0) {
        if (cancel && cancel->cancelled()) return false;
        uint32_t step = remaining < kSliceMs ? remaining : kSliceMs;
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
        remaining -= step;
    }
    return !(cancel && cancel->cancelled());
}

uint64_t SteadyPollTimer::now_ms() const {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

std::string build_submit_body(const SearchRequest& req, const SequenceQuery& query) {
    char evalue[32];
    std::snprintf(evalue, sizeof(evalue), "%g", req.evalue);

    std::string body = "CMD=Put";
    body += "&PROGRAM=" + url_encode(program_name(req.program));
    body += "&DATABASE=" + url_encode(req.database);
    body += "&QUERY=" + url_encode(query.sequence);
    body += "&EXPECT=" + url_encode(evalue);
    body += "&HITLIST_SIZE=" + std::to_string(req.max_targets);
    body += "&FORMAT_TYPE=XML";

    if (req.program == BlastProgram::kBlastn) {
        uint32_t word = req.word_size > 0 ? req.word_size : DEFAULT_BLASTN_WORD_SIZE;
        body += "&WORD_SIZE=" + std::to_string(word);
    } else {
        if (req.word_size > 0) body += "&WORD_SIZE=" + std::to_string(req.word_size);
        std::string matrix = req.matrix.empty() ? DEFAULT_MATRIX : req.matrix;
        int gap_open = req.gap_open > 0 ? req.gap_open : DEFAULT_GAP_OPEN;
        int gap_extend = req.gap_extend > 0 ? req.gap_extend : DEFAULT_GAP_EXTEND;
        body += "&MATRIX_NAME=" + url_encode(matrix);
        body += "&GAPCOSTS=" + url_encode(std::to_string(gap_open) + " " +
                                          std::to_string(gap_extend));
    }
    body += req.low_complexity ? "&FILTER=L" : "&FILTER=F";
    return body;
}

bool extract_request_id(const std::string& body, std::string& request_id) {
    static const std::regex rid_re(R"(RID = ([A-Z0-9]+))");
    std::smatch m;
    if (!std::regex_search(body, m, rid_re)) return false;
    request_id = m[1].str();
    return true;
}

RemoteJobStatus parse_job_status(const std::string& body) {
    if (body.find("Status=WAITING") != std::string::npos) return RemoteJobStatus::kWaiting;
    if (body.find("Status=FAILED") != std::string::npos) return RemoteJobStatus::kFailed;
    if (body.find("Status=UNKNOWN") != std::string::npos) return RemoteJobStatus::kUnknown;
    if (body.find("Status=READY") != std::string::npos) return RemoteJobStatus::kReady;
    return RemoteJobStatus::kWaiting;
}

RemoteBackend::RemoteBackend(HttpTransport& http, PollTimer& timer,
                             const RemoteBackendOptions& opts, const Logger& logger)
    : http_(http), timer_(timer), opts_(opts), logger_(logger) {}

bool RemoteBackend::prepare(const SearchRequest&, const std::string& db_path,
                            SearchError& err) {
    if (db_path.empty()) {
        err.set(ErrorCode::kDatabaseNotFound, "no remote database given");
        return false;
    }
    return true;
}

bool RemoteBackend::submit(const SearchRequest& req, const SequenceQuery& query,
                           RemoteJob& job, SearchError& err) {
    HttpResponse resp;
    std::string http_err;
    logger_.debug("Submitting %s search against %s to %s",
                  program_name(req.program), req.database.c_str(), opts_.url.c_str());
    if (!http_.post_form(opts_.url, build_submit_body(req, query), resp, http_err)) {
        err.set(ErrorCode::kRemoteSubmission, "submission failed: " + http_err);
        return false;
    }
    if (resp.status != 200) {
        err.set(ErrorCode::kRemoteSubmission,
                "submission failed: HTTP " + std::to_string(resp.status));
        return false;
    }

    job = RemoteJob{};
    if (!extract_request_id(resp.body, job.request_id)) {
        err.set(ErrorCode::kRemoteSubmission,
                "no request id in submission response: " + resp.body);
        return false;
    }
    job.status = RemoteJobStatus::kSubmitted;
    job.started_at_ms = timer_.now_ms();
    logger_.info("Remote job submitted: RID %s", job.request_id.c_str());
    return true;
}

bool RemoteBackend::poll(RemoteJob& job, const ExecutionContext& ctx, SearchError& err) {
    const std::string status_url =
        opts_.url + "?CMD=Get&FORMAT_OBJECT=SearchInfo&RID=" + url_encode(job.request_id);
    const uint64_t max_wait_ms = static_cast<uint64_t>(opts_.max_wait_sec) * 1000;

    while (job.attempts < opts_.max_poll_attempts) {
        HttpResponse resp;
        std::string http_err;
        job.attempts++;
        if (!http_.get(status_url, resp, http_err)) {
            job.status = RemoteJobStatus::kFailed;
            err.set(ErrorCode::kRemoteJobFailed, "status check failed: " + http_err);
            return false;
        }
        if (resp.status != 200) {
            job.status = RemoteJobStatus::kFailed;
            err.set(ErrorCode::kRemoteJobFailed,
                    "status check failed: HTTP " + std::to_string(resp.status));
            return false;
        }

        job.status = parse_job_status(resp.body);
        logger_.debug("RID %s: %s (attempt %u/%u)", job.request_id.c_str(),
                      remote_job_status_name(job.status), job.attempts,
                      opts_.max_poll_attempts);

        switch (job.status) {
        case RemoteJobStatus::kReady:
            logger_.info("Remote job %s ready after %u poll(s)",
                         job.request_id.c_str(), job.attempts);
            return true;
        case RemoteJobStatus::kFailed:
            err.set(ErrorCode::kRemoteJobFailed,
                    "remote job " + job.request_id + " failed on the server");
            return false;
        case RemoteJobStatus::kUnknown:
            err.set(ErrorCode::kRemoteUnknown,
                    "remote job " + job.request_id + " is unknown (it may have expired)");
            return false;
        default:
            break;
        }

        if (job.attempts >= opts_.max_poll_attempts) break;
        if (timer_.now_ms() - job.started_at_ms >= max_wait_ms) break;

        ctx.notify("poll", "waiting for remote results (" + std::to_string(job.attempts) +
                   "/" + std::to_string(opts_.max_poll_attempts) + ")");
        if (!timer_.wait(opts_.poll_interval_ms, ctx.cancel)) {
            err.set(ErrorCode::kCancelled, "remote search cancelled (RID " +
                    job.request_id + ")");
            return false;
        }
    }

    job.status = RemoteJobStatus::kTimedOut;
    err.set(ErrorCode::kRemoteTimeout,
            "remote job " + job.request_id + " timed out after " +
            std::to_string(job.attempts) + " status checks");
    logger_.info("Remote job %s timed out", job.request_id.c_str());
    return false;
}

bool RemoteBackend::retrieve(const RemoteJob& job, RawOutput& out, SearchError& err) {
    const std::string base = opts_.url + "?CMD=Get&RID=" + url_encode(job.request_id);

    HttpResponse resp;
    std::string http_err;
    if (!http_.get(base + "&FORMAT_TYPE=XML", resp, http_err)) {
        err.set(ErrorCode::kRemoteJobFailed, "results retrieval failed: " + http_err);
        return false;
    }
    if (resp.status != 200) {
        err.set(ErrorCode::kRemoteJobFailed,
                "results retrieval failed: HTTP " + std::to_string(resp.status));
        return false;
    }

    out = RawOutput{};
    out.format = RawFormat::kXml;
    out.body = std::move(resp.body);
    out.request_id = job.request_id;

    if (opts_.fetch_audit_text) {
        HttpResponse text;
        if (http_.get(base + "&FORMAT_TYPE=Text", text, http_err) && text.status == 200) {
            out.audit_text = std::move(text.body);
        } else {
            logger_.warn("Text report for RID %s not available", job.request_id.c_str());
        }
    }
    return true;
}

bool RemoteBackend::execute(const SearchRequest& req, const SequenceQuery& query,
                            const std::string& db_path, const ExecutionContext& ctx,
                            RawOutput& out, SearchError& err) {
    SearchRequest remote_req = req;
    remote_req.database = db_path;

    RemoteJob job;
    ctx.notify("submit", "submitting to NCBI BLAST");
    if (!submit(remote_req, query, job, err)) return false;

    ctx.notify("poll", "job " + job.request_id + " submitted");
    if (!poll(job, ctx, err)) return false;

    ctx.notify("retrieve", "downloading results for " + job.request_id);
    return retrieve(job, out, err);
}

} // namespace blastbridge
