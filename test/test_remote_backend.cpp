#include "test_util.hpp"
#include "remote/remote_backend.hpp"

#include <deque>
#include <string>
#include <vector>

using namespace blastbridge;

// Replays scripted responses in order and records every request.
class FakeHttpTransport : public HttpTransport {
public:
    struct Step {
        bool ok = true;
        long status = 200;
        std::string body;
    };

    std::deque<Step> script;
    std::vector<std::string> post_urls;
    std::vector<std::string> post_bodies;
    std::vector<std::string> get_urls;

    void push(long status, const std::string& body) {
        Step s;
        s.status = status;
        s.body = body;
        script.push_back(s);
    }
    void push_transport_error() {
        Step s;
        s.ok = false;
        script.push_back(s);
    }

    bool post_form(const std::string& url, const std::string& body,
                   HttpResponse& resp, std::string& error_msg) override {
        post_urls.push_back(url);
        post_bodies.push_back(body);
        return next(resp, error_msg);
    }

    bool get(const std::string& url, HttpResponse& resp, std::string& error_msg) override {
        get_urls.push_back(url);
        return next(resp, error_msg);
    }

private:
    bool next(HttpResponse& resp, std::string& error_msg) {
        if (script.empty()) {
            error_msg = "script exhausted";
            return false;
        }
        Step s = script.front();
        script.pop_front();
        if (!s.ok) {
            error_msg = "connection refused";
            return false;
        }
        resp.status = s.status;
        resp.body = s.body;
        return true;
    }
};

// Virtual clock: wait() advances time without sleeping.
class FakePollTimer : public PollTimer {
public:
    uint32_t sleeps = 0;
    uint64_t now = 1000;
    CancelToken* cancel_after = nullptr;  // request cancellation on the first wait

    bool wait(uint32_t ms, const CancelToken* cancel) override {
        if (cancel_after) cancel_after->request();
        if (cancel && cancel->cancelled()) return false;
        sleeps++;
        now += ms;
        return true;
    }
    uint64_t now_ms() const override { return now; }
};

static const char* kSubmitOk =
    "<!--QBlastInfoBegin\n    RID = ABC123XYZ\n    RTOE = 20\nQBlastInfoEnd\n-->";
static const char* kWaiting = "<!--QBlastInfoBegin\n\tStatus=WAITING\nQBlastInfoEnd\n-->";
static const char* kReady =
    "<!--QBlastInfoBegin\n\tStatus=READY\nQBlastInfoEnd\n-->\nThereAreHits=yes\n";
static const char* kXml = "<?xml version=\"1.0\"?>\n<BlastOutput></BlastOutput>\n";

static SearchRequest make_request() {
    SearchRequest req;
    req.program = BlastProgram::kBlastn;
    req.database = "nt";
    req.evalue = 10.0;
    req.max_targets = 50;
    return req;
}

static SequenceQuery make_query() {
    SequenceQuery q;
    q.sequence = "ACGTACGTACGTACGT";
    q.length = 16;
    q.type = SequenceType::kDna;
    return q;
}

static RemoteBackendOptions fast_options() {
    RemoteBackendOptions opts;
    opts.url = "https://blast.example.org/Blast.cgi";
    opts.poll_interval_ms = 5000;
    opts.max_poll_attempts = 60;
    opts.max_wait_sec = 330;
    opts.fetch_audit_text = false;
    return opts;
}

static void test_submit_body() {
    std::fprintf(stderr, "-- test_submit_body\n");

    SearchRequest req = make_request();
    std::string body = build_submit_body(req, make_query());
    CHECK(body.find("CMD=Put") == 0);
    CHECK(body.find("&PROGRAM=blastn") != std::string::npos);
    CHECK(body.find("&DATABASE=nt") != std::string::npos);
    CHECK(body.find("&QUERY=ACGTACGTACGTACGT") != std::string::npos);
    CHECK(body.find("&EXPECT=10") != std::string::npos);
    CHECK(body.find("&HITLIST_SIZE=50") != std::string::npos);
    CHECK(body.find("&FORMAT_TYPE=XML") != std::string::npos);
    CHECK(body.find("&WORD_SIZE=11") != std::string::npos);
    CHECK(body.find("MATRIX_NAME") == std::string::npos);
    CHECK(body.find("&FILTER=L") != std::string::npos);

    req.program = BlastProgram::kBlastp;
    req.low_complexity = false;
    body = build_submit_body(req, make_query());
    CHECK(body.find("&MATRIX_NAME=BLOSUM62") != std::string::npos);
    CHECK(body.find("&GAPCOSTS=11+1") != std::string::npos);
    CHECK(body.find("WORD_SIZE") == std::string::npos);
    CHECK(body.find("&FILTER=F") != std::string::npos);
}

static void test_extract_rid_and_status() {
    std::fprintf(stderr, "-- test_extract_rid_and_status\n");

    std::string rid;
    CHECK(extract_request_id(kSubmitOk, rid));
    CHECK(rid == "ABC123XYZ");
    CHECK(!extract_request_id("<html>error</html>", rid));

    CHECK(parse_job_status(kWaiting) == RemoteJobStatus::kWaiting);
    CHECK(parse_job_status(kReady) == RemoteJobStatus::kReady);
    CHECK(parse_job_status("Status=FAILED") == RemoteJobStatus::kFailed);
    CHECK(parse_job_status("Status=UNKNOWN") == RemoteJobStatus::kUnknown);
    CHECK(parse_job_status("<html></html>") == RemoteJobStatus::kWaiting);
}

static void test_url_encode() {
    std::fprintf(stderr, "-- test_url_encode\n");

    CHECK(url_encode("abc-_.~XYZ09") == "abc-_.~XYZ09");
    CHECK(url_encode("11 1") == "11+1");
    CHECK(url_encode("a&b=c") == "a%26b%3Dc");
    CHECK(url_encode(">q\n") == "%3Eq%0A");
    CHECK(is_retryable_http_status(503));
    CHECK(is_retryable_http_status(429));
    CHECK(!is_retryable_http_status(404));
}

static void test_waiting_then_ready() {
    std::fprintf(stderr, "-- test_waiting_then_ready\n");

    Logger logger;
    logger.set_quiet();
    FakeHttpTransport http;
    FakePollTimer timer;
    http.push(200, kSubmitOk);
    http.push(200, kWaiting);
    http.push(200, kWaiting);
    http.push(200, kReady);
    http.push(200, kXml);

    RemoteBackend backend(http, timer, fast_options(), logger);
    ExecutionContext ctx;
    RawOutput out;
    SearchError err;
    CHECK(backend.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(out.format == RawFormat::kXml);
    CHECK(out.body == kXml);
    CHECK(out.request_id == "ABC123XYZ");
    CHECK_EQ(timer.sleeps, 2u);
    CHECK_EQ(http.post_urls.size(), 1u);
    CHECK_EQ(http.get_urls.size(), 4u);
    CHECK(http.get_urls[0].find("FORMAT_OBJECT=SearchInfo") != std::string::npos);
    CHECK(http.get_urls[0].find("RID=ABC123XYZ") != std::string::npos);
    CHECK(http.get_urls[3].find("FORMAT_TYPE=XML") != std::string::npos);
}

static void test_audit_text() {
    std::fprintf(stderr, "-- test_audit_text\n");

    Logger logger;
    logger.set_quiet();
    FakeHttpTransport http;
    FakePollTimer timer;
    http.push(200, kSubmitOk);
    http.push(200, kReady);
    http.push(200, kXml);
    http.push(200, "BLASTN 2.15.0+\nQuery= ...\n");

    RemoteBackendOptions opts = fast_options();
    opts.fetch_audit_text = true;
    RemoteBackend backend(http, timer, opts, logger);
    ExecutionContext ctx;
    RawOutput out;
    SearchError err;
    CHECK(backend.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(out.audit_text.find("BLASTN") == 0);
    CHECK(http.get_urls.back().find("FORMAT_TYPE=Text") != std::string::npos);

    // a missing text report does not fail the search
    FakeHttpTransport http2;
    http2.push(200, kSubmitOk);
    http2.push(200, kReady);
    http2.push(200, kXml);
    http2.push(500, "");
    RemoteBackend backend2(http2, timer, opts, logger);
    CHECK(backend2.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(out.audit_text.empty());
    CHECK(out.body == kXml);
}

static void test_timeout_after_attempts() {
    std::fprintf(stderr, "-- test_timeout_after_attempts\n");

    Logger logger;
    logger.set_quiet();
    FakeHttpTransport http;
    FakePollTimer timer;
    http.push(200, kSubmitOk);
    for (int i = 0; i < 60; i++) http.push(200, kWaiting);

    RemoteBackendOptions opts = fast_options();
    opts.max_wait_sec = 100000;
    RemoteBackend backend(http, timer, opts, logger);
    ExecutionContext ctx;
    RawOutput out;
    SearchError err;
    CHECK(!backend.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(err.code == ErrorCode::kRemoteTimeout);
    CHECK_EQ(http.get_urls.size(), 60u);
    CHECK_EQ(timer.sleeps, 59u);
}

static void test_timeout_wall_clock() {
    std::fprintf(stderr, "-- test_timeout_wall_clock\n");

    Logger logger;
    logger.set_quiet();
    FakeHttpTransport http;
    FakePollTimer timer;
    http.push(200, kSubmitOk);
    for (int i = 0; i < 60; i++) http.push(200, kWaiting);

    RemoteBackendOptions opts = fast_options();
    opts.max_wait_sec = 20;  // four 5 s intervals
    RemoteBackend backend(http, timer, opts, logger);
    ExecutionContext ctx;
    RawOutput out;
    SearchError err;
    CHECK(!backend.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(err.code == ErrorCode::kRemoteTimeout);
    CHECK_EQ(timer.sleeps, 4u);
    CHECK_EQ(http.get_urls.size(), 5u);
}

static void test_job_failed_and_unknown() {
    std::fprintf(stderr, "-- test_job_failed_and_unknown\n");

    Logger logger;
    logger.set_quiet();
    FakePollTimer timer;
    ExecutionContext ctx;
    RawOutput out;

    FakeHttpTransport http;
    http.push(200, kSubmitOk);
    http.push(200, kWaiting);
    http.push(200, "Status=FAILED");
    RemoteBackend backend(http, timer, fast_options(), logger);
    SearchError err;
    CHECK(!backend.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(err.code == ErrorCode::kRemoteJobFailed);

    FakeHttpTransport http2;
    http2.push(200, kSubmitOk);
    http2.push(200, "Status=UNKNOWN");
    RemoteBackend backend2(http2, timer, fast_options(), logger);
    err.clear();
    CHECK(!backend2.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(err.code == ErrorCode::kRemoteUnknown);
}

static void test_submission_errors() {
    std::fprintf(stderr, "-- test_submission_errors\n");

    Logger logger;
    logger.set_quiet();
    FakePollTimer timer;
    ExecutionContext ctx;
    RawOutput out;

    FakeHttpTransport http;
    http.push(200, "<html>Message ID#24 Error: Query contains no data</html>");
    RemoteBackend backend(http, timer, fast_options(), logger);
    SearchError err;
    CHECK(!backend.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(err.code == ErrorCode::kRemoteSubmission);
    CHECK(err.message.find("Query contains no data") != std::string::npos);
    CHECK_EQ(http.get_urls.size(), 0u);

    FakeHttpTransport http2;
    http2.push(500, "");
    RemoteBackend backend2(http2, timer, fast_options(), logger);
    err.clear();
    CHECK(!backend2.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(err.code == ErrorCode::kRemoteSubmission);

    FakeHttpTransport http3;
    http3.push_transport_error();
    RemoteBackend backend3(http3, timer, fast_options(), logger);
    err.clear();
    CHECK(!backend3.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(err.code == ErrorCode::kRemoteSubmission);

    FakeHttpTransport http4;
    http4.push(200, kSubmitOk);
    http4.push_transport_error();
    RemoteBackend backend4(http4, timer, fast_options(), logger);
    err.clear();
    CHECK(!backend4.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(err.code == ErrorCode::kRemoteJobFailed);
}

static void test_cancel_during_poll() {
    std::fprintf(stderr, "-- test_cancel_during_poll\n");

    Logger logger;
    logger.set_quiet();
    FakeHttpTransport http;
    FakePollTimer timer;
    CancelToken cancel;
    timer.cancel_after = &cancel;
    http.push(200, kSubmitOk);
    http.push(200, kWaiting);
    http.push(200, kReady);

    RemoteBackend backend(http, timer, fast_options(), logger);
    ExecutionContext ctx;
    ctx.cancel = &cancel;
    RawOutput out;
    SearchError err;
    CHECK(!backend.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(err.code == ErrorCode::kCancelled);
    CHECK_EQ(http.get_urls.size(), 1u);
}

static void test_progress_stages() {
    std::fprintf(stderr, "-- test_progress_stages\n");

    struct Recorder : ProgressObserver {
        std::vector<std::string> stages;
        void on_progress(const std::string& stage, const std::string&) override {
            stages.push_back(stage);
        }
    };

    Logger logger;
    logger.set_quiet();
    FakeHttpTransport http;
    FakePollTimer timer;
    http.push(200, kSubmitOk);
    http.push(200, kWaiting);
    http.push(200, kReady);
    http.push(200, kXml);

    Recorder rec;
    ExecutionContext ctx;
    ctx.observer = &rec;
    RemoteBackend backend(http, timer, fast_options(), logger);
    RawOutput out;
    SearchError err;
    CHECK(backend.execute(make_request(), make_query(), "nt", ctx, out, err));
    CHECK(!rec.stages.empty());
    CHECK(rec.stages.front() == "submit");
    CHECK(rec.stages.back() == "retrieve");
}

int main() {
    test_submit_body();
    test_extract_rid_and_status();
    test_url_encode();
    test_waiting_then_ready();
    test_audit_text();
    test_timeout_after_attempts();
    test_timeout_wall_clock();
    test_job_failed_and_unknown();
    test_submission_errors();
    test_cancel_during_poll();
    test_progress_stages();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
