#include "test_util.hpp"
#include "fake_blast_runner.hpp"
#include "exec/local_backend.hpp"
#include "registry/config_store.hpp"
#include "registry/database_registry.hpp"
#include "search/orchestrator.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

using namespace blastbridge;
using fake_blast::FakeBlastRunner;

static std::string g_test_dir;

static const char* kQuery40 = "ACGTTGCAAGGCTTACCGATGCATGCAAGTCCGATTGACC";

// Backend returning a scripted outcome.
class ScriptedBackend : public SearchBackend {
public:
    ResultSource src = ResultSource::kLocal;
    ErrorCode prepare_error = ErrorCode::kNone;
    ErrorCode execute_error = ErrorCode::kNone;
    RawOutput output;
    std::function<void()> during_execute;

    int prepare_calls = 0;
    int execute_calls = 0;
    std::string last_db_path;

    ResultSource source() const override { return src; }

    bool prepare(const SearchRequest&, const std::string& db_path,
                 SearchError& err) override {
        prepare_calls++;
        last_db_path = db_path;
        if (prepare_error != ErrorCode::kNone) {
            err.set(prepare_error, "prepare failed");
            return false;
        }
        return true;
    }

    bool execute(const SearchRequest&, const SequenceQuery&, const std::string&,
                 const ExecutionContext& ctx, RawOutput& out, SearchError& err) override {
        execute_calls++;
        if (during_execute) during_execute();
        if (ctx.cancelled()) {
            err.set(ErrorCode::kCancelled, "cancelled");
            return false;
        }
        if (execute_error != ErrorCode::kNone) {
            err.set(execute_error, "execute failed");
            return false;
        }
        out = output;
        return true;
    }
};

struct Recorder : ProgressObserver {
    std::vector<std::string> stages;
    void on_progress(const std::string& stage, const std::string&) override {
        stages.push_back(stage);
    }
};

static SearchRequest make_request(const std::string& query = kQuery40) {
    SearchRequest req;
    req.query = query;
    req.program = BlastProgram::kBlastn;
    req.database = "testdb";
    return req;
}

static std::string tab_line(const std::string& subject, uint32_t qstart, uint32_t qend,
                            double bits, double evalue) {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "Query_sequence\t%s\t100.000\t%u\t0\t0\t%u\t%u\t1\t%u\t%g\t%.1f\n",
                  subject.c_str(), qend - qstart + 1, qstart, qend, qend - qstart + 1,
                  evalue, bits);
    return buf;
}

static void test_rejects_short_query() {
    std::fprintf(stderr, "-- test_rejects_short_query\n");

    Logger logger;
    logger.set_quiet();
    ScriptedBackend local, remote;
    SearchOrchestrator orch(nullptr, local, remote, logger);

    SearchResult result;
    SearchError err;
    CHECK(!orch.run(make_request("ACGTACGTA"), result, err));
    CHECK(err.code == ErrorCode::kValidation);
    CHECK_EQ(local.prepare_calls, 0);
    CHECK_EQ(local.execute_calls, 0);
    CHECK(!orch.busy());
}

static void test_rejects_incompatible_program() {
    std::fprintf(stderr, "-- test_rejects_incompatible_program\n");

    Logger logger;
    logger.set_quiet();
    ScriptedBackend local, remote;
    SearchOrchestrator orch(nullptr, local, remote, logger);

    SearchRequest req = make_request();
    req.program = BlastProgram::kBlastp;
    SearchResult result;
    SearchError err;
    CHECK(!orch.run(req, result, err));
    CHECK(err.code == ErrorCode::kValidation);
    CHECK_EQ(local.execute_calls, 0);

    req = make_request("MKTAYIAKQRQISFVKSHFSRQ");
    req.program = BlastProgram::kBlastn;
    err.clear();
    CHECK(!orch.run(req, result, err));
    CHECK(err.code == ErrorCode::kValidation);
    CHECK_EQ(local.execute_calls, 0);
    CHECK_EQ(remote.execute_calls, 0);
}

static void test_bad_parameters() {
    std::fprintf(stderr, "-- test_bad_parameters\n");

    Logger logger;
    logger.set_quiet();
    ScriptedBackend local, remote;
    SearchOrchestrator orch(nullptr, local, remote, logger);

    SearchRequest req = make_request();
    req.database.clear();
    SearchResult result;
    SearchError err;
    CHECK(!orch.run(req, result, err));
    CHECK(err.code == ErrorCode::kValidation);
    CHECK_EQ(local.prepare_calls, 0);
}

static void test_prepare_failure_is_surfaced() {
    std::fprintf(stderr, "-- test_prepare_failure_is_surfaced\n");

    Logger logger;
    logger.set_quiet();
    ScriptedBackend local, remote;
    local.prepare_error = ErrorCode::kDatabaseNotFound;
    SearchOrchestrator orch(nullptr, local, remote, logger);

    SearchResult result;
    SearchError err;
    CHECK(!orch.run(make_request(), result, err));
    CHECK(err.code == ErrorCode::kDatabaseNotFound);
    CHECK_EQ(local.execute_calls, 0);
}

static void test_execution_failure_falls_back() {
    std::fprintf(stderr, "-- test_execution_failure_falls_back\n");

    Logger logger;
    logger.set_quiet();
    ScriptedBackend local, remote;
    local.execute_error = ErrorCode::kMissingExecutable;
    SearchOrchestrator orch(nullptr, local, remote, logger);

    Recorder rec;
    SearchResult result;
    SearchError err;
    CHECK(orch.run(make_request(), result, err, &rec));
    CHECK(err.ok());
    CHECK(result.source == ResultSource::kFallback);
    CHECK(!result.is_real_results);
    CHECK(result.error_message.find("execute failed") != std::string::npos);
    CHECK(!result.hits.empty());
    CHECK(!result.search_id.empty());
    for (const auto& h : result.hits) CHECK(h.query_range.to <= 40u);

    bool saw_fallback = false;
    for (const auto& s : rec.stages) saw_fallback = saw_fallback || s == "fallback";
    CHECK(saw_fallback);
    CHECK(rec.stages.back() == "done");
}

static void test_remote_failures_fall_back() {
    std::fprintf(stderr, "-- test_remote_failures_fall_back\n");

    Logger logger;
    logger.set_quiet();
    const ErrorCode codes[] = {ErrorCode::kRemoteSubmission, ErrorCode::kRemoteJobFailed,
                               ErrorCode::kRemoteUnknown, ErrorCode::kRemoteTimeout};
    for (ErrorCode code : codes) {
        ScriptedBackend local, remote;
        remote.execute_error = code;
        SearchOrchestrator orch(nullptr, local, remote, logger);
        SearchRequest req = make_request();
        req.service = ServiceKind::kRemote;
        req.database = "nt";
        SearchResult result;
        SearchError err;
        CHECK(orch.run(req, result, err));
        CHECK(result.source == ResultSource::kFallback);
        CHECK_EQ(local.execute_calls, 0);
    }
}

static void test_parse_failure_falls_back() {
    std::fprintf(stderr, "-- test_parse_failure_falls_back\n");

    Logger logger;
    logger.set_quiet();
    ScriptedBackend local, remote;
    local.output.format = RawFormat::kTabular;
    local.output.body = "this is not tabular output\n";
    SearchOrchestrator orch(nullptr, local, remote, logger);

    SearchResult result;
    SearchError err;
    CHECK(orch.run(make_request(), result, err));
    CHECK(result.source == ResultSource::kFallback);
    CHECK(result.error_message.find("ParseError") == 0);
}

static void test_cancelled() {
    std::fprintf(stderr, "-- test_cancelled\n");

    Logger logger;
    logger.set_quiet();
    ScriptedBackend local, remote;
    CancelToken cancel;
    local.during_execute = [&cancel]() { cancel.request(); };
    SearchOrchestrator orch(nullptr, local, remote, logger);

    SearchResult result;
    SearchError err;
    CHECK(!orch.run(make_request(), result, err, nullptr, &cancel));
    CHECK(err.code == ErrorCode::kCancelled);
    CHECK(!orch.busy());
}

static void test_busy() {
    std::fprintf(stderr, "-- test_busy\n");

    Logger logger;
    logger.set_quiet();
    ScriptedBackend local, remote;
    local.output.body = tab_line("s1", 1, 40, 75.0, 1e-15);
    SearchOrchestrator orch(nullptr, local, remote, logger);

    bool was_busy = false;
    ErrorCode nested_code = ErrorCode::kNone;
    bool nested_ok = true;
    local.during_execute = [&]() {
        was_busy = orch.busy();
        SearchResult nested;
        SearchError nested_err;
        nested_ok = orch.run(make_request(), nested, nested_err);
        nested_code = nested_err.code;
    };

    SearchResult result;
    SearchError err;
    CHECK(orch.run(make_request(), result, err));
    CHECK(was_busy);
    CHECK(!nested_ok);
    CHECK(nested_code == ErrorCode::kDatabaseBusy);
    CHECK(result.source == ResultSource::kLocal);
    CHECK(!orch.busy());

    // the flag is released, a second search runs
    local.during_execute = nullptr;
    CHECK(orch.run(make_request(), result, err));
}

static void test_remote_success() {
    std::fprintf(stderr, "-- test_remote_success\n");

    Logger logger;
    logger.set_quiet();
    ScriptedBackend local, remote;
    remote.src = ResultSource::kRemote;
    remote.output.format = RawFormat::kXml;
    remote.output.request_id = "RID42";
    remote.output.audit_text = "BLASTN text";
    remote.output.body =
        "<?xml version=\"1.0\"?><BlastOutput><BlastOutput_db>nt</BlastOutput_db>"
        "<BlastOutput_iterations><Iteration><Iteration_hits><Hit>"
        "<Hit_id>gi|1</Hit_id><Hit_def>thing [Homo sapiens]</Hit_def>"
        "<Hit_accession>NM_1</Hit_accession><Hit_len>900</Hit_len><Hit_hsps><Hsp>"
        "<Hsp_bit-score>60</Hsp_bit-score><Hsp_evalue>1e-9</Hsp_evalue>"
        "<Hsp_query-from>5</Hsp_query-from><Hsp_query-to>34</Hsp_query-to>"
        "<Hsp_hit-from>1</Hsp_hit-from><Hsp_hit-to>30</Hsp_hit-to>"
        "<Hsp_identity>30</Hsp_identity><Hsp_gaps>0</Hsp_gaps>"
        "<Hsp_align-len>30</Hsp_align-len></Hsp></Hit_hsps></Hit>"
        "</Iteration_hits></Iteration></BlastOutput_iterations></BlastOutput>";
    SearchOrchestrator orch(nullptr, local, remote, logger);

    SearchRequest req = make_request();
    req.service = ServiceKind::kRemote;
    req.database = "nt";
    SearchResult result;
    SearchError err;
    CHECK(orch.run(req, result, err));
    CHECK(result.source == ResultSource::kRemote);
    CHECK(result.is_real_results);
    CHECK(result.request_id == "RID42");
    CHECK(result.audit_text == "BLASTN text");
    CHECK_EQ(result.hits.size(), 1u);
    CHECK(result.hits[0].organism == "Homo sapiens");
    CHECK(remote.last_db_path == "nt");
}

static void test_translated_programs_mark_similar_residues() {
    std::fprintf(stderr, "-- test_translated_programs_mark_similar_residues\n");

    Logger logger;
    logger.set_quiet();

    // blastx: DNA query, protein alignment rows in the tabular output
    {
        ScriptedBackend local, remote;
        local.output.body =
            "Query_sequence\tsp|P1|X\t60.000\t5\t2\t0\t1\t15\t3\t7\t1e-5\t40.0\t"
            "protein X [Bacillus subtilis]\tMIKDA\tMVRDA\n";
        SearchOrchestrator orch(nullptr, local, remote, logger);
        SearchRequest req = make_request();
        req.program = BlastProgram::kBlastx;
        req.database = "/db/prot";
        SearchResult result;
        SearchError err;
        CHECK(orch.run(req, result, err));
        CHECK(result.is_real_results);
        CHECK_EQ(result.hits.size(), 1u);
        if (!result.hits.empty()) {
            CHECK(result.hits[0].alignment.match_line == "|++||");
        }
    }

    // tblastn: protein rows in the remote XML report
    {
        ScriptedBackend local, remote;
        remote.src = ResultSource::kRemote;
        remote.output.format = RawFormat::kXml;
        remote.output.body =
            "<?xml version=\"1.0\"?><BlastOutput><BlastOutput_db>nt</BlastOutput_db>"
            "<BlastOutput_iterations><Iteration><Iteration_hits><Hit>"
            "<Hit_id>gi|2</Hit_id><Hit_def>locus [Mus musculus]</Hit_def>"
            "<Hit_accession>NC_2</Hit_accession><Hit_len>3000</Hit_len><Hit_hsps><Hsp>"
            "<Hsp_bit-score>25</Hsp_bit-score><Hsp_evalue>0.01</Hsp_evalue>"
            "<Hsp_query-from>1</Hsp_query-from><Hsp_query-to>5</Hsp_query-to>"
            "<Hsp_hit-from>100</Hsp_hit-from><Hsp_hit-to>114</Hsp_hit-to>"
            "<Hsp_identity>3</Hsp_identity><Hsp_gaps>0</Hsp_gaps>"
            "<Hsp_align-len>5</Hsp_align-len>"
            "<Hsp_qseq>MIKDA</Hsp_qseq><Hsp_hseq>MVRDA</Hsp_hseq></Hsp></Hit_hsps></Hit>"
            "</Iteration_hits></Iteration></BlastOutput_iterations></BlastOutput>";
        SearchOrchestrator orch(nullptr, local, remote, logger);
        SearchRequest req = make_request();
        req.program = BlastProgram::kTblastn;
        req.service = ServiceKind::kRemote;
        req.database = "nt";
        SearchResult result;
        SearchError err;
        CHECK(orch.run(req, result, err));
        CHECK(result.is_real_results);
        CHECK_EQ(result.hits.size(), 1u);
        if (!result.hits.empty()) {
            CHECK(result.hits[0].alignment.match_line == "|++||");
        }
    }

    // blastn: A/G is a mismatch, not a similar pair
    {
        ScriptedBackend local, remote;
        local.output.body =
            "Query_sequence\ts1\t80.000\t5\t1\t0\t1\t5\t1\t5\t1e-2\t10.0\t"
            "s1\tACGTA\tGCGTA\n";
        SearchOrchestrator orch(nullptr, local, remote, logger);
        SearchRequest req = make_request();
        SearchResult result;
        SearchError err;
        CHECK(orch.run(req, result, err));
        CHECK_EQ(result.hits.size(), 1u);
        if (!result.hits.empty()) {
            CHECK(result.hits[0].alignment.match_line == " ||||");
        }
    }
}

static void test_registry_record_states() {
    std::fprintf(stderr, "-- test_registry_record_states\n");

    Logger logger;
    logger.set_quiet();
    FakeBlastRunner runner;
    JsonFileConfigStore store(g_test_dir + "/states/registry.json", logger);
    SearchError err;
    CHECK(store.open(err));
    RegistryOptions opts;
    opts.db_dir = g_test_dir + "/states/dbs";
    DatabaseRegistry reg(store, runner, opts, logger);
    CHECK(reg.load(err));

    DatabaseRecord building;
    building.id = "custom_building_1";
    building.name = "building";
    building.status = DbStatus::kCreating;
    building.db_path = opts.db_dir + "/custom_building_1";
    CHECK(store.set(building.id, building, err));

    DatabaseRecord broken = building;
    broken.id = "custom_broken_2";
    broken.name = "broken";
    broken.status = DbStatus::kError;
    CHECK(store.set(broken.id, broken, err));

    DatabaseRecord prot = building;
    prot.id = "custom_prot_3";
    prot.name = "prot";
    prot.status = DbStatus::kReady;
    prot.mol_type = MolType::kProtein;
    prot.db_path = opts.db_dir + "/custom_prot_3";
    CHECK(store.set(prot.id, prot, err));

    // a second load picks the records up without the validation pass
    CHECK(reg.load(err));

    ScriptedBackend local, remote;
    SearchOrchestrator orch(&reg, local, remote, logger);
    SearchResult result;

    SearchRequest req = make_request();
    req.database = "building";
    err.clear();
    CHECK(!orch.run(req, result, err));
    CHECK(err.code == ErrorCode::kDatabaseBusy);

    req.database = "custom_broken_2";
    err.clear();
    CHECK(!orch.run(req, result, err));
    CHECK(err.code == ErrorCode::kDatabaseCorrupt);

    req.database = "prot";
    err.clear();
    CHECK(!orch.run(req, result, err));
    CHECK(err.code == ErrorCode::kValidation);

    CHECK_EQ(local.prepare_calls, 0);

    // unknown references pass through as paths
    req.database = "/elsewhere/db";
    local.output.body = "";
    err.clear();
    CHECK(orch.run(req, result, err));
    CHECK(local.last_db_path == "/elsewhere/db");
    CHECK(result.hits.empty());
    CHECK(result.is_real_results);
}

static void test_end_to_end_local() {
    std::fprintf(stderr, "-- test_end_to_end_local\n");

    Logger logger;
    logger.set_quiet();
    FakeBlastRunner runner;
    JsonFileConfigStore store(g_test_dir + "/e2e/registry.json", logger);
    SearchError err;
    CHECK(store.open(err));
    RegistryOptions opts;
    opts.db_dir = g_test_dir + "/e2e/dbs";
    DatabaseRegistry reg(store, runner, opts, logger);
    CHECK(reg.load(err));

    std::string src = g_test_dir + "/two.fa";
    {
        std::ofstream f(src);
        f << ">seq1 first [Escherichia coli]\n" << kQuery40 << "\n"
          << ">seq2 second [Bacillus subtilis]\nTTGACCATGGCATTAGGCCAATTGGCCAAGGTTCCAAGGT\n";
    }
    DatabaseRecord rec;
    CHECK(reg.create(src, "two seqs", MolType::kNucleotide, rec, err));

    runner.search_out = tab_line("seq2", 11, 30, 30.2, 0.004) +
                        tab_line("seq1", 1, 40, 75.8, 1e-17);

    LocalBackendOptions lopts;
    lopts.temp_dir = g_test_dir;
    LocalBackend local(runner, lopts, logger);
    ScriptedBackend remote;
    SearchOrchestrator orch(&reg, local, remote, logger);

    SearchRequest req = make_request();
    req.database = "two seqs";
    SearchResult result;
    CHECK(orch.run(req, result, err));
    CHECK(result.source == ResultSource::kLocal);
    CHECK(result.is_real_results);
    CHECK(result.hits.size() <= 2u);
    CHECK_EQ(result.hits.size(), 2u);
    CHECK(result.hits[0].accession == "seq1");
    for (const auto& h : result.hits) {
        CHECK(h.query_range.to <= 40u);
        CHECK(h.identity_count <= h.alignment_length);
    }
    CHECK_EQ(result.statistics.db_sequences, 2u);
    CHECK_EQ(result.statistics.db_letters, 80u);
    CHECK_EQ(result.query_info.length, 40u);
    CHECK(result.query_info.type == SequenceType::kDna);
    CHECK(FakeBlastRunner::arg(runner.calls.back(), "-db") == rec.db_path);
    CHECK(runner.last_query_text == std::string(">Query_sequence\n") + kQuery40 + "\n");
}

int main() {
    g_test_dir = "/tmp/blastbridge_orchestrator_test";
    std::filesystem::remove_all(g_test_dir);
    std::filesystem::create_directories(g_test_dir);

    test_rejects_short_query();
    test_rejects_incompatible_program();
    test_bad_parameters();
    test_prepare_failure_is_surfaced();
    test_execution_failure_falls_back();
    test_remote_failures_fall_back();
    test_parse_failure_falls_back();
    test_cancelled();
    test_busy();
    test_remote_success();
    test_translated_programs_mark_similar_residues();
    test_registry_record_states();
    test_end_to_end_local();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
