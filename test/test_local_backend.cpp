#include "test_util.hpp"
#include "fake_blast_runner.hpp"
#include "exec/local_backend.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace blastbridge;
using fake_blast::FakeBlastRunner;

static std::string g_test_dir;

static bool contains_pair(const std::vector<std::string>& argv, const std::string& key,
                          const std::string& value) {
    return FakeBlastRunner::arg(argv, key) == value;
}

static void test_argv_blastn() {
    std::fprintf(stderr, "-- test_argv_blastn\n");

    SearchRequest req;
    req.program = BlastProgram::kBlastn;
    req.evalue = 0.001;
    req.max_targets = 25;
    LocalBackendOptions opts;
    opts.blast_bin_dir = "/opt/blast/bin";

    auto argv = build_blast_argv(req, "/tmp/q.fasta", "/data/db/x", opts);
    CHECK(argv[0] == "/opt/blast/bin/blastn");
    CHECK(contains_pair(argv, "-query", "/tmp/q.fasta"));
    CHECK(contains_pair(argv, "-db", "/data/db/x"));
    CHECK(contains_pair(argv, "-evalue", "0.001"));
    CHECK(contains_pair(argv, "-max_target_seqs", "25"));
    CHECK(contains_pair(argv, "-word_size", "11"));
    CHECK(contains_pair(argv, "-dust", "yes"));
    CHECK(FakeBlastRunner::arg(argv, "-outfmt").compare(0, 2, "6 ") == 0);
    CHECK(!FakeBlastRunner::has(argv, "-matrix"));
    CHECK(!FakeBlastRunner::has(argv, "-gapopen"));
    CHECK(!FakeBlastRunner::has(argv, "-num_threads"));

    req.gap_open = 5;
    req.gap_extend = 2;
    req.low_complexity = false;
    opts.num_threads = 4;
    argv = build_blast_argv(req, "q", "d", opts);
    CHECK(contains_pair(argv, "-gapopen", "5"));
    CHECK(contains_pair(argv, "-gapextend", "2"));
    CHECK(contains_pair(argv, "-dust", "no"));
    CHECK(contains_pair(argv, "-num_threads", "4"));
}

static void test_argv_protein() {
    std::fprintf(stderr, "-- test_argv_protein\n");

    SearchRequest req;
    req.program = BlastProgram::kBlastp;
    LocalBackendOptions opts;

    auto argv = build_blast_argv(req, "q", "d", opts);
    CHECK(argv[0] == "blastp");
    CHECK(contains_pair(argv, "-matrix", "BLOSUM62"));
    CHECK(contains_pair(argv, "-gapopen", "11"));
    CHECK(contains_pair(argv, "-gapextend", "1"));
    CHECK(contains_pair(argv, "-seg", "yes"));
    CHECK(!FakeBlastRunner::has(argv, "-word_size"));
    CHECK(!FakeBlastRunner::has(argv, "-dust"));

    req.matrix = "PAM30";
    req.word_size = 3;
    argv = build_blast_argv(req, "q", "d", opts);
    CHECK(contains_pair(argv, "-matrix", "PAM30"));
    CHECK(contains_pair(argv, "-word_size", "3"));
}

static void test_prepare() {
    std::fprintf(stderr, "-- test_prepare\n");

    Logger logger;
    logger.set_quiet();
    FakeBlastRunner runner;
    LocalBackend backend(runner, LocalBackendOptions(), logger);

    SearchRequest req;
    SearchError err;
    std::string db = g_test_dir + "/db1";
    CHECK(!backend.prepare(req, db, err));
    CHECK(err.code == ErrorCode::kDatabaseNotFound);

    fake_blast::write_index_files(db, MolType::kNucleotide);
    err.clear();
    CHECK(backend.prepare(req, db, err));

    // blastp needs the protein index files
    req.program = BlastProgram::kBlastp;
    CHECK(!backend.prepare(req, db, err));
    CHECK(err.code == ErrorCode::kDatabaseNotFound);

    err.clear();
    CHECK(!backend.prepare(req, "", err));
    CHECK_EQ(runner.calls.size(), 0u);
}

static void test_execute() {
    std::fprintf(stderr, "-- test_execute\n");

    Logger logger;
    logger.set_quiet();
    FakeBlastRunner runner;
    runner.search_out = "Query_sequence\tsubj1\t100.000\t40\t0\t0\t1\t40\t1\t40\t1e-15\t75.0\n";
    LocalBackendOptions opts;
    opts.temp_dir = g_test_dir;
    LocalBackend backend(runner, opts, logger);

    SearchRequest req;
    SequenceQuery query;
    query.sequence = "ACGTACGTACGT";
    query.length = 12;
    ExecutionContext ctx;
    RawOutput out;
    SearchError err;
    CHECK(backend.execute(req, query, g_test_dir + "/db1", ctx, out, err));
    CHECK(out.format == RawFormat::kTabular);
    CHECK(out.body == runner.search_out);
    CHECK(out.command_line.find("blastn") == 0);
    CHECK(runner.last_query_text == ">Query_sequence\nACGTACGTACGT\n");

    // the staged query is gone after the run
    std::string query_path = FakeBlastRunner::arg(runner.calls.back(), "-query");
    CHECK(!query_path.empty());
    CHECK(!std::filesystem::exists(query_path));
}

static void test_execute_failure() {
    std::fprintf(stderr, "-- test_execute_failure\n");

    Logger logger;
    logger.set_quiet();
    FakeBlastRunner runner;
    runner.search_exit = 2;
    runner.search_err = "BLAST Database error: Could not find volume or alias file\n";
    LocalBackendOptions opts;
    opts.temp_dir = g_test_dir;
    LocalBackend backend(runner, opts, logger);

    SearchRequest req;
    SequenceQuery query;
    query.sequence = "ACGTACGTACGT";
    ExecutionContext ctx;
    RawOutput out;
    SearchError err;
    CHECK(!backend.execute(req, query, "db", ctx, out, err));
    CHECK(err.code == ErrorCode::kCorruptDatabase);
    std::string query_path = FakeBlastRunner::arg(runner.calls.back(), "-query");
    CHECK(!std::filesystem::exists(query_path));

    FakeBlastRunner missing;
    missing.missing.insert("blastn");
    LocalBackend backend2(missing, opts, logger);
    err.clear();
    CHECK(!backend2.execute(req, query, "db", ctx, out, err));
    CHECK(err.code == ErrorCode::kMissingExecutable);
}

static void test_execute_cancelled() {
    std::fprintf(stderr, "-- test_execute_cancelled\n");

    Logger logger;
    logger.set_quiet();
    FakeBlastRunner runner;
    LocalBackend backend(runner, LocalBackendOptions(), logger);

    CancelToken cancel;
    cancel.request();
    ExecutionContext ctx;
    ctx.cancel = &cancel;

    SearchRequest req;
    SequenceQuery query;
    query.sequence = "ACGTACGTACGT";
    RawOutput out;
    SearchError err;
    CHECK(!backend.execute(req, query, "db", ctx, out, err));
    CHECK(err.code == ErrorCode::kCancelled);
    CHECK_EQ(runner.calls.size(), 0u);
}

int main() {
    g_test_dir = "/tmp/blastbridge_local_backend_test";
    std::filesystem::create_directories(g_test_dir);

    test_argv_blastn();
    test_argv_protein();
    test_prepare();
    test_execute();
    test_execute_failure();
    test_execute_cancelled();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
