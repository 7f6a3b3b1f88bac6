#include "core/config.hpp"
#include "core/types.hpp"
#include "core/version.hpp"
#include "exec/local_backend.hpp"
#include "exec/process_runner.hpp"
#include "io/result_writer.hpp"
#include "parse/hit_sort.hpp"
#include "registry/config_store.hpp"
#include "registry/database_registry.hpp"
#include "remote/http_transport.hpp"
#include "remote/remote_backend.hpp"
#include "search/orchestrator.hpp"
#include "sequence/genome_source.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace blastbridge;

static CancelToken g_cancel;

static void signal_handler(int /*sig*/) {
    g_cancel.request();
}

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Query (one required):\n"
        "  -query <path>            Query FASTA or plain sequence file (- for stdin)\n"
        "  -sequence <text>         Query sequence on the command line\n"
        "  -genome <fasta> -region <chrom:start-end>\n"
        "                           Query taken from a genome region\n"
        "\n"
        "Search:\n"
        "  -program <name>          blastn, blastp, blastx, tblastn (default: blastn)\n"
        "  -service <local|remote>  Where to run the search (default: local)\n"
        "  -db <ref>                Database id, name or path (remote: NCBI name, e.g. nt)\n"
        "  -evalue <float>          E-value threshold (default: 10)\n"
        "  -max_target_seqs <int>   Maximum hits (default: 50)\n"
        "  -word_size <int>         Word size (default: 11 for blastn)\n"
        "  -matrix <name>           Scoring matrix for protein programs (default: BLOSUM62)\n"
        "  -gapopen <int>           Gap open cost\n"
        "  -gapextend <int>         Gap extend cost\n"
        "  -low_complexity <yes|no> Low-complexity filter (default: yes)\n"
        "\n"
        "Environment:\n"
        "  -registry <path>         Registry file (env BLASTBRIDGE_REGISTRY)\n"
        "  -blast_bin_dir <dir>     BLAST+ programs (env BLASTBRIDGE_BLAST_BIN, default: PATH)\n"
        "  -ncbi_url <url>          NCBI BLAST endpoint (env BLASTBRIDGE_NCBI_URL)\n"
        "  -threads <int>           BLAST threads (default: all cores)\n"
        "\n"
        "Output:\n"
        "  -o <path>                Output file (default: stdout)\n"
        "  -outfmt <tab|json|text>  Output format (default: tab)\n"
        "  -sort_by <key>           bitscore, evalue, identity, coverage, length\n"
        "  -sort_order <asc|desc>   Sort direction (default: desc; evalue: asc)\n"
        "  -max_evalue <float>      Only report hits at or below this e-value\n"
        "  -min_identity <float>    Only report hits at or above this identity (%%)\n"
        "  -organism <name>         Only report hits from this organism\n"
        "  -quiet                   Errors only\n"
        "  -v, --verbose            Verbose logging\n"
        "  --version                Print version\n"
        "\n"
        "Exit status: 0 when a result (real or simulated) was produced,\n"
        "1 when the request was rejected, 2 on usage errors, 130 when cancelled.\n",
        prog);
}

static bool read_text(const std::string& path, std::string& text) {
    if (path == "-") {
        std::stringstream ss;
        ss << std::cin.rdbuf();
        text = ss.str();
        return true;
    }
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    text = ss.str();
    return true;
}

class LogProgress : public ProgressObserver {
public:
    explicit LogProgress(const Logger& logger) : logger_(logger) {}
    void on_progress(const std::string& stage, const std::string& message) override {
        logger_.debug("[%s] %s", stage.c_str(), message.c_str());
    }

private:
    const Logger& logger_;
};

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "blastbridgesearch")) return 0;
    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    int query_sources = (cli.has("-query") ? 1 : 0) + (cli.has("-sequence") ? 1 : 0) +
                        (cli.has("-genome") ? 1 : 0);
    if (query_sources != 1 || !cli.has("-db")) {
        print_usage(argv[0]);
        return 2;
    }

    Logger logger = make_logger(cli);

    // Request
    SearchRequest req;
    if (!parse_program(cli.get_string("-program", "blastn"), req.program)) {
        std::fprintf(stderr, "Error: unknown program '%s'\n",
                     cli.get_string("-program").c_str());
        return 2;
    }
    if (!parse_service(cli.get_string("-service", "local"), req.service)) {
        std::fprintf(stderr, "Error: unknown service '%s'\n",
                     cli.get_string("-service").c_str());
        return 2;
    }
    req.database = cli.get_string("-db");
    req.evalue = cli.get_double("-evalue", DEFAULT_EVALUE);
    int max_targets = cli.get_int("-max_target_seqs", static_cast<int>(DEFAULT_MAX_TARGETS));
    req.max_targets = max_targets > 0 ? static_cast<uint32_t>(max_targets) : 0;
    int word_size = cli.get_int("-word_size", 0);
    req.word_size = word_size > 0 ? static_cast<uint32_t>(word_size) : 0;
    req.matrix = cli.get_string("-matrix");
    req.gap_open = cli.get_int("-gapopen", 0);
    req.gap_extend = cli.get_int("-gapextend", 0);
    std::string lc = cli.get_string("-low_complexity", "yes");
    if (lc != "yes" && lc != "no") {
        std::fprintf(stderr, "Error: -low_complexity must be yes or no\n");
        return 2;
    }
    req.low_complexity = (lc == "yes");

    if (cli.has("-query")) {
        std::string path = cli.get_string("-query");
        if (!read_text(path, req.query)) {
            std::fprintf(stderr, "Error: cannot read query file %s\n", path.c_str());
            return 1;
        }
    } else if (cli.has("-sequence")) {
        req.query = cli.get_string("-sequence");
    } else {
        std::string chrom;
        uint64_t start = 0, end = 0;
        if (!parse_region(cli.get_string("-region"), chrom, start, end)) {
            std::fprintf(stderr, "Error: -genome needs -region <chrom:start-end>\n");
            return 2;
        }
        FastaGenomeSource genome;
        SearchError gerr;
        if (!genome.load(cli.get_string("-genome"), gerr) ||
            !query_from_region(genome, chrom, start, end, req.query, gerr)) {
            std::fprintf(stderr, "Error: %s\n", gerr.message.c_str());
            return 1;
        }
    }

    // Output
    OutputFormat outfmt = OutputFormat::kTab;
    std::string fmt_err;
    if (!parse_output_format(cli.get_string("-outfmt", "tab"), outfmt, fmt_err)) {
        std::fprintf(stderr, "%s\n", fmt_err.c_str());
        return 2;
    }
    bool custom_sort = cli.has("-sort_by") || cli.has("-sort_order");
    SortKey sort_key = SortKey::kBitScore;
    if (cli.has("-sort_by") && !parse_sort_key(cli.get_string("-sort_by"), sort_key)) {
        std::fprintf(stderr, "Error: unknown sort key '%s'\n",
                     cli.get_string("-sort_by").c_str());
        return 2;
    }
    SortOrder sort_order = (sort_key == SortKey::kEvalue) ? SortOrder::kAscending
                                                          : SortOrder::kDescending;
    if (cli.has("-sort_order") && !parse_sort_order(cli.get_string("-sort_order"), sort_order)) {
        std::fprintf(stderr, "Error: unknown sort order '%s'\n",
                     cli.get_string("-sort_order").c_str());
        return 2;
    }
    HitFilter filter;
    filter.max_evalue = cli.get_double("-max_evalue", -1.0);
    filter.min_identity = cli.get_double("-min_identity", 0.0);
    filter.organism = cli.get_string("-organism");

    // Collaborators
    PosixProcessRunner runner;
    JsonFileConfigStore store(resolve_registry_path(cli), logger);
    SearchError store_err;
    if (!store.open(store_err)) {
        logger.error("%s", store_err.message.c_str());
        return 1;
    }
    RegistryOptions reg_opts;
    reg_opts.db_dir = resolve_db_dir(cli);
    reg_opts.blast_bin_dir = resolve_blast_bin_dir(cli);
    DatabaseRegistry registry(store, runner, reg_opts, logger);
    if (!registry.load(store_err)) {
        logger.error("%s", store_err.message.c_str());
        return 1;
    }

    LocalBackendOptions local_opts;
    local_opts.blast_bin_dir = reg_opts.blast_bin_dir;
    local_opts.num_threads = resolve_threads(cli);
    LocalBackend local(runner, local_opts, logger);

    CurlHttpTransport http;
    SteadyPollTimer timer;
    RemoteBackendOptions remote_opts;
    remote_opts.url = cli.get_string_env("-ncbi_url", "BLASTBRIDGE_NCBI_URL", NCBI_BLAST_URL);
    RemoteBackend remote(http, timer, remote_opts, logger);

    SearchOrchestrator orchestrator(&registry, local, remote, logger);

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Search
    LogProgress progress(logger);
    SearchResult result;
    SearchError err;
    if (!orchestrator.run(req, result, err, &progress, &g_cancel)) {
        if (err.code == ErrorCode::kCancelled) {
            logger.error("Search cancelled");
            return 130;
        }
        logger.error("%s: %s", error_code_name(err.code), err.message.c_str());
        return 1;
    }

    if (!result.is_real_results) {
        logger.warn("SIMULATED RESULTS: %s", result.error_message.c_str());
    }
    if (custom_sort) sort_hits(result.hits, sort_key, sort_order);
    if (filter.max_evalue >= 0.0 || filter.min_identity > 0.0 || !filter.organism.empty()) {
        result.hits = filter_hits(result.hits, filter);
    }

    std::string output_path = cli.get_string("-o");
    if (output_path.empty()) {
        write_result(std::cout, result, outfmt);
        std::cout.flush();
    } else {
        std::ofstream out(output_path);
        if (!out.is_open()) {
            logger.error("cannot open output file %s", output_path.c_str());
            return 1;
        }
        write_result(out, result, outfmt);
        if (!out.good()) {
            logger.error("write failed for %s", output_path.c_str());
            return 1;
        }
    }
    return 0;
}
