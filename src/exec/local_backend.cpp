#include "exec/local_backend.hpp"

#include <cstdio>

#include "core/config.hpp"
#include "exec/blast_tools.hpp"
#include "exec/temp_file.hpp"

namespace blastbridge {

static std::string format_evalue(double evalue) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", evalue);
    return buf;
}

std::vector<std::string> build_blast_argv(const SearchRequest& req,
                                          const std::string& query_path,
                                          const std::string& db_path,
                                          const LocalBackendOptions& opts) {
    std::vector<std::string> argv;
    argv.push_back(blast_tool_path(opts.blast_bin_dir, program_name(req.program)));
    argv.insert(argv.end(), {"-query", query_path, "-db", db_path,
                             "-evalue", format_evalue(req.evalue),
                             "-max_target_seqs", std::to_string(req.max_targets),
                             "-outfmt", TABULAR_OUTFMT});

    if (req.program == BlastProgram::kBlastn) {
        uint32_t word = req.word_size > 0 ? req.word_size : DEFAULT_BLASTN_WORD_SIZE;
        argv.insert(argv.end(), {"-word_size", std::to_string(word)});
        if (req.gap_open > 0 && req.gap_extend > 0) {
            argv.insert(argv.end(), {"-gapopen", std::to_string(req.gap_open),
                                     "-gapextend", std::to_string(req.gap_extend)});
        }
        argv.insert(argv.end(), {"-dust", req.low_complexity ? "yes" : "no"});
    } else {
        if (req.word_size > 0) {
            argv.insert(argv.end(), {"-word_size", std::to_string(req.word_size)});
        }
        std::string matrix = req.matrix.empty() ? DEFAULT_MATRIX : req.matrix;
        int gap_open = req.gap_open > 0 ? req.gap_open : DEFAULT_GAP_OPEN;
        int gap_extend = req.gap_extend > 0 ? req.gap_extend : DEFAULT_GAP_EXTEND;
        argv.insert(argv.end(), {"-matrix", matrix,
                                 "-gapopen", std::to_string(gap_open),
                                 "-gapextend", std::to_string(gap_extend),
                                 "-seg", req.low_complexity ? "yes" : "no"});
    }

    if (opts.num_threads > 1) {
        argv.insert(argv.end(), {"-num_threads", std::to_string(opts.num_threads)});
    }
    return argv;
}

LocalBackend::LocalBackend(ProcessRunner& runner, const LocalBackendOptions& opts,
                           const Logger& logger)
    : runner_(runner), opts_(opts), logger_(logger) {}

bool LocalBackend::prepare(const SearchRequest& req, const std::string& db_path,
                           SearchError& err) {
    if (db_path.empty()) {
        err.set(ErrorCode::kDatabaseNotFound, "no database given");
        return false;
    }
    MolType mol = database_mol_type(req.program);
    if (!database_files_exist(db_path, mol)) {
        const auto& exts = required_db_extensions(mol);
        err.set(ErrorCode::kDatabaseNotFound,
                std::string(mol_type_name(mol)) + " database not found: " + db_path +
                " (expected " + db_path + exts[0] + ", " + exts[1] + ", " + exts[2] + ")");
        return false;
    }
    return true;
}

bool LocalBackend::execute(const SearchRequest& req, const SequenceQuery& query,
                           const std::string& db_path, const ExecutionContext& ctx,
                           RawOutput& out, SearchError& err) {
    if (ctx.cancelled()) {
        err.set(ErrorCode::kCancelled, "search cancelled");
        return false;
    }

    TempFile query_file;
    std::string tmp_err;
    if (!query_file.create(opts_.temp_dir, "blastbridge_query_", ".fasta",
                           ">Query_sequence\n" + query.sequence + "\n", tmp_err)) {
        err.set(ErrorCode::kIo, "cannot stage query: " + tmp_err);
        return false;
    }

    std::vector<std::string> argv = build_blast_argv(req, query_file.path(), db_path, opts_);
    out = RawOutput{};
    out.format = RawFormat::kTabular;
    out.command_line = format_command_line(argv);
    logger_.debug("Running: %s", out.command_line.c_str());
    ctx.notify("execute", std::string("running ") + program_name(req.program));

    ProcessResult result;
    std::string run_err;
    if (!runner_.run(argv, result, run_err)) {
        err.set(ErrorCode::kProcessFailed, std::string(program_name(req.program)) +
                ": " + run_err);
        return false;
    }
    if (!result.success()) {
        classify_process_failure(program_name(req.program), result, err);
        logger_.debug("%s stderr: %s", program_name(req.program), result.err.c_str());
        return false;
    }
    if (!result.err.empty()) {
        logger_.debug("%s warnings: %s", program_name(req.program), result.err.c_str());
    }

    out.body = std::move(result.out);
    return true;
}

} // namespace blastbridge
