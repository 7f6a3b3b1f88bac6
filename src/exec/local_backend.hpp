#pragma once

#include <string>
#include <vector>

#include "exec/process_runner.hpp"
#include "exec/search_backend.hpp"
#include "util/logger.hpp"

namespace blastbridge {

struct LocalBackendOptions {
    std::string blast_bin_dir;  // empty = PATH
    std::string temp_dir;       // query staging; empty = $TMPDIR or /tmp
    int num_threads = 1;
};

// Command line for one search. The query is read from query_path and
// results are requested as TABULAR_OUTFMT columns.
std::vector<std::string> build_blast_argv(const SearchRequest& req,
                                          const std::string& query_path,
                                          const std::string& db_path,
                                          const LocalBackendOptions& opts);

// Runs blastn / blastp / blastx / tblastn as a subprocess.
class LocalBackend : public SearchBackend {
public:
    LocalBackend(ProcessRunner& runner, const LocalBackendOptions& opts,
                 const Logger& logger);

    ResultSource source() const override { return ResultSource::kLocal; }

    // kDatabaseNotFound unless the index files for the program's database
    // type exist at db_path.
    bool prepare(const SearchRequest& req, const std::string& db_path,
                 SearchError& err) override;

    bool execute(const SearchRequest& req, const SequenceQuery& query,
                 const std::string& db_path, const ExecutionContext& ctx,
                 RawOutput& out, SearchError& err) override;

private:
    ProcessRunner& runner_;
    LocalBackendOptions opts_;
    const Logger& logger_;
};

} // namespace blastbridge
