#include "search/orchestrator.hpp"

#include <chrono>

#include "parse/blast_xml_parser.hpp"
#include "parse/tabular_parser.hpp"
#include "registry/database_registry.hpp"
#include "search/fallback_generator.hpp"
#include "sequence/sequence_validator.hpp"

namespace blastbridge {

namespace {

// Clears the in-flight flag on every exit path.
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_.store(false); }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

SearchOrchestrator::SearchOrchestrator(DatabaseRegistry* registry, SearchBackend& local,
                                       SearchBackend& remote, const Logger& logger)
    : registry_(registry), local_(local), remote_(remote), logger_(logger) {}

std::string SearchOrchestrator::next_search_id() {
    uint32_t n = ++search_counter_;
    return "search_" + std::to_string(epoch_millis()) + "_" + std::to_string(n);
}

bool SearchOrchestrator::resolve_database(const SearchRequest& req, std::string& db_path,
                                          Statistics& stats, SearchError& err) const {
    stats.database = req.database;
    if (req.service == ServiceKind::kRemote || registry_ == nullptr) {
        db_path = req.database;
        return true;
    }

    DatabaseRecord rec;
    if (!registry_->find(req.database, rec)) {
        db_path = registry_->resolve_path(req.database);
        return true;
    }
    if (rec.status == DbStatus::kCreating) {
        err.set(ErrorCode::kDatabaseBusy, "database '" + rec.name + "' is still being built");
        return false;
    }
    if (rec.status == DbStatus::kError) {
        err.set(ErrorCode::kDatabaseCorrupt,
                "database '" + rec.name + "' failed to build; update or delete it");
        return false;
    }
    if (rec.mol_type != database_mol_type(req.program)) {
        err.set(ErrorCode::kValidation,
                std::string(program_name(req.program)) + " needs a " +
                mol_type_name(database_mol_type(req.program)) + " database but '" +
                rec.name + "' is " + mol_type_name(rec.mol_type));
        return false;
    }
    db_path = rec.db_path;
    stats.db_sequences = rec.sequence_count;
    stats.db_letters = rec.letter_count;
    return true;
}

bool SearchOrchestrator::run(const SearchRequest& req, SearchResult& result,
                             SearchError& err, ProgressObserver* observer,
                             const CancelToken* cancel) {
    if (in_flight_.exchange(true)) {
        err.set(ErrorCode::kDatabaseBusy, "another search is already running");
        return false;
    }
    InFlightGuard guard(in_flight_);

    ExecutionContext ctx;
    ctx.cancel = cancel;
    ctx.observer = observer;
    auto started = std::chrono::steady_clock::now();

    // Validate
    ctx.notify("validate", "checking query and parameters");
    SequenceQuery query;
    if (!validate_request_parameters(req, err) ||
        !validate_query(req.query, query, err) ||
        !check_program_compatibility(req.program, query.type, err)) {
        logger_.debug("Request rejected: %s", err.message.c_str());
        return false;
    }

    // Resolve
    ctx.notify("resolve", "resolving database " + req.database);
    std::string db_path;
    Statistics db_stats;
    if (!resolve_database(req, db_path, db_stats, err)) return false;

    SearchBackend& backend = (req.service == ServiceKind::kLocal) ? local_ : remote_;
    if (!backend.prepare(req, db_path, err)) return false;

    logger_.info("Running %s (%s) against %s, query %u residues",
                 program_name(req.program), service_name(req.service),
                 db_path.c_str(), query.length);

    // Execute and parse; any failure from here on becomes a fallback result.
    RawOutput raw;
    SearchError run_err;
    ctx.notify("execute", std::string("starting ") + service_name(req.service) + " search");
    bool ok = backend.execute(req, query, db_path, ctx, raw, run_err);

    std::vector<Hit> hits;
    Statistics stats = db_stats;
    if (ok) {
        ctx.notify("parse", "parsing results");
        // blastx aligns translated DNA, so residue type follows the program
        bool protein = is_protein_scoring(req.program);
        if (raw.format == RawFormat::kXml) {
            ok = parse_blast_xml(raw.body, query.length, protein, hits, stats, run_err);
            if (stats.database.empty()) stats.database = req.database;
        } else {
            TabularParseInfo info;
            ok = parse_tabular(raw.body, query.length, protein, hits, run_err, &info);
            if (info.skipped > 0) {
                logger_.debug("Skipped %zu malformed result line(s)", info.skipped);
            }
        }
    }

    if (!ok) {
        if (run_err.code == ErrorCode::kCancelled) {
            err = run_err;
            logger_.info("Search cancelled");
            return false;
        }
        if (!triggers_fallback(run_err.code)) {
            err = run_err;
            return false;
        }
        logger_.warn("Search failed (%s): %s; returning simulated results",
                     error_code_name(run_err.code), run_err.message.c_str());
        ctx.notify("fallback", run_err.message);

        result = generate_fallback(req, query, run_err);
        result.search_id = next_search_id();
        result.statistics.db_sequences = db_stats.db_sequences;
        result.statistics.db_letters = db_stats.db_letters;
        result.statistics.search_time_sec = seconds_since(started);
        result.request_id = raw.request_id;
        ctx.notify("done", "simulated results");
        return true;
    }

    result = SearchResult{};
    result.search_id = next_search_id();
    result.query_info.preview = query_preview(query.sequence);
    result.query_info.length = query.length;
    result.query_info.type = query.type;
    result.parameters = req;
    result.hits = std::move(hits);
    result.statistics = stats;
    result.statistics.search_time_sec = seconds_since(started);
    result.source = backend.source();
    result.is_real_results = true;
    result.raw_output = std::move(raw.body);
    result.audit_text = std::move(raw.audit_text);
    result.request_id = raw.request_id;

    logger_.info("Search %s finished: %zu hit(s) in %.1f s", result.search_id.c_str(),
                 result.hits.size(), result.statistics.search_time_sec);
    ctx.notify("done", std::to_string(result.hits.size()) + " hit(s)");
    return true;
}

} // namespace blastbridge
