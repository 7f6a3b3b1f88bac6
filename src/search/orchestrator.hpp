#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "core/error.hpp"
#include "core/types.hpp"
#include "exec/search_backend.hpp"
#include "util/logger.hpp"

namespace blastbridge {

class DatabaseRegistry;

// Runs one search end to end:
//   validate -> resolve database -> backend pre-flight -> execute
//   -> parse -> rank, or a fallback result if execution or parsing fails.
//
// Returns false only for requests rejected before the backend runs
// (validation, unknown database, busy) and for cancellation. Every other
// outcome is a SearchResult, real or simulated.
class SearchOrchestrator {
public:
    // registry may be null (database references are then used as paths).
    SearchOrchestrator(DatabaseRegistry* registry, SearchBackend& local,
                       SearchBackend& remote, const Logger& logger);

    bool run(const SearchRequest& req, SearchResult& result, SearchError& err,
             ProgressObserver* observer = nullptr, const CancelToken* cancel = nullptr);

    // True while a search is in flight. A second run() meanwhile fails
    // with kDatabaseBusy.
    bool busy() const { return in_flight_.load(); }

private:
    DatabaseRegistry* registry_;
    SearchBackend& local_;
    SearchBackend& remote_;
    const Logger& logger_;
    std::atomic<bool> in_flight_{false};
    std::atomic<uint32_t> search_counter_{0};

    bool resolve_database(const SearchRequest& req, std::string& db_path,
                          Statistics& stats, SearchError& err) const;
    std::string next_search_id();
};

} // namespace blastbridge
