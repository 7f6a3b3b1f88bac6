#pragma once

#include <cstdint>
#include <string>

#include "core/error.hpp"
#include "core/types.hpp"

namespace blastbridge {

// FNV-1a over the query sequence and database reference.
uint64_t fallback_seed(const std::string& sequence, const std::string& database);

// Build a simulated result for a request whose backend failed.
// The result has source kFallback, is_real_results false and the cause in
// error_message. Hits obey the same invariants as parsed hits (identity
// count within the alignment length, ordered query range, exact match
// lines) and are ranked like real ones. The same request and database
// always give the same result.
SearchResult generate_fallback(const SearchRequest& req, const SequenceQuery& query,
                               const SearchError& cause);

} // namespace blastbridge
