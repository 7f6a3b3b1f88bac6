#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"

namespace blastbridge {

// Parse a BLAST XML report (NCBI FORMAT_TYPE=XML, or blast -outfmt 5).
// Only the first Iteration (the single query) is read. For each Hit the
// first Hsp becomes the primary alignment and the remaining ones go to
// hsps. Statistics_* values and BlastOutput_db fill stats.
//
// A well-formed report without hits yields an empty list. A document
// that is not XML, or whose root is not BlastOutput, fails with kParse.
bool parse_blast_xml(const std::string& body, uint32_t query_length, bool protein,
                     std::vector<Hit>& hits, Statistics& stats, SearchError& err);

} // namespace blastbridge
