#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"

namespace blastbridge {

struct TabularParseInfo {
    size_t lines = 0;     // data lines seen (comments and blanks excluded)
    size_t skipped = 0;   // data lines rejected
};

// Parse "-outfmt 6" output in TABULAR_OUTFMT column order. Columns 1-12
// (qseqid .. bitscore) are required; stitle, qseq, sseq, qcovhsp, slen
// and score are used when present. '#' and blank lines are ignored.
// A line that is short or has a bad number is skipped. Further lines for
// an already seen subject become hsps of that hit. Hits come back in the
// default ranking (bit score desc, e-value asc).
//
// Fails with kParse only if there were data lines and none was usable.
bool parse_tabular(const std::string& body, uint32_t query_length, bool protein,
                   std::vector<Hit>& hits, SearchError& err,
                   TabularParseInfo* info = nullptr);

} // namespace blastbridge
