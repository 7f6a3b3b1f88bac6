#pragma once

#include <cstdint>
#include <string>

#include "core/error.hpp"
#include "core/types.hpp"

namespace blastbridge {

struct FastaCheckInfo {
    uint64_t size_bytes = 0;
    uint64_t record_count = 0;   // '>' lines in the whole file
    std::string first_header;
};

// Preconditions checked before a source file is handed to makeblastdb:
// the file exists and is non-empty, its first non-blank line starts with
// '>', and a sequence line follows within the first FASTA_CHECK_LINES lines.
// Missing/empty files fail with kValidation; GenBank/EMBL flat files and
// other non-FASTA text fail with kUnsupportedFormat.
bool check_fasta_source(const std::string& path, MolType mol_type,
                        FastaCheckInfo& info, SearchError& err);

} // namespace blastbridge
