#pragma once

#include <cstddef>
#include <cstdint>

namespace blastbridge {

// Query validation
inline constexpr uint32_t MIN_QUERY_LENGTH = 10;
inline constexpr uint32_t QUERY_PREVIEW_LENGTH = 100;

// Fraction of unambiguous A/C/G/T above which a nucleotide query is plain DNA
inline constexpr double DNA_UNAMBIGUOUS_RATIO = 0.85;

// Search defaults
inline constexpr double DEFAULT_EVALUE = 10.0;
inline constexpr uint32_t DEFAULT_MAX_TARGETS = 50;
inline constexpr uint32_t DEFAULT_BLASTN_WORD_SIZE = 11;
inline constexpr const char* DEFAULT_MATRIX = "BLOSUM62";
inline constexpr int DEFAULT_GAP_OPEN = 11;
inline constexpr int DEFAULT_GAP_EXTEND = 1;

// Remote job protocol
inline constexpr const char* NCBI_BLAST_URL = "https://blast.ncbi.nlm.nih.gov/blast/Blast.cgi";
inline constexpr uint32_t REMOTE_POLL_INTERVAL_MS = 5000;
inline constexpr uint32_t REMOTE_MAX_POLL_ATTEMPTS = 60;
inline constexpr uint32_t REMOTE_MAX_WAIT_SEC = 330;
inline constexpr uint32_t REMOTE_HTTP_TIMEOUT_SEC = 60;
inline constexpr uint32_t REMOTE_HTTP_RETRIES = 3;

// Tabular output: columns through bitscore are required, the rest optional
inline constexpr const char* TABULAR_OUTFMT =
    "6 qseqid sseqid pident length mismatch gapopen qstart qend sstart send "
    "evalue bitscore stitle qseq sseq qcovhsp slen score";
inline constexpr size_t TABULAR_MIN_COLUMNS = 12;

// FASTA precheck: number of leading lines inspected
inline constexpr size_t FASTA_CHECK_LINES = 100;

// Score model constants reported by synthetic results
inline constexpr double FALLBACK_KAPPA = 0.041;
inline constexpr double FALLBACK_LAMBDA = 0.267;
inline constexpr double FALLBACK_ENTROPY = 0.14;
inline constexpr uint32_t FALLBACK_MIN_HITS = 5;
inline constexpr uint32_t FALLBACK_MAX_HITS = 19;

} // namespace blastbridge
