#pragma once

#include <string>

#include "core/error.hpp"
#include "core/types.hpp"

namespace blastbridge {

// Strip FASTA header lines ('>' to end of line), drop everything that is
// not a residue letter or '*', and upper-case the rest.
std::string clean_sequence(const std::string& raw);

// Classify a cleaned sequence.
//   any of E F I L P Q Z          -> Protein
//   only nucleotide/IUPAC codes   -> DNA if >85% A/C/G/T, else DNA-ambiguous
//   otherwise                     -> Unknown
SequenceType detect_sequence_type(const std::string& sequence);

// Clean, type and length-check raw query text.
// Fails with kValidation when fewer than MIN_QUERY_LENGTH residues remain.
bool validate_query(const std::string& raw, SequenceQuery& query,
                    SearchError& err);

// Reject program / sequence type combinations BLAST cannot run:
// blastp needs a protein query; blastn, blastx and tblastn refuse one.
bool check_program_compatibility(BlastProgram program, SequenceType type,
                                 SearchError& err);

// Check request parameters that do not depend on the sequence.
bool validate_request_parameters(const SearchRequest& req, SearchError& err);

// First QUERY_PREVIEW_LENGTH residues, with "..." appended when truncated.
std::string query_preview(const std::string& sequence);

// Translate a nucleotide sequence in the three forward frames with the
// standard codon table and return the longest stretch without a stop codon.
// Unknown codons translate to 'X'. Returns "XXXX" if nothing translates.
std::string translate_longest_orf(const std::string& nucleotides);

} // namespace blastbridge
