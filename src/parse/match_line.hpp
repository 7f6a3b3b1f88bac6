#pragma once

#include <cstdint>
#include <string>

namespace blastbridge {

// True if two residues fall in the same similarity class:
// {A,G} {I,L,V} {F,W,Y} {K,R} {D,E} {Q,N} {S,T} {C,M}.
bool is_similar_residue(char a, char b);

// Column-by-column match line for two aligned strings:
//   gap in either row    ' '
//   identical residues   '|'
//   similar (protein)    '+'
//   otherwise            ' '
// The result is as long as the shorter row.
std::string compute_match_line(const std::string& query, const std::string& subject,
                               bool protein);

// Identity and gap columns of an alignment (same column rules as above).
struct AlignmentCounts {
    uint32_t identities = 0;
    uint32_t gaps = 0;
    uint32_t mismatches = 0;
    uint32_t length = 0;
};

AlignmentCounts count_alignment(const std::string& query, const std::string& subject);

} // namespace blastbridge
