#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"

namespace blastbridge {

enum class SortKey { kBitScore, kEvalue, kIdentity, kCoverage, kLength };
enum class SortOrder { kDescending, kAscending };

// "bitscore" / "bit_score", "evalue", "identity", "coverage", "length".
bool parse_sort_key(const std::string& str, SortKey& key);
// "desc" / "descending", "asc" / "ascending".
bool parse_sort_order(const std::string& str, SortOrder& order);
const char* sort_key_name(SortKey key);

// Default ranking: bit score descending, ties by e-value ascending.
void sort_hits(std::vector<Hit>& hits);

// Order by one key; equal keys keep the default ranking.
void sort_hits(std::vector<Hit>& hits, SortKey key, SortOrder order);

struct HitFilter {
    double max_evalue = -1.0;     // < 0 = no limit
    double min_identity = 0.0;    // percent
    std::string organism;         // exact (case-insensitive); empty = any
};

std::vector<Hit> filter_hits(const std::vector<Hit>& hits, const HitFilter& filter);

// Distinct non-empty organisms, sorted.
std::vector<std::string> unique_organisms(const std::vector<Hit>& hits);

// Organism from a trailing "[Genus species]" in a description, or "".
std::string extract_organism(const std::string& description);

} // namespace blastbridge
