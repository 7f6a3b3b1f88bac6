#include "parse/hit_sort.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace blastbridge {

static std::string lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool parse_sort_key(const std::string& str, SortKey& key) {
    std::string s = lower(str);
    if (s == "bitscore" || s == "bit_score" || s == "bits") {
        key = SortKey::kBitScore;
    } else if (s == "evalue") {
        key = SortKey::kEvalue;
    } else if (s == "identity") {
        key = SortKey::kIdentity;
    } else if (s == "coverage") {
        key = SortKey::kCoverage;
    } else if (s == "length") {
        key = SortKey::kLength;
    } else {
        return false;
    }
    return true;
}

bool parse_sort_order(const std::string& str, SortOrder& order) {
    std::string s = lower(str);
    if (s == "desc" || s == "descending") {
        order = SortOrder::kDescending;
    } else if (s == "asc" || s == "ascending") {
        order = SortOrder::kAscending;
    } else {
        return false;
    }
    return true;
}

const char* sort_key_name(SortKey key) {
    switch (key) {
    case SortKey::kBitScore: return "bitscore";
    case SortKey::kEvalue:   return "evalue";
    case SortKey::kIdentity: return "identity";
    case SortKey::kCoverage: return "coverage";
    case SortKey::kLength:   return "length";
    }
    return "?";
}

static bool default_less(const Hit& a, const Hit& b) {
    if (a.bit_score != b.bit_score) return a.bit_score > b.bit_score;
    return a.evalue < b.evalue;
}

void sort_hits(std::vector<Hit>& hits) {
    std::stable_sort(hits.begin(), hits.end(), default_less);
}

static double key_value(const Hit& h, SortKey key) {
    switch (key) {
    case SortKey::kBitScore: return h.bit_score;
    case SortKey::kEvalue:   return h.evalue;
    case SortKey::kIdentity: return h.identity_percent;
    case SortKey::kCoverage: return h.coverage_percent;
    case SortKey::kLength:   return static_cast<double>(h.alignment_length);
    }
    return 0.0;
}

void sort_hits(std::vector<Hit>& hits, SortKey key, SortOrder order) {
    std::stable_sort(hits.begin(), hits.end(), [key, order](const Hit& a, const Hit& b) {
        double va = key_value(a, key);
        double vb = key_value(b, key);
        if (va != vb) return order == SortOrder::kDescending ? va > vb : va < vb;
        return default_less(a, b);
    });
}

std::vector<Hit> filter_hits(const std::vector<Hit>& hits, const HitFilter& filter) {
    std::string organism = lower(filter.organism);
    std::vector<Hit> out;
    for (const auto& h : hits) {
        if (filter.max_evalue >= 0.0 && h.evalue > filter.max_evalue) continue;
        if (h.identity_percent < filter.min_identity) continue;
        if (!organism.empty() && lower(h.organism) != organism) continue;
        out.push_back(h);
    }
    return out;
}

std::vector<std::string> unique_organisms(const std::vector<Hit>& hits) {
    std::set<std::string> seen;
    for (const auto& h : hits) {
        if (!h.organism.empty()) seen.insert(h.organism);
    }
    return std::vector<std::string>(seen.begin(), seen.end());
}

std::string extract_organism(const std::string& description) {
    size_t end = description.find_last_not_of(" \t\r\n");
    if (end == std::string::npos || description[end] != ']') return {};
    size_t open = description.rfind('[', end);
    if (open == std::string::npos || open + 1 >= end) return {};
    return description.substr(open + 1, end - open - 1);
}

} // namespace blastbridge
