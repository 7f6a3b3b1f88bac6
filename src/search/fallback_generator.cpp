#include "search/fallback_generator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <random>
#include <vector>

#include "core/config.hpp"
#include "parse/hit_sort.hpp"
#include "parse/match_line.hpp"
#include "sequence/sequence_validator.hpp"

namespace blastbridge {

// Database size assumed by the e-value model.
static constexpr double kModelDbLetters = 1e6;

uint64_t fallback_seed(const std::string& sequence, const std::string& database) {
    uint64_t h = 1469598103934665603ULL;
    auto mix = [&h](const std::string& s) {
        for (unsigned char c : s) {
            h ^= c;
            h *= 1099511628211ULL;
        }
    };
    mix(sequence);
    h ^= 0xFF;
    h *= 1099511628211ULL;
    mix(database);
    return h;
}

static const std::vector<std::string>& organisms_for(const std::string& database) {
    static const std::vector<std::string> nucleotide = {
        "Escherichia coli", "Homo sapiens", "Mus musculus",
        "Saccharomyces cerevisiae", "Arabidopsis thaliana"};
    static const std::vector<std::string> protein = {
        "Escherichia coli str. K-12", "Homo sapiens", "Mus musculus",
        "Rattus norvegicus", "Drosophila melanogaster"};
    static const std::vector<std::string> structure = {
        "Homo sapiens", "Escherichia coli", "Thermus thermophilus",
        "Bacillus stearothermophilus"};
    if (database == "nr" || database == "swissprot" || database == "refseq_protein")
        return protein;
    if (database == "pdb") return structure;
    return nucleotide;
}

static std::string make_accession(const std::string& database, uint32_t serial,
                                  std::mt19937_64& rng) {
    char buf[32];
    unsigned version = static_cast<unsigned>(rng() % 9) + 1;
    if (database == "nt" || database == "refseq_genomic") {
        std::snprintf(buf, sizeof(buf), "NC_%06u.%u", serial % 1000000, version);
    } else if (database == "refseq_rna") {
        std::snprintf(buf, sizeof(buf), "NM_%06u.%u", serial % 1000000, version);
    } else if (database == "nr" || database == "refseq_protein") {
        std::snprintf(buf, sizeof(buf), "XP_%06u.%u", serial % 1000000, version);
    } else if (database == "swissprot") {
        std::snprintf(buf, sizeof(buf), "P%05u", serial % 100000);
    } else {
        std::snprintf(buf, sizeof(buf), "SIM_%06u", serial % 1000000);
    }
    return buf;
}

// Copy of the aligned query with roughly (1 - identity) of the positions
// substituted.
static std::string mutate(const std::string& seq, double identity, bool protein,
                          std::mt19937_64& rng) {
    static const std::string nt = "ACGT";
    static const std::string aa = "ACDEFGHIKLMNPQRSTVWY";
    const std::string& alphabet = protein ? aa : nt;
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    std::string out = seq;
    for (auto& c : out) {
        if (coin(rng) < identity) continue;
        char r = c;
        while (r == c) r = alphabet[rng() % alphabet.size()];
        c = r;
    }
    return out;
}

SearchResult generate_fallback(const SearchRequest& req, const SequenceQuery& query,
                               const SearchError& cause) {
    std::mt19937_64 rng(fallback_seed(query.sequence, req.database));
    const bool protein = query.type == SequenceType::kProtein;
    const uint32_t m = std::max<uint32_t>(1, static_cast<uint32_t>(query.sequence.size()));

    SearchResult result;
    result.parameters = req;
    result.query_info.preview = query_preview(query.sequence);
    result.query_info.length = query.length;
    result.query_info.type = query.type;
    result.source = ResultSource::kFallback;
    result.is_real_results = false;
    result.error_message = std::string(error_code_name(cause.code)) + ": " +
                           (cause.message.empty() ? "search failed" : cause.message);
    result.raw_output = "# SIMULATED RESULTS - the search did not run.\n# " +
                        result.error_message + "\n";

    uint32_t span = FALLBACK_MAX_HITS - FALLBACK_MIN_HITS + 1;
    uint32_t count = FALLBACK_MIN_HITS + static_cast<uint32_t>(rng() % span);
    count = std::min(count, req.max_targets);

    const auto& organisms = organisms_for(req.database);
    std::uniform_real_distribution<double> jitter(-10.0, 10.0);

    for (uint32_t i = 0; i < count; i++) {
        Hit hit;
        hit.bit_score = std::max(50.0, 500.0 - i * 30.0 + jitter(rng));
        hit.bit_score = std::round(hit.bit_score * 10.0) / 10.0;
        hit.raw_score = std::round(hit.bit_score * 2.2);
        hit.evalue = FALLBACK_KAPPA * m * kModelDbLetters *
                     std::exp(-FALLBACK_LAMBDA * hit.bit_score);

        // Alignments shrink and diverge further down the list.
        uint32_t min_len = std::min<uint32_t>(m, 10);
        uint32_t len = std::max(min_len, m - std::min(m - min_len, i * (m / 20 + 1)));
        uint32_t qfrom = 1 + static_cast<uint32_t>(rng() % (m - len + 1));
        double identity = std::max(0.55, 0.99 - i * 0.025);

        hit.alignment.query = query.sequence.substr(qfrom - 1, len);
        hit.alignment.subject = mutate(hit.alignment.query, identity, protein, rng);
        hit.alignment.match_line =
            compute_match_line(hit.alignment.query, hit.alignment.subject, protein);
        AlignmentCounts c = count_alignment(hit.alignment.query, hit.alignment.subject);

        hit.alignment_length = c.length;
        hit.identity_count = c.identities;
        hit.mismatch_count = c.mismatches;
        hit.gap_count = c.gaps;
        hit.identity_percent = c.length > 0 ? 100.0 * c.identities / c.length : 0.0;
        hit.coverage_percent = 100.0 * c.length / m;
        hit.query_range.from = qfrom;
        hit.query_range.to = qfrom + len - 1;
        hit.hit_range.from = 1 + static_cast<uint32_t>(rng() % 5000);
        hit.hit_range.to = hit.hit_range.from + len - 1;
        hit.subject_length = hit.hit_range.to + static_cast<uint32_t>(rng() % 2000);

        hit.organism = organisms[rng() % organisms.size()];
        hit.accession = make_accession(req.database, static_cast<uint32_t>(rng() % 1000000), rng);
        hit.description = std::string("Simulated ") + (protein ? "protein" : "sequence") +
                          " similar to query, match " + std::to_string(i + 1) +
                          " [" + hit.organism + "]";
        result.hits.push_back(std::move(hit));
    }
    sort_hits(result.hits);

    result.statistics.database = req.database;
    result.statistics.effective_search_space = m * kModelDbLetters;
    result.statistics.kappa = FALLBACK_KAPPA;
    result.statistics.lambda = FALLBACK_LAMBDA;
    result.statistics.entropy = FALLBACK_ENTROPY;
    return result;
}

} // namespace blastbridge
