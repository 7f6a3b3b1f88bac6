#include "parse/tabular_parser.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "core/config.hpp"
#include "parse/hit_sort.hpp"
#include "parse/match_line.hpp"

namespace blastbridge {

namespace {

enum Column {
    kQseqid = 0, kSseqid, kPident, kLength, kMismatch, kGapopen,
    kQstart, kQend, kSstart, kSend, kEvalue, kBitscore,
    kStitle, kQseq, kSseq, kQcovhsp, kSlen, kScore,
};

// One parsed line: the subject and its alignment.
struct TabularRow {
    std::string subject_id;
    std::string title;
    uint32_t subject_length = 0;
    double query_coverage = -1.0;  // qcovhsp, negative when absent
    Hsp hsp;
};

} // namespace

// Split a string by tab delimiter
static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string::size_type start = 0;
    while (true) {
        auto pos = line.find('\t', start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

static const std::string& field(const std::vector<std::string>& f, size_t i) {
    static const std::string empty;
    return i < f.size() ? f[i] : empty;
}

static uint32_t to_u32(const std::string& s) {
    return static_cast<uint32_t>(std::stoul(s));
}

static bool parse_row(const std::vector<std::string>& f, bool protein, TabularRow& row) {
    try {
        row.subject_id = f[kSseqid];
        if (row.subject_id.empty()) return false;

        Hsp& h = row.hsp;
        double pident = std::stod(f[kPident]);
        h.alignment_length = to_u32(f[kLength]);
        h.mismatch_count = to_u32(f[kMismatch]);
        uint32_t gap_opens = to_u32(f[kGapopen]);
        uint32_t qstart = to_u32(f[kQstart]);
        uint32_t qend = to_u32(f[kQend]);
        h.query_range.from = std::min(qstart, qend);
        h.query_range.to = std::max(qstart, qend);
        h.hit_range.from = to_u32(f[kSstart]);
        h.hit_range.to = to_u32(f[kSend]);
        h.evalue = std::stod(f[kEvalue]);
        h.bit_score = std::stod(f[kBitscore]);

        row.title = field(f, kStitle);
        if (!field(f, kSlen).empty()) row.subject_length = to_u32(f[kSlen]);
        if (!field(f, kScore).empty()) h.raw_score = std::stod(f[kScore]);
        if (!field(f, kQcovhsp).empty()) row.query_coverage = std::stod(f[kQcovhsp]);

        const std::string& qseq = field(f, kQseq);
        const std::string& sseq = field(f, kSseq);
        if (!qseq.empty() && !sseq.empty()) {
            AlignmentCounts c = count_alignment(qseq, sseq);
            h.identity_count = c.identities;
            h.gap_count = c.gaps;
            h.alignment.query = qseq;
            h.alignment.subject = sseq;
            h.alignment.match_line = compute_match_line(qseq, sseq, protein);
        } else {
            h.identity_count = static_cast<uint32_t>(
                std::lround(h.alignment_length * pident / 100.0));
            h.gap_count = gap_opens;
        }
        h.identity_count = std::min(h.identity_count, h.alignment_length);
    } catch (const std::exception&) {
        return false;
    }

    if (row.subject_length == 0) {
        row.subject_length = std::max(row.hsp.hit_range.from, row.hsp.hit_range.to);
    }
    return true;
}

// BLAST's own qcovhsp wins over the length-derived coverage when reported.
static void fill_hit_from_hsp(Hit& hit, const Hsp& h, double query_coverage,
                              uint32_t query_length) {
    hit.evalue = h.evalue;
    hit.bit_score = h.bit_score;
    hit.raw_score = h.raw_score;
    hit.identity_count = h.identity_count;
    hit.alignment_length = h.alignment_length;
    hit.gap_count = h.gap_count;
    hit.mismatch_count = h.mismatch_count;
    hit.query_range = h.query_range;
    hit.hit_range = h.hit_range;
    hit.alignment = h.alignment;
    hit.identity_percent = h.alignment_length > 0
        ? 100.0 * h.identity_count / h.alignment_length : 0.0;
    if (query_coverage >= 0.0) {
        hit.coverage_percent = std::min(100.0, query_coverage);
    } else {
        hit.coverage_percent = query_length > 0
            ? std::min(100.0, 100.0 * h.alignment_length / query_length) : 0.0;
    }
}

bool parse_tabular(const std::string& body, uint32_t query_length, bool protein,
                   std::vector<Hit>& hits, SearchError& err, TabularParseInfo* info) {
    hits.clear();
    TabularParseInfo local;
    std::unordered_map<std::string, size_t> index;

    std::istringstream iss(body);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        local.lines++;

        auto fields = split_tabs(line);
        TabularRow row;
        if (fields.size() < TABULAR_MIN_COLUMNS || !parse_row(fields, protein, row)) {
            local.skipped++;
            continue;
        }

        auto it = index.find(row.subject_id);
        if (it != index.end()) {
            hits[it->second].hsps.push_back(std::move(row.hsp));
            continue;
        }

        Hit hit;
        hit.accession = row.subject_id;
        hit.description = row.title.empty() ? row.subject_id : row.title;
        hit.organism = extract_organism(hit.description);
        hit.subject_length = row.subject_length;
        fill_hit_from_hsp(hit, row.hsp, row.query_coverage, query_length);
        index[row.subject_id] = hits.size();
        hits.push_back(std::move(hit));
    }

    if (info) *info = local;
    if (local.lines > 0 && hits.empty()) {
        err.set(ErrorCode::kParse, "no usable lines in tabular output (" +
                std::to_string(local.skipped) + " rejected)");
        return false;
    }

    for (auto& hit : hits) {
        std::stable_sort(hit.hsps.begin(), hit.hsps.end(), [](const Hsp& a, const Hsp& b) {
            if (a.bit_score != b.bit_score) return a.bit_score > b.bit_score;
            return a.evalue < b.evalue;
        });
    }
    sort_hits(hits);
    return true;
}

} // namespace blastbridge
