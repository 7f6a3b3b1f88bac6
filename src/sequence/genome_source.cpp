#include "sequence/genome_source.hpp"

#include <cstdlib>

#include "io/fasta_reader.hpp"

namespace blastbridge {

bool FastaGenomeSource::load(const std::string& path, SearchError& err) {
    std::vector<FastaRecord> records;
    if (!read_fasta(path, records)) {
        err.set(ErrorCode::kIo, "cannot read genome file " + path);
        return false;
    }
    if (records.empty()) {
        err.set(ErrorCode::kValidation, "no sequences in genome file " + path);
        return false;
    }
    for (auto& r : records) add(r.id, r.sequence);
    return true;
}

void FastaGenomeSource::add(const std::string& chromosome, const std::string& sequence) {
    if (sequences_.count(chromosome) == 0) order_.push_back(chromosome);
    sequences_[chromosome] = sequence;
}

std::vector<std::string> FastaGenomeSource::chromosomes() const {
    return order_;
}

std::string FastaGenomeSource::get_sequence(const std::string& chromosome,
                                            uint64_t start, uint64_t end) const {
    auto it = sequences_.find(chromosome);
    if (it == sequences_.end() || start == 0 || end < start) return {};
    const std::string& seq = it->second;
    if (start > seq.size()) return {};
    if (end > seq.size()) end = seq.size();
    return seq.substr(start - 1, end - start + 1);
}

uint64_t FastaGenomeSource::chromosome_length(const std::string& chromosome) const {
    auto it = sequences_.find(chromosome);
    return it == sequences_.end() ? 0 : it->second.size();
}

static bool parse_position(const std::string& s, uint64_t& v) {
    std::string digits;
    for (char c : s) {
        if (c == ',') continue;
        if (c < '0' || c > '9') return false;
        digits += c;
    }
    if (digits.empty()) return false;
    v = std::strtoull(digits.c_str(), nullptr, 10);
    return true;
}

bool parse_region(const std::string& text, std::string& chromosome,
                  uint64_t& start, uint64_t& end) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;
    auto dash = text.find('-', colon);
    if (dash == std::string::npos) return false;
    chromosome = text.substr(0, colon);
    return parse_position(text.substr(colon + 1, dash - colon - 1), start) &&
           parse_position(text.substr(dash + 1), end) && start > 0 && end >= start;
}

bool query_from_region(const GenomeSource& genome, const std::string& chromosome,
                       uint64_t start, uint64_t end, std::string& query,
                       SearchError& err) {
    if (start == 0 || end < start) {
        err.set(ErrorCode::kValidation,
                "Invalid region " + chromosome + ":" + std::to_string(start) +
                "-" + std::to_string(end));
        return false;
    }

    uint64_t len = genome.chromosome_length(chromosome);
    if (len == 0) {
        err.set(ErrorCode::kValidation, "Unknown chromosome: " + chromosome);
        return false;
    }
    if (end > len) end = len;

    std::string seq = genome.get_sequence(chromosome, start, end);
    if (seq.empty()) {
        err.set(ErrorCode::kValidation,
                "No sequence available for " + chromosome + ":" +
                std::to_string(start) + "-" + std::to_string(end));
        return false;
    }

    query = ">" + chromosome + ":" + std::to_string(start) + "-" +
            std::to_string(end) + "\n" + seq + "\n";
    return true;
}

} // namespace blastbridge
