#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/error.hpp"

namespace blastbridge {

// Read access to a loaded genome. Coordinates are 1-based inclusive.
class GenomeSource {
public:
    virtual ~GenomeSource() = default;

    virtual std::vector<std::string> chromosomes() const = 0;

    // Returns an empty string if the chromosome or range is unknown.
    virtual std::string get_sequence(const std::string& chromosome,
                                     uint64_t start, uint64_t end) const = 0;

    // Length of a chromosome, 0 if unknown.
    virtual uint64_t chromosome_length(const std::string& chromosome) const = 0;
};

// Genome held in memory, one chromosome per FASTA record (keyed by id).
class FastaGenomeSource : public GenomeSource {
public:
    // Returns false if the file cannot be read or has no records.
    bool load(const std::string& path, SearchError& err);
    void add(const std::string& chromosome, const std::string& sequence);

    std::vector<std::string> chromosomes() const override;
    std::string get_sequence(const std::string& chromosome,
                             uint64_t start, uint64_t end) const override;
    uint64_t chromosome_length(const std::string& chromosome) const override;

private:
    std::vector<std::string> order_;
    std::map<std::string, std::string> sequences_;
};

// Parse "chrom:start-end" (1-based, inclusive; commas allowed in numbers).
bool parse_region(const std::string& text, std::string& chromosome,
                  uint64_t& start, uint64_t& end);

// Raw query text (FASTA with a "chrom:start-end" header) for a region.
bool query_from_region(const GenomeSource& genome, const std::string& chromosome,
                       uint64_t start, uint64_t end, std::string& query,
                       SearchError& err);

} // namespace blastbridge
