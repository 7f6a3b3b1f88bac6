#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace blastbridge {

struct FastaRecord {
    std::string id;       // first word after '>'
    std::string title;    // rest of the defline, may be empty
    std::string sequence; // concatenated sequence lines (uppercase)
};

// Read all records from an input stream. ';' comment lines are skipped.
std::vector<FastaRecord> read_fasta_stream(std::istream& in);

// Read all records from a FASTA file. path can be "-" for stdin.
// Returns false if the file cannot be opened.
bool read_fasta(const std::string& path, std::vector<FastaRecord>& records);

// Write one record with the sequence wrapped at line_width columns.
void write_fasta_record(std::ostream& out, const std::string& header,
                        const std::string& sequence, size_t line_width = 70);

} // namespace blastbridge
