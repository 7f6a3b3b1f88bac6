#include "registry/fasta_check.hpp"

#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>

#include "core/config.hpp"

namespace blastbridge {

static std::string trim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

static bool is_sequence_line(const std::string& line, MolType mol_type) {
    static const char* kNucleotide = "ACGTUNRYSWKMBDHV-";
    for (char c : line) {
        char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (mol_type == MolType::kNucleotide) {
            if (std::strchr(kNucleotide, u) == nullptr) return false;
        } else {
            if (!std::isalpha(static_cast<unsigned char>(u)) && u != '*' && u != '-')
                return false;
        }
    }
    return !line.empty();
}

static bool has_flat_file_marker(const std::string& line) {
    static const char* kMarkers[] = {"LOCUS", "ACCESSION", "VERSION", "FEATURES",
                                     "ORIGIN", "DEFINITION"};
    for (const char* m : kMarkers) {
        if (line.compare(0, std::strlen(m), m) == 0) return true;
    }
    // EMBL line codes
    return line.compare(0, 5, "ID   ") == 0 || line.compare(0, 5, "SQ   ") == 0;
}

bool check_fasta_source(const std::string& path, MolType mol_type,
                        FastaCheckInfo& info, SearchError& err) {
    info = FastaCheckInfo{};

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        err.set(ErrorCode::kValidation, "Source file not found: " + path);
        return false;
    }
    info.size_bytes = std::filesystem::file_size(path, ec);
    if (ec || info.size_bytes == 0) {
        err.set(ErrorCode::kValidation, "Source file is empty: " + path);
        return false;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        err.set(ErrorCode::kValidation, "Cannot read source file: " + path);
        return false;
    }

    std::string line;
    size_t inspected = 0;
    bool seen_first = false;
    bool has_sequence = false;

    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (!t.empty() && t[0] == '>') info.record_count++;
        if (inspected >= FASTA_CHECK_LINES) continue;
        if (t.empty()) continue;
        inspected++;

        if (!seen_first) {
            seen_first = true;
            if (t[0] != '>') {
                if (has_flat_file_marker(t)) {
                    err.set(ErrorCode::kUnsupportedFormat,
                            "File appears to be in GenBank/EMBL format, not FASTA: " + path);
                } else {
                    err.set(ErrorCode::kUnsupportedFormat,
                            "File does not appear to be in FASTA format "
                            "(first line should start with '>'): " + path);
                }
                return false;
            }
            info.first_header = t.substr(0, 80);
            continue;
        }

        if (t[0] == '>') continue;
        if (is_sequence_line(t, mol_type)) {
            has_sequence = true;
        } else if (has_flat_file_marker(t)) {
            err.set(ErrorCode::kUnsupportedFormat,
                    "File appears to be in GenBank/EMBL format, not FASTA: " + path);
            return false;
        }
    }

    if (!seen_first) {
        err.set(ErrorCode::kValidation, "Source file contains no content: " + path);
        return false;
    }
    if (!has_sequence) {
        err.set(ErrorCode::kUnsupportedFormat,
                std::string("File does not contain valid ") + mol_type_name(mol_type) +
                " sequence data: " + path);
        return false;
    }
    return true;
}

} // namespace blastbridge
