#include "sequence/sequence_validator.hpp"

#include <cctype>
#include <cstring>
#include <sstream>
#include <unordered_map>

#include "core/config.hpp"

namespace blastbridge {

std::string clean_sequence(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    std::istringstream iss(raw);
    std::string line;
    while (std::getline(iss, line)) {
        size_t p = 0;
        while (p < line.size() && std::isspace(static_cast<unsigned char>(line[p])))
            p++;
        if (p < line.size() && line[p] == '>') continue;

        for (char c : line) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isalpha(uc)) {
                out.push_back(static_cast<char>(std::toupper(uc)));
            } else if (c == '*') {
                out.push_back(c);
            }
        }
    }
    return out;
}

SequenceType detect_sequence_type(const std::string& sequence) {
    if (sequence.empty()) return SequenceType::kUnknown;

    static const char* kProteinOnly = "EFILPQZ";
    static const char* kNucleotide = "ACGTURYSWKMBDHVN";

    for (char c : sequence) {
        if (std::strchr(kProteinOnly, c) != nullptr) return SequenceType::kProtein;
    }

    size_t unambiguous = 0;
    for (char c : sequence) {
        if (std::strchr(kNucleotide, c) == nullptr) return SequenceType::kUnknown;
        if (c == 'A' || c == 'C' || c == 'G' || c == 'T' || c == 'U') unambiguous++;
    }

    double ratio = static_cast<double>(unambiguous) / static_cast<double>(sequence.size());
    return (ratio > DNA_UNAMBIGUOUS_RATIO) ? SequenceType::kDna
                                           : SequenceType::kDnaAmbiguous;
}

bool validate_query(const std::string& raw, SequenceQuery& query,
                    SearchError& err) {
    std::string cleaned = clean_sequence(raw);
    if (cleaned.size() < MIN_QUERY_LENGTH) {
        err.set(ErrorCode::kValidation,
                "Query sequence must be at least " + std::to_string(MIN_QUERY_LENGTH) +
                " characters long (got " + std::to_string(cleaned.size()) + ")");
        return false;
    }

    query.type = detect_sequence_type(cleaned);
    query.length = static_cast<uint32_t>(cleaned.size());
    query.sequence = std::move(cleaned);
    return true;
}

bool check_program_compatibility(BlastProgram program, SequenceType type,
                                 SearchError& err) {
    if (program == BlastProgram::kBlastp) {
        if (type != SequenceType::kProtein) {
            err.set(ErrorCode::kValidation,
                    std::string("BLASTP requires a protein sequence (detected ") +
                    sequence_type_name(type) + ")");
            return false;
        }
        return true;
    }

    if (type == SequenceType::kProtein) {
        std::string name = program_name(program);
        for (auto& c : name)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        err.set(ErrorCode::kValidation, name + " cannot be used with protein sequences");
        return false;
    }
    return true;
}

bool validate_request_parameters(const SearchRequest& req, SearchError& err) {
    if (req.database.empty()) {
        err.set(ErrorCode::kValidation, "Please select a database");
        return false;
    }
    if (!(req.evalue > 0.0)) {
        err.set(ErrorCode::kValidation, "E-value threshold must be positive");
        return false;
    }
    if (req.max_targets == 0) {
        err.set(ErrorCode::kValidation, "Maximum target sequences must be at least 1");
        return false;
    }
    if (req.gap_open < 0 || req.gap_extend < 0) {
        err.set(ErrorCode::kValidation, "Gap costs must not be negative");
        return false;
    }
    if (req.word_size != 0 && req.program == BlastProgram::kBlastn && req.word_size < 4) {
        err.set(ErrorCode::kValidation, "BLASTN word size must be at least 4");
        return false;
    }
    if (req.word_size != 0 && req.program != BlastProgram::kBlastn &&
        (req.word_size < 2 || req.word_size > 7)) {
        err.set(ErrorCode::kValidation, "Protein word size must be between 2 and 7");
        return false;
    }
    return true;
}

std::string query_preview(const std::string& sequence) {
    if (sequence.size() <= QUERY_PREVIEW_LENGTH) return sequence;
    return sequence.substr(0, QUERY_PREVIEW_LENGTH) + "...";
}

static const std::unordered_map<std::string, char>& codon_table() {
    static const std::unordered_map<std::string, char> table = {
        {"TTT", 'F'}, {"TTC", 'F'}, {"TTA", 'L'}, {"TTG", 'L'},
        {"TCT", 'S'}, {"TCC", 'S'}, {"TCA", 'S'}, {"TCG", 'S'},
        {"TAT", 'Y'}, {"TAC", 'Y'}, {"TAA", '*'}, {"TAG", '*'},
        {"TGT", 'C'}, {"TGC", 'C'}, {"TGA", '*'}, {"TGG", 'W'},
        {"CTT", 'L'}, {"CTC", 'L'}, {"CTA", 'L'}, {"CTG", 'L'},
        {"CCT", 'P'}, {"CCC", 'P'}, {"CCA", 'P'}, {"CCG", 'P'},
        {"CAT", 'H'}, {"CAC", 'H'}, {"CAA", 'Q'}, {"CAG", 'Q'},
        {"CGT", 'R'}, {"CGC", 'R'}, {"CGA", 'R'}, {"CGG", 'R'},
        {"ATT", 'I'}, {"ATC", 'I'}, {"ATA", 'I'}, {"ATG", 'M'},
        {"ACT", 'T'}, {"ACC", 'T'}, {"ACA", 'T'}, {"ACG", 'T'},
        {"AAT", 'N'}, {"AAC", 'N'}, {"AAA", 'K'}, {"AAG", 'K'},
        {"AGT", 'S'}, {"AGC", 'S'}, {"AGA", 'R'}, {"AGG", 'R'},
        {"GTT", 'V'}, {"GTC", 'V'}, {"GTA", 'V'}, {"GTG", 'V'},
        {"GCT", 'A'}, {"GCC", 'A'}, {"GCA", 'A'}, {"GCG", 'A'},
        {"GAT", 'D'}, {"GAC", 'D'}, {"GAA", 'E'}, {"GAG", 'E'},
        {"GGT", 'G'}, {"GGC", 'G'}, {"GGA", 'G'}, {"GGG", 'G'},
    };
    return table;
}

std::string translate_longest_orf(const std::string& nucleotides) {
    const auto& table = codon_table();

    std::string seq;
    seq.reserve(nucleotides.size());
    for (char c : nucleotides) {
        char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        seq.push_back(u == 'U' ? 'T' : u);
    }

    std::string longest;
    for (size_t frame = 0; frame < 3; frame++) {
        std::string orf;
        for (size_t i = frame; i + 2 < seq.size(); i += 3) {
            auto it = table.find(seq.substr(i, 3));
            char aa = (it != table.end()) ? it->second : 'X';
            if (aa == '*') {
                if (orf.size() > longest.size()) longest = orf;
                orf.clear();
            } else {
                orf.push_back(aa);
            }
        }
        if (orf.size() > longest.size()) longest = orf;
    }

    return longest.empty() ? std::string("XXXX") : longest;
}

} // namespace blastbridge
