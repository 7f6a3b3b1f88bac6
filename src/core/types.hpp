#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace blastbridge {

enum class SequenceType { kDna, kDnaAmbiguous, kProtein, kUnknown };

enum class BlastProgram { kBlastn, kBlastp, kBlastx, kTblastn };

enum class ServiceKind { kLocal, kRemote };

enum class MolType { kNucleotide, kProtein };

enum class DbStatus { kCreating, kReady, kError };

enum class ResultSource { kLocal, kRemote, kFallback };

// Cleaned, typed query. Built only by validate_query().
struct SequenceQuery {
    std::string sequence;
    SequenceType type = SequenceType::kUnknown;
    uint32_t length = 0;
};

struct SearchRequest {
    std::string query;             // raw query text (FASTA or bare residues)
    BlastProgram program = BlastProgram::kBlastn;
    ServiceKind service = ServiceKind::kLocal;
    std::string database;          // record id, record name, or database path/name
    double evalue = 10.0;
    uint32_t max_targets = 50;

    // Advanced parameters. 0 / empty = program default.
    uint32_t word_size = 0;
    std::string matrix;
    int gap_open = 0;
    int gap_extend = 0;
    bool low_complexity = true;
};

struct Range {
    uint32_t from = 0;
    uint32_t to = 0;
};

struct Alignment {
    std::string query;
    std::string subject;
    std::string match_line;
};

// One local alignment between the query and a subject.
struct Hsp {
    double bit_score = 0.0;
    double raw_score = 0.0;
    double evalue = 0.0;
    uint32_t identity_count = 0;
    uint32_t alignment_length = 0;
    uint32_t gap_count = 0;
    uint32_t mismatch_count = 0;
    Range query_range;
    Range hit_range;
    Alignment alignment;
};

struct Hit {
    std::string accession;
    std::string description;
    std::string organism;          // empty when unknown
    uint32_t subject_length = 0;
    double evalue = 0.0;
    double bit_score = 0.0;
    double raw_score = 0.0;
    double identity_percent = 0.0;
    uint32_t identity_count = 0;
    double coverage_percent = 0.0;
    uint32_t alignment_length = 0;
    uint32_t gap_count = 0;
    uint32_t mismatch_count = 0;
    Range query_range;
    Range hit_range;
    Alignment alignment;
    std::vector<Hsp> hsps;         // secondary alignments, best first
};

struct Statistics {
    std::string database;
    uint64_t db_sequences = 0;
    uint64_t db_letters = 0;
    double search_time_sec = 0.0;
    double effective_search_space = 0.0;
    double kappa = 0.0;
    double lambda = 0.0;
    double entropy = 0.0;
};

struct QueryInfo {
    std::string preview;
    uint32_t length = 0;
    SequenceType type = SequenceType::kUnknown;
};

struct SearchResult {
    std::string search_id;
    QueryInfo query_info;
    SearchRequest parameters;
    std::vector<Hit> hits;
    Statistics statistics;
    ResultSource source = ResultSource::kLocal;
    bool is_real_results = true;
    std::string error_message;     // set only for fallback results
    std::string raw_output;
    std::string audit_text;        // remote human-readable copy, may be empty
    std::string request_id;        // remote job token, may be empty
};

struct DatabaseRecord {
    std::string id;
    std::string name;
    MolType mol_type = MolType::kNucleotide;
    DbStatus status = DbStatus::kCreating;
    std::string directory;
    std::string db_path;           // directory + base name, no extension
    uint64_t sequence_count = 0;
    uint64_t letter_count = 0;
    std::string source_file;
    std::string created_at;        // ISO-8601 UTC
    std::string last_validated;    // ISO-8601 UTC, empty = never
    bool discovered = false;       // found on disk, not a registry record
};

const char* sequence_type_name(SequenceType t);
const char* program_name(BlastProgram p);
const char* service_name(ServiceKind s);
const char* mol_type_name(MolType m);       // "nucleotide" / "protein"
const char* mol_type_dbtype(MolType m);     // "nucl" / "prot"
const char* db_status_name(DbStatus s);
const char* result_source_name(ResultSource s);

bool parse_program(const std::string& str, BlastProgram& out);
bool parse_service(const std::string& str, ServiceKind& out);
bool parse_mol_type(const std::string& str, MolType& out);
bool parse_db_status(const std::string& str, DbStatus& out);

// Database molecule type searched by a program.
MolType database_mol_type(BlastProgram p);

// True if the program scores with a substitution matrix.
bool is_protein_scoring(BlastProgram p);

// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string iso_timestamp_now();

// Milliseconds since the epoch.
uint64_t epoch_millis();

} // namespace blastbridge
