#include "core/types.hpp"

#include <chrono>
#include <ctime>

namespace blastbridge {

const char* sequence_type_name(SequenceType t) {
    switch (t) {
    case SequenceType::kDna:          return "DNA";
    case SequenceType::kDnaAmbiguous: return "DNA/RNA (with ambiguous bases)";
    case SequenceType::kProtein:      return "Protein";
    case SequenceType::kUnknown:      return "Unknown";
    }
    return "Unknown";
}

const char* program_name(BlastProgram p) {
    switch (p) {
    case BlastProgram::kBlastn:  return "blastn";
    case BlastProgram::kBlastp:  return "blastp";
    case BlastProgram::kBlastx:  return "blastx";
    case BlastProgram::kTblastn: return "tblastn";
    }
    return "blastn";
}

const char* service_name(ServiceKind s) {
    return (s == ServiceKind::kRemote) ? "remote" : "local";
}

const char* mol_type_name(MolType m) {
    return (m == MolType::kProtein) ? "protein" : "nucleotide";
}

const char* mol_type_dbtype(MolType m) {
    return (m == MolType::kProtein) ? "prot" : "nucl";
}

const char* db_status_name(DbStatus s) {
    switch (s) {
    case DbStatus::kCreating: return "creating";
    case DbStatus::kReady:    return "ready";
    case DbStatus::kError:    return "error";
    }
    return "error";
}

const char* result_source_name(ResultSource s) {
    switch (s) {
    case ResultSource::kLocal:    return "Local";
    case ResultSource::kRemote:   return "Remote";
    case ResultSource::kFallback: return "Fallback";
    }
    return "Fallback";
}

bool parse_program(const std::string& str, BlastProgram& out) {
    if (str == "blastn")  { out = BlastProgram::kBlastn;  return true; }
    if (str == "blastp")  { out = BlastProgram::kBlastp;  return true; }
    if (str == "blastx")  { out = BlastProgram::kBlastx;  return true; }
    if (str == "tblastn") { out = BlastProgram::kTblastn; return true; }
    return false;
}

bool parse_service(const std::string& str, ServiceKind& out) {
    if (str == "local") { out = ServiceKind::kLocal; return true; }
    // "ncbi" is accepted as an alias
    if (str == "remote" || str == "ncbi") { out = ServiceKind::kRemote; return true; }
    return false;
}

bool parse_mol_type(const std::string& str, MolType& out) {
    if (str == "nucl" || str == "nucleotide") { out = MolType::kNucleotide; return true; }
    if (str == "prot" || str == "protein")    { out = MolType::kProtein;    return true; }
    return false;
}

bool parse_db_status(const std::string& str, DbStatus& out) {
    if (str == "creating") { out = DbStatus::kCreating; return true; }
    if (str == "ready")    { out = DbStatus::kReady;    return true; }
    if (str == "error")    { out = DbStatus::kError;    return true; }
    return false;
}

MolType database_mol_type(BlastProgram p) {
    // blastx: translated nucleotide query vs protein db
    // tblastn: protein query vs translated nucleotide db
    switch (p) {
    case BlastProgram::kBlastp:
    case BlastProgram::kBlastx:
        return MolType::kProtein;
    case BlastProgram::kBlastn:
    case BlastProgram::kTblastn:
        return MolType::kNucleotide;
    }
    return MolType::kNucleotide;
}

bool is_protein_scoring(BlastProgram p) {
    return p != BlastProgram::kBlastn;
}

std::string iso_timestamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

uint64_t epoch_millis() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace blastbridge
