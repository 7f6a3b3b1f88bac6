#include "exec/blast_tools.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <regex>
#include <sstream>

namespace blastbridge {

std::string blast_tool_path(const std::string& bin_dir, const std::string& name) {
    if (bin_dir.empty()) return name;
    if (bin_dir.back() == '/') return bin_dir + name;
    return bin_dir + "/" + name;
}

static bool contains_any(const std::string& haystack,
                         std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

static std::string trim_diagnostic(const std::string& s) {
    size_t e = s.size();
    while (e > 0 && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(0, e);
}

void classify_process_failure(const std::string& program, const ProcessResult& result,
                              SearchError& err) {
    std::string diag = trim_diagnostic(result.err);

    if (result.exec_failed || (result.exited && result.exit_code == 127)) {
        std::string msg = program + " could not be executed";
        if (result.exec_failed) msg += std::string(": ") + std::strerror(result.exec_errno);
        msg += ". Is BLAST+ installed and on PATH?";
        err.set(ErrorCode::kMissingExecutable, msg);
        return;
    }

    std::string status;
    if (result.exited) {
        status = "exit code " + std::to_string(result.exit_code);
    } else {
        status = "killed by signal " + std::to_string(result.term_signal);
    }
    std::string msg = program + " failed (" + status + ")";
    if (!diag.empty()) msg += ": " + diag;

    if (contains_any(result.err, {"BLAST Database error", "No alias or index file found",
                                  "Could not find volume", "Database memory map file error",
                                  "is corrupt", "database is corrupted",
                                  "Error reading"})) {
        err.set(ErrorCode::kCorruptDatabase, msg);
    } else if (contains_any(result.err, {"BLAST query/options error", "FASTA-format",
                                         "Argument \"", "Invalid", "invalid",
                                         "Unknown argument", "Sequence contains no data",
                                         "Too many arguments"})) {
        err.set(ErrorCode::kMalformedInput, msg);
    } else {
        err.set(ErrorCode::kProcessFailed, msg);
    }
}

const std::vector<std::string>& required_db_extensions(MolType mol_type) {
    static const std::vector<std::string> nucl = {".nhr", ".nin", ".nsq"};
    static const std::vector<std::string> prot = {".phr", ".pin", ".psq"};
    return (mol_type == MolType::kProtein) ? prot : nucl;
}

const std::vector<std::string>& all_db_extensions(MolType mol_type) {
    static const std::vector<std::string> nucl = {
        ".nhr", ".nin", ".nsq", ".ndb", ".not", ".ntf", ".nto", ".nos",
        ".nog", ".nsd", ".nsi", ".njs", ".nal", ".nhd", ".nhi", ".nnd", ".nni"};
    static const std::vector<std::string> prot = {
        ".phr", ".pin", ".psq", ".pdb", ".pot", ".ptf", ".pto", ".pos",
        ".pog", ".psd", ".psi", ".pjs", ".pal", ".phd", ".phi", ".pnd", ".pni"};
    return (mol_type == MolType::kProtein) ? prot : nucl;
}

bool database_files_exist(const std::string& db_path, MolType mol_type) {
    if (db_path.empty()) return false;
    std::error_code ec;

    bool all = true;
    for (const auto& ext : required_db_extensions(mol_type)) {
        if (!std::filesystem::exists(db_path + ext, ec)) {
            all = false;
            break;
        }
    }
    if (all) return true;

    // Multi-volume databases are reached through an alias file.
    const char* alias = (mol_type == MolType::kProtein) ? ".pal" : ".nal";
    return std::filesystem::exists(db_path + alias, ec);
}

size_t remove_database_files(const std::string& db_path, MolType mol_type) {
    size_t removed = 0;
    std::error_code ec;
    for (const auto& ext : all_db_extensions(mol_type)) {
        if (std::filesystem::remove(db_path + ext, ec)) removed++;
    }
    return removed;
}

static uint64_t parse_grouped_number(const std::string& s) {
    uint64_t v = 0;
    for (char c : s) {
        if (c >= '0' && c <= '9') v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    return v;
}

bool parse_blastdb_info(const std::string& text, BlastDbInfo& info) {
    info = BlastDbInfo{};
    static const std::regex summary_re(
        R"(([\d,]+)\s+sequences;\s+([\d,]+)\s+total\s+(letters|bases|residues))");
    static const std::regex seqs_re(R"(Number of sequences:\s*([\d,]+))");
    static const std::regex letters_re(R"(Number of letters:\s*([\d,]+))");

    bool found = false;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::smatch m;
        if (line.compare(0, 9, "Database:") == 0 && info.title.empty()) {
            size_t p = 9;
            while (p < line.size() && line[p] == ' ') p++;
            info.title = line.substr(p);
        } else if (std::regex_search(line, m, summary_re)) {
            info.sequences = parse_grouped_number(m[1].str());
            info.letters = parse_grouped_number(m[2].str());
            found = true;
        } else if (std::regex_search(line, m, seqs_re)) {
            info.sequences = parse_grouped_number(m[1].str());
            found = true;
        } else if (std::regex_search(line, m, letters_re)) {
            info.letters = parse_grouped_number(m[1].str());
        }
    }
    return found;
}

std::vector<BlastDbListEntry> parse_blastdb_list(const std::string& text) {
    std::vector<BlastDbListEntry> out;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto sp = line.find_last_of(" \t");
        if (sp == std::string::npos || sp == 0) continue;

        std::string type = line.substr(sp + 1);
        std::string path = line.substr(0, sp);
        while (!path.empty() && std::isspace(static_cast<unsigned char>(path.back())))
            path.pop_back();
        if (path.empty()) continue;

        for (auto& c : type)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        BlastDbListEntry e;
        e.path = path;
        if (type == "nucleotide") {
            e.mol_type = MolType::kNucleotide;
        } else if (type == "protein") {
            e.mol_type = MolType::kProtein;
        } else {
            continue;
        }
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace blastbridge
