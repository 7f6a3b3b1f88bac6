#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"
#include "exec/process_runner.hpp"

namespace blastbridge {

// Path of a BLAST+ program: bin_dir/name, or name alone (PATH lookup)
// when bin_dir is empty.
std::string blast_tool_path(const std::string& bin_dir, const std::string& name);

// Turn a failed run of a BLAST+ program into an error code:
//   could not exec / exit 127                     -> kMissingExecutable
//   database open/read errors on stderr           -> kCorruptDatabase
//   query/option/input format errors on stderr    -> kMalformedInput
//   anything else                                 -> kProcessFailed
// The message carries the captured diagnostic stream.
void classify_process_failure(const std::string& program, const ProcessResult& result,
                              SearchError& err);

// Index files that must exist for a database of this type (".nhr" ...).
const std::vector<std::string>& required_db_extensions(MolType mol_type);

// Every file extension makeblastdb may write for this type.
const std::vector<std::string>& all_db_extensions(MolType mol_type);

// True if the required index files (or a multi-volume alias file) exist
// for db_path.
bool database_files_exist(const std::string& db_path, MolType mol_type);

// Remove db_path.<ext> for every known extension. Missing files are
// skipped. Returns the number of files removed.
size_t remove_database_files(const std::string& db_path, MolType mol_type);

struct BlastDbInfo {
    std::string title;
    uint64_t sequences = 0;
    uint64_t letters = 0;
};

// Parse "blastdbcmd -info" output. Accepts both
//   "\t2 sequences; 80 total letters"  and
//   "Number of sequences: 2" / "Number of letters: 80".
// Returns false if no sequence count is found.
bool parse_blastdb_info(const std::string& text, BlastDbInfo& info);

struct BlastDbListEntry {
    std::string path;
    MolType mol_type = MolType::kNucleotide;
};

// Parse "blastdbcmd -list <dir> -list_outfmt '%f %p'" output:
// one "<path> <Nucleotide|Protein>" line per database.
std::vector<BlastDbListEntry> parse_blastdb_list(const std::string& text);

} // namespace blastbridge
