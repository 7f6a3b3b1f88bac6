#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"
#include "exec/process_runner.hpp"
#include "registry/config_store.hpp"
#include "sequence/genome_source.hpp"
#include "util/logger.hpp"

namespace blastbridge {

struct RegistryOptions {
    std::string db_dir;         // where new databases are built; empty = next to the source
    std::string blast_bin_dir;  // makeblastdb / blastdbcmd location; empty = PATH
};

// Catalog of local BLAST databases: custom records built through
// makeblastdb and persisted in a ConfigStore, plus databases discovered on
// disk. Record transitions:
//   create:  creating -> ready, or removed on any failure
//   update:  ready|error -> creating -> ready, or error on failure
//   remove / failed validation: record and files deleted
// A record in `creating` is not eligible for update or remove.
class DatabaseRegistry {
public:
    DatabaseRegistry(ConfigStore& store, ProcessRunner& runner,
                     const RegistryOptions& opts, const Logger& logger);

    // Read the store and run the validation pass. Records whose files
    // are gone, and records left in `creating` by an interrupted run, are
    // dropped. Only the first call validates.
    bool load(SearchError& err);

    bool create(const std::string& source_file, const std::string& name,
                MolType mol_type, DatabaseRecord& out, SearchError& err);

    // Write every chromosome of the genome to "<db_dir>/<name>.fasta"
    // (translated for protein databases) and build a database from it.
    bool create_from_genome(const GenomeSource& genome, const std::string& name,
                            MolType mol_type, DatabaseRecord& out, SearchError& err);

    bool remove(const std::string& id, SearchError& err);

    // Rebuild a record from its source file.
    bool update(const std::string& id, DatabaseRecord& out, SearchError& err);

    // True if the record's index files exist. A record that fails is
    // deleted; an unknown id is false.
    bool validate(const std::string& id);

    // Custom records followed by discovered databases, each sorted by name.
    std::vector<DatabaseRecord> list() const;

    // Look up a custom or discovered record by id, then by name.
    bool find(const std::string& ref, DatabaseRecord& out) const;

    // Database path for a reference: a record id or name maps to its
    // db_path; anything else is returned unchanged.
    std::string resolve_path(const std::string& ref) const;

    // List the BLAST databases in a directory (blastdbcmd -list).
    // Databases that are already custom records are not repeated.
    bool discover(const std::string& directory, std::vector<DatabaseRecord>& out,
                  SearchError& err);

    // Sequence and letter counts of a built database (blastdbcmd -info).
    bool query_stats(const std::string& db_path, uint64_t& sequences,
                     uint64_t& letters, SearchError& err);

private:
    ConfigStore& store_;
    ProcessRunner& runner_;
    RegistryOptions opts_;
    const Logger& logger_;

    mutable std::mutex mutex_;
    std::map<std::string, DatabaseRecord> records_;
    std::map<std::string, DatabaseRecord> discovered_;
    bool validated_ = false;

    bool run_tool(const std::string& tool, const std::vector<std::string>& args,
                  ProcessResult& result, SearchError& err);
    bool build(const DatabaseRecord& rec, SearchError& err);
    bool persist(const DatabaseRecord& rec, SearchError& err);
    void drop_record(const std::string& id);
    std::string allocate_id(const std::string& name) const;
};

// Lower-case name with every character outside [a-z0-9_-] replaced by '_'.
std::string sanitize_db_name(const std::string& name);

} // namespace blastbridge
