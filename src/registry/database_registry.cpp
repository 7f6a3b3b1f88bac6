#include "registry/database_registry.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include "exec/blast_tools.hpp"
#include "io/fasta_reader.hpp"
#include "registry/fasta_check.hpp"
#include "sequence/sequence_validator.hpp"

namespace blastbridge {

std::string sanitize_db_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '-') {
            out += static_cast<char>(std::tolower(uc));
        } else {
            out += '_';
        }
    }
    return out;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

DatabaseRegistry::DatabaseRegistry(ConfigStore& store, ProcessRunner& runner,
                                   const RegistryOptions& opts, const Logger& logger)
    : store_(store), runner_(runner), opts_(opts), logger_(logger) {}

bool DatabaseRegistry::load(SearchError& err) {
    std::vector<DatabaseRecord> all = store_.list_all();

    std::vector<DatabaseRecord> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
        for (auto& rec : all) {
            records_[rec.id] = rec;
        }
        if (validated_) return true;
        validated_ = true;

        for (auto it = records_.begin(); it != records_.end();) {
            const DatabaseRecord& rec = it->second;
            bool drop = false;
            if (rec.status == DbStatus::kCreating) {
                logger_.warn("Database '%s' (%s) was left unfinished; removing it",
                             rec.name.c_str(), rec.id.c_str());
                drop = true;
            } else if (rec.status == DbStatus::kReady &&
                       !database_files_exist(rec.db_path, rec.mol_type)) {
                logger_.warn("Database '%s' (%s): files missing at %s; removing record",
                             rec.name.c_str(), rec.id.c_str(), rec.db_path.c_str());
                drop = true;
            }
            if (drop) {
                stale.push_back(rec);
                it = records_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& rec : stale) {
        if (rec.status == DbStatus::kCreating) {
            remove_database_files(rec.db_path, rec.mol_type);
        }
        if (!store_.remove(rec.id, err)) {
            logger_.error("Cannot update registry: %s", err.message.c_str());
            return false;
        }
    }
    logger_.debug("Registry loaded: %zu database(s)", records_.size());
    return true;
}

std::string DatabaseRegistry::allocate_id(const std::string& name) const {
    std::string base = "custom_" + sanitize_db_name(name) + "_" +
                       std::to_string(epoch_millis());
    std::string id = base;
    for (int n = 2; records_.count(id) != 0; n++) {
        id = base + "_" + std::to_string(n);
    }
    return id;
}

bool DatabaseRegistry::persist(const DatabaseRecord& rec, SearchError& err) {
    if (!store_.set(rec.id, rec, err)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    records_[rec.id] = rec;
    return true;
}

void DatabaseRegistry::drop_record(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(id);
    }
    SearchError store_err;
    if (!store_.remove(id, store_err)) {
        logger_.error("Cannot remove registry entry %s: %s",
                      id.c_str(), store_err.message.c_str());
    }
}

bool DatabaseRegistry::run_tool(const std::string& tool,
                                const std::vector<std::string>& args,
                                ProcessResult& result, SearchError& err) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(blast_tool_path(opts_.blast_bin_dir, tool));
    argv.insert(argv.end(), args.begin(), args.end());
    logger_.debug("Running: %s", format_command_line(argv).c_str());

    std::string run_err;
    if (!runner_.run(argv, result, run_err)) {
        err.set(ErrorCode::kProcessFailed, tool + ": " + run_err);
        return false;
    }
    if (!result.success()) {
        classify_process_failure(tool, result, err);
        return false;
    }
    return true;
}

bool DatabaseRegistry::query_stats(const std::string& db_path, uint64_t& sequences,
                                   uint64_t& letters, SearchError& err) {
    ProcessResult result;
    if (!run_tool("blastdbcmd", {"-db", db_path, "-info"}, result, err)) return false;

    BlastDbInfo info;
    if (!parse_blastdb_info(result.out, info)) {
        err.set(ErrorCode::kDatabaseCorrupt,
                "cannot read database statistics for " + db_path);
        return false;
    }
    sequences = info.sequences;
    letters = info.letters;
    return true;
}

// makeblastdb, then file check and statistics. Fills the counts in rec.
bool DatabaseRegistry::build(const DatabaseRecord& rec, SearchError& err) {
    ProcessResult result;
    if (!run_tool("makeblastdb",
                  {"-in", rec.source_file, "-dbtype", mol_type_dbtype(rec.mol_type),
                   "-out", rec.db_path, "-title", rec.name},
                  result, err)) {
        return false;
    }
    if (!database_files_exist(rec.db_path, rec.mol_type)) {
        err.set(ErrorCode::kDatabaseCorrupt,
                "makeblastdb finished but no index files were written at " + rec.db_path);
        return false;
    }
    return true;
}

bool DatabaseRegistry::create(const std::string& source_file, const std::string& name,
                              MolType mol_type, DatabaseRecord& out, SearchError& err) {
    std::string clean_name = trim(name);
    if (clean_name.empty()) {
        err.set(ErrorCode::kValidation, "database name is required");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : records_) {
            if (kv.second.name == clean_name) {
                err.set(ErrorCode::kValidation,
                        "a database named '" + clean_name + "' already exists");
                return false;
            }
        }
    }

    FastaCheckInfo check;
    if (!check_fasta_source(source_file, mol_type, check, err)) return false;

    std::error_code ec;
    std::filesystem::path src_abs = std::filesystem::absolute(source_file, ec);
    if (ec) src_abs = source_file;
    std::string dir = opts_.db_dir.empty() ? src_abs.parent_path().string() : opts_.db_dir;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        err.set(ErrorCode::kIo, "cannot create database directory " + dir + ": " + ec.message());
        return false;
    }

    DatabaseRecord rec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Re-check under the same lock that reserves the id.
        for (const auto& kv : records_) {
            if (kv.second.name == clean_name) {
                err.set(ErrorCode::kValidation,
                        "a database named '" + clean_name + "' already exists");
                return false;
            }
        }
        rec.id = allocate_id(clean_name);
        rec.name = clean_name;
        rec.mol_type = mol_type;
        rec.status = DbStatus::kCreating;
        rec.directory = dir;
        rec.db_path = (std::filesystem::path(dir) / rec.id).string();
        rec.source_file = src_abs.string();
        rec.created_at = iso_timestamp_now();
        records_[rec.id] = rec;
    }

    if (!store_.set(rec.id, rec, err)) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(rec.id);
        return false;
    }
    logger_.info("Creating %s database '%s' from %s (%llu sequences)",
                 mol_type_name(mol_type), rec.name.c_str(), rec.source_file.c_str(),
                 static_cast<unsigned long long>(check.record_count));

    bool ok = build(rec, err) &&
              query_stats(rec.db_path, rec.sequence_count, rec.letter_count, err);
    if (ok) {
        rec.status = DbStatus::kReady;
        rec.last_validated = iso_timestamp_now();
        ok = persist(rec, err);
    }
    if (!ok) {
        logger_.error("Database '%s' could not be created: %s",
                      rec.name.c_str(), err.message.c_str());
        remove_database_files(rec.db_path, rec.mol_type);
        drop_record(rec.id);
        return false;
    }

    logger_.info("Database '%s' ready: %llu sequences, %llu letters",
                 rec.name.c_str(),
                 static_cast<unsigned long long>(rec.sequence_count),
                 static_cast<unsigned long long>(rec.letter_count));
    out = rec;
    return true;
}

bool DatabaseRegistry::create_from_genome(const GenomeSource& genome,
                                          const std::string& name, MolType mol_type,
                                          DatabaseRecord& out, SearchError& err) {
    std::string clean_name = trim(name);
    if (clean_name.empty()) {
        err.set(ErrorCode::kValidation, "database name is required");
        return false;
    }
    if (opts_.db_dir.empty()) {
        err.set(ErrorCode::kValidation,
                "a database directory is required to build from a genome");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : records_) {
            if (kv.second.name == clean_name) {
                err.set(ErrorCode::kValidation,
                        "a database named '" + clean_name + "' already exists");
                return false;
            }
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(opts_.db_dir, ec);
    if (ec) {
        err.set(ErrorCode::kIo, "cannot create database directory " + opts_.db_dir +
                ": " + ec.message());
        return false;
    }
    std::string fasta_path =
        (std::filesystem::path(opts_.db_dir) / (sanitize_db_name(clean_name) + ".fasta")).string();

    size_t written = 0;
    {
        std::ofstream fasta(fasta_path, std::ios::trunc);
        if (!fasta.is_open()) {
            err.set(ErrorCode::kIo, "cannot write " + fasta_path);
            return false;
        }
        for (const auto& chrom : genome.chromosomes()) {
            uint64_t len = genome.chromosome_length(chrom);
            if (len == 0) continue;
            std::string seq = genome.get_sequence(chrom, 1, len);
            if (seq.empty()) continue;
            if (mol_type == MolType::kProtein) {
                write_fasta_record(fasta, chrom + "_translated", translate_longest_orf(seq));
            } else {
                write_fasta_record(fasta, chrom, seq);
            }
            written++;
        }
        if (!fasta.good()) {
            err.set(ErrorCode::kIo, "write failed for " + fasta_path);
            std::filesystem::remove(fasta_path, ec);
            return false;
        }
    }
    if (written == 0) {
        err.set(ErrorCode::kValidation, "genome has no sequence data");
        std::filesystem::remove(fasta_path, ec);
        return false;
    }
    logger_.debug("Wrote %zu chromosome(s) to %s", written, fasta_path.c_str());

    if (!create(fasta_path, clean_name, mol_type, out, err)) {
        std::filesystem::remove(fasta_path, ec);
        return false;
    }
    return true;
}

bool DatabaseRegistry::remove(const std::string& id, SearchError& err) {
    DatabaseRecord rec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            err.set(ErrorCode::kDatabaseNotFound, "no database with id " + id);
            return false;
        }
        if (it->second.status == DbStatus::kCreating) {
            err.set(ErrorCode::kDatabaseBusy,
                    "database '" + it->second.name + "' is being built");
            return false;
        }
        rec = it->second;
    }

    size_t n = remove_database_files(rec.db_path, rec.mol_type);
    if (!store_.remove(rec.id, err)) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(rec.id);
    }
    logger_.info("Deleted database '%s' (%zu file(s) removed)", rec.name.c_str(), n);
    return true;
}

bool DatabaseRegistry::update(const std::string& id, DatabaseRecord& out, SearchError& err) {
    DatabaseRecord rec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            err.set(ErrorCode::kDatabaseNotFound, "no database with id " + id);
            return false;
        }
        if (it->second.status == DbStatus::kCreating) {
            err.set(ErrorCode::kDatabaseBusy,
                    "database '" + it->second.name + "' is being built");
            return false;
        }
        rec = it->second;
        it->second.status = DbStatus::kCreating;
    }

    auto fail = [&](const DatabaseRecord& r) {
        DatabaseRecord failed = r;
        failed.status = DbStatus::kError;
        SearchError store_err;
        if (!persist(failed, store_err)) {
            logger_.error("Cannot record failed rebuild of '%s': %s",
                          failed.name.c_str(), store_err.message.c_str());
            std::lock_guard<std::mutex> lock(mutex_);
            records_[failed.id] = failed;
        }
        logger_.error("Database '%s' could not be rebuilt: %s",
                      failed.name.c_str(), err.message.c_str());
        return false;
    };

    FastaCheckInfo check;
    if (!check_fasta_source(rec.source_file, rec.mol_type, check, err)) return fail(rec);

    DatabaseRecord building = rec;
    building.status = DbStatus::kCreating;
    if (!persist(building, err)) return fail(rec);

    logger_.info("Rebuilding database '%s' from %s", rec.name.c_str(), rec.source_file.c_str());
    remove_database_files(rec.db_path, rec.mol_type);

    if (!build(building, err) ||
        !query_stats(building.db_path, building.sequence_count, building.letter_count, err)) {
        return fail(building);
    }

    building.status = DbStatus::kReady;
    building.last_validated = iso_timestamp_now();
    if (!persist(building, err)) return fail(building);

    out = building;
    return true;
}

bool DatabaseRegistry::validate(const std::string& id) {
    DatabaseRecord rec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) return false;
        rec = it->second;
    }
    if (rec.status == DbStatus::kCreating) return false;

    if (!database_files_exist(rec.db_path, rec.mol_type)) {
        logger_.warn("Database '%s' failed validation: files missing at %s",
                     rec.name.c_str(), rec.db_path.c_str());
        drop_record(rec.id);
        return false;
    }

    rec.last_validated = iso_timestamp_now();
    SearchError store_err;
    if (!persist(rec, store_err)) {
        logger_.warn("Cannot record validation time for '%s': %s",
                     rec.name.c_str(), store_err.message.c_str());
    }
    return true;
}

std::vector<DatabaseRecord> DatabaseRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DatabaseRecord> custom, disk;
    for (const auto& kv : records_) custom.push_back(kv.second);
    for (const auto& kv : discovered_) disk.push_back(kv.second);

    auto by_name = [](const DatabaseRecord& a, const DatabaseRecord& b) {
        return a.name < b.name;
    };
    std::sort(custom.begin(), custom.end(), by_name);
    std::sort(disk.begin(), disk.end(), by_name);
    custom.insert(custom.end(), disk.begin(), disk.end());
    return custom;
}

bool DatabaseRegistry::find(const std::string& ref, DatabaseRecord& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto* m : {&records_, &discovered_}) {
        auto it = m->find(ref);
        if (it != m->end()) {
            out = it->second;
            return true;
        }
    }
    for (const auto* m : {&records_, &discovered_}) {
        for (const auto& kv : *m) {
            if (kv.second.name == ref) {
                out = kv.second;
                return true;
            }
        }
    }
    return false;
}

std::string DatabaseRegistry::resolve_path(const std::string& ref) const {
    DatabaseRecord rec;
    if (find(ref, rec)) return rec.db_path;
    return ref;
}

bool DatabaseRegistry::discover(const std::string& directory,
                                std::vector<DatabaseRecord>& out, SearchError& err) {
    ProcessResult result;
    if (!run_tool("blastdbcmd", {"-list", directory, "-list_outfmt", "%f %p"}, result, err))
        return false;

    std::vector<BlastDbListEntry> entries = parse_blastdb_list(result.out);

    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    for (const auto& e : entries) {
        bool is_custom = false;
        for (const auto& kv : records_) {
            if (kv.second.db_path == e.path) {
                is_custom = true;
                break;
            }
        }
        if (is_custom) continue;

        std::filesystem::path p(e.path);
        DatabaseRecord rec;
        rec.name = p.filename().string();
        rec.id = "local_" + rec.name;
        rec.mol_type = e.mol_type;
        rec.status = DbStatus::kReady;
        rec.directory = p.parent_path().string();
        rec.db_path = e.path;
        rec.discovered = true;
        discovered_[rec.id] = rec;
        out.push_back(rec);
    }
    logger_.debug("Discovered %zu database(s) in %s", out.size(), directory.c_str());
    return true;
}

} // namespace blastbridge
