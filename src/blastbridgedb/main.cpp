#include "core/types.hpp"
#include "core/version.hpp"
#include "exec/process_runner.hpp"
#include "io/result_writer.hpp"
#include "registry/config_store.hpp"
#include "registry/database_registry.hpp"
#include "sequence/genome_source.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace blastbridge;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s <action> [options]\n"
        "\n"
        "Actions (exactly one):\n"
        "  -create <fasta>          Build a database from a FASTA file\n"
        "  -genome <fasta>          Build a database from every chromosome of a genome\n"
        "                           (protein databases are translated)\n"
        "  -delete <id>             Delete a database and its files\n"
        "  -update <id>             Rebuild a database from its source file\n"
        "  -validate <id|all>       Check that database files still exist\n"
        "  -list                    List registered and discovered databases\n"
        "  -discover <dir>          Find BLAST databases in a directory\n"
        "\n"
        "Options:\n"
        "  -name <name>             Database name (required with -create / -genome)\n"
        "  -dbtype <nucl|prot>      Molecule type (default: nucl)\n"
        "  -db_dir <dir>            Where databases are built (env BLASTBRIDGE_DB_DIR)\n"
        "  -registry <path>         Registry file (env BLASTBRIDGE_REGISTRY)\n"
        "  -blast_bin_dir <dir>     BLAST+ programs (env BLASTBRIDGE_BLAST_BIN, default: PATH)\n"
        "  -outfmt <tab|json>       Listing format (default: tab)\n"
        "  -quiet                   Errors only\n"
        "  -v, --verbose            Verbose logging\n"
        "  --version                Print version\n",
        prog);
}

static int fail(const Logger& logger, const SearchError& err) {
    logger.error("%s: %s", error_code_name(err.code), err.message.c_str());
    return 1;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "blastbridgedb")) return 0;
    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    static const char* actions[] = {"-create", "-genome", "-delete", "-update",
                                    "-validate", "-list", "-discover"};
    int n_actions = 0;
    for (const char* a : actions) {
        if (cli.has(a)) n_actions++;
    }
    if (n_actions != 1) {
        print_usage(argv[0]);
        return 2;
    }

    Logger logger = make_logger(cli);

    MolType mol_type = MolType::kNucleotide;
    if (!parse_mol_type(cli.get_string("-dbtype", "nucl"), mol_type)) {
        std::fprintf(stderr, "Error: -dbtype must be nucl or prot\n");
        return 2;
    }
    OutputFormat outfmt = OutputFormat::kTab;
    std::string fmt_err;
    if (!parse_output_format(cli.get_string("-outfmt", "tab"), outfmt, fmt_err)) {
        std::fprintf(stderr, "%s\n", fmt_err.c_str());
        return 2;
    }

    PosixProcessRunner runner;
    JsonFileConfigStore store(resolve_registry_path(cli), logger);
    SearchError err;
    if (!store.open(err)) return fail(logger, err);

    RegistryOptions opts;
    opts.db_dir = resolve_db_dir(cli);
    opts.blast_bin_dir = resolve_blast_bin_dir(cli);
    DatabaseRegistry registry(store, runner, opts, logger);
    if (!registry.load(err)) return fail(logger, err);

    if (cli.has("-create") || cli.has("-genome")) {
        if (!cli.has("-name")) {
            std::fprintf(stderr, "Error: -name is required\n");
            return 2;
        }
        DatabaseRecord rec;
        if (cli.has("-create")) {
            if (!registry.create(cli.get_string("-create"), cli.get_string("-name"),
                                 mol_type, rec, err)) {
                return fail(logger, err);
            }
        } else {
            FastaGenomeSource genome;
            if (!genome.load(cli.get_string("-genome"), err)) return fail(logger, err);
            if (!registry.create_from_genome(genome, cli.get_string("-name"), mol_type,
                                             rec, err)) {
                return fail(logger, err);
            }
        }
        write_database_list(std::cout, {rec}, outfmt);
        return 0;
    }

    if (cli.has("-delete")) {
        if (!registry.remove(cli.get_string("-delete"), err)) return fail(logger, err);
        return 0;
    }

    if (cli.has("-update")) {
        DatabaseRecord rec;
        if (!registry.update(cli.get_string("-update"), rec, err)) return fail(logger, err);
        write_database_list(std::cout, {rec}, outfmt);
        return 0;
    }

    if (cli.has("-validate")) {
        std::string target = cli.get_string("-validate");
        std::vector<std::string> ids;
        if (target == "all" || target == "1") {
            for (const auto& rec : registry.list()) {
                if (!rec.discovered) ids.push_back(rec.id);
            }
        } else {
            ids.push_back(target);
        }
        int bad = 0;
        for (const auto& id : ids) {
            bool ok = registry.validate(id);
            std::printf("%s\t%s\n", id.c_str(), ok ? "ok" : "missing");
            if (!ok) bad++;
        }
        return bad > 0 ? 1 : 0;
    }

    if (cli.has("-discover")) {
        std::vector<DatabaseRecord> found;
        if (!registry.discover(cli.get_string("-discover"), found, err)) {
            return fail(logger, err);
        }
        write_database_list(std::cout, found, outfmt);
        return 0;
    }

    // -list
    if (!opts.db_dir.empty()) {
        std::vector<DatabaseRecord> found;
        if (!registry.discover(opts.db_dir, found, err)) {
            logger.warn("Discovery in %s failed: %s", opts.db_dir.c_str(), err.message.c_str());
        }
    }
    write_database_list(std::cout, registry.list(), outfmt);
    return 0;
}
