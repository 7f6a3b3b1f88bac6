#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

// BLASTBRIDGE_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace blastbridge {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, BLASTBRIDGE_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose and -quiet flags.
inline Logger make_logger(const CliParser& cli) {
    if (cli.has("-quiet")) return Logger(Logger::kError);
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo);
}

// Resolve thread count from CLI (0 or negative -> hardware_concurrency).
inline int resolve_threads(const CliParser& cli,
                           const std::string& key = "-threads") {
    int n = cli.get_int(key, 0);
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

// Registry JSON path: -registry, $BLASTBRIDGE_REGISTRY, ~/.blastbridge/databases.json.
inline std::string resolve_registry_path(const CliParser& cli) {
    const char* home = std::getenv("HOME");
    std::string fallback = std::string(home ? home : ".") + "/.blastbridge/databases.json";
    return cli.get_string_env("-registry", "BLASTBRIDGE_REGISTRY", fallback);
}

inline std::string resolve_db_dir(const CliParser& cli) {
    return cli.get_string_env("-db_dir", "BLASTBRIDGE_DB_DIR");
}

inline std::string resolve_blast_bin_dir(const CliParser& cli) {
    return cli.get_string_env("-blast_bin_dir", "BLASTBRIDGE_BLAST_BIN");
}

} // namespace blastbridge
