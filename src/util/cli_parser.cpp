#include "util/cli_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace blastbridge {

// A token that can follow a key as its value: anything not starting with
// '-', a lone "-" (stdin), or a negative number.
static bool is_value_token(const char* tok) {
    if (tok[0] != '-') return true;
    if (tok[1] == '\0') return true;
    return std::isdigit(static_cast<unsigned char>(tok[1])) || tok[1] == '.';
}

CliParser::CliParser(int argc, char* argv[]) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            if (arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            if (i + 1 < argc && is_value_token(argv[i + 1])) {
                opts_[arg].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[arg].push_back("1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    try {
        return std::stoi(it->second.back());
    } catch (const std::exception&) {
        return default_val;
    }
}

double CliParser::get_double(const std::string& key, double default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    try {
        return std::stod(it->second.back());
    } catch (const std::exception&) {
        return default_val;
    }
}

std::string CliParser::get_string_env(const std::string& key, const char* env_name,
                                      const std::string& default_val) const {
    if (has(key)) return get_string(key, default_val);
    const char* env = std::getenv(env_name);
    if (env != nullptr && env[0] != '\0') return env;
    return default_val;
}

} // namespace blastbridge
