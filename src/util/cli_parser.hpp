#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace blastbridge {

// Command-line parser for "-key value" style arguments.
// "--key=value" is also accepted. A key followed by another key (or by
// nothing) is a flag with value "1". Repeated keys keep every value.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    bool has(const std::string& key) const;

    // Last value given for key, or default_val.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // All values given for key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    int get_int(const std::string& key, int default_val = 0) const;
    double get_double(const std::string& key, double default_val = 0.0) const;

    // Value for key, else the environment variable env_name, else default_val.
    std::string get_string_env(const std::string& key, const char* env_name,
                               const std::string& default_val = {}) const;

    const std::string& program() const { return program_; }
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace blastbridge
