#pragma once

#include <string>
#include <vector>

namespace blastbridge {

struct ProcessResult {
    int exit_code = -1;        // valid when exited is true
    bool exited = false;       // normal termination
    int term_signal = 0;       // set when killed by a signal
    bool exec_failed = false;  // the child could not exec the program
    int exec_errno = 0;        // errno reported by execvp
    std::string out;           // captured stdout
    std::string err;           // captured stderr

    bool success() const { return exited && exit_code == 0; }
};

// Runs external programs to completion and captures their output.
// The whole run is atomic from the caller's point of view.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // argv[0] is the program (looked up in PATH if it has no '/').
    // Returns false only if the process could not be started at all
    // (pipe/fork failure); exec failures and non-zero exits return true
    // with the details in result.
    virtual bool run(const std::vector<std::string>& argv,
                     ProcessResult& result, std::string& error_msg) = 0;
};

// fork/execvp implementation with stdout and stderr read through pipes.
class PosixProcessRunner : public ProcessRunner {
public:
    PosixProcessRunner() = default;

    // Run children in this directory (empty = inherit).
    void set_working_dir(const std::string& dir) { working_dir_ = dir; }

    bool run(const std::vector<std::string>& argv,
             ProcessResult& result, std::string& error_msg) override;

private:
    std::string working_dir_;
};

// Shell-style rendering of argv for log messages.
std::string format_command_line(const std::vector<std::string>& argv);

} // namespace blastbridge
