#include "exec/process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace blastbridge {

static void close_if_open(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Report errno to the parent through the status pipe and exit.
[[noreturn]] static void child_fail(int status_fd, int errnum) {
    ssize_t n = ::write(status_fd, &errnum, sizeof(errnum));
    (void)n;
    ::_exit(127);
}

bool PosixProcessRunner::run(const std::vector<std::string>& argv,
                             ProcessResult& result, std::string& error_msg) {
    result = ProcessResult{};
    if (argv.empty()) {
        error_msg = "empty command line";
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (::pipe(out_pipe) < 0 || ::pipe(err_pipe) < 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) < 0) {
        error_msg = std::string("pipe() failed: ") + std::strerror(errno);
        close_if_open(out_pipe[0]);
        close_if_open(out_pipe[1]);
        close_if_open(err_pipe[0]);
        close_if_open(err_pipe[1]);
        close_if_open(status_pipe[0]);
        close_if_open(status_pipe[1]);
        return false;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        error_msg = std::string("fork() failed: ") + std::strerror(errno);
        close_if_open(out_pipe[0]);
        close_if_open(out_pipe[1]);
        close_if_open(err_pipe[0]);
        close_if_open(err_pipe[1]);
        close_if_open(status_pipe[0]);
        close_if_open(status_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        ::close(status_pipe[0]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (::dup2(out_pipe[1], STDOUT_FILENO) < 0) child_fail(status_pipe[1], errno);
        if (::dup2(err_pipe[1], STDERR_FILENO) < 0) child_fail(status_pipe[1], errno);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        if (!working_dir_.empty() && ::chdir(working_dir_.c_str()) < 0)
            child_fail(status_pipe[1], errno);
        ::execvp(cargv[0], cargv.data());
        child_fail(status_pipe[1], errno);
    }

    // Parent
    close_if_open(out_pipe[1]);
    close_if_open(err_pipe[1]);
    close_if_open(status_pipe[1]);

    struct pollfd fds[2];
    fds[0].fd = out_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = err_pipe[0];
    fds[1].events = POLLIN;
    int open_fds = 2;
    char buf[8192];

    while (open_fds > 0) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0) continue;
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
                if (n > 0) {
                    (i == 0 ? result.out : result.err).append(buf, static_cast<size_t>(n));
                } else if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
                    ::close(fds[i].fd);
                    fds[i].fd = -1;
                    open_fds--;
                }
            }
        }
    }
    for (auto& f : fds) close_if_open(f.fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_if_open(status_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        result.exec_failed = true;
        result.exec_errno = child_errno;
    }

    int status = 0;
    pid_t w;
    do {
        w = ::waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) {
        error_msg = std::string("waitpid() failed: ") + std::strerror(errno);
        return false;
    }

    if (WIFEXITED(status)) {
        result.exited = true;
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    if (result.exec_failed && result.err.empty()) {
        result.err = std::string(argv[0]) + ": " + std::strerror(result.exec_errno);
    }
    return true;
}

std::string format_command_line(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) line += ' ';
        const auto& a = argv[i];
        bool quote = a.empty() || a.find_first_of(" \t\"'$") != std::string::npos;
        if (quote) {
            line += '"';
            for (char c : a) {
                if (c == '"' || c == '\\') line += '\\';
                line += c;
            }
            line += '"';
        } else {
            line += a;
        }
    }
    return line;
}

} // namespace blastbridge
