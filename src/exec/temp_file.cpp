#include "exec/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace blastbridge {

std::string default_temp_dir() {
    const char* env = std::getenv("TMPDIR");
    if (env != nullptr && env[0] != '\0') return env;
    return "/tmp";
}

TempFile::~TempFile() {
    release();
}

TempFile::TempFile(TempFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

bool TempFile::create(const std::string& dir, const std::string& prefix,
                      const std::string& suffix, const std::string& content,
                      std::string& error_msg) {
    release();

    std::string base = dir.empty() ? default_temp_dir() : dir;
    std::string tmpl = base + "/" + prefix + "XXXXXX" + suffix;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        error_msg = "cannot create temporary file in " + base + ": " + std::strerror(errno);
        return false;
    }
    path_ = buf.data();

    const char* p = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            error_msg = "cannot write temporary file " + path_ + ": " + std::strerror(errno);
            ::close(fd);
            release();
            return false;
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::close(fd) < 0) {
        error_msg = "cannot close temporary file " + path_ + ": " + std::strerror(errno);
        release();
        return false;
    }
    return true;
}

void TempFile::release() {
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace blastbridge
