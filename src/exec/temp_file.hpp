#pragma once

#include <string>

namespace blastbridge {

// RAII temporary file. The file is created (mkstemps) and filled by
// create(); it is unlinked when the guard is destroyed or released,
// on every exit path.
class TempFile {
public:
    TempFile() = default;
    ~TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;

    // Create "<dir>/<prefix>XXXXXX<suffix>" holding content.
    // dir empty -> $TMPDIR or /tmp. Returns false and sets error_msg on failure.
    bool create(const std::string& dir, const std::string& prefix,
                const std::string& suffix, const std::string& content,
                std::string& error_msg);

    const std::string& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    // Remove the file now.
    void release();

private:
    std::string path_;
};

// Directory for transient files: $TMPDIR, else /tmp.
std::string default_temp_dir();

} // namespace blastbridge
