#pragma once

#include <string>
#include <utility>

namespace blastbridge {

enum class ErrorCode {
    kNone = 0,

    // Rejected before any backend runs
    kValidation,
    kDatabaseNotFound,
    kDatabaseCorrupt,
    kUnsupportedFormat,
    kDatabaseBusy,

    // Local backend process failures
    kMissingExecutable,
    kCorruptDatabase,
    kMalformedInput,
    kProcessFailed,

    // Remote backend
    kRemoteSubmission,
    kRemoteJobFailed,
    kRemoteUnknown,
    kRemoteTimeout,
    kCancelled,

    kParse,
    kIo,
};

struct SearchError {
    ErrorCode code = ErrorCode::kNone;
    std::string message;

    void set(ErrorCode c, std::string msg) {
        code = c;
        message = std::move(msg);
    }
    void clear() {
        code = ErrorCode::kNone;
        message.clear();
    }
    bool ok() const { return code == ErrorCode::kNone; }
};

const char* error_code_name(ErrorCode code);

// Errors surfaced to the caller without running a backend.
bool is_pre_execution_error(ErrorCode code);

// Errors absorbed into a fallback result.
bool triggers_fallback(ErrorCode code);

bool is_process_error(ErrorCode code);

} // namespace blastbridge
