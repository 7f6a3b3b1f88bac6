#include "core/error.hpp"

namespace blastbridge {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::kNone:              return "None";
    case ErrorCode::kValidation:        return "ValidationError";
    case ErrorCode::kDatabaseNotFound:  return "DatabaseNotFoundError";
    case ErrorCode::kDatabaseCorrupt:   return "DatabaseCorruptError";
    case ErrorCode::kUnsupportedFormat: return "UnsupportedFormatError";
    case ErrorCode::kDatabaseBusy:      return "DatabaseBusyError";
    case ErrorCode::kMissingExecutable: return "ProcessExecutionError(missing-executable)";
    case ErrorCode::kCorruptDatabase:   return "ProcessExecutionError(corrupt-database)";
    case ErrorCode::kMalformedInput:    return "ProcessExecutionError(malformed-input)";
    case ErrorCode::kProcessFailed:     return "ProcessExecutionError";
    case ErrorCode::kRemoteSubmission:  return "RemoteSubmissionError";
    case ErrorCode::kRemoteJobFailed:   return "RemoteJobFailedError";
    case ErrorCode::kRemoteUnknown:     return "RemoteJobUnknownError";
    case ErrorCode::kRemoteTimeout:     return "RemoteTimeoutError";
    case ErrorCode::kCancelled:         return "Cancelled";
    case ErrorCode::kParse:             return "ParseError";
    case ErrorCode::kIo:                return "IoError";
    }
    return "UnknownError";
}

bool is_pre_execution_error(ErrorCode code) {
    switch (code) {
    case ErrorCode::kValidation:
    case ErrorCode::kDatabaseNotFound:
    case ErrorCode::kDatabaseCorrupt:
    case ErrorCode::kUnsupportedFormat:
    case ErrorCode::kDatabaseBusy:
        return true;
    default:
        return false;
    }
}

bool is_process_error(ErrorCode code) {
    return code == ErrorCode::kMissingExecutable ||
           code == ErrorCode::kCorruptDatabase ||
           code == ErrorCode::kMalformedInput ||
           code == ErrorCode::kProcessFailed;
}

bool triggers_fallback(ErrorCode code) {
    if (is_process_error(code)) return true;
    switch (code) {
    case ErrorCode::kRemoteSubmission:
    case ErrorCode::kRemoteJobFailed:
    case ErrorCode::kRemoteUnknown:
    case ErrorCode::kRemoteTimeout:
    case ErrorCode::kParse:
    case ErrorCode::kIo:
        return true;
    default:
        return false;
    }
}

} // namespace blastbridge
