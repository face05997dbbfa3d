#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCode {
    // bundle
    ConfigMissing,
    RootfsMissing,
    InvalidConfigFormat,
    // conversion
    ExtractionFailed,
    CopyFailed,
    EmptyRootfs,
    ArchiveCreationFailed,
    UploadFailed,
    UnsupportedSource,
    // identity
    IdentityExhausted,
    // state
    StateMissing,
    InvalidStateFormat,
    // orchestration
    UnsupportedImageReference,
    PathTraversalRejected,
    LxcCreateFailed,
    LxcStartFailed,
    LxcStopFailed,
    LxcDeleteFailed,
    MountConfigFailed,
    // translated from external tools
    NotFound,
    PermissionDenied,
    AlreadyExists,
    InvalidArgument,
    OperationFailed
};

class RuntimeError : public std::runtime_error {
public:
    RuntimeError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

const char* error_code_name(ErrorCode code);

// Maps the diagnostic text of a failed pct/zfs/tar invocation onto the
// stable error taxonomy. Unrecognized text yields `fallback`.
ErrorCode translate_tool_error(const std::string& diagnostic,
                               ErrorCode fallback = ErrorCode::OperationFailed);

// Re-throws `error` with "<operation> <subject>: " prepended, keeping the code.
[[noreturn]] void rethrow_with_context(const RuntimeError& error,
                                       const std::string& operation,
                                       const std::string& subject);
