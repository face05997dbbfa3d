#include "lxcri/errors.h"

#include <algorithm>
#include <cctype>

RuntimeError::RuntimeError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigMissing:
            return "ConfigMissing";
        case ErrorCode::RootfsMissing:
            return "RootfsMissing";
        case ErrorCode::InvalidConfigFormat:
            return "InvalidConfigFormat";
        case ErrorCode::ExtractionFailed:
            return "ExtractionFailed";
        case ErrorCode::CopyFailed:
            return "CopyFailed";
        case ErrorCode::EmptyRootfs:
            return "EmptyRootfs";
        case ErrorCode::ArchiveCreationFailed:
            return "ArchiveCreationFailed";
        case ErrorCode::UploadFailed:
            return "UploadFailed";
        case ErrorCode::UnsupportedSource:
            return "UnsupportedSource";
        case ErrorCode::IdentityExhausted:
            return "IdentityExhausted";
        case ErrorCode::StateMissing:
            return "StateMissing";
        case ErrorCode::InvalidStateFormat:
            return "InvalidStateFormat";
        case ErrorCode::UnsupportedImageReference:
            return "UnsupportedImageReference";
        case ErrorCode::PathTraversalRejected:
            return "PathTraversalRejected";
        case ErrorCode::LxcCreateFailed:
            return "LxcCreateFailed";
        case ErrorCode::LxcStartFailed:
            return "LxcStartFailed";
        case ErrorCode::LxcStopFailed:
            return "LxcStopFailed";
        case ErrorCode::LxcDeleteFailed:
            return "LxcDeleteFailed";
        case ErrorCode::MountConfigFailed:
            return "MountConfigFailed";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::PermissionDenied:
            return "PermissionDenied";
        case ErrorCode::AlreadyExists:
            return "AlreadyExists";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::OperationFailed:
            return "OperationFailed";
    }
    return "Unknown";
}

namespace {

struct TranslationRule {
    const char* needle;
    ErrorCode code;
};

// First match wins, so the more specific phrases come first.
const TranslationRule kTranslationRules[] = {
        {"permission denied", ErrorCode::PermissionDenied},
        {"operation not permitted", ErrorCode::PermissionDenied},
        {"access denied", ErrorCode::PermissionDenied},
        {"already exists", ErrorCode::AlreadyExists},
        {"file exists", ErrorCode::AlreadyExists},
        {"does not exist", ErrorCode::NotFound},
        {"not found", ErrorCode::NotFound},
        {"no such", ErrorCode::NotFound},
        {"parameter verification failed", ErrorCode::InvalidArgument},
        {"invalid", ErrorCode::InvalidArgument},
        {"unable to parse", ErrorCode::InvalidArgument},
        {"bad request", ErrorCode::InvalidArgument},
};

} // namespace

ErrorCode translate_tool_error(const std::string& diagnostic, ErrorCode fallback) {
    std::string lowered = diagnostic;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const auto& rule : kTranslationRules) {
        if (lowered.find(rule.needle) != std::string::npos) {
            return rule.code;
        }
    }
    return fallback;
}

void rethrow_with_context(const RuntimeError& error,
                          const std::string& operation,
                          const std::string& subject) {
    throw RuntimeError(error.code(), operation + " " + subject + ": " + error.what());
}
