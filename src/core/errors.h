#pragma once

namespace imgopt::core {

enum class ErrorKind {
    None,
    SourceUnreadable,
    UnsupportedSource,
    EncodeFailed,
    InputDirectoryMissing,
    ManifestCorrupt,
    NotFound,
    TransformFailed,
    InvalidConfig,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::SourceUnreadable:
            return "source unreadable";
        case ErrorKind::UnsupportedSource:
            return "unsupported source";
        case ErrorKind::EncodeFailed:
            return "encode failed";
        case ErrorKind::InputDirectoryMissing:
            return "input directory missing";
        case ErrorKind::ManifestCorrupt:
            return "manifest corrupt";
        case ErrorKind::NotFound:
            return "not found";
        case ErrorKind::TransformFailed:
            return "transform failed";
        case ErrorKind::InvalidConfig:
            return "invalid configuration";
    }
    return "unknown";
}

} // namespace imgopt::core
