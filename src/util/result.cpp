#include "util/result.hpp"

namespace tzupdater {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                  return "None";
        case ErrorKind::InvalidArgument:       return "InvalidArgument";
        case ErrorKind::ToolMissing:           return "ToolMissing";
        case ErrorKind::SourceUnreachable:     return "SourceUnreachable";
        case ErrorKind::ReleaseNotFound:       return "ReleaseNotFound";
        case ErrorKind::FetchFailed:           return "FetchFailed";
        case ErrorKind::ExtractFailed:         return "ExtractFailed";
        case ErrorKind::ComponentCompileError: return "ComponentCompileError";
        case ErrorKind::VersionUnresolvable:   return "VersionUnresolvable";
        case ErrorKind::ConfigError:           return "ConfigError";
        case ErrorKind::IoError:               return "IoError";
        case ErrorKind::Internal:              return "Internal";
    }
    return "Unknown";
}

} // namespace tzupdater
