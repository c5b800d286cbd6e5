#include "util/result.hpp"

namespace esa {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNone:                 return "none";
        case ErrorCode::kArchiveIo:            return "archive-io";
        case ErrorCode::kMissingManifest:      return "missing-manifest";
        case ErrorCode::kMalformedRequirement: return "malformed-requirement";
        case ErrorCode::kResolutionConflict:   return "resolution-conflict";
        case ErrorCode::kConfig:               return "config";
        default:                               return "unknown";
    }
}

} // namespace esa
