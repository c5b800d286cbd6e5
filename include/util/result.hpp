#pragma once
#include <string>
#include <utility>

namespace esa {

enum class ErrorCode : int {
    kNone = 0,
    kArchiveIo = 1,
    kMissingManifest = 2,
    kMalformedRequirement = 3,
    kResolutionConflict = 4,
    kConfig = 5,
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }
    ErrorCode code() const { return static_cast<ErrorCode>(err); }

    // A missing manifest is an archive I/O failure as well.
    bool IsArchiveIoError() const {
        return code() == ErrorCode::kArchiveIo || code() == ErrorCode::kMissingManifest;
    }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode e, std::string m) {
        return {.ok = false, .err = static_cast<int>(e), .msg = std::move(m)};
    }
};

} // namespace esa
