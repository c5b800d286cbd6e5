#pragma once

#include <archive.h>

#include <memory>
#include <string>

namespace esa {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) archive_read_free(a);
    }
};

// Owns a libarchive read handle; archive_read_free() runs on every exit path.
using ArchiveReadPtr = std::unique_ptr<struct archive, ArchiveReadDeleter>;

// New read handle restricted to the zip format (jar and esa files are zips).
inline ArchiveReadPtr NewZipReader() {
    ArchiveReadPtr a(archive_read_new());
    if (a) {
        archive_read_support_format_zip(a.get());
    }
    return a;
}

inline std::string ArchiveErrorString(struct archive* a) {
    const char* em = a ? archive_error_string(a) : nullptr;
    return em ? std::string(em) : std::string("unknown");
}

} // namespace esa
