#include "esa/manifest_extractor.hpp"

#include "io/archive_handle.hpp"
#include "io/temp_file.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive_entry.h>

#include <vector>

namespace esa {

namespace {

constexpr size_t kReadBlockSize = 64 * 1024;
constexpr const char kTempFilePrefix[] = "unpackedBundle-";

Result ReadAllBounded(IReader& src, std::uint64_t max_bytes, std::vector<std::uint8_t>& out) {
    out.clear();
    std::vector<std::uint8_t> buf(kReadBlockSize);
    while (true) {
        const ssize_t n = src.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) return Result::Fail(ErrorCode::kArchiveIo, "read failed");
        if (n == 0) break;
        if (out.size() + static_cast<size_t>(n) > max_bytes) {
            return Result::Fail(ErrorCode::kArchiveIo,
                                "entry exceeds size limit of " + std::to_string(max_bytes) + " bytes");
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

// Scans an opened jar for META-INF/MANIFEST.MF and reads it.
Result FindJarManifest(struct archive* a,
                       const std::string& source_id,
                       std::uint64_t max_bytes,
                       std::string& out) {
    struct archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(ErrorCode::kMissingManifest,
                                "cannot read " + source_id + " as an archive: " + ArchiveErrorString(a));
        }

        const char* raw = archive_entry_pathname(entry);
        const std::string name = NormalizeEntryPath(raw ? std::string(raw) : std::string());
        if (!EqualsIgnoreCase(name, kJarManifestPath)) continue;

        out.clear();
        std::vector<char> buf(kReadBlockSize);
        while (true) {
            const la_ssize_t n = archive_read_data(a, buf.data(), buf.size());
            if (n == 0) return Result::Ok();
            if (n < 0) {
                return Result::Fail(ErrorCode::kMissingManifest,
                                    "cannot read manifest of " + source_id + ": " + ArchiveErrorString(a));
            }
            if (out.size() + static_cast<size_t>(n) > max_bytes) {
                return Result::Fail(ErrorCode::kMissingManifest, "manifest of " + source_id + " is too large");
            }
            out.append(buf.data(), static_cast<size_t>(n));
        }
    }
    return Result::Fail(ErrorCode::kMissingManifest,
                        std::string("no ") + kJarManifestPath + " in " + source_id);
}

Result ParseManifestText(const std::string& source_id, const std::string& text, JarManifest& out) {
    auto parsed = JarManifest::Parse(text);
    if (!parsed) {
        return Result::Fail(ErrorCode::kMissingManifest,
                            "unreadable manifest in " + source_id + ": " + parsed.error());
    }
    out = std::move(*parsed);
    return Result::Ok();
}

} // namespace

Result ManifestExtractor::ReadComponentManifest(const std::string& source_id,
                                                IReader& entry,
                                                JarManifest& out) const {
    std::string text;
    auto res = options_.mode == ExtractionMode::kMemory ? ReadFromMemory(source_id, entry, text)
                                                        : ReadFromTempFile(source_id, entry, text);
    if (!res.is_ok()) return res;
    return ParseManifestText(source_id, text, out);
}

Result ManifestExtractor::ReadFromTempFile(const std::string& source_id,
                                           IReader& entry,
                                           std::string& manifest_text) const {
    TempFile tmp;
    auto cr = TempFile::Create(options_.temp_dir, kTempFilePrefix, tmp);
    if (!cr.is_ok()) return cr;

    std::uint64_t copied = 0;
    auto copy = tmp.CopyFrom(entry, options_.max_component_bytes, copied);
    if (!copy.is_ok()) {
        return Result::Fail(copy.code(), "extracting " + source_id + ": " + copy.message());
    }
    auto closed = tmp.Close();
    if (!closed.is_ok()) return closed;
    LogDebug("extracted %s to %s (%llu bytes)", source_id.c_str(), tmp.Path().c_str(),
             static_cast<unsigned long long>(copied));

    ArchiveReadPtr jar = NewZipReader();
    if (!jar) return Result::Fail(ErrorCode::kArchiveIo, "archive_read_new failed");
    if (archive_read_open_filename(jar.get(), tmp.Path().c_str(), kReadBlockSize) != ARCHIVE_OK) {
        return Result::Fail(ErrorCode::kMissingManifest,
                            "cannot read " + source_id + " as an archive: " + ArchiveErrorString(jar.get()));
    }
    // jar is released before tmp is unlinked (reverse declaration order)
    return FindJarManifest(jar.get(), source_id, options_.max_manifest_bytes, manifest_text);
}

Result ManifestExtractor::ReadFromMemory(const std::string& source_id,
                                         IReader& entry,
                                         std::string& manifest_text) const {
    std::vector<std::uint8_t> bytes;
    auto rr = ReadAllBounded(entry, options_.max_component_bytes, bytes);
    if (!rr.is_ok()) {
        return Result::Fail(rr.code(), "extracting " + source_id + ": " + rr.message());
    }

    ArchiveReadPtr jar = NewZipReader();
    if (!jar) return Result::Fail(ErrorCode::kArchiveIo, "archive_read_new failed");
    if (archive_read_open_memory(jar.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
        return Result::Fail(ErrorCode::kMissingManifest,
                            "cannot read " + source_id + " as an archive: " + ArchiveErrorString(jar.get()));
    }
    return FindJarManifest(jar.get(), source_id, options_.max_manifest_bytes, manifest_text);
}

Result ManifestExtractor::ReadSubsystemManifest(const std::string& source_id,
                                                IReader& entry,
                                                JarManifest& out) const {
    std::vector<std::uint8_t> bytes;
    auto rr = ReadAllBounded(entry, options_.max_manifest_bytes, bytes);
    if (!rr.is_ok()) {
        return Result::Fail(ErrorCode::kMissingManifest, "reading " + source_id + ": " + rr.message());
    }
    return ParseManifestText(source_id, std::string(bytes.begin(), bytes.end()), out);
}

} // namespace esa
