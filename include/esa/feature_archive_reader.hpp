#pragma once

#include "io/archive_handle.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <archive_entry.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace esa {

inline constexpr const char kSubsystemManifestPath[] = "OSGI-INF/SUBSYSTEM.MF";

enum class FeatureEntryKind {
    kComponent,
    kSubsystemManifest,
};

struct FeatureEntryInfo {
    std::string name;   // normalized archive-relative path
    std::uint64_t size = 0;
    FeatureEntryKind kind = FeatureEntryKind::kComponent;
};

// A "*.jar" directly under the archive root.
bool IsComponentEntryPath(std::string_view normalized_path);
// OSGI-INF/SUBSYSTEM.MF, any case.
bool IsSubsystemManifestPath(std::string_view normalized_path);

/**
 * @brief Sequential reader over the entries of a feature (.esa) archive that
 * matter for requirement resolution.
 *
 * Next() yields component jars and the first subsystem manifest, in archive
 * order, and skips everything else. libarchive is sequential: the current
 * entry must be read to EOF or skipped before calling Next() again.
 */
class FeatureArchiveReader {
public:
    FeatureArchiveReader() = default;

    FeatureArchiveReader(const FeatureArchiveReader&) = delete;
    FeatureArchiveReader& operator=(const FeatureArchiveReader&) = delete;

    Result Open(const std::string& path);

    // Returns Ok + eof=true at end of archive.
    Result Next(FeatureEntryInfo& out, bool& eof);

    // Streams the current entry via archive_read_data().
    Result OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader);

    Result SkipCurrent();

    const std::string& Path() const { return path_; }

private:
    Result Fail(const std::string& what) const;

    std::string path_;
    ArchiveReadPtr ar_;
    struct archive_entry* cur_entry_ = nullptr;
    bool in_entry_ = false;
    bool subsystem_seen_ = false;

    class EntryReader final : public IReader {
    public:
        explicit EntryReader(FeatureArchiveReader* parent) : parent_(parent) {}
        ssize_t Read(std::span<std::uint8_t> out) override;
        std::optional<std::uint64_t> TotalSize() const override;

    private:
        FeatureArchiveReader* parent_ = nullptr;
    };
};

} // namespace esa
