#include "esa/feature_archive_reader.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace esa {

namespace {
constexpr size_t kReadBlockSize = 64 * 1024;
} // namespace

bool IsComponentEntryPath(std::string_view normalized_path) {
    return normalized_path.find('/') == std::string_view::npos &&
           normalized_path.size() > 4 && EndsWith(normalized_path, ".jar");
}

bool IsSubsystemManifestPath(std::string_view normalized_path) {
    return EqualsIgnoreCase(normalized_path, kSubsystemManifestPath);
}

Result FeatureArchiveReader::Fail(const std::string& what) const {
    return Result::Fail(ErrorCode::kArchiveIo, what + ": " + path_ + " (" + ArchiveErrorString(ar_.get()) + ")");
}

Result FeatureArchiveReader::Open(const std::string& path) {
    if (ar_) return Result::Fail(ErrorCode::kArchiveIo, "Archive already opened: " + path_);
    path_ = path;

    ar_ = NewZipReader();
    if (!ar_) return Result::Fail(ErrorCode::kArchiveIo, "archive_read_new failed");

    if (archive_read_open_filename(ar_.get(), path.c_str(), kReadBlockSize) != ARCHIVE_OK) {
        auto res = Fail("Could not open archive");
        ar_.reset();
        return res;
    }
    return Result::Ok();
}

Result FeatureArchiveReader::Next(FeatureEntryInfo& out, bool& eof) {
    eof = false;
    if (!ar_) return Result::Fail(ErrorCode::kArchiveIo, "Archive not opened");

    if (in_entry_) {
        return Result::Fail(ErrorCode::kArchiveIo,
                            "Previous entry not finished (read to EOF or call SkipCurrent)");
    }

    while (true) {
        const int r = archive_read_next_header(ar_.get(), &cur_entry_);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r == ARCHIVE_WARN) {
            LogWarn("%s: %s", path_.c_str(), ArchiveErrorString(ar_.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return Fail("Could not read archive entry");
        }

        const char* raw = archive_entry_pathname(cur_entry_);
        const std::string name = NormalizeEntryPath(raw ? std::string(raw) : std::string());

        std::optional<FeatureEntryKind> kind;
        if (archive_entry_filetype(cur_entry_) == AE_IFREG) {
            if (IsComponentEntryPath(name)) {
                kind = FeatureEntryKind::kComponent;
            } else if (IsSubsystemManifestPath(name)) {
                if (subsystem_seen_) {
                    LogWarn("%s: ignoring duplicate subsystem manifest %s", path_.c_str(), name.c_str());
                } else {
                    kind = FeatureEntryKind::kSubsystemManifest;
                    subsystem_seen_ = true;
                }
            }
        }

        if (!kind) {
            LogDebug("skip: %s", name.c_str());
            if (archive_read_data_skip(ar_.get()) != ARCHIVE_OK) {
                return Fail("Could not skip archive entry " + name);
            }
            continue;
        }

        out.name = name;
        out.size = archive_entry_size_is_set(cur_entry_)
                       ? static_cast<std::uint64_t>(archive_entry_size(cur_entry_))
                       : 0;
        out.kind = *kind;
        in_entry_ = true;
        return Result::Ok();
    }
}

Result FeatureArchiveReader::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    in_entry_ = false;
    if (archive_read_data_skip(ar_.get()) != ARCHIVE_OK) {
        return Fail("archive_read_data_skip");
    }
    return Result::Ok();
}

Result FeatureArchiveReader::OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader) {
    if (!in_entry_) return Result::Fail(ErrorCode::kArchiveIo, "No current entry");
    out_reader = std::make_unique<EntryReader>(this);
    return Result::Ok();
}

ssize_t FeatureArchiveReader::EntryReader::Read(std::span<std::uint8_t> out) {
    if (!parent_ || !parent_->in_entry_) return 0;
    const la_ssize_t n = archive_read_data(parent_->ar_.get(), out.data(), out.size());
    if (n < 0) return -1;
    if (n == 0) {
        // entry finished
        parent_->in_entry_ = false;
        return 0;
    }
    return static_cast<ssize_t>(n);
}

std::optional<std::uint64_t> FeatureArchiveReader::EntryReader::TotalSize() const {
    if (!parent_ || !parent_->cur_entry_ || !archive_entry_size_is_set(parent_->cur_entry_)) return std::nullopt;
    const la_int64_t sz = archive_entry_size(parent_->cur_entry_);
    if (sz < 0) return std::nullopt;
    return static_cast<std::uint64_t>(sz);
}

} // namespace esa
