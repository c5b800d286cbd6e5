#include "io/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <utility>
#include <vector>

namespace esa {

Result TempFile::Create(const std::string& dir, const std::string& prefix, TempFile& out) {
    std::string tmpl = (dir.empty() ? std::string("/tmp") : dir) + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return Result::Fail(ErrorCode::kArchiveIo,
                            "mkstemp failed in " + dir + " (" + std::strerror(errno) + ")");
    }
    out.Cleanup();
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

const std::string& TempFile::Path() const { return path_; }

Result TempFile::WriteAll(std::span<const std::uint8_t> data) {
    if (!fd_.Valid()) return Result::Fail(ErrorCode::kArchiveIo, "temp file not open");
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd_.Get(), data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorCode::kArchiveIo,
                                "write to " + path_ + " failed (" + std::strerror(errno) + ")");
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result TempFile::CopyFrom(IReader& src, std::uint64_t max_bytes, std::uint64_t& out_copied) {
    out_copied = 0;
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = src.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) return Result::Fail(ErrorCode::kArchiveIo, "read failed while copying to " + path_);
        if (n == 0) break;

        out_copied += static_cast<std::uint64_t>(n);
        if (out_copied > max_bytes) {
            return Result::Fail(ErrorCode::kArchiveIo,
                                "entry exceeds size limit of " + std::to_string(max_bytes) + " bytes");
        }
        auto wr = WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return wr;
    }
    return Result::Ok();
}

Result TempFile::Close() {
    if (!fd_.Valid()) return Result::Ok();
    if (!fd_.Close()) {
        return Result::Fail(ErrorCode::kArchiveIo, "close of " + path_ + " failed");
    }
    return Result::Ok();
}

void TempFile::Cleanup() {
    (void)fd_.Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace esa
