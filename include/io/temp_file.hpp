#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace esa {

// A mkstemp(3) file that is unlinked when the object goes away.
class TempFile {
public:
    static Result Create(const std::string& dir, const std::string& prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    const std::string& Path() const;

    Result WriteAll(std::span<const std::uint8_t> data);

    // Copies `src` to the file until EOF. Fails once more than `max_bytes` arrive.
    Result CopyFrom(IReader& src, std::uint64_t max_bytes, std::uint64_t& out_copied);

    // Flush and close the descriptor; the file stays on disk until destruction.
    Result Close();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

} // namespace esa
