#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace esa::config {

// Optional tool settings read from a JSON object. Absent keys stay unset
// and the built-in defaults apply.
class ToolConfigFromFile {
public:
    std::optional<std::string> log_level;
    std::optional<std::string> temp_dir;
    std::optional<std::uint64_t> max_component_bytes;
    std::optional<std::string> component_extraction;

    Result LoadFile(const std::string& path);

    void Reset();
};

} // namespace esa::config
