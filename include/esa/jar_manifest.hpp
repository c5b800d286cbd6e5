#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace esa {

inline constexpr const char kRequireCapabilityHeader[] = "Require-Capability";

// Main section of a JAR-style manifest (META-INF/MANIFEST.MF, OSGI-INF/SUBSYSTEM.MF).
class JarManifest {
public:
    // Reads "Name: value" lines up to the first blank line. Lines that start
    // with a single space continue the previous value.
    static std::expected<JarManifest, std::string> Parse(std::string_view text);

    // Header names compare case-insensitively.
    std::optional<std::string> MainAttribute(std::string_view name) const;

    const std::vector<std::pair<std::string, std::string>>& MainAttributes() const { return main_; }

private:
    std::vector<std::pair<std::string, std::string>> main_;
};

} // namespace esa
