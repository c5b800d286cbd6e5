#pragma once

#include "esa/jar_manifest.hpp"

#include <string>
#include <string_view>

namespace esa {

struct FeatureIdentity {
    std::string symbolic_name;
    std::string version;
    std::string display_name;

    // Display name preference: Subsystem-Name, IBM-ShortName, symbolic name,
    // then `fallback_name` (usually the archive file name).
    static FeatureIdentity FromSubsystemManifest(const JarManifest* manifest, std::string_view fallback_name);
};

// Only .esa files are feature archives.
bool IsFeatureArchivePath(std::string_view path);

} // namespace esa
