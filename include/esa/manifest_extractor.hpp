#pragma once

#include "esa/jar_manifest.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace esa {

inline constexpr const char kJarManifestPath[] = "META-INF/MANIFEST.MF";

enum class ExtractionMode {
    kTempFile,  // copy the nested jar to a temp file, then open it
    kMemory,    // buffer the nested jar and decode it with archive_read_open_memory
};

struct ManifestExtractorOptions {
    std::string temp_dir = "/tmp";
    std::uint64_t max_component_bytes = 256ULL * 1024 * 1024;
    std::uint64_t max_manifest_bytes = 1024ULL * 1024;
    ExtractionMode mode = ExtractionMode::kTempFile;
};

class ManifestExtractor {
public:
    ManifestExtractor() = default;
    explicit ManifestExtractor(ManifestExtractorOptions options) : options_(std::move(options)) {}

    // Manifest of a jar nested in the feature archive. `entry` streams the
    // jar's bytes. In temp-file mode the copy is removed before returning,
    // whatever the outcome.
    Result ReadComponentManifest(const std::string& source_id, IReader& entry, JarManifest& out) const;

    // SUBSYSTEM.MF is read straight from the entry stream.
    Result ReadSubsystemManifest(const std::string& source_id, IReader& entry, JarManifest& out) const;

    const ManifestExtractorOptions& Options() const { return options_; }

private:
    Result ReadFromTempFile(const std::string& source_id, IReader& entry, std::string& manifest_text) const;
    Result ReadFromMemory(const std::string& source_id, IReader& entry, std::string& manifest_text) const;

    ManifestExtractorOptions options_;
};

} // namespace esa
