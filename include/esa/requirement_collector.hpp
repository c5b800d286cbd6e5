#pragma once

#include "esa/feature_archive_reader.hpp"
#include "esa/jar_manifest.hpp"
#include "esa/manifest_extractor.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace esa {

// Raw Require-Capability value of one source (a component jar or SUBSYSTEM.MF).
struct RawRequirement {
    std::string source_id;
    std::string header_value;
};

struct CollectedRequirements {
    // Components in archive order, then the subsystem manifest.
    std::vector<RawRequirement> requirements;
    std::optional<JarManifest> subsystem_manifest;
    std::size_t components_scanned = 0;
};

class RequirementCollector {
public:
    explicit RequirementCollector(const ManifestExtractor& extractor) : extractor_(extractor) {}

    // Walks every entry of an opened archive. Any extraction failure aborts
    // the walk; no partial result is returned.
    Result Collect(FeatureArchiveReader& archive, CollectedRequirements& out) const;

private:
    const ManifestExtractor& extractor_;
};

} // namespace esa
