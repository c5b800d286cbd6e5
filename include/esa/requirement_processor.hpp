#pragma once

#include "esa/feature_resource.hpp"
#include "esa/manifest_extractor.hpp"
#include "esa/version_range_resolver.hpp"
#include "util/result.hpp"

#include <string>
#include <utility>

namespace esa {

/**
 * @brief One requirement-resolution pass over a feature archive.
 *
 * Opens the archive, collects the Require-Capability header of every
 * component jar and of SUBSYSTEM.MF, narrows the Java execution
 * environments and, on success, publishes the minimum version and the
 * per-source raw filters to the resource in a single call.
 *
 * An unnamed resource is named after the feature (Subsystem-Name and
 * fallbacks) before resolution starts.
 *
 * Failures leave the resource's version requirements untouched:
 *  - kArchiveIo / kMissingManifest: archive or manifest unreadable
 *  - kMalformedRequirement: header, filter or range does not parse
 *  - kResolutionConflict: no environment satisfies every source
 */
class RequirementProcessor {
public:
    RequirementProcessor() = default;
    explicit RequirementProcessor(ManifestExtractorOptions options) : extractor_(std::move(options)) {}
    RequirementProcessor(ManifestExtractorOptions options, VersionRangeResolver resolver)
        : extractor_(std::move(options)), resolver_(std::move(resolver)) {}

    Result Process(const std::string& esa_path, FeatureResource& resource) const;

private:
    ManifestExtractor extractor_;
    VersionRangeResolver resolver_;
};

} // namespace esa
