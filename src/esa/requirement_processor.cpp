#include "esa/requirement_processor.hpp"

#include "esa/feature_archive_reader.hpp"
#include "esa/feature_identity.hpp"
#include "esa/requirement_collector.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <map>
#include <optional>
#include <utility>

namespace esa {

Result RequirementProcessor::Process(const std::string& esa_path, FeatureResource& resource) const {
    CollectedRequirements collected;
    {
        FeatureArchiveReader archive;
        auto open_result = archive.Open(esa_path);
        if (!open_result.is_ok()) return open_result;

        RequirementCollector collector(extractor_);
        auto collect_result = collector.Collect(archive, collected);
        if (!collect_result.is_ok()) return collect_result;
    }

    std::string name = resource.Name();
    if (name.empty()) {
        const JarManifest* subsystem = collected.subsystem_manifest ? &*collected.subsystem_manifest : nullptr;
        name = FeatureIdentity::FromSubsystemManifest(subsystem, FileName(esa_path)).display_name;
    }

    auto resolution = resolver_.Resolve(collected.requirements);
    if (!resolution) {
        return Result::Fail(ErrorCode::kMalformedRequirement, esa_path + ": " + resolution.error());
    }

    if (resolution->IsConflict()) {
        return Result::Fail(ErrorCode::kResolutionConflict,
                            "ESA " + name +
                                " is invalid as no Java execution environment matches all the bundle requirements: " +
                                resolution->DescribeDiagnostics());
    }

    // Only the minimum matters: later environments include earlier ones.
    const std::string minimum = resolution->MinimumVersion();
    std::optional<std::map<std::string, std::string>> raw;
    if (!resolution->raw_directives.empty()) raw = std::move(resolution->raw_directives);

    LogInfo("%s: minimum Java version %s (%s), %zu constraining source(s)",
            esa_path.c_str(),
            minimum.c_str(),
            resolution->surviving.front().label.c_str(),
            raw ? raw->size() : static_cast<size_t>(0));

    resource.SetName(std::move(name));
    resource.SetJavaSeVersionRequirements(minimum, std::nullopt, std::move(raw));
    return Result::Ok();
}

} // namespace esa
