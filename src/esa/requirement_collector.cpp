#include "esa/requirement_collector.hpp"

#include "util/logger.hpp"

#include <memory>
#include <utility>

namespace esa {

Result RequirementCollector::Collect(FeatureArchiveReader& archive, CollectedRequirements& out) const {
    CollectedRequirements collected;
    std::optional<RawRequirement> subsystem_requirement;

    bool eof = false;
    FeatureEntryInfo entry{};

    while (true) {
        auto next_result = archive.Next(entry, eof);
        if (!next_result.is_ok()) return next_result;
        if (eof) break;

        std::unique_ptr<IReader> entry_reader;
        auto open_entry_result = archive.OpenCurrentEntryReader(entry_reader);
        if (!open_entry_result.is_ok()) return open_entry_result;

        JarManifest manifest;
        if (entry.kind == FeatureEntryKind::kComponent) {
            ++collected.components_scanned;
            auto res = extractor_.ReadComponentManifest(entry.name, *entry_reader, manifest);
            if (!res.is_ok()) {
                return Result::Fail(res.code(), res.message() + " (archive " + archive.Path() + ")");
            }
        } else {
            auto res = extractor_.ReadSubsystemManifest(kSubsystemManifestPath, *entry_reader, manifest);
            if (!res.is_ok()) {
                return Result::Fail(res.code(), res.message() + " (archive " + archive.Path() + ")");
            }
        }

        auto skip_result = archive.SkipCurrent();
        if (!skip_result.is_ok()) return skip_result;

        auto header = manifest.MainAttribute(kRequireCapabilityHeader);
        if (entry.kind == FeatureEntryKind::kSubsystemManifest) {
            if (header) subsystem_requirement = RawRequirement{kSubsystemManifestPath, std::move(*header)};
            collected.subsystem_manifest = std::move(manifest);
            continue;
        }

        if (!header) {
            LogDebug("%s: no %s header", entry.name.c_str(), kRequireCapabilityHeader);
            continue;
        }
        LogDebug("%s: %s: %s", entry.name.c_str(), kRequireCapabilityHeader, header->c_str());
        collected.requirements.push_back(RawRequirement{entry.name, std::move(*header)});
    }

    if (subsystem_requirement) {
        collected.requirements.push_back(std::move(*subsystem_requirement));
    }

    LogInfo("Scanned %s: components=%zu subsystem_manifest=%s requirements=%zu",
            archive.Path().c_str(),
            collected.components_scanned,
            collected.subsystem_manifest ? "yes" : "no",
            collected.requirements.size());

    out = std::move(collected);
    return Result::Ok();
}

} // namespace esa
