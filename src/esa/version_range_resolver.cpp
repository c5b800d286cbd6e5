#include "esa/version_range_resolver.hpp"

#include "esa/capability_parser.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <utility>

namespace esa {

namespace {

CandidateEnvironment MakeEnvironment(const char* label, const char* range) {
    // The table is constant; a parse failure here is a programming error.
    return CandidateEnvironment{label, VersionRange::Parse(range).value()};
}

std::vector<CandidateEnvironment> BuildJavaExecutionEnvironments() {
    return {
        MakeEnvironment("Java 6", "[1.2,1.6]"),
        MakeEnvironment("Java 7", "[1.2,1.7]"),
        MakeEnvironment("Java 8", "[1.2,1.8]"),
        MakeEnvironment("Java 9", "[1.2,1.9]"),
        MakeEnvironment("Java 10", "[1.2,1.10]"),
        MakeEnvironment("Java 11", "[1.2,1.11]"),
    };
}

} // namespace

const std::vector<CandidateEnvironment>& JavaExecutionEnvironments() {
    static const std::vector<CandidateEnvironment> kEnvironments = BuildJavaExecutionEnvironments();
    return kEnvironments;
}

std::string EliminationDiagnostic::Describe() const {
    return "Manifest from " + source_id + " with range " + attempted.ToString() + " caused env for " +
           eliminated_label + " to be removed.";
}

std::string ResolutionResult::MinimumVersion() const {
    if (surviving.empty()) return {};
    const auto& max = surviving.front().range.Maximum();
    return max ? max->Text() : surviving.front().range.Minimum().Text();
}

std::string ResolutionResult::DescribeDiagnostics() const {
    std::string out;
    for (const auto& d : diagnostics) {
        if (!out.empty()) out.push_back(' ');
        out += d.Describe();
    }
    return out;
}

VersionRangeResolver::VersionRangeResolver() : candidates_(JavaExecutionEnvironments()) {}

VersionRangeResolver::VersionRangeResolver(std::vector<CandidateEnvironment> candidates)
    : candidates_(std::move(candidates)) {}

std::expected<ResolutionResult, std::string> VersionRangeResolver::Resolve(
    const std::vector<RawRequirement>& requirements) const {
    ResolutionResult result;
    result.surviving = candidates_;

    for (const auto& req : requirements) {
        auto clauses = CapabilityParser::ParseRequirement(req.header_value);
        if (!clauses) {
            return std::unexpected(req.source_id + ": malformed " + kRequireCapabilityHeader + ": " + clauses.error());
        }

        // Only the first execution-environment clause of a source is consulted.
        const auto ee = std::find_if(clauses->begin(), clauses->end(), [](const RequirementClause& c) {
            return c.name_space == kExecutionEnvironmentNamespace;
        });
        if (ee == clauses->end()) {
            LogDebug("%s: no %s requirement", req.source_id.c_str(), kExecutionEnvironmentNamespace);
            continue;
        }

        const auto filter_directive = ee->directives.find(kFilterDirective);
        if (filter_directive == ee->directives.end()) {
            LogDebug("%s: %s requirement without filter", req.source_id.c_str(), kExecutionEnvironmentNamespace);
            continue;
        }

        auto filter = CapabilityParser::ParseFilter(filter_directive->second);
        if (!filter) {
            return std::unexpected(req.source_id + ": malformed filter: " + filter.error());
        }

        const auto kind = filter->find(kExecutionEnvironmentNamespace);
        const auto version = filter->find(kVersionFilterKey);
        if (kind == filter->end() || kind->second != kJavaSeFilterValue || version == filter->end()) {
            LogDebug("%s: uninteresting filter %s", req.source_id.c_str(), filter_directive->second.c_str());
            continue;
        }

        auto range = CapabilityParser::ParseVersionRange(version->second);
        if (!range) {
            return std::unexpected(req.source_id + ": malformed version range: " + range.error());
        }

        std::vector<CandidateEnvironment> kept;
        kept.reserve(result.surviving.size());
        bool eliminated_any = false;
        for (const auto& candidate : result.surviving) {
            // Survivors keep their own bounds; only disjoint candidates go.
            if (candidate.range.Intersect(*range)) {
                kept.push_back(candidate);
                continue;
            }
            result.diagnostics.push_back(EliminationDiagnostic{req.source_id, *range, candidate.label});
            LogDebug("%s", result.diagnostics.back().Describe().c_str());
            eliminated_any = true;
        }
        result.surviving = std::move(kept);

        if (eliminated_any) {
            result.raw_directives[req.source_id] = filter_directive->second;
        }
    }

    return result;
}

} // namespace esa
