#pragma once

#include "esa/requirement_collector.hpp"
#include "esa/version_range.hpp"

#include <expected>
#include <map>
#include <string>
#include <vector>

namespace esa {

inline constexpr const char kExecutionEnvironmentNamespace[] = "osgi.ee";
inline constexpr const char kJavaSeFilterValue[] = "JavaSE";
inline constexpr const char kVersionFilterKey[] = "version";
inline constexpr const char kFilterDirective[] = "filter";

struct CandidateEnvironment {
    std::string label;
    VersionRange range;
};

// "Java 6" .. "Java 11", ascending by upper bound. Built once, never mutated.
const std::vector<CandidateEnvironment>& JavaExecutionEnvironments();

// One candidate removal: `source_id` asked for `attempted`, which does not
// overlap `eliminated_label`'s range.
struct EliminationDiagnostic {
    std::string source_id;
    VersionRange attempted;
    std::string eliminated_label;

    std::string Describe() const;
};

struct ResolutionResult {
    std::vector<CandidateEnvironment> surviving;
    std::vector<EliminationDiagnostic> diagnostics;
    // source id -> raw filter directive, for sources that eliminated a candidate
    std::map<std::string, std::string> raw_directives;

    bool IsConflict() const { return surviving.empty(); }

    // Upper bound of the lowest surviving environment. Empty on conflict.
    std::string MinimumVersion() const;

    // The diagnostic trail, in encounter order, as one line.
    std::string DescribeDiagnostics() const;
};

class VersionRangeResolver {
public:
    VersionRangeResolver();
    explicit VersionRangeResolver(std::vector<CandidateEnvironment> candidates);

    // Narrows the candidate list by each requirement in order. Fails only if
    // a header, filter or range is malformed; a conflict is reported through
    // ResolutionResult::IsConflict().
    std::expected<ResolutionResult, std::string> Resolve(const std::vector<RawRequirement>& requirements) const;

private:
    std::vector<CandidateEnvironment> candidates_;
};

} // namespace esa
