#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace esa {

struct JavaSeRequirements {
    std::string minimum;
    std::optional<std::string> maximum;
    // source id -> raw filter directive; absent when no source constrained the result
    std::optional<std::map<std::string, std::string>> raw_requirements;
};

// The catalog-side view of a feature that the resolution pass writes to.
class FeatureResource {
public:
    void SetName(std::string name) { name_ = std::move(name); }
    const std::string& Name() const { return name_; }

    void SetJavaSeVersionRequirements(std::string minimum,
                                      std::optional<std::string> maximum,
                                      std::optional<std::map<std::string, std::string>> raw_requirements) {
        java_se_ = JavaSeRequirements{std::move(minimum), std::move(maximum), std::move(raw_requirements)};
    }
    const std::optional<JavaSeRequirements>& JavaSeVersionRequirements() const { return java_se_; }

private:
    std::string name_;
    std::optional<JavaSeRequirements> java_se_;
};

} // namespace esa
