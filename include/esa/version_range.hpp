#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace esa {

/**
 * @brief OSGi version: major[.minor[.micro[.qualifier]]].
 *
 * The text the version was parsed from is kept verbatim, so a range
 * written as "[1.2,1.8]" reports its maximum as "1.8" rather than "1.8.0".
 */
class Version {
public:
    static std::expected<Version, std::string> Parse(std::string_view text);

    Version() = default;

    std::uint32_t Major() const { return major_; }
    std::uint32_t Minor() const { return minor_; }
    std::uint32_t Micro() const { return micro_; }
    const std::string& Qualifier() const { return qualifier_; }
    const std::string& Text() const { return text_; }

    // <0, 0, >0 like strcmp. "1.8" and "1.8.0" compare equal.
    int Compare(const Version& other) const;

private:
    std::uint32_t major_ = 0;
    std::uint32_t minor_ = 0;
    std::uint32_t micro_ = 0;
    std::string qualifier_;
    std::string text_ = "0.0.0";
};

/**
 * @brief Interval of versions with independently open or closed ends.
 *
 * Text forms: "[a,b]", "(a,b)", "[a,b)", "(a,b]", a bare "a" meaning
 * "a or later", and an empty ceiling ("[a,)") which is also unbounded.
 * A range never describes an empty set; Intersect() reports emptiness
 * by returning nullopt.
 */
class VersionRange {
public:
    static std::expected<VersionRange, std::string> Parse(std::string_view text);

    // nullopt when the bounds describe an empty interval.
    static std::optional<VersionRange> Make(Version minimum,
                                            bool minimum_exclusive,
                                            std::optional<Version> maximum,
                                            bool maximum_exclusive);

    const Version& Minimum() const { return minimum_; }
    bool MinimumExclusive() const { return minimum_exclusive_; }
    const std::optional<Version>& Maximum() const { return maximum_; }
    bool MaximumExclusive() const { return maximum_exclusive_; }

    std::optional<VersionRange> Intersect(const VersionRange& other) const;

    std::string ToString() const;

private:
    VersionRange(Version minimum, bool minimum_exclusive, std::optional<Version> maximum, bool maximum_exclusive);

    static bool IsNonEmpty(const Version& minimum,
                           bool minimum_exclusive,
                           const std::optional<Version>& maximum,
                           bool maximum_exclusive);

    Version minimum_;
    bool minimum_exclusive_ = false;
    std::optional<Version> maximum_;
    bool maximum_exclusive_ = false;
};

} // namespace esa
