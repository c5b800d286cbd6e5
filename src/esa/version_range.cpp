#include "esa/version_range.hpp"

#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ranges>
#include <utility>
#include <vector>

namespace esa {

namespace {

bool IsQualifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::expected<std::uint32_t, std::string> ParseNumber(std::string_view part, std::string_view whole) {
    std::uint32_t value = 0;
    const auto* first = part.data();
    const auto* last = part.data() + part.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (part.empty() || ec != std::errc() || ptr != last) {
        return std::unexpected("invalid version \"" + std::string(whole) + "\": bad component \"" +
                               std::string(part) + "\"");
    }
    return value;
}

} // namespace

std::expected<Version, std::string> Version::Parse(std::string_view text) {
    const std::string_view trimmed = Trim(text);
    if (trimmed.empty()) {
        return std::unexpected("invalid version: empty string");
    }

    std::vector<std::string_view> parts;
    for (auto&& rng : trimmed | std::views::split('.')) {
        parts.emplace_back(rng.begin(), rng.end());
    }
    if (parts.size() > 4) {
        return std::unexpected("invalid version \"" + std::string(trimmed) + "\": too many components");
    }

    Version v;
    std::uint32_t* numeric[] = {&v.major_, &v.minor_, &v.micro_};
    for (size_t i = 0; i < parts.size() && i < 3; ++i) {
        auto n = ParseNumber(parts[i], trimmed);
        if (!n) return std::unexpected(n.error());
        *numeric[i] = *n;
    }
    if (parts.size() == 4) {
        const auto q = parts[3];
        if (q.empty() || !std::ranges::all_of(q, IsQualifierChar)) {
            return std::unexpected("invalid version \"" + std::string(trimmed) + "\": bad qualifier");
        }
        v.qualifier_ = std::string(q);
    }
    v.text_ = std::string(trimmed);
    return v;
}

int Version::Compare(const Version& other) const {
    if (major_ != other.major_) return major_ < other.major_ ? -1 : 1;
    if (minor_ != other.minor_) return minor_ < other.minor_ ? -1 : 1;
    if (micro_ != other.micro_) return micro_ < other.micro_ ? -1 : 1;
    const int q = qualifier_.compare(other.qualifier_);
    return q < 0 ? -1 : (q > 0 ? 1 : 0);
}

VersionRange::VersionRange(Version minimum,
                           bool minimum_exclusive,
                           std::optional<Version> maximum,
                           bool maximum_exclusive)
    : minimum_(std::move(minimum)),
      minimum_exclusive_(minimum_exclusive),
      maximum_(std::move(maximum)),
      maximum_exclusive_(maximum_exclusive) {}

bool VersionRange::IsNonEmpty(const Version& minimum,
                              bool minimum_exclusive,
                              const std::optional<Version>& maximum,
                              bool maximum_exclusive) {
    if (!maximum) return true;
    const int cmp = minimum.Compare(*maximum);
    if (cmp == 0) return !(minimum_exclusive || maximum_exclusive);
    return cmp < 0;
}

std::optional<VersionRange> VersionRange::Make(Version minimum,
                                               bool minimum_exclusive,
                                               std::optional<Version> maximum,
                                               bool maximum_exclusive) {
    if (!IsNonEmpty(minimum, minimum_exclusive, maximum, maximum_exclusive)) return std::nullopt;
    // An unbounded ceiling is never exclusive.
    if (!maximum) maximum_exclusive = false;
    return VersionRange(std::move(minimum), minimum_exclusive, std::move(maximum), maximum_exclusive);
}

std::expected<VersionRange, std::string> VersionRange::Parse(std::string_view text) {
    const std::string_view s = Trim(text);
    if (s.empty()) return std::unexpected("invalid version range: empty string");

    const char open = s.front();
    if (open != '[' && open != '(') {
        auto v = Version::Parse(s);
        if (!v) return std::unexpected(v.error());
        return VersionRange(std::move(*v), false, std::nullopt, false);
    }

    const char close = s.back();
    if (s.size() < 2 || (close != ']' && close != ')')) {
        return std::unexpected("invalid version range \"" + std::string(s) + "\": missing closing bracket");
    }
    const std::string_view body = s.substr(1, s.size() - 2);
    const auto comma = body.find(',');
    if (comma == std::string_view::npos || body.find(',', comma + 1) != std::string_view::npos) {
        return std::unexpected("invalid version range \"" + std::string(s) + "\": expected floor,ceiling");
    }

    auto floor = Version::Parse(body.substr(0, comma));
    if (!floor) return std::unexpected(floor.error());

    std::optional<Version> ceiling;
    const std::string_view ceiling_text = Trim(body.substr(comma + 1));
    if (!ceiling_text.empty()) {
        auto c = Version::Parse(ceiling_text);
        if (!c) return std::unexpected(c.error());
        ceiling = std::move(*c);
    }

    auto range = Make(std::move(*floor), open == '(', std::move(ceiling), close == ')');
    if (!range) {
        return std::unexpected("invalid version range \"" + std::string(s) + "\": empty interval");
    }
    return std::move(*range);
}

std::optional<VersionRange> VersionRange::Intersect(const VersionRange& other) const {
    // Highest floor wins; on a tie an exclusive end dominates.
    const Version* floor = &minimum_;
    bool floor_exclusive = minimum_exclusive_;
    const int min_cmp = minimum_.Compare(other.minimum_);
    if (min_cmp < 0) {
        floor = &other.minimum_;
        floor_exclusive = other.minimum_exclusive_;
    } else if (min_cmp == 0) {
        floor_exclusive = minimum_exclusive_ || other.minimum_exclusive_;
    }

    // Lowest ceiling wins.
    std::optional<Version> ceiling;
    bool ceiling_exclusive = false;
    if (maximum_ && other.maximum_) {
        const int max_cmp = maximum_->Compare(*other.maximum_);
        if (max_cmp < 0) {
            ceiling = maximum_;
            ceiling_exclusive = maximum_exclusive_;
        } else if (max_cmp > 0) {
            ceiling = other.maximum_;
            ceiling_exclusive = other.maximum_exclusive_;
        } else {
            ceiling = maximum_;
            ceiling_exclusive = maximum_exclusive_ || other.maximum_exclusive_;
        }
    } else if (maximum_) {
        ceiling = maximum_;
        ceiling_exclusive = maximum_exclusive_;
    } else if (other.maximum_) {
        ceiling = other.maximum_;
        ceiling_exclusive = other.maximum_exclusive_;
    }

    return Make(*floor, floor_exclusive, std::move(ceiling), ceiling_exclusive);
}

std::string VersionRange::ToString() const {
    if (!maximum_) {
        if (!minimum_exclusive_) return minimum_.Text();
        return "(" + minimum_.Text() + ",)";
    }
    std::string out;
    out.push_back(minimum_exclusive_ ? '(' : '[');
    out += minimum_.Text();
    out.push_back(',');
    out += maximum_->Text();
    out.push_back(maximum_exclusive_ ? ')' : ']');
    return out;
}

} // namespace esa
