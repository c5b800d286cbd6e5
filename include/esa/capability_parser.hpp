#pragma once

#include "esa/version_range.hpp"

#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace esa {

// One clause of a Require-Capability header: "ns;attr=v;directive:=v".
struct RequirementClause {
    std::string name_space;
    std::map<std::string, std::string> attributes;
    std::map<std::string, std::string> directives;
};

// Attribute name -> expected value, as found in a clause's filter directive.
using FilterExpression = std::map<std::string, std::string>;

class CapabilityParser {
public:
    // Splits a header value into clauses, preserving their order.
    static std::expected<std::vector<RequirementClause>, std::string> ParseRequirement(std::string_view raw);

    // Flattens an LDAP-style filter such as
    //   (&(osgi.ee=JavaSE)(version>=1.7)(!(version>=1.9)))
    // into {"osgi.ee": "JavaSE", "version": "[1.7,1.9)"}.
    // Comparisons on "version" fold into one interval; a plain
    // "version=x" is kept verbatim.
    static std::expected<FilterExpression, std::string> ParseFilter(std::string_view filter);

    static std::expected<VersionRange, std::string> ParseVersionRange(std::string_view value);
};

} // namespace esa
