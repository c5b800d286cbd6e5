#pragma once

#include "esa/feature_resource.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace esa {

nlohmann::json ReportSuccess(const std::string& path, const FeatureResource& resource);
nlohmann::json ReportFailure(const std::string& path, const Result& res);

// Single-line JSON for stdout. Paths, manifest values and archive entry
// names are not guaranteed UTF-8; invalid sequences become U+FFFD.
std::string ReportLine(const nlohmann::json& report);

} // namespace esa
