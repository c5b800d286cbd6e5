#include "esa/feature_report.hpp"

namespace esa {

nlohmann::json ReportSuccess(const std::string& path, const FeatureResource& resource) {
    nlohmann::json j;
    j["path"] = path;
    j["name"] = resource.Name();
    const auto& req = resource.JavaSeVersionRequirements();
    if (req) {
        j["minimumJavaVersion"] = req->minimum;
    } else {
        j["minimumJavaVersion"] = nullptr;
    }
    if (req && req->raw_requirements) {
        j["rawRequirements"] = *req->raw_requirements;
    } else {
        j["rawRequirements"] = nullptr;
    }
    return j;
}

nlohmann::json ReportFailure(const std::string& path, const Result& res) {
    nlohmann::json j;
    j["path"] = path;
    j["category"] = ErrorCodeName(res.code());
    j["error"] = res.message();
    return j;
}

std::string ReportLine(const nlohmann::json& report) {
    return report.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace esa
