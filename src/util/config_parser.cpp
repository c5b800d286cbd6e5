#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace esa::config {

void ToolConfigFromFile::Reset() {
    log_level.reset();
    temp_dir.reset();
    max_component_bytes.reset();
    component_extraction.reset();
}

Result ToolConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorCode::kConfig, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorCode::kConfig, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace esa::config
