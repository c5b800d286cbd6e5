#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>

namespace esa::config::detail {

namespace {

// Missing key: true and `out` untouched. Wrong type: false.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v <= 0) {
        err = std::string(key) + " must be positive";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ToolConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "LogLevel", cfg.log_level, err) ||
        !GetStringIfPresent(j, "TempDir", cfg.temp_dir, err) ||
        !GetU64IfPresent(j, "MaxComponentBytes", cfg.max_component_bytes, err) ||
        !GetStringIfPresent(j, "ComponentExtraction", cfg.component_extraction, err)) {
        return false;
    }

    if (cfg.log_level && !ParseLogLevel(*cfg.log_level)) {
        err = "unknown LogLevel '" + *cfg.log_level + "'";
        return false;
    }
    if (cfg.temp_dir && cfg.temp_dir->empty()) {
        err = "TempDir must not be empty";
        return false;
    }
    if (cfg.component_extraction && *cfg.component_extraction != "tempfile" &&
        *cfg.component_extraction != "memory") {
        err = "ComponentExtraction must be \"tempfile\" or \"memory\"";
        return false;
    }

    return true;
}

} // namespace esa::config::detail
