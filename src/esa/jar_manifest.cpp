#include "esa/jar_manifest.hpp"

#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>

namespace esa {

namespace {

constexpr size_t kMaxHeaderNameLength = 70;

bool IsHeaderNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

// Next line without its terminator; accepts \r\n, \n and \r.
std::string_view NextLine(std::string_view text, size_t& pos) {
    const size_t start = pos;
    while (pos < text.size() && text[pos] != '\n' && text[pos] != '\r') ++pos;
    const std::string_view line = text.substr(start, pos - start);
    if (pos < text.size()) {
        if (text[pos] == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') ++pos;
        ++pos;
    }
    return line;
}

} // namespace

std::expected<JarManifest, std::string> JarManifest::Parse(std::string_view text) {
    if (text.rfind("\xEF\xBB\xBF", 0) == 0) text.remove_prefix(3);

    JarManifest m;
    std::string* last_value = nullptr;
    size_t pos = 0;
    int line_no = 0;

    while (pos < text.size()) {
        const std::string_view line = NextLine(text, pos);
        ++line_no;
        if (line.empty()) break;

        if (line.front() == ' ') {
            if (!last_value) {
                return std::unexpected("line " + std::to_string(line_no) + ": continuation without header");
            }
            last_value->append(line.substr(1));
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0 || colon + 1 >= line.size() || line[colon + 1] != ' ') {
            return std::unexpected("line " + std::to_string(line_no) + ": invalid header field");
        }
        const std::string_view name = line.substr(0, colon);
        if (name.size() > kMaxHeaderNameLength) {
            return std::unexpected("line " + std::to_string(line_no) + ": header name too long");
        }
        for (char c : name) {
            if (!IsHeaderNameChar(c)) {
                return std::unexpected("line " + std::to_string(line_no) + ": invalid header name \"" +
                                       std::string(name) + "\"");
            }
        }

        std::string value(line.substr(colon + 2));
        auto existing = std::find_if(m.main_.begin(), m.main_.end(), [&](const auto& kv) {
            return EqualsIgnoreCase(kv.first, name);
        });
        if (existing != m.main_.end()) {
            // Last occurrence wins.
            existing->second = std::move(value);
            last_value = &existing->second;
        } else {
            m.main_.emplace_back(std::string(name), std::move(value));
            last_value = &m.main_.back().second;
        }
    }
    return m;
}

std::optional<std::string> JarManifest::MainAttribute(std::string_view name) const {
    for (const auto& [key, value] : main_) {
        if (EqualsIgnoreCase(key, name)) return value;
    }
    return std::nullopt;
}

} // namespace esa
