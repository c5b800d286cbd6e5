#include "esa/capability_parser.hpp"

#include "util/path_utils.hpp"
#include "util/result.hpp"

#include <optional>
#include <utility>

namespace esa {

namespace {

constexpr const char kVersionAttribute[] = "version";

// Split on `sep` outside double quotes. Backslash escapes the next
// character inside a quoted section.
std::expected<std::vector<std::string_view>, std::string> SplitTopLevel(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    bool in_quote = false;
    size_t start = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (in_quote) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_quote = false;
            }
            continue;
        }
        if (c == '"') {
            in_quote = true;
        } else if (c == sep) {
            out.push_back(s.substr(start, i - start));
            start = i + 1;
        }
    }
    if (in_quote) {
        return std::unexpected("unterminated quote in \"" + std::string(s) + "\"");
    }
    out.push_back(s.substr(start));
    return out;
}

std::expected<std::string, std::string> Unquote(std::string_view v) {
    v = Trim(v);
    if (v.empty() || v.front() != '"') return std::string(v);
    if (v.size() < 2 || v.back() != '"') {
        return std::unexpected("unterminated quote in value " + std::string(v));
    }
    std::string out;
    out.reserve(v.size() - 2);
    for (size_t i = 1; i + 1 < v.size(); ++i) {
        if (v[i] == '\\' && i + 2 < v.size()) {
            ++i;
        }
        out.push_back(v[i]);
    }
    return out;
}

std::expected<RequirementClause, std::string> ParseClause(std::string_view clause_text) {
    auto params = SplitTopLevel(clause_text, ';');
    if (!params) return std::unexpected(params.error());

    RequirementClause clause;
    clause.name_space = std::string(Trim(params->front()));
    if (clause.name_space.empty()) {
        return std::unexpected("clause without namespace: \"" + std::string(Trim(clause_text)) + "\"");
    }
    if (clause.name_space.find_first_of("=\"") != std::string::npos) {
        return std::unexpected("invalid namespace \"" + clause.name_space + "\"");
    }

    for (size_t i = 1; i < params->size(); ++i) {
        const std::string_view param = Trim((*params)[i]);
        if (param.empty()) continue;

        const auto eq = param.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return std::unexpected("parameter without '=' in clause " + clause.name_space + ": \"" +
                                   std::string(param) + "\"");
        }

        const bool directive = param[eq - 1] == ':';
        std::string_view key = Trim(param.substr(0, directive ? eq - 1 : eq));
        if (!directive) {
            // typed attribute: key:Version=1.0
            const auto colon = key.find(':');
            if (colon != std::string_view::npos) key = Trim(key.substr(0, colon));
        }
        if (key.empty()) {
            return std::unexpected("empty parameter name in clause " + clause.name_space);
        }

        auto value = Unquote(param.substr(eq + 1));
        if (!value) return std::unexpected(value.error());

        auto& target = directive ? clause.directives : clause.attributes;
        target[std::string(key)] = std::move(*value);
    }
    return clause;
}

class FilterParser {
public:
    explicit FilterParser(std::string_view text) : s_(text) {}

    std::expected<FilterExpression, std::string> Run() {
        SkipSpace();
        auto r = ParseNode(/*negated=*/false);
        if (!r.is_ok()) return std::unexpected(r.msg);
        SkipSpace();
        if (pos_ != s_.size()) {
            return std::unexpected(Error("trailing characters after filter"));
        }

        if (floor_ || ceiling_) {
            std::string range;
            const std::string floor = floor_ ? floor_->Text() : std::string("0.0.0");
            if (!ceiling_) {
                range = floor_exclusive_ ? "(" + floor + ",)" : floor;
            } else {
                range = (floor_exclusive_ ? "(" : "[") + floor + "," + ceiling_->Text() +
                        (ceiling_exclusive_ ? ")" : "]");
            }
            out_[kVersionAttribute] = range;
        }
        return std::move(out_);
    }

private:
    std::string Error(const std::string& what) const {
        return what + " at offset " + std::to_string(pos_) + " in filter \"" + std::string(s_) + "\"";
    }

    void SkipSpace() {
        while (pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t')) ++pos_;
    }

    bool Consume(char c) {
        SkipSpace();
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    Result ParseNode(bool negated) {
        if (!Consume('(')) return Result::Fail(ErrorCode::kMalformedRequirement, Error("expected '('"));
        SkipSpace();
        if (pos_ >= s_.size()) return Result::Fail(ErrorCode::kMalformedRequirement, Error("unbalanced parentheses"));

        const char c = s_[pos_];
        if (c == '&') {
            if (negated) {
                return Result::Fail(ErrorCode::kMalformedRequirement, Error("unsupported negated conjunction"));
            }
            ++pos_;
            SkipSpace();
            while (pos_ < s_.size() && s_[pos_] == '(') {
                auto r = ParseNode(negated);
                if (!r.is_ok()) return r;
                SkipSpace();
            }
        } else if (c == '!') {
            ++pos_;
            auto r = ParseNode(!negated);
            if (!r.is_ok()) return r;
        } else if (c == '|') {
            return Result::Fail(ErrorCode::kMalformedRequirement, Error("unsupported filter operator '|'"));
        } else {
            auto r = ParseItem(negated);
            if (!r.is_ok()) return r;
        }

        if (!Consume(')')) return Result::Fail(ErrorCode::kMalformedRequirement, Error("expected ')'"));
        return Result::Ok();
    }

    Result ParseItem(bool negated) {
        std::string item;
        while (pos_ < s_.size() && s_[pos_] != ')') {
            if (s_[pos_] == '(') {
                return Result::Fail(ErrorCode::kMalformedRequirement, Error("unexpected '('"));
            }
            if (s_[pos_] == '\\' && pos_ + 1 < s_.size()) ++pos_;
            item.push_back(s_[pos_++]);
        }
        if (pos_ >= s_.size()) return Result::Fail(ErrorCode::kMalformedRequirement, Error("unbalanced parentheses"));

        const auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result::Fail(ErrorCode::kMalformedRequirement, Error("filter term without operator"));
        }
        std::string op = "=";
        size_t key_end = eq;
        if (item[eq - 1] == '>' || item[eq - 1] == '<' || item[eq - 1] == '~') {
            op = std::string(1, item[eq - 1]) + "=";
            key_end = eq - 1;
        }
        const std::string key(Trim(std::string_view(item).substr(0, key_end)));
        const std::string value(Trim(std::string_view(item).substr(eq + 1)));
        if (key.empty() || value.empty()) {
            return Result::Fail(ErrorCode::kMalformedRequirement, Error("incomplete filter term \"" + item + "\""));
        }

        if (key != kVersionAttribute) {
            if (!negated) out_[key] = value;
            return Result::Ok();
        }

        if (op == "=" || op == "~=") {
            if (negated) {
                return Result::Fail(ErrorCode::kMalformedRequirement, Error("unsupported negated version equality"));
            }
            out_[key] = value;
        } else if (op == ">=") {
            return negated ? TightenCeiling(value, /*exclusive=*/true) : TightenFloor(value, /*exclusive=*/false);
        } else {
            return negated ? TightenFloor(value, /*exclusive=*/true) : TightenCeiling(value, /*exclusive=*/false);
        }
        return Result::Ok();
    }

    // Repeated bounds intersect: the highest floor and the lowest ceiling
    // win, and an exclusive end wins over an inclusive one at the same version.
    Result TightenFloor(const std::string& value, bool exclusive) {
        auto v = Version::Parse(value);
        if (!v) return Result::Fail(ErrorCode::kMalformedRequirement, Error(v.error()));
        if (floor_) {
            const int cmp = v->Compare(*floor_);
            if (cmp < 0 || (cmp == 0 && !exclusive)) return Result::Ok();
        }
        floor_ = std::move(*v);
        floor_exclusive_ = exclusive;
        return Result::Ok();
    }

    Result TightenCeiling(const std::string& value, bool exclusive) {
        auto v = Version::Parse(value);
        if (!v) return Result::Fail(ErrorCode::kMalformedRequirement, Error(v.error()));
        if (ceiling_) {
            const int cmp = v->Compare(*ceiling_);
            if (cmp > 0 || (cmp == 0 && !exclusive)) return Result::Ok();
        }
        ceiling_ = std::move(*v);
        ceiling_exclusive_ = exclusive;
        return Result::Ok();
    }

    std::string_view s_;
    size_t pos_ = 0;
    FilterExpression out_;
    std::optional<Version> floor_;
    bool floor_exclusive_ = false;
    std::optional<Version> ceiling_;
    bool ceiling_exclusive_ = false;
};

} // namespace

std::expected<std::vector<RequirementClause>, std::string> CapabilityParser::ParseRequirement(std::string_view raw) {
    auto clauses_text = SplitTopLevel(raw, ',');
    if (!clauses_text) return std::unexpected(clauses_text.error());

    std::vector<RequirementClause> out;
    for (const auto& text : *clauses_text) {
        if (Trim(text).empty()) continue;
        auto clause = ParseClause(text);
        if (!clause) return std::unexpected(clause.error());
        out.push_back(std::move(*clause));
    }
    return out;
}

std::expected<FilterExpression, std::string> CapabilityParser::ParseFilter(std::string_view filter) {
    const std::string_view trimmed = Trim(filter);
    if (trimmed.empty()) return std::unexpected("empty filter");
    return FilterParser(trimmed).Run();
}

std::expected<VersionRange, std::string> CapabilityParser::ParseVersionRange(std::string_view value) {
    auto unquoted = Unquote(value);
    if (!unquoted) return std::unexpected(unquoted.error());
    return VersionRange::Parse(*unquoted);
}

} // namespace esa
