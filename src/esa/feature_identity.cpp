#include "esa/feature_identity.hpp"

#include "util/path_utils.hpp"

namespace esa {

namespace {

std::string NonEmptyAttribute(const JarManifest& m, const char* name) {
    auto v = m.MainAttribute(name);
    if (!v) return {};
    return std::string(Trim(*v));
}

} // namespace

FeatureIdentity FeatureIdentity::FromSubsystemManifest(const JarManifest* manifest, std::string_view fallback_name) {
    FeatureIdentity id;
    id.version = "0.0.0";
    if (manifest) {
        // "com.example.feature; visibility:=public; singleton:=true"
        std::string symbolic = NonEmptyAttribute(*manifest, "Subsystem-SymbolicName");
        id.symbolic_name = std::string(Trim(std::string_view(symbolic).substr(0, symbolic.find(';'))));

        const std::string version = NonEmptyAttribute(*manifest, "Subsystem-Version");
        if (!version.empty()) id.version = version;

        for (const char* header : {"Subsystem-Name", "IBM-ShortName"}) {
            id.display_name = NonEmptyAttribute(*manifest, header);
            if (!id.display_name.empty()) break;
        }
    }
    if (id.display_name.empty()) id.display_name = id.symbolic_name;
    if (id.display_name.empty()) id.display_name = std::string(fallback_name);
    return id;
}

bool IsFeatureArchivePath(std::string_view path) {
    const auto name = FileName(path);
    return name.size() > 4 && EndsWith(name, ".esa");
}

} // namespace esa
