#include "esa/feature_identity.hpp"
#include "esa/feature_report.hpp"
#include "esa/feature_resource.hpp"
#include "esa/requirement_processor.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <getopt.h>
#include <optional>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-v|-q] <feature.esa>...\n"
        "\n"
        "Resolves the minimum Java version required by each feature archive\n"
        "and prints one JSON object per feature on stdout.\n"
        "\n"
        "Options:\n"
        "  -c, --config    JSON config (LogLevel, TempDir, MaxComponentBytes, ComponentExtraction)\n"
        "  -v, --verbose   Debug logging\n"
        "  -q, --quiet     Errors only\n"
        "  -h, --help      Show this help\n",
        argv);
}

} // namespace

int main(int argc, char **argv) {
    const char *config_path = nullptr;
    std::optional<esa::LogLevel> cli_level;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'v':
                cli_level = esa::LogLevel::Debug;
                break;

            case 'q':
                cli_level = esa::LogLevel::Error;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    esa::ManifestExtractorOptions options;
    if (config_path) {
        esa::config::ToolConfigFromFile cfg;
        if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
        if (cfg.log_level) {
            esa::Logger::Instance().SetLevel(*esa::ParseLogLevel(*cfg.log_level));
        }
        if (cfg.temp_dir) options.temp_dir = *cfg.temp_dir;
        if (cfg.max_component_bytes) options.max_component_bytes = *cfg.max_component_bytes;
        if (cfg.component_extraction) {
            options.mode = *cfg.component_extraction == "memory" ? esa::ExtractionMode::kMemory
                                                                 : esa::ExtractionMode::kTempFile;
        }
    }
    if (cli_level) esa::Logger::Instance().SetLevel(*cli_level);

    const esa::RequirementProcessor processor(options);

    // Each feature stands alone: a failure is reported and the batch goes on.
    int failures = 0;
    for (int i = optind; i < argc; ++i) {
        const std::string path = argv[i];
        if (!esa::IsFeatureArchivePath(path)) {
            LogWarn("skip: %s is not an .esa file", path.c_str());
            continue;
        }

        esa::FeatureResource resource;
        auto res = processor.Process(path, resource);
        if (!res.is_ok()) {
            LogError("%s", res.msg.c_str());
            std::printf("%s\n", esa::ReportLine(esa::ReportFailure(path, res)).c_str());
            ++failures;
            continue;
        }
        std::printf("%s\n", esa::ReportLine(esa::ReportSuccess(path, resource)).c_str());
    }

    return failures == 0 ? 0 : 1;
}
