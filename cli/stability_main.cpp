// scaffkit-stability: summarize compiler stability reports for a module.
//
// Usage: scaffkit-stability [<module>] [--reports <dir>] [--json] [--no-color]
//
// Reports are produced by the build with compiler reports enabled,
// e.g. ./gradlew :app:assembleRelease -PcomposeCompilerReports=true

#include "common/console.hpp"
#include "common/errors.hpp"
#include "config/toolkit_config.hpp"
#include "stability/report_directory.hpp"
#include "stability/report_renderer.hpp"
#include "stability/stability_aggregator.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace scaffkit;

namespace {

const char* kTag = "stability";

struct Args {
    std::string module = "app";
    std::string reports;
    bool json = false;
    bool color = true;
    bool help = false;
};

Args parseArgs(int argc, char** argv) {
    Args args;
    bool module_seen = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--reports") {
            if (i + 1 >= argc) throw ValidationError("--reports requires a value");
            args.reports = argv[++i];
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "--no-color") {
            args.color = false;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw ValidationError("Unknown option " + arg);
        } else if (!module_seen) {
            args.module = arg;
            module_seen = true;
        } else {
            throw ValidationError("Unexpected argument '" + arg + "'");
        }
    }
    return args;
}

} // namespace

int main(int argc, char** argv) {
    try {
        Args args = parseArgs(argc, argv);
        if (args.help) {
            std::cout << "Usage: scaffkit-stability [<module>] [--reports <dir>] [--json] [--no-color]\n";
            return 0;
        }

        ToolkitConfig config = loadToolkitConfig();
        std::string dir = args.reports.empty()
            ? (std::filesystem::path(args.module) / config.report_subdir).string()
            : args.reports;

        ReportFiles files;
        try {
            files = findReportFiles(dir);
        } catch (const IoError& e) {
            logError(kTag, e.what());
            logInfo(kTag, "Run: ./gradlew :" + args.module +
                    ":assembleRelease -PcomposeCompilerReports=true");
            return 1;
        }

        StabilityReport report = loadReports(files);

        std::vector<ModuleMetrics> metrics;
        for (const auto& path : files.metrics_files) {
            try {
                metrics.push_back(loadModuleMetrics(path));
            } catch (const ToolkitError& e) {
                logWarning(kTag, std::string("skipping metrics: ") + e.what());
            }
        }

        StabilityAggregator aggregator;
        StabilitySummary summary = aggregator.summarize(report);

        if (args.json) {
            std::cout << dumpSummaryJson(summaryToJson(summary, metrics), 2) << "\n";
            return 0;
        }

        Style style = Style::detect(args.color);
        std::cout << style.blue("Compose Stability Analyzer") << " (" << dir << ")\n\n";
        std::cout << renderTextReport(summary, metrics, style);
        return 0;
    } catch (const ToolkitError& e) {
        logError(kTag, e.what());
        return 1;
    } catch (const std::exception& e) {
        logError(kTag, std::string("unexpected failure: ") + e.what());
        return 1;
    }
}
