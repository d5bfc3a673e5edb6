// scaffkit-scan: block commits that carry debug logging.
//
// Usage: scaffkit-scan [--all-files] [--no-color] [<file>...]
//        git diff --cached --name-only --diff-filter=ACM | scaffkit-scan
//
// Exit status is 1 when any forbidden statement is found.

#include "common/console.hpp"
#include "common/errors.hpp"
#include "config/toolkit_config.hpp"
#include "scanning/pattern_scanner.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace scaffkit;

namespace {

const char* kTag = "scan";

struct Args {
    std::vector<std::string> paths;
    bool all_files = false;
    bool color = true;
    bool help = false;
};

Args parseArgs(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--all-files") {
            args.all_files = true;
        } else if (arg == "--no-color") {
            args.color = false;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw ValidationError("Unknown option " + arg);
        } else {
            args.paths.push_back(arg);
        }
    }
    return args;
}

bool hasExtension(const std::string& path, const std::vector<std::string>& extensions) {
    if (extensions.empty()) return true;
    return std::any_of(extensions.begin(), extensions.end(), [&](const std::string& ext) {
        return path.size() >= ext.size() &&
               path.compare(path.size() - ext.size(), ext.size(), ext) == 0;
    });
}

PatternScanner scannerFor(const ToolkitConfig& config) {
    auto patterns = config.forbidden_patterns.empty()
        ? defaultForbiddenPatterns() : config.forbidden_patterns;
    auto allow = config.allow_list.empty() ? defaultAllowList() : config.allow_list;
    return PatternScanner(compilePatterns(patterns), allow);
}

} // namespace

int main(int argc, char** argv) {
    try {
        Args args = parseArgs(argc, argv);
        if (args.help) {
            std::cout << "Usage: scaffkit-scan [--all-files] [--no-color] [<file>...]\n"
                      << "Reads file paths from stdin when none are given.\n";
            return 0;
        }

        if (args.paths.empty()) {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) args.paths.push_back(line);
            }
        }

        ToolkitConfig config = loadToolkitConfig();
        std::vector<std::string> files;
        for (const auto& p : args.paths) {
            if (args.all_files || hasExtension(p, config.scan_extensions)) files.push_back(p);
        }

        Style style = Style::detect(args.color);
        std::cout << "Checking for debug log statements...\n\n";

        if (files.empty()) {
            std::cout << style.green("No matching files to check") << "\n";
            return 0;
        }

        PatternScanner scanner = scannerFor(config);
        ScanResult result = scanner.scanFiles(files);

        if (!result.blocked()) {
            std::cout << style.green("No forbidden log statements found") << " ("
                      << result.files_scanned << " files checked)\n";
            return 0;
        }

        std::string current;
        for (const auto& match : result.matches) {
            if (match.file_path != current) {
                if (!current.empty()) std::cout << "\n";
                current = match.file_path;
                std::cout << style.red("Found in: " + current) << "\n";
            }
            std::cout << "   " << style.yellow("Line " + std::to_string(match.line_number) + ":")
                      << " " << match.line_text << "\n";
        }

        std::cout << "\n" << style.red("Commit blocked: remove debug logs before committing")
                  << " (" << result.matches.size() << " found)\n\n"
                  << style.yellow("Suggestions:") << "\n"
                  << "   - Use Timber instead: Timber.d(\"message\")\n"
                  << "   - Timber is stripped in release builds\n\n"
                  << "   To bypass (emergency only):\n"
                  << "   git commit --no-verify\n";
        return 1;
    } catch (const ToolkitError& e) {
        logError(kTag, e.what());
        return 1;
    } catch (const std::exception& e) {
        logError(kTag, std::string("unexpected failure: ") + e.what());
        return 1;
    }
}
