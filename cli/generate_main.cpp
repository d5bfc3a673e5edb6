// scaffkit-generate: expand a feature module from the template library.
//
// Usage: scaffkit-generate <FeatureName> [--pattern mvi|mvvm]
//                          [--package <dotted>] [--output <dir>]
//                          [--templates <dir>] [--no-color]

#include "common/console.hpp"
#include "common/errors.hpp"
#include "config/toolkit_config.hpp"
#include "scaffold/scaffold_manifest.hpp"
#include "scaffold/scaffold_writer.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace scaffkit;

namespace {

const char* kTag = "scaffold";

void printUsage(const ManifestRegistry& registry) {
    std::string variants;
    for (const auto& v : registry.variants()) {
        if (!variants.empty()) variants += "|";
        variants += v;
    }
    std::cout << "Usage: scaffkit-generate <FeatureName> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --pattern " << variants << "    Architecture pattern (default: mvi)\n"
              << "  --package <package>   Base package name (default: com.example)\n"
              << "  --output <dir>        Output directory (default: feature/)\n"
              << "  --templates <dir>     Template library directory\n"
              << "  --no-color            Plain output\n";
}

struct Args {
    std::string feature_name;
    std::string pattern;
    std::string package;
    std::string output;
    std::string templates;
    bool color = true;
    bool help = false;
};

Args parseArgs(int argc, char** argv) {
    Args args;
    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw ValidationError(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--pattern") {
            args.pattern = value(i, arg);
        } else if (arg == "--package") {
            args.package = value(i, arg);
        } else if (arg == "--output") {
            args.output = value(i, arg);
        } else if (arg == "--templates") {
            args.templates = value(i, arg);
        } else if (arg == "--no-color") {
            args.color = false;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw ValidationError("Unknown option " + arg);
        } else if (args.feature_name.empty()) {
            args.feature_name = arg;
        } else {
            throw ValidationError("Unexpected argument '" + arg + "'");
        }
    }
    return args;
}

} // namespace

int main(int argc, char** argv) {
    ManifestRegistry registry = defaultManifestRegistry();

    try {
        Args args = parseArgs(argc, argv);
        if (args.help) {
            printUsage(registry);
            return 0;
        }
        if (args.feature_name.empty()) {
            logError(kTag, "Feature name is required");
            printUsage(registry);
            return 1;
        }

        ToolkitConfig config = loadToolkitConfig();
        if (!args.package.empty()) config.base_package = args.package;
        if (!args.output.empty()) config.output_dir = args.output;
        if (!args.templates.empty()) config.template_dir = args.templates;

        ScaffoldRequest request;
        request.feature_name = args.feature_name;
        request.variant = args.pattern.empty() ? config.default_pattern : args.pattern;
        request.output_root = config.output_dir;
        request.base_package = config.base_package;

        Style style = Style::detect(args.color);
        std::cout << style.blue("Generating " + args.feature_name + " feature module...") << "\n"
                  << "   Pattern: " << request.variant << "\n";

        ScaffoldWriter writer(registry, config.template_dir);
        std::cout << "   Templates: " << writer.templateRoot().generic_string() << "\n";
        ScaffoldResult result = writer.run(request);

        std::cout << "   Package: " << result.full_package << "\n"
                  << "   Module: " << result.module_dir.generic_string() << "\n\n";

        for (const auto& error : result.directory_errors) {
            logError(kTag, error);
        }

        for (const auto& file : result.files) {
            if (!file.ok) {
                logError(kTag, file.error);
                continue;
            }
            for (const auto& token : file.unresolved_tokens) {
                logWarning(kTag, file.output_path + " keeps unknown token {{" + token + "}}");
            }
        }

        if (!result.ok()) {
            logError(kTag, std::to_string(result.failedCount()) + " of " +
                     std::to_string(result.files.size()) + " files failed, " +
                     std::to_string(result.directory_errors.size()) + " directories failed; " +
                     std::to_string(result.writtenCount()) + " written");
            return 1;
        }

        std::cout << style.green("Feature module generated") << " ("
                  << result.writtenCount() << " files)\n\n"
                  << style.blue("Generated files:") << "\n";
        for (const auto& path : result.writtenPaths()) {
            std::cout << "   " << path << "\n";
        }

        std::cout << "\n" << style.yellow("Next steps:") << "\n"
                  << "   1. Add the module to settings.gradle.kts:\n"
                  << "      include(\":feature:" << result.names.lower << "\")\n"
                  << "   2. Implement UseCase dependencies in " << result.names.original << "ViewModel\n"
                  << "   3. Add the route to your NavHost:\n"
                  << "      " << result.names.camel
                  << "Screen(onNavigateBack = { navController.popBackStack() })\n";
        return 0;
    } catch (const ToolkitError& e) {
        logError(kTag, e.what());
        return 1;
    } catch (const std::exception& e) {
        logError(kTag, std::string("unexpected failure: ") + e.what());
        return 1;
    }
}
