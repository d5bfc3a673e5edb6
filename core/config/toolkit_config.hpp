#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scaffkit {

// ─── Toolkit Config ───────────────────────────────────────────
// Settings shared by the three tools. Layered, later wins:
//   defaults → JSON file → environment → command-line flags.
//
// JSON file: $SCAFFKIT_CONFIG, else ./scaffkit.json when present.
// Environment: SCAFFKIT_PACKAGE, SCAFFKIT_TEMPLATE_DIR,
//              SCAFFKIT_OUTPUT_DIR.

struct ToolkitConfig {
    std::string base_package = "com.example";
    std::string output_dir = "feature";
    std::string default_pattern = "mvi";
    std::string template_dir = defaultTemplateDir();
    std::string report_subdir = "build/compose-reports";
    std::vector<std::string> scan_extensions = {".kt"};
    std::vector<std::string> forbidden_patterns;  // empty → built-in list
    std::vector<std::string> allow_list;          // empty → built-in list
    std::string loaded_from;                      // config file used, if any

    /// Template directory compiled into the binary.
    static std::string defaultTemplateDir();
};

/// Lookup used for environment variables; injectable for tests.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the process environment.
EnvLookup processEnvironment();

/// Apply the keys of a parsed JSON object. Throws ValidationError on
/// a value of the wrong type; unknown keys are ignored.
void applyJson(ToolkitConfig& config, const nlohmann::json& j, const std::string& origin);

/// Parse and apply a JSON config file. Throws IoError if unreadable,
/// ValidationError if malformed.
void applyConfigFile(ToolkitConfig& config, const std::string& path);

void applyEnvironment(ToolkitConfig& config, const EnvLookup& env);

/// Defaults, then the config file, then the environment.
ToolkitConfig loadToolkitConfig(const EnvLookup& env = processEnvironment(),
                                const std::string& working_dir = ".");

} // namespace scaffkit
