#include "config/toolkit_config.hpp"
#include "common/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

#ifndef SCAFFKIT_TEMPLATE_DIR
#define SCAFFKIT_TEMPLATE_DIR "templates"
#endif

namespace scaffkit {

std::string ToolkitConfig::defaultTemplateDir() {
    return SCAFFKIT_TEMPLATE_DIR;
}

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string(value);
    };
}

namespace {

void readString(const nlohmann::json& j, const char* key, std::string& out,
                const std::string& origin) {
    if (!j.contains(key)) return;
    if (!j[key].is_string()) {
        throw ValidationError(origin + ": '" + key + "' must be a string");
    }
    out = j[key].get<std::string>();
}

void readStringList(const nlohmann::json& j, const char* key, std::vector<std::string>& out,
                    const std::string& origin) {
    if (!j.contains(key)) return;
    const auto& value = j[key];
    if (!value.is_array()) {
        throw ValidationError(origin + ": '" + key + "' must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ValidationError(origin + ": '" + key + "' must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    out = std::move(items);
}

} // namespace

void applyJson(ToolkitConfig& config, const nlohmann::json& j, const std::string& origin) {
    if (!j.is_object()) {
        throw ValidationError(origin + ": top level must be a JSON object");
    }
    readString(j, "base_package", config.base_package, origin);
    readString(j, "output_dir", config.output_dir, origin);
    readString(j, "default_pattern", config.default_pattern, origin);
    readString(j, "template_dir", config.template_dir, origin);
    readString(j, "report_subdir", config.report_subdir, origin);
    readStringList(j, "scan_extensions", config.scan_extensions, origin);
    readStringList(j, "forbidden_patterns", config.forbidden_patterns, origin);
    readStringList(j, "allow_list", config.allow_list, origin);
}

void applyConfigFile(ToolkitConfig& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw IoError(path, "Cannot read config file");
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("Malformed config file " + path + ": " + e.what());
    }
    applyJson(config, j, path);
    config.loaded_from = path;
}

void applyEnvironment(ToolkitConfig& config, const EnvLookup& env) {
    if (auto v = env("SCAFFKIT_PACKAGE")) config.base_package = *v;
    if (auto v = env("SCAFFKIT_TEMPLATE_DIR")) config.template_dir = *v;
    if (auto v = env("SCAFFKIT_OUTPUT_DIR")) config.output_dir = *v;
}

ToolkitConfig loadToolkitConfig(const EnvLookup& env, const std::string& working_dir) {
    ToolkitConfig config;

    if (auto explicit_path = env("SCAFFKIT_CONFIG")) {
        applyConfigFile(config, *explicit_path);
    } else {
        std::filesystem::path local = std::filesystem::path(working_dir) / "scaffkit.json";
        std::error_code ec;
        if (std::filesystem::is_regular_file(local, ec)) {
            applyConfigFile(config, local.string());
        }
    }

    applyEnvironment(config, env);
    return config;
}

} // namespace scaffkit
