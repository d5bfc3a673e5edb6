#include "scaffold/scaffold_writer.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace scaffkit {

// ─── Scaffold Result ──────────────────────────────────────────

size_t ScaffoldResult::writtenCount() const {
    return static_cast<size_t>(std::count_if(files.begin(), files.end(),
        [](const FileOutcome& f) { return f.ok; }));
}

size_t ScaffoldResult::failedCount() const {
    return files.size() - writtenCount();
}

std::vector<std::string> ScaffoldResult::writtenPaths() const {
    std::vector<std::string> paths;
    for (const auto& f : files) {
        if (f.ok) paths.push_back(f.output_path);
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

// ─── Tokens ───────────────────────────────────────────────────

std::string featurePackage(const std::string& base_package, const NameContext& names) {
    return base_package + ".feature." + names.lower;
}

TokenMap scaffoldTokens(const NameContext& names, const std::string& base_package) {
    std::string full_package = featurePackage(base_package, names);
    std::string package_path = full_package;
    std::replace(package_path.begin(), package_path.end(), '.', '/');

    TokenMap tokens;
    tokens.bind("FEATURE_NAME", names.original);
    tokens.bind("FEATURE_PASCAL", names.pascal);
    tokens.bind("FEATURE_CAMEL", names.camel);
    tokens.bind("FEATURE_LOWER", names.lower);
    tokens.bind("FEATURE_UPPER", names.upper);
    tokens.bind("FEATURE_SNAKE", names.snake);
    tokens.bind("FEATURE_NAME_CAMEL", names.snake);  // legacy spelling in older templates
    tokens.bind("BASE_PACKAGE", base_package);
    tokens.bind("PACKAGE", full_package);
    tokens.bind("FULL_PACKAGE", full_package);
    tokens.bind("PACKAGE_PATH", package_path);
    tokens.bind("DATA_TYPE", "Any");
    return tokens;
}

bool isValidPackage(const std::string& package) {
    static const std::regex kPackage(R"([A-Za-z_][A-Za-z0-9_]*(\.[A-Za-z_][A-Za-z0-9_]*)*)");
    return std::regex_match(package, kPackage);
}

// ─── Scaffold Writer ──────────────────────────────────────────

ScaffoldResult ScaffoldWriter::run(const ScaffoldRequest& request) const {
    NameContext names = deriveNames(request.feature_name);

    const ScaffoldManifest* manifest = registry_.getByVariant(request.variant);
    if (!manifest) {
        throw UnknownVariantError(request.variant);
    }
    if (!isValidPackage(request.base_package)) {
        throw ValidationError("Invalid package '" + request.base_package +
                              "'; expected a dotted identifier path such as com.example");
    }

    TokenMap tokens = scaffoldTokens(names, request.base_package);
    fs::path root(request.output_root.empty() ? "." : request.output_root);

    // Resolve every destination first so a colliding manifest writes nothing.
    std::vector<fs::path> destinations;
    std::unordered_set<std::string> seen;
    for (const auto& entry : manifest->entries) {
        fs::path dest = (root / substitute(entry.output_pattern, tokens)).lexically_normal();
        if (!seen.insert(dest.generic_string()).second) {
            throw OutputCollisionError(dest.generic_string());
        }
        destinations.push_back(dest);
    }

    ensureWritableRoot(root);

    ScaffoldResult result;
    result.names = names;
    result.variant = manifest->variant;
    result.full_package = featurePackage(request.base_package, names);
    result.module_dir = (root / names.lower).lexically_normal();

    for (const auto& pattern : manifest->directories) {
        fs::path dir = (root / substitute(pattern, tokens)).lexically_normal();
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            result.directory_errors.push_back(
                "Cannot create directory " + dir.generic_string() + ": " + ec.message());
        } else if (!fs::is_directory(dir, ec)) {
            result.directory_errors.push_back(
                "Cannot create directory " + dir.generic_string() + ": path exists and is not a directory");
        }
    }

    for (size_t i = 0; i < manifest->entries.size(); i++) {
        result.files.push_back(writeEntry(manifest->entries[i], destinations[i], tokens));
    }
    return result;
}

FileOutcome ScaffoldWriter::writeEntry(const TemplateEntry& entry,
                                       const fs::path& output_path,
                                       const TokenMap& tokens) const {
    FileOutcome outcome;
    outcome.template_path = entry.template_path;
    outcome.output_path = output_path.generic_string();

    fs::path source = template_root_ / entry.template_path;
    std::string body;
    {
        std::ifstream in(source, std::ios::binary);
        if (!in) {
            outcome.error = "Template not found: " + source.generic_string();
            return outcome;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            outcome.error = "Failed to read template: " + source.generic_string();
            return outcome;
        }
        body = buffer.str();
    }

    std::string expanded = substitute(body, tokens);
    outcome.unresolved_tokens = unresolvedTokens(expanded, tokens);

    std::error_code ec;
    if (output_path.has_parent_path()) {
        fs::create_directories(output_path.parent_path(), ec);
        if (ec) {
            outcome.error = "Cannot create directory " +
                output_path.parent_path().generic_string() + ": " + ec.message();
            return outcome;
        }
    }

    {
        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            outcome.error = "Cannot open for writing: " + outcome.output_path;
            return outcome;
        }
        out << expanded;
        out.close();
        if (!out) {
            outcome.error = "Write failed: " + outcome.output_path;
            return outcome;
        }
    }

    outcome.ok = true;
    return outcome;
}

void ScaffoldWriter::ensureWritableRoot(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw IoError(root.generic_string(), "Cannot create output root (" + ec.message() + ")");
    }
    if (!fs::is_directory(root, ec)) {
        throw IoError(root.generic_string(), "Output root is not a directory");
    }

    // Pick a name nothing in the root uses yet, so the check never
    // truncates or deletes a user file.
    fs::path marker;
    for (unsigned n = 0;; n++) {
        marker = root / (".scaffkit-write-check-" + std::to_string(n));
        if (!fs::exists(marker, ec) && !ec) break;
        if (ec) {
            throw IoError(root.generic_string(), "Cannot inspect output root (" + ec.message() + ")");
        }
    }
    {
        std::ofstream out(marker, std::ios::binary);
        if (!out) {
            throw IoError(root.generic_string(), "Output root is not writable");
        }
    }
    fs::remove(marker, ec);
}

} // namespace scaffkit
