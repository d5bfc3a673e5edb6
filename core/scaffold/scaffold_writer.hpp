#pragma once

#include "naming/case_deriver.hpp"
#include "scaffold/scaffold_manifest.hpp"
#include "templating/token_substitution.hpp"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace scaffkit {

struct ScaffoldRequest {
    std::string feature_name;
    std::string variant = "mvi";
    std::string output_root = "feature";
    std::string base_package = "com.example";
};

/// Outcome of writing one manifest entry.
struct FileOutcome {
    std::string template_path;
    std::string output_path;
    bool ok = false;
    std::string error;                            // set when !ok
    std::vector<std::string> unresolved_tokens;   // {{TOKENS}} left in the output
};

// ─── Scaffold Result ──────────────────────────────────────────
// Per-file outcomes in manifest order. Files written before a
// failure stay on disk; re-running overwrites them.

struct ScaffoldResult {
    NameContext names;
    std::string variant;
    std::string full_package;
    std::filesystem::path module_dir;
    std::vector<FileOutcome> files;
    std::vector<std::string> directory_errors;  // manifest directories that could not be created

    size_t writtenCount() const;
    size_t failedCount() const;
    bool ok() const { return failedCount() == 0 && directory_errors.empty(); }

    /// Output paths of successfully written files, sorted.
    std::vector<std::string> writtenPaths() const;
};

/// "<base>.feature.<lower>"
std::string featurePackage(const std::string& base_package, const NameContext& names);

/// Tokens bound for every template and output pattern of a run.
TokenMap scaffoldTokens(const NameContext& names, const std::string& base_package);

/// True for dotted identifier paths such as "com.example.app".
bool isValidPackage(const std::string& package);

// ─── Scaffold Writer ──────────────────────────────────────────
// Expands a variant's manifest into `output_root`.
//
// Order of checks:
// 1. feature name, variant and package are validated (ValidationError,
//    UnknownVariantError) before touching the filesystem;
// 2. every output path is resolved; a duplicate throws
//    OutputCollisionError before anything is written;
// 3. the output root is created and checked for writability (IoError
//    if unusable); existing files in it are never touched by the check;
// 4. the manifest's extra directories are created; failures are kept
//    in directory_errors;
// 5. entries are written in order; a failing entry is recorded in
//    its FileOutcome and the remaining entries still run.

class ScaffoldWriter {
public:
    ScaffoldWriter(const ManifestRegistry& registry, std::filesystem::path template_root)
        : registry_(registry), template_root_(std::move(template_root)) {}

    ScaffoldResult run(const ScaffoldRequest& request) const;

    const std::filesystem::path& templateRoot() const { return template_root_; }

private:
    const ManifestRegistry& registry_;
    std::filesystem::path template_root_;

    FileOutcome writeEntry(const TemplateEntry& entry,
                           const std::filesystem::path& output_path,
                           const TokenMap& tokens) const;

    static void ensureWritableRoot(const std::filesystem::path& root);
};

} // namespace scaffkit
