#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scaffkit {

/// One template and the (placeholder-bearing) path it is written to.
/// template_path is relative to the template root, output_pattern
/// to the output root.
struct TemplateEntry {
    std::string template_path;
    std::string output_pattern;
};

// ─── Scaffold Manifest ────────────────────────────────────────
// Ordered template set for one architectural variant. Entries are
// processed in order. Resolved output paths must be pairwise
// distinct; the writer rejects a manifest that collides.

struct ScaffoldManifest {
    std::string variant;
    std::string description;
    std::vector<TemplateEntry> entries;
    std::vector<std::string> directories;  // created even if no file lands in them

    size_t fileCount() const { return entries.size(); }
};

// ─── Manifest Registry ────────────────────────────────────────
// Closed set of variants available to the scaffold writer.
// Read-only once populated.

class ManifestRegistry {
public:
    /// Register a manifest; replaces an existing one with the same variant.
    void registerManifest(ScaffoldManifest manifest);

    /// Look up a manifest. Returns nullptr if the variant is unknown.
    const ScaffoldManifest* getByVariant(const std::string& variant) const;

    /// Variant names in registration order.
    std::vector<std::string> variants() const;

    size_t count() const { return manifests_.size(); }

private:
    std::vector<ScaffoldManifest> manifests_;
    std::unordered_map<std::string, size_t> variant_index_;
};

/// Register the built-in mvi and mvvm manifests.
void registerDefaultManifests(ManifestRegistry& registry);

/// A registry pre-populated with the built-in manifests.
ManifestRegistry defaultManifestRegistry();

} // namespace scaffkit
