#include "scaffold/scaffold_manifest.hpp"

namespace scaffkit {

void ManifestRegistry::registerManifest(ScaffoldManifest manifest) {
    auto it = variant_index_.find(manifest.variant);
    if (it != variant_index_.end()) {
        manifests_[it->second] = std::move(manifest);
        return;
    }
    variant_index_[manifest.variant] = manifests_.size();
    manifests_.push_back(std::move(manifest));
}

const ScaffoldManifest* ManifestRegistry::getByVariant(const std::string& variant) const {
    auto it = variant_index_.find(variant);
    if (it == variant_index_.end()) return nullptr;
    return &manifests_[it->second];
}

std::vector<std::string> ManifestRegistry::variants() const {
    std::vector<std::string> names;
    names.reserve(manifests_.size());
    for (const auto& m : manifests_) {
        names.push_back(m.variant);
    }
    return names;
}

// ─── Built-in Manifests ───────────────────────────────────────
// Feature module layout:
//   <lower>/build.gradle.kts
//   <lower>/src/main/kotlin/<package path>/{ui,navigation}/
//   <lower>/src/test/kotlin/<package path>/
//   <lower>/src/androidTest/kotlin/<package path>/

namespace {

const std::string kMain = "{{FEATURE_LOWER}}/src/main/kotlin/{{PACKAGE_PATH}}/";
const std::string kTest = "{{FEATURE_LOWER}}/src/test/kotlin/{{PACKAGE_PATH}}/";
const std::string kAndroidTest = "{{FEATURE_LOWER}}/src/androidTest/kotlin/{{PACKAGE_PATH}}/";

std::vector<std::string> moduleDirectories() {
    return {kMain + "ui", kMain + "navigation", kTest, kAndroidTest};
}

ScaffoldManifest mviManifest() {
    ScaffoldManifest m;
    m.variant = "mvi";
    m.description = "Model-View-Intent: contract, reducer ViewModel, route and screen";
    m.entries = {
        {"mvi/Contract.kt.template", kMain + "{{FEATURE_NAME}}Contract.kt"},
        {"mvi/ViewModel.kt.template", kMain + "{{FEATURE_NAME}}ViewModel.kt"},
        {"mvi/Route.kt.template", kMain + "ui/{{FEATURE_NAME}}Route.kt"},
        {"mvi/Screen.kt.template", kMain + "ui/{{FEATURE_NAME}}Screen.kt"},
        {"mvi/Navigation.kt.template", kMain + "navigation/{{FEATURE_NAME}}Navigation.kt"},
        {"mvi/ViewModelTest.kt.template", kTest + "{{FEATURE_NAME}}ViewModelTest.kt"},
        {"mvi/build.gradle.kts.template", "{{FEATURE_LOWER}}/build.gradle.kts"},
    };
    m.directories = moduleDirectories();
    return m;
}

ScaffoldManifest mvvmManifest() {
    ScaffoldManifest m;
    m.variant = "mvvm";
    m.description = "Model-View-ViewModel: UI state, ViewModel and screen";
    m.entries = {
        {"mvvm/UiState.kt.template", kMain + "{{FEATURE_NAME}}UiState.kt"},
        {"mvvm/ViewModel.kt.template", kMain + "{{FEATURE_NAME}}ViewModel.kt"},
        {"mvvm/Screen.kt.template", kMain + "ui/{{FEATURE_NAME}}Screen.kt"},
        {"mvvm/Navigation.kt.template", kMain + "navigation/{{FEATURE_NAME}}Navigation.kt"},
        {"mvvm/ViewModelTest.kt.template", kTest + "{{FEATURE_NAME}}ViewModelTest.kt"},
        {"mvvm/build.gradle.kts.template", "{{FEATURE_LOWER}}/build.gradle.kts"},
    };
    m.directories = moduleDirectories();
    return m;
}

} // namespace

void registerDefaultManifests(ManifestRegistry& registry) {
    registry.registerManifest(mviManifest());
    registry.registerManifest(mvvmManifest());
}

ManifestRegistry defaultManifestRegistry() {
    ManifestRegistry registry;
    registerDefaultManifests(registry);
    return registry;
}

} // namespace scaffkit
