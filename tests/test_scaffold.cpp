#include <gtest/gtest.h>
#include "scaffold/scaffold_manifest.hpp"
#include "scaffold/scaffold_writer.hpp"
#include "config/toolkit_config.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace scaffkit;
namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void writeFile(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

} // namespace

class ScaffoldTest : public ::testing::Test {
protected:
    fs::path work;
    fs::path out_root;
    ManifestRegistry registry = defaultManifestRegistry();

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        work = fs::temp_directory_path() /
               ("scaffkit_" + std::string(info->name()) + "_" + std::to_string(stamp));
        fs::create_directories(work);
        out_root = work / "feature";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(work, ec);
    }

    ScaffoldRequest request(const std::string& name, const std::string& variant = "mvi") const {
        ScaffoldRequest r;
        r.feature_name = name;
        r.variant = variant;
        r.output_root = out_root.string();
        r.base_package = "com.example";
        return r;
    }
};

// ─── Manifest Registry Tests ───────────────────────────────────

TEST(ManifestRegistryTest, DefaultVariants) {
    ManifestRegistry registry = defaultManifestRegistry();
    EXPECT_EQ(registry.count(), 2);

    auto variants = registry.variants();
    ASSERT_EQ(variants.size(), 2);
    EXPECT_EQ(variants[0], "mvi");
    EXPECT_EQ(variants[1], "mvvm");

    ASSERT_NE(registry.getByVariant("mvi"), nullptr);
    EXPECT_EQ(registry.getByVariant("mvi")->fileCount(), 7);
    EXPECT_EQ(registry.getByVariant("mvvm")->fileCount(), 6);
    EXPECT_EQ(registry.getByVariant("mvc"), nullptr);
}

TEST(ManifestRegistryTest, RegisterReplacesSameVariant) {
    ManifestRegistry registry;
    registry.registerManifest({"mini", "first", {{"a.template", "a.kt"}}, {}});
    registry.registerManifest({"mini", "second", {{"b.template", "b.kt"}, {"c.template", "c.kt"}}, {}});

    EXPECT_EQ(registry.count(), 1);
    EXPECT_EQ(registry.getByVariant("mini")->description, "second");
    EXPECT_EQ(registry.getByVariant("mini")->fileCount(), 2);
}

// ─── Token Binding Tests ───────────────────────────────────────

TEST(ScaffoldTokensTest, BindsEveryVariant) {
    TokenMap tokens = scaffoldTokens(deriveNames("UserProfile"), "com.acme");

    EXPECT_EQ(*tokens.lookup("FEATURE_NAME"), "UserProfile");
    EXPECT_EQ(*tokens.lookup("FEATURE_PASCAL"), "UserProfile");
    EXPECT_EQ(*tokens.lookup("FEATURE_CAMEL"), "userProfile");
    EXPECT_EQ(*tokens.lookup("FEATURE_LOWER"), "userprofile");
    EXPECT_EQ(*tokens.lookup("FEATURE_UPPER"), "USER_PROFILE");
    EXPECT_EQ(*tokens.lookup("FEATURE_SNAKE"), "user_profile");
    EXPECT_EQ(*tokens.lookup("FEATURE_NAME_CAMEL"), "user_profile");
    EXPECT_EQ(*tokens.lookup("BASE_PACKAGE"), "com.acme");
    EXPECT_EQ(*tokens.lookup("PACKAGE"), "com.acme.feature.userprofile");
    EXPECT_EQ(*tokens.lookup("FULL_PACKAGE"), "com.acme.feature.userprofile");
    EXPECT_EQ(*tokens.lookup("PACKAGE_PATH"), "com/acme/feature/userprofile");
    EXPECT_EQ(*tokens.lookup("DATA_TYPE"), "Any");
}

TEST(ScaffoldTokensTest, PackageValidation) {
    EXPECT_TRUE(isValidPackage("com.example"));
    EXPECT_TRUE(isValidPackage("app"));
    EXPECT_TRUE(isValidPackage("io.my_org.v2"));
    EXPECT_FALSE(isValidPackage(""));
    EXPECT_FALSE(isValidPackage("com..example"));
    EXPECT_FALSE(isValidPackage("com.example."));
    EXPECT_FALSE(isValidPackage("com/example"));
    EXPECT_FALSE(isValidPackage("2com.example"));
}

// ─── Writer Tests (built-in templates) ─────────────────────────

TEST_F(ScaffoldTest, GeneratesMviModule) {
    ScaffoldWriter writer(registry, ToolkitConfig::defaultTemplateDir());
    ScaffoldResult result = writer.run(request("UserProfile"));

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.files.size(), 7);
    EXPECT_EQ(result.writtenCount(), 7);
    EXPECT_EQ(result.full_package, "com.example.feature.userprofile");
    EXPECT_EQ(result.names.lower, "userprofile");
    EXPECT_EQ(result.module_dir.generic_string(),
              (out_root / "userprofile").lexically_normal().generic_string());
    EXPECT_EQ(writer.templateRoot().string(), ToolkitConfig::defaultTemplateDir());
    EXPECT_TRUE(result.directory_errors.empty());

    fs::path pkg = out_root / "userprofile/src/main/kotlin/com/example/feature/userprofile";
    EXPECT_TRUE(fs::is_regular_file(pkg / "UserProfileContract.kt"));
    EXPECT_TRUE(fs::is_regular_file(pkg / "UserProfileViewModel.kt"));
    EXPECT_TRUE(fs::is_regular_file(pkg / "ui/UserProfileRoute.kt"));
    EXPECT_TRUE(fs::is_regular_file(pkg / "ui/UserProfileScreen.kt"));
    EXPECT_TRUE(fs::is_regular_file(pkg / "navigation/UserProfileNavigation.kt"));
    EXPECT_TRUE(fs::is_regular_file(
        out_root / "userprofile/src/test/kotlin/com/example/feature/userprofile/UserProfileViewModelTest.kt"));
    EXPECT_TRUE(fs::is_regular_file(out_root / "userprofile/build.gradle.kts"));
    EXPECT_TRUE(fs::is_directory(
        out_root / "userprofile/src/androidTest/kotlin/com/example/feature/userprofile"));

    for (const auto& file : result.files) {
        std::string text = readFile(file.output_path);
        EXPECT_EQ(text.find("{{"), std::string::npos) << file.output_path;
        EXPECT_NE(text.find("userprofile"), std::string::npos) << file.output_path;
        EXPECT_TRUE(file.unresolved_tokens.empty()) << file.output_path;
    }

    std::string contract = readFile(pkg / "UserProfileContract.kt");
    EXPECT_NE(contract.find("package com.example.feature.userprofile"), std::string::npos);
    EXPECT_NE(contract.find("object UserProfileContract"), std::string::npos);

    std::string nav = readFile(pkg / "navigation/UserProfileNavigation.kt");
    EXPECT_NE(nav.find("USER_PROFILE_ROUTE = \"userprofile\""), std::string::npos);
    EXPECT_NE(nav.find("userProfileScreen"), std::string::npos);
}

TEST_F(ScaffoldTest, GeneratesMvvmModule) {
    ScaffoldWriter writer(registry, ToolkitConfig::defaultTemplateDir());
    ScaffoldResult result = writer.run(request("order_history", "mvvm"));

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.writtenCount(), 6);
    EXPECT_EQ(result.variant, "mvvm");
    EXPECT_TRUE(fs::is_regular_file(
        out_root / "orderhistory/src/main/kotlin/com/example/feature/orderhistory/order_historyUiState.kt"));
}

TEST_F(ScaffoldTest, WrittenPathsAreSorted) {
    ScaffoldWriter writer(registry, ToolkitConfig::defaultTemplateDir());
    ScaffoldResult result = writer.run(request("Cart"));

    auto paths = result.writtenPaths();
    ASSERT_EQ(paths.size(), 7);
    EXPECT_TRUE(std::is_sorted(paths.begin(), paths.end()));
}

TEST_F(ScaffoldTest, RerunOverwritesWithSameContent) {
    ScaffoldWriter writer(registry, ToolkitConfig::defaultTemplateDir());
    ScaffoldResult first = writer.run(request("Cart"));
    std::string before = readFile(first.files[0].output_path);

    writeFile(first.files[0].output_path, "stale");
    ScaffoldResult second = writer.run(request("Cart"));

    EXPECT_TRUE(second.ok());
    EXPECT_EQ(readFile(second.files[0].output_path), before);
}

TEST_F(ScaffoldTest, UnknownVariantWritesNothing) {
    ScaffoldWriter writer(registry, ToolkitConfig::defaultTemplateDir());
    try {
        writer.run(request("Cart", "mvc"));
        FAIL() << "expected UnknownVariantError";
    } catch (const UnknownVariantError& e) {
        EXPECT_EQ(e.variant(), "mvc");
    }
    EXPECT_FALSE(fs::exists(out_root));
}

TEST_F(ScaffoldTest, InvalidNameWritesNothing) {
    ScaffoldWriter writer(registry, ToolkitConfig::defaultTemplateDir());
    EXPECT_THROW(writer.run(request("")), ValidationError);
    EXPECT_THROW(writer.run(request("bad-name")), ValidationError);
    EXPECT_FALSE(fs::exists(out_root));
}

TEST_F(ScaffoldTest, InvalidPackageWritesNothing) {
    ScaffoldWriter writer(registry, ToolkitConfig::defaultTemplateDir());
    ScaffoldRequest r = request("Cart");
    r.base_package = "com..example";
    EXPECT_THROW(writer.run(r), ValidationError);
    EXPECT_FALSE(fs::exists(out_root));
}

TEST_F(ScaffoldTest, OutputRootThatIsAFile) {
    writeFile(out_root, "not a directory");
    ScaffoldWriter writer(registry, ToolkitConfig::defaultTemplateDir());
    EXPECT_THROW(writer.run(request("Cart")), IoError);
}

TEST_F(ScaffoldTest, WritabilityCheckKeepsExistingFiles) {
    writeFile(out_root / ".scaffkit-write-check-0", "user data");
    writeFile(out_root / ".scaffkit-write-check", "more user data");

    ScaffoldWriter writer(registry, ToolkitConfig::defaultTemplateDir());
    ASSERT_TRUE(writer.run(request("Cart")).ok());

    EXPECT_EQ(readFile(out_root / ".scaffkit-write-check-0"), "user data");
    EXPECT_EQ(readFile(out_root / ".scaffkit-write-check"), "more user data");
    EXPECT_FALSE(fs::exists(out_root / ".scaffkit-write-check-1"));
}

// ─── Writer Tests (injected manifests) ─────────────────────────

TEST_F(ScaffoldTest, CollisionDetectedBeforeWriting) {
    fs::path templates = work / "templates";
    writeFile(templates / "a.template", "A");
    writeFile(templates / "b.template", "B");

    ManifestRegistry custom;
    custom.registerManifest({"clash", "", {
        {"a.template", "{{FEATURE_LOWER}}/Same.kt"},
        {"b.template", "{{FEATURE_LOWER}}/./Same.kt"},
    }, {}});

    ScaffoldWriter writer(custom, templates);
    EXPECT_THROW(writer.run(request("Cart", "clash")), OutputCollisionError);
    EXPECT_FALSE(fs::exists(out_root / "cart/Same.kt"));
}

TEST_F(ScaffoldTest, MissingTemplateFailsOnlyThatEntry) {
    fs::path templates = work / "templates";
    writeFile(templates / "present.template", "class {{FEATURE_PASCAL}}");

    ManifestRegistry custom;
    custom.registerManifest({"partial", "", {
        {"missing.template", "{{FEATURE_LOWER}}/Missing.kt"},
        {"present.template", "{{FEATURE_LOWER}}/Present.kt"},
    }, {}});

    ScaffoldWriter writer(custom, templates);
    ScaffoldResult result = writer.run(request("my_cart", "partial"));

    ASSERT_EQ(result.files.size(), 2);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failedCount(), 1);
    EXPECT_FALSE(result.files[0].ok);
    EXPECT_NE(result.files[0].error.find("missing.template"), std::string::npos);
    EXPECT_TRUE(result.files[1].ok);
    EXPECT_EQ(readFile(out_root / "mycart/Present.kt"), "class MyCart");
}

TEST_F(ScaffoldTest, UnknownTokensSurviveAndAreReported) {
    fs::path templates = work / "templates";
    writeFile(templates / "t.template", "{{FEATURE_NAME}} {{CUSTOM_THING}}");

    ManifestRegistry custom;
    custom.registerManifest({"one", "", {{"t.template", "{{FEATURE_LOWER}}/T.kt"}}, {}});

    ScaffoldWriter writer(custom, templates);
    ScaffoldResult result = writer.run(request("Cart", "one"));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(readFile(out_root / "cart/T.kt"), "Cart {{CUSTOM_THING}}");
    ASSERT_EQ(result.files[0].unresolved_tokens.size(), 1);
    EXPECT_EQ(result.files[0].unresolved_tokens[0], "CUSTOM_THING");
}

TEST_F(ScaffoldTest, ByteExactTemplateCopy) {
    fs::path templates = work / "templates";
    std::string body = "line one\r\n\ttabbed {single} braces\r\nno newline at end";
    writeFile(templates / "raw.template", body);

    ManifestRegistry custom;
    custom.registerManifest({"raw", "", {{"raw.template", "raw.txt"}}, {}});

    ScaffoldWriter writer(custom, templates);
    ASSERT_TRUE(writer.run(request("Cart", "raw")).ok());
    EXPECT_EQ(readFile(out_root / "raw.txt"), body);
}

TEST_F(ScaffoldTest, DirectoryFailureIsReported) {
    fs::path templates = work / "templates";
    writeFile(templates / "t.template", "x");
    writeFile(out_root / "cart/assets", "a regular file");

    ManifestRegistry custom;
    custom.registerManifest({"dirs", "", {{"t.template", "{{FEATURE_LOWER}}/T.kt"}},
                             {"{{FEATURE_LOWER}}/assets", "{{FEATURE_LOWER}}/res"}});

    ScaffoldWriter writer(custom, templates);
    ScaffoldResult result = writer.run(request("Cart", "dirs"));

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failedCount(), 0);
    ASSERT_EQ(result.directory_errors.size(), 1);
    EXPECT_NE(result.directory_errors[0].find("cart/assets"), std::string::npos);
    EXPECT_TRUE(fs::is_directory(out_root / "cart/res"));
    EXPECT_EQ(readFile(out_root / "cart/T.kt"), "x");
}
