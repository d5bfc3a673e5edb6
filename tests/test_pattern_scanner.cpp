#include <gtest/gtest.h>
#include "scanning/pattern_scanner.hpp"
#include "common/errors.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace scaffkit;
namespace fs = std::filesystem;

// ─── Scan Tests ────────────────────────────────────────────────

TEST(PatternScannerTest, DebugLogBlocksCommit) {
    PatternScanner scanner = defaultPatternScanner();
    ScanResult result = scanner.scan({{"app/src/main/kotlin/Foo.kt", "Log.d(\"x\")"}});

    EXPECT_EQ(result.verdict(), ScanVerdict::Blocked);
    ASSERT_EQ(result.matches.size(), 1);
    EXPECT_EQ(result.matches[0].file_path, "app/src/main/kotlin/Foo.kt");
    EXPECT_EQ(result.matches[0].line_number, 1);
    EXPECT_EQ(result.matches[0].pattern, R"(Log\.d\()");
    EXPECT_EQ(result.matches[0].line_text, "Log.d(\"x\")");
}

TEST(PatternScannerTest, TestSourceSetsAreAllowed) {
    PatternScanner scanner = defaultPatternScanner();
    ScanResult result = scanner.scan({
        {"app/src/test/kotlin/FooTest.kt", "Log.d(\"x\")"},
        {"app/src/androidTest/kotlin/FooUiTest.kt", "println(\"x\")"},
    });

    EXPECT_EQ(result.verdict(), ScanVerdict::Clean);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(result.skipped.size(), 2);
    EXPECT_EQ(result.files_scanned, 0);
}

TEST(PatternScannerTest, AllowListIsSubstringMatch) {
    PatternScanner scanner = defaultPatternScanner();
    EXPECT_TRUE(scanner.isAllowListed("lib/test/Helper.kt"));
    EXPECT_TRUE(scanner.isAllowListed("/abs/path/androidTest/X.kt"));
    EXPECT_FALSE(scanner.isAllowListed("test/Helper.kt"));
    EXPECT_FALSE(scanner.isAllowListed("src/testing/Helper.kt"));
}

TEST(PatternScannerTest, CleanFile) {
    PatternScanner scanner = defaultPatternScanner();
    ScanResult result = scanner.scan({{"Foo.kt", "Timber.d(\"fine\")\nval x = 1\n"}});
    EXPECT_FALSE(result.blocked());
    EXPECT_EQ(result.files_scanned, 1);
}

TEST(PatternScannerTest, OneMatchPerLine) {
    PatternScanner scanner = defaultPatternScanner();
    ScanResult result = scanner.scan({{"Foo.kt",
        "val a = 1\n"
        "Log.v(\"a\"); println(\"b\")\n"
        "System.err.println(\"c\")\n"}});

    ASSERT_EQ(result.matches.size(), 2);
    EXPECT_EQ(result.matches[0].line_number, 2);
    EXPECT_EQ(result.matches[0].pattern, R"(Log\.v\()");
    EXPECT_EQ(result.matches[1].line_number, 3);
    EXPECT_EQ(result.matches[1].pattern, R"(println\()");
}

TEST(PatternScannerTest, PrintMatchesSubstring) {
    // Patterns are case-sensitive substrings: debugprint( matches, debugPrint( does not.
    PatternScanner scanner = defaultPatternScanner();
    ScanResult result = scanner.scan({{"Foo.kt", "debugPrint(value)\nLog.w(\"ok\")\n"}});
    ASSERT_EQ(result.matches.size(), 0);

    result = scanner.scan({{"Foo.kt", "debugprint(value)\n"}});
    ASSERT_EQ(result.matches.size(), 1);
}

TEST(PatternScannerTest, MatchOrderFollowsInputs) {
    PatternScanner scanner = defaultPatternScanner();
    ScanResult result = scanner.scan({
        {"b.kt", "Log.i(\"1\")\n"},
        {"a.kt", "x\nLog.d(\"2\")\n"},
    });

    ASSERT_EQ(result.matches.size(), 2);
    EXPECT_EQ(result.matches[0].file_path, "b.kt");
    EXPECT_EQ(result.matches[1].file_path, "a.kt");
    EXPECT_EQ(result.matches[1].line_number, 2);
}

TEST(PatternScannerTest, CrLfLinesTrimmed) {
    PatternScanner scanner = defaultPatternScanner();
    ScanResult result = scanner.scan({{"Foo.kt", "ok\r\nLog.d(\"x\")\r\n"}});
    ASSERT_EQ(result.matches.size(), 1);
    EXPECT_EQ(result.matches[0].line_text, "Log.d(\"x\")");
}

TEST(PatternScannerTest, InjectedPatterns) {
    PatternScanner scanner(compilePatterns({R"(\bTODO\b)"}), {"/generated/"});
    ScanResult result = scanner.scan({
        {"src/A.kt", "// TODO remove\nLog.d(\"x\")\n"},
        {"build/generated/B.kt", "// TODO\n"},
    });

    ASSERT_EQ(result.matches.size(), 1);
    EXPECT_EQ(result.matches[0].line_number, 1);
    EXPECT_EQ(result.skipped.size(), 1);
}

TEST(PatternScannerTest, BadPatternRejected) {
    EXPECT_THROW(compilePatterns({"Log\\.d("}), ValidationError);
}

// ─── File Scan Tests ───────────────────────────────────────────

TEST(PatternScannerTest, ScanFilesFromDisk) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("scaffkit_scan_" + std::to_string(stamp));
    fs::create_directories(dir / "src/main");
    {
        std::ofstream out(dir / "src/main/Foo.kt");
        out << "fun f() {\n    println(\"debug\")\n}\n";
    }

    PatternScanner scanner = defaultPatternScanner();
    ScanResult result = scanner.scanFiles({
        (dir / "src/main/Foo.kt").string(),
        (dir / "src/test/Missing.kt").string(),
    });
    EXPECT_TRUE(result.blocked());
    ASSERT_EQ(result.matches.size(), 1);
    EXPECT_EQ(result.matches[0].line_number, 2);
    EXPECT_EQ(result.skipped.size(), 1);

    EXPECT_THROW(scanner.scanFiles({(dir / "src/main/Missing.kt").string()}), IoError);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
