#pragma once

#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace scaffkit {

/// A forbidden pattern: the source text is kept for reporting.
struct ForbiddenPattern {
    std::string source;
    std::regex regex;

    explicit ForbiddenPattern(const std::string& pattern);
};

struct ScanInput {
    std::string path;
    std::string content;
};

struct ScanMatch {
    std::string file_path;
    int line_number = 0;         // 1-based
    std::string pattern;         // source of the first matching rule
    std::string line_text;
};

enum class ScanVerdict { Clean, Blocked };

struct ScanResult {
    std::vector<ScanMatch> matches;   // file order, then line order
    std::vector<std::string> skipped; // allow-listed paths
    size_t files_scanned = 0;

    ScanVerdict verdict() const {
        return matches.empty() ? ScanVerdict::Clean : ScanVerdict::Blocked;
    }
    bool blocked() const { return verdict() == ScanVerdict::Blocked; }
};

// ─── Pattern Scanner ──────────────────────────────────────────
// Pre-commit gate. A path containing any allow-list substring is
// skipped whole. Every other line matching a forbidden pattern
// yields one ScanMatch. There is no warning level: the result is
// Clean or Blocked.

class PatternScanner {
public:
    PatternScanner(std::vector<ForbiddenPattern> patterns,
                   std::vector<std::string> allow_list)
        : patterns_(std::move(patterns)), allow_list_(std::move(allow_list)) {}

    bool isAllowListed(const std::string& path) const;

    ScanResult scan(const std::vector<ScanInput>& inputs) const;

    /// Read each path from disk, then scan. Throws IoError on the
    /// first file that cannot be read.
    ScanResult scanFiles(const std::vector<std::string>& paths) const;

    const std::vector<ForbiddenPattern>& patterns() const { return patterns_; }
    const std::vector<std::string>& allowList() const { return allow_list_; }

private:
    std::vector<ForbiddenPattern> patterns_;
    std::vector<std::string> allow_list_;

    void scanOne(const ScanInput& input, ScanResult& result) const;
};

/// Debug logging calls that must not reach a commit.
std::vector<std::string> defaultForbiddenPatterns();

/// Test source sets, where debug output is acceptable.
std::vector<std::string> defaultAllowList();

/// Compile pattern sources. Throws ValidationError on a bad regex.
std::vector<ForbiddenPattern> compilePatterns(const std::vector<std::string>& sources);

PatternScanner defaultPatternScanner();

} // namespace scaffkit
