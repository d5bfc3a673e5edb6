#include "scanning/pattern_scanner.hpp"
#include "common/errors.hpp"
#include <fstream>
#include <sstream>

namespace scaffkit {

ForbiddenPattern::ForbiddenPattern(const std::string& pattern)
    : source(pattern), regex(pattern) {}

bool PatternScanner::isAllowListed(const std::string& path) const {
    for (const auto& marker : allow_list_) {
        if (!marker.empty() && path.find(marker) != std::string::npos) return true;
    }
    return false;
}

ScanResult PatternScanner::scan(const std::vector<ScanInput>& inputs) const {
    ScanResult result;
    for (const auto& input : inputs) {
        if (isAllowListed(input.path)) {
            result.skipped.push_back(input.path);
            continue;
        }
        scanOne(input, result);
    }
    return result;
}

void PatternScanner::scanOne(const ScanInput& input, ScanResult& result) const {
    result.files_scanned++;

    std::istringstream in(input.content);
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        for (const auto& pattern : patterns_) {
            if (std::regex_search(line, pattern.regex)) {
                result.matches.push_back({input.path, line_number, pattern.source, line});
                break;
            }
        }
    }
}

ScanResult PatternScanner::scanFiles(const std::vector<std::string>& paths) const {
    std::vector<ScanInput> inputs;
    inputs.reserve(paths.size());
    for (const auto& path : paths) {
        ScanInput input;
        input.path = path;
        if (!isAllowListed(path)) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                throw IoError(path, "Cannot read file");
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            input.content = buffer.str();
        }
        inputs.push_back(std::move(input));
    }
    return scan(inputs);
}

// ─── Defaults ─────────────────────────────────────────────────

std::vector<std::string> defaultForbiddenPatterns() {
    return {
        R"(Log\.d\()",
        R"(Log\.v\()",
        R"(Log\.i\()",
        R"(println\()",
        R"(print\()",
        R"(System\.out\.)",
        R"(System\.err\.)",
    };
}

std::vector<std::string> defaultAllowList() {
    return {"/test/", "/androidTest/"};
}

std::vector<ForbiddenPattern> compilePatterns(const std::vector<std::string>& sources) {
    std::vector<ForbiddenPattern> patterns;
    patterns.reserve(sources.size());
    for (const auto& src : sources) {
        try {
            patterns.emplace_back(src);
        } catch (const std::regex_error& e) {
            throw ValidationError("Invalid forbidden pattern '" + src + "': " + e.what());
        }
    }
    return patterns;
}

PatternScanner defaultPatternScanner() {
    return PatternScanner(compilePatterns(defaultForbiddenPatterns()), defaultAllowList());
}

} // namespace scaffkit
