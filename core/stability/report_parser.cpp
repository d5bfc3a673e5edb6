#include "stability/report_parser.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>

namespace scaffkit {

void StabilityReport::append(const StabilityReport& other) {
    records.insert(records.end(), other.records.begin(), other.records.end());
}

std::vector<ClassRecord> StabilityReport::classes() const {
    std::vector<ClassRecord> out;
    for (const auto& r : records) {
        if (const auto* c = std::get_if<ClassRecord>(&r)) out.push_back(*c);
    }
    return out;
}

std::vector<ComposableRecord> StabilityReport::composables() const {
    std::vector<ComposableRecord> out;
    for (const auto& r : records) {
        if (const auto* c = std::get_if<ComposableRecord>(&r)) out.push_back(*c);
    }
    return out;
}

namespace {

const std::regex kClassLine(R"(^(stable|unstable)\s+class\s+([^\s{<(]+))");
const std::regex kMemberLine(R"(^(stable|unstable)\s+(val|var)\s+([^\s:]+)\s*:\s*(.*\S)\s*$)");
const std::regex kFunName(R"(\bfun\s+(?:[\w<>?]+\.)?([A-Za-z_]\w*)\s*\()");
const std::regex kRestartable(R"(\brestartable\b)");
const std::regex kSkippable(R"(\bskippable\b)");
const std::regex kNotSkippable(R"(\bnot\s+skippable\b|\bnon-skippable\b)");
const std::regex kUnstableParam(R"(^unstable\s+([A-Za-z_]\w*)\s*:\s*([^=]*[^=\s])\s*(=.*)?$)");

size_t indentOf(const std::string& line) {
    size_t n = 0;
    while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) n++;
    return n;
}

std::string trimmed(const std::string& line) {
    size_t begin = indentOf(line);
    size_t end = line.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) end--;
    return line.substr(begin, end - begin);
}

struct Markers {
    bool restartable = false;
    bool skippable = false;
};

std::optional<Markers> markersOf(const std::string& text) {
    bool restartable = std::regex_search(text, kRestartable);
    bool mentions_skip = std::regex_search(text, kSkippable);
    if (!restartable && !mentions_skip) return std::nullopt;

    Markers m;
    m.restartable = restartable;
    m.skippable = mentions_skip && !std::regex_search(text, kNotSkippable);
    return m;
}

// ─── Parser State Machine ─────────────────────────────────────

class ReportParser {
public:
    StabilityReport run(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            feed(line);
        }
        closeClass();
        closeComposable();
        return std::move(report_);
    }

private:
    enum class State { OutsideRecord, InsideClassRecord, InsideComposableParams };

    State state_ = State::OutsideRecord;
    StabilityReport report_;

    ClassRecord current_class_;
    size_t class_indent_ = 0;

    ComposableRecord current_fn_;
    size_t fn_indent_ = 0;

    std::optional<Markers> pending_;

    void feed(const std::string& line) {
        std::string text = trimmed(line);
        if (text.empty()) return;
        size_t indent = indentOf(line);

        switch (state_) {
            case State::InsideClassRecord:
                if (consumeMember(text)) return;
                if (indent > class_indent_) return;
                closeClass();
                break;
            case State::InsideComposableParams:
                if (text[0] == ')') {
                    closeComposable();
                    return;
                }
                if (indent > fn_indent_) {
                    consumeParam(text);
                    return;
                }
                closeComposable();
                break;
            case State::OutsideRecord:
                break;
        }
        feedOutside(text, indent);
    }

    void feedOutside(const std::string& text, size_t indent) {
        std::smatch m;
        if (std::regex_search(text, m, kClassLine)) {
            current_class_ = ClassRecord{};
            current_class_.name = m[2].str();
            current_class_.stable = (m[1].str() == "stable");
            class_indent_ = indent;
            state_ = State::InsideClassRecord;
            pending_.reset();  // a marker never carries across a class record
            return;
        }

        if (auto markers = markersOf(beforeFun(text))) {
            pending_ = markers;
        }

        if (pending_ && std::regex_search(text, m, kFunName)) {
            current_fn_ = ComposableRecord{};
            current_fn_.name = m[1].str();
            current_fn_.restartable = pending_->restartable;
            current_fn_.skippable = pending_->skippable;
            pending_.reset();

            // Parameters follow when the parameter list stays open.
            std::string rest = m.suffix().str();
            if (rest.find(')') == std::string::npos) {
                fn_indent_ = indent;
                state_ = State::InsideComposableParams;
            } else {
                report_.records.emplace_back(current_fn_);
            }
        }
    }

    bool consumeMember(const std::string& text) {
        std::smatch m;
        if (!std::regex_match(text, m, kMemberLine)) return false;
        if (m[1].str() == "unstable") {
            current_class_.unstable_members.push_back(
                MemberInfo{m[3].str(), m[4].str(), m[2].str() == "var"});
        }
        return true;
    }

    void consumeParam(const std::string& text) {
        std::smatch m;
        if (std::regex_match(text, m, kUnstableParam)) {
            current_fn_.unstable_params.push_back(ParamInfo{m[1].str(), m[2].str()});
        }
    }

    void closeClass() {
        if (state_ != State::InsideClassRecord) return;
        report_.records.emplace_back(current_class_);
        state_ = State::OutsideRecord;
    }

    void closeComposable() {
        if (state_ != State::InsideComposableParams) return;
        report_.records.emplace_back(current_fn_);
        state_ = State::OutsideRecord;
    }

    /// Marker words are only read before `fun`, so parameter names
    /// such as `skippable: Boolean` on the same line do not count.
    static std::string beforeFun(const std::string& text) {
        std::smatch m;
        if (std::regex_search(text, m, kFunName)) return m.prefix().str();
        return text;
    }
};

} // namespace

StabilityReport parseReport(const std::string& text) {
    std::istringstream in(text);
    return ReportParser{}.run(in);
}

StabilityReport parseReportFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IoError(path, "Cannot read report");
    }
    StabilityReport report = ReportParser{}.run(in);
    if (in.bad()) {
        throw IoError(path, "Failed while reading report");
    }
    return report;
}

} // namespace scaffkit
