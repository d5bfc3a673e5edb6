#pragma once

#include <string>
#include <variant>
#include <vector>

namespace scaffkit {

// ─── Report Records ───────────────────────────────────────────
// Structured form of the compiler's stability reports. Records
// are immutable once parsed and kept in file order.

struct MemberInfo {
    std::string name;
    std::string type;
    bool is_mutable = false;  // declared `var`
};

/// `stable class X` / `unstable class X` plus its unstable members.
struct ClassRecord {
    std::string name;
    bool stable = false;
    std::vector<MemberInfo> unstable_members;
};

struct ParamInfo {
    std::string name;
    std::string type;
};

/// A composable function and its restart/skip classification.
struct ComposableRecord {
    std::string name;
    bool restartable = false;
    bool skippable = false;
    std::vector<ParamInfo> unstable_params;
};

using ReportRecord = std::variant<ClassRecord, ComposableRecord>;

struct StabilityReport {
    std::vector<ReportRecord> records;

    bool empty() const { return records.empty(); }
    size_t size() const { return records.size(); }

    /// Append every record of `other`, preserving its order.
    void append(const StabilityReport& other);

    std::vector<ClassRecord> classes() const;
    std::vector<ComposableRecord> composables() const;
};

// ─── Report Parser ────────────────────────────────────────────
// Line-oriented. The parser is outside any record, inside a class
// record opened at some indentation, or inside the open parameter
// list of a composable.
//
//   unstable class Foo {                 ← opens Foo at indent 0
//     unstable val items: List<Item>     ← member, attached to Foo
//     <runtime stability> = Unstable     ← deeper, ignored
//   }                                    ← indent 0, not a member: closes
//
//   restartable skippable fun Row(       ← composable marker + fun name
//     unstable items: List<Item>         ← unstable parameter
//   )
//
// A marker line without `fun Name(` applies to the next `fun Name(`.
// Unrecognized lines are skipped; nothing in the text is an error.

StabilityReport parseReport(const std::string& text);

/// Read and parse a report file. Throws IoError if it cannot be read.
StabilityReport parseReportFile(const std::string& path);

} // namespace scaffkit
