// PyBind11 bindings for the scaffkit core.
// Exposes name derivation, token substitution, scaffolding, report
// analysis and the pattern scanner to Python tooling.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "common/errors.hpp"
#include "naming/case_deriver.hpp"
#include "templating/token_substitution.hpp"
#include "scaffold/scaffold_manifest.hpp"
#include "scaffold/scaffold_writer.hpp"
#include "stability/report_parser.hpp"
#include "stability/stability_aggregator.hpp"
#include "stability/report_renderer.hpp"
#include "scanning/pattern_scanner.hpp"

namespace py = pybind11;

PYBIND11_MODULE(scaffkit_bindings, m) {
    m.doc() = "scaffkit C++ Core Bindings";

    // ── Errors ──
    auto toolkit_error = py::register_exception<scaffkit::ToolkitError>(m, "ToolkitError");
    py::register_exception<scaffkit::ValidationError>(m, "ValidationError", toolkit_error.ptr());
    py::register_exception<scaffkit::IoError>(m, "IoError", toolkit_error.ptr());

    // ── NameContext ──
    py::class_<scaffkit::NameContext>(m, "NameContext")
        .def(py::init<>())
        .def_readonly("original", &scaffkit::NameContext::original)
        .def_readonly("pascal", &scaffkit::NameContext::pascal)
        .def_readonly("camel", &scaffkit::NameContext::camel)
        .def_readonly("lower", &scaffkit::NameContext::lower)
        .def_readonly("upper", &scaffkit::NameContext::upper)
        .def_readonly("snake", &scaffkit::NameContext::snake);

    m.def("derive_names", &scaffkit::deriveNames, py::arg("name"));
    m.def("split_words", &scaffkit::splitWords, py::arg("name"));

    // ── TokenMap ──
    py::class_<scaffkit::TokenMap>(m, "TokenMap")
        .def(py::init<>())
        .def(py::init([](const std::map<std::string, std::string>& bindings) {
            scaffkit::TokenMap tokens;
            for (const auto& [name, value] : bindings) tokens.bind(name, value);
            return tokens;
        }))
        .def("bind", &scaffkit::TokenMap::bind)
        .def("contains", &scaffkit::TokenMap::contains)
        .def("__len__", &scaffkit::TokenMap::size);

    m.def("substitute", &scaffkit::substitute, py::arg("text"), py::arg("tokens"));
    m.def("unresolved_tokens", &scaffkit::unresolvedTokens, py::arg("text"), py::arg("tokens"));

    // ── Scaffold ──
    py::class_<scaffkit::ScaffoldRequest>(m, "ScaffoldRequest")
        .def(py::init<>())
        .def_readwrite("feature_name", &scaffkit::ScaffoldRequest::feature_name)
        .def_readwrite("variant", &scaffkit::ScaffoldRequest::variant)
        .def_readwrite("output_root", &scaffkit::ScaffoldRequest::output_root)
        .def_readwrite("base_package", &scaffkit::ScaffoldRequest::base_package);

    py::class_<scaffkit::FileOutcome>(m, "FileOutcome")
        .def_readonly("template_path", &scaffkit::FileOutcome::template_path)
        .def_readonly("output_path", &scaffkit::FileOutcome::output_path)
        .def_readonly("ok", &scaffkit::FileOutcome::ok)
        .def_readonly("error", &scaffkit::FileOutcome::error)
        .def_readonly("unresolved_tokens", &scaffkit::FileOutcome::unresolved_tokens);

    py::class_<scaffkit::ScaffoldResult>(m, "ScaffoldResult")
        .def_readonly("names", &scaffkit::ScaffoldResult::names)
        .def_readonly("variant", &scaffkit::ScaffoldResult::variant)
        .def_readonly("full_package", &scaffkit::ScaffoldResult::full_package)
        .def_readonly("files", &scaffkit::ScaffoldResult::files)
        .def_readonly("directory_errors", &scaffkit::ScaffoldResult::directory_errors)
        .def_property_readonly("module_dir", [](const scaffkit::ScaffoldResult& r) {
            return r.module_dir.generic_string();
        })
        .def("written_count", &scaffkit::ScaffoldResult::writtenCount)
        .def("failed_count", &scaffkit::ScaffoldResult::failedCount)
        .def("ok", &scaffkit::ScaffoldResult::ok)
        .def("written_paths", &scaffkit::ScaffoldResult::writtenPaths);

    m.def("default_variants", []() {
        return scaffkit::defaultManifestRegistry().variants();
    });

    m.def("scaffold", [](const scaffkit::ScaffoldRequest& request, const std::string& template_root) {
        scaffkit::ManifestRegistry registry = scaffkit::defaultManifestRegistry();
        scaffkit::ScaffoldWriter writer(registry, template_root);
        return writer.run(request);
    }, py::arg("request"), py::arg("template_root"));

    // ── Reports ──
    py::class_<scaffkit::MemberInfo>(m, "MemberInfo")
        .def_readonly("name", &scaffkit::MemberInfo::name)
        .def_readonly("type", &scaffkit::MemberInfo::type)
        .def_readonly("is_mutable", &scaffkit::MemberInfo::is_mutable);

    py::class_<scaffkit::ClassRecord>(m, "ClassRecord")
        .def_readonly("name", &scaffkit::ClassRecord::name)
        .def_readonly("stable", &scaffkit::ClassRecord::stable)
        .def_readonly("unstable_members", &scaffkit::ClassRecord::unstable_members);

    py::class_<scaffkit::ParamInfo>(m, "ParamInfo")
        .def_readonly("name", &scaffkit::ParamInfo::name)
        .def_readonly("type", &scaffkit::ParamInfo::type);

    py::class_<scaffkit::ComposableRecord>(m, "ComposableRecord")
        .def_readonly("name", &scaffkit::ComposableRecord::name)
        .def_readonly("restartable", &scaffkit::ComposableRecord::restartable)
        .def_readonly("skippable", &scaffkit::ComposableRecord::skippable)
        .def_readonly("unstable_params", &scaffkit::ComposableRecord::unstable_params);

    py::class_<scaffkit::StabilityReport>(m, "StabilityReport")
        .def(py::init<>())
        .def_readonly("records", &scaffkit::StabilityReport::records)
        .def("classes", &scaffkit::StabilityReport::classes)
        .def("composables", &scaffkit::StabilityReport::composables)
        .def("__len__", &scaffkit::StabilityReport::size);

    m.def("parse_report", &scaffkit::parseReport, py::arg("text"));
    m.def("parse_report_file", &scaffkit::parseReportFile, py::arg("path"));

    py::enum_<scaffkit::IssueKind>(m, "IssueKind")
        .value("UNSTABLE_CLASS", scaffkit::IssueKind::UnstableClass)
        .value("NON_SKIPPABLE_COMPOSABLE", scaffkit::IssueKind::NonSkippableComposable);

    py::class_<scaffkit::StabilityIssue>(m, "StabilityIssue")
        .def_readonly("kind", &scaffkit::StabilityIssue::kind)
        .def_readonly("subject", &scaffkit::StabilityIssue::subject)
        .def_readonly("culprits", &scaffkit::StabilityIssue::culprits)
        .def_readonly("hints", &scaffkit::StabilityIssue::hints);

    py::class_<scaffkit::StabilitySummary>(m, "StabilitySummary")
        .def_readonly("stable_count", &scaffkit::StabilitySummary::stable_count)
        .def_readonly("unstable_count", &scaffkit::StabilitySummary::unstable_count)
        .def_readonly("skippable_count", &scaffkit::StabilitySummary::skippable_count)
        .def_readonly("non_skippable_count", &scaffkit::StabilitySummary::non_skippable_count)
        .def_readonly("restartable_count", &scaffkit::StabilitySummary::restartable_count)
        .def_readonly("issues", &scaffkit::StabilitySummary::issues)
        .def("stability_rate", &scaffkit::StabilitySummary::stabilityRate)
        .def("skippable_rate", &scaffkit::StabilitySummary::skippableRate);

    m.def("summarize", [](const scaffkit::StabilityReport& report) {
        return scaffkit::StabilityAggregator{}.summarize(report);
    }, py::arg("report"));

    m.def("summary_json", [](const scaffkit::StabilitySummary& summary) {
        return scaffkit::dumpSummaryJson(scaffkit::summaryToJson(summary));
    }, py::arg("summary"));

    // ── Scanner ──
    py::class_<scaffkit::ScanInput>(m, "ScanInput")
        .def(py::init<>())
        .def(py::init([](std::string path, std::string content) {
            return scaffkit::ScanInput{std::move(path), std::move(content)};
        }))
        .def_readwrite("path", &scaffkit::ScanInput::path)
        .def_readwrite("content", &scaffkit::ScanInput::content);

    py::class_<scaffkit::ScanMatch>(m, "ScanMatch")
        .def_readonly("file_path", &scaffkit::ScanMatch::file_path)
        .def_readonly("line_number", &scaffkit::ScanMatch::line_number)
        .def_readonly("pattern", &scaffkit::ScanMatch::pattern)
        .def_readonly("line_text", &scaffkit::ScanMatch::line_text);

    py::class_<scaffkit::ScanResult>(m, "ScanResult")
        .def_readonly("matches", &scaffkit::ScanResult::matches)
        .def_readonly("skipped", &scaffkit::ScanResult::skipped)
        .def_readonly("files_scanned", &scaffkit::ScanResult::files_scanned)
        .def("blocked", &scaffkit::ScanResult::blocked);

    m.def("scan", [](const std::vector<scaffkit::ScanInput>& inputs) {
        return scaffkit::defaultPatternScanner().scan(inputs);
    }, py::arg("inputs"));

    m.def("scan_files", [](const std::vector<std::string>& paths) {
        return scaffkit::defaultPatternScanner().scanFiles(paths);
    }, py::arg("paths"));
}
