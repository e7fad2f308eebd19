/**
 * @file main.cpp
 * @brief structaudit command-line driver: analyze (dry run), apply approved fixes, autofix,
 *        and crossdup for paragraphs repeated across a batch of documents.
 */

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "application/StructuralAuditService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DocumentFileStore.hpp"
#include "infrastructure/ReportSerializer.hpp"

using namespace structaudit;
using infrastructure::DocumentFileStore;
using infrastructure::ReportSerializer;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

struct Options {
    std::string document;
    std::vector<std::string> documents;
    std::string reference;
    std::string mode = "APOSTILA";
    std::string config = "settings.json";
    std::string report;
    std::string output;
    std::vector<std::string> approve;
    bool approveAll = false;
};

// Writes the result over the input (after a backup) or to --output.
int WriteResult(const Options& opts, const application::ApplyResult& result) {
    std::cout << ReportSerializer::ApplyResultToJson(result).dump(2) << std::endl;
    if (result.fixesApplied.empty()) {
        std::cout << "[structaudit] Nothing applied; document left untouched" << std::endl;
        return kExitOk;
    }

    const std::string target = opts.output.empty() ? opts.document : opts.output;
    if (target == opts.document && !DocumentFileStore::backup(opts.document)) return kExitFailure;
    if (!DocumentFileStore::writeAtomic(target, result.newText)) return kExitFailure;
    std::cout << "[structaudit] Wrote " << target << " (" << result.originalSize << " -> " << result.newSize
              << " bytes)" << std::endl;
    return kExitOk;
}

int RunAnalyze(const Options& opts) {
    auto text = DocumentFileStore::readText(opts.document);
    if (!text) return kExitFailure;

    std::optional<std::string> reference;
    if (!opts.reference.empty()) {
        reference = DocumentFileStore::readText(opts.reference);
        if (!reference) return kExitFailure;
    }

    application::StructuralAuditService service(infrastructure::ConfigLoader::LoadProfiles(opts.config));
    try {
        const auto report = service.analyze(*text, opts.mode, reference);
        const std::string json = ReportSerializer::ToJson(report).dump(2);
        if (opts.report.empty()) {
            std::cout << json << std::endl;
        } else if (!DocumentFileStore::writeAtomic(opts.report, json + "\n")) {
            return kExitFailure;
        } else {
            std::cout << "[structaudit] " << report.totalIssues() << " issues written to " << opts.report << std::endl;
        }
    } catch (const application::MalformedInputError& e) {
        std::cerr << "[structaudit] " << opts.document << ": " << e.what() << std::endl;
        return kExitFailure;
    }
    return kExitOk;
}

int RunApply(const Options& opts) {
    if (!opts.approveAll && opts.approve.empty()) {
        std::cerr << "[structaudit] apply needs --approve <ids> or --approve-all" << std::endl;
        return kExitUsage;
    }
    auto text = DocumentFileStore::readText(opts.document);
    auto reportText = DocumentFileStore::readText(opts.report);
    if (!text || !reportText) return kExitFailure;

    std::vector<domain::analysis::FixIssue> issues;
    std::string mode = opts.mode;
    try {
        const auto report = nlohmann::json::parse(*reportText);
        issues = ReportSerializer::IssuesFromReport(report);
        mode = report.value("mode", mode);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[structaudit] Invalid report " << opts.report << ": " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[structaudit] Invalid report " << opts.report << ": " << e.what() << std::endl;
        return kExitFailure;
    }

    std::vector<domain::analysis::FixIssue> approved;
    const std::set<std::string> wanted(opts.approve.begin(), opts.approve.end());
    std::set<std::string> found;
    for (const auto& issue : issues) {
        if (opts.approveAll || wanted.count(issue.id)) {
            approved.push_back(issue);
            found.insert(issue.id);
        }
    }
    for (const auto& id : wanted) {
        if (!found.count(id)) std::cerr << "[structaudit] Unknown issue id '" << id << "'" << std::endl;
    }

    application::StructuralAuditService service(infrastructure::ConfigLoader::LoadProfiles(opts.config));
    return WriteResult(opts, service.apply(*text, approved, mode));
}

int RunAutoFix(const Options& opts) {
    auto text = DocumentFileStore::readText(opts.document);
    if (!text) return kExitFailure;

    application::StructuralAuditService service(infrastructure::ConfigLoader::LoadProfiles(opts.config));
    try {
        return WriteResult(opts, service.autoFix(*text, opts.mode));
    } catch (const application::MalformedInputError& e) {
        std::cerr << "[structaudit] " << opts.document << ": " << e.what() << std::endl;
        return kExitFailure;
    }
}

int RunCrossDuplicates(const Options& opts) {
    if (opts.documents.size() < 2) {
        std::cerr << "[structaudit] crossdup needs at least two documents" << std::endl;
        return kExitUsage;
    }
    std::vector<application::SourceText> sources;
    for (const auto& path : opts.documents) {
        auto text = DocumentFileStore::readText(path);
        if (!text) return kExitFailure;
        sources.push_back({path, std::move(*text)});
    }

    application::StructuralAuditService service(infrastructure::ConfigLoader::LoadProfiles(opts.config));
    try {
        const auto duplicates = service.findCrossDocumentDuplicates(sources, opts.mode);
        const std::string json = ReportSerializer::CrossDocumentDuplicatesToJson(duplicates, sources.size()).dump(2);
        if (opts.report.empty()) {
            std::cout << json << std::endl;
        } else if (!DocumentFileStore::writeAtomic(opts.report, json + "\n")) {
            return kExitFailure;
        } else {
            std::cout << "[structaudit] " << duplicates.size() << " cross-file duplicates written to " << opts.report
                      << std::endl;
        }
    } catch (const application::MalformedInputError& e) {
        std::cerr << "[structaudit] " << e.what() << std::endl;
        return kExitFailure;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"Structural audit and repair of generated Markdown documents"};
    app.require_subcommand(1);

    Options opts;
    int exitCode = kExitOk;

    auto* analyze = app.add_subcommand("analyze", "Report structural issues without touching the document");
    analyze->add_option("document", opts.document, "Markdown document")->required();
    analyze->add_option("--mode", opts.mode, "APOSTILA | FIDELIDADE | AUDIENCIA | REUNIAO | DEPOIMENTO");
    analyze->add_option("--config", opts.config, "settings.json with threshold overrides");
    analyze->add_option("--report", opts.report, "Write the JSON report here instead of stdout");
    analyze->add_option("--reference", opts.reference, "Reference text the document was generated from");
    analyze->callback([&]() { exitCode = RunAnalyze(opts); });

    auto* apply = app.add_subcommand("apply", "Apply approved issues from a report");
    apply->add_option("document", opts.document, "Markdown document")->required();
    apply->add_option("--report", opts.report, "Report produced by 'analyze'")->required();
    apply->add_option("--approve", opts.approve, "Comma-separated issue ids")->delimiter(',');
    apply->add_flag("--approve-all", opts.approveAll, "Apply every issue in the report");
    apply->add_option("--output", opts.output, "Write here instead of overwriting the document");
    apply->add_option("--config", opts.config, "settings.json with threshold overrides");
    apply->callback([&]() { exitCode = RunApply(opts); });

    auto* autofix = app.add_subcommand("autofix", "Analyze and apply every auto-applicable issue");
    autofix->add_option("document", opts.document, "Markdown document")->required();
    autofix->add_option("--mode", opts.mode, "APOSTILA | FIDELIDADE | AUDIENCIA | REUNIAO | DEPOIMENTO");
    autofix->add_option("--config", opts.config, "settings.json with threshold overrides");
    autofix->add_option("--output", opts.output, "Write here instead of overwriting the document");
    autofix->callback([&]() { exitCode = RunAutoFix(opts); });

    auto* crossdup = app.add_subcommand("crossdup", "Report paragraphs repeated across several documents");
    crossdup->add_option("documents", opts.documents, "Markdown documents")->required();
    crossdup->add_option("--mode", opts.mode, "APOSTILA | FIDELIDADE | AUDIENCIA | REUNIAO | DEPOIMENTO");
    crossdup->add_option("--config", opts.config, "settings.json with threshold overrides");
    crossdup->add_option("--report", opts.report, "Write the JSON report here instead of stdout");
    crossdup->callback([&]() { exitCode = RunCrossDuplicates(opts); });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? kExitOk : kExitUsage;
    }
    return exitCode;
}
