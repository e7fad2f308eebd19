/**
 * @file StructuralAuditService.cpp
 * @brief Implementation of StructuralAuditService.
 */

#include "application/StructuralAuditService.hpp"
#include "domain/analysis/DuplicateDetector.hpp"
#include "domain/analysis/HeadingNumbering.hpp"
#include "domain/analysis/HeadingSemanticsAnalyzer.hpp"
#include "domain/analysis/TablePlacementAnalyzer.hpp"
#include "domain/document/Document.hpp"
#include "domain/text/TextUtils.hpp"

#include <iostream>
#include <utility>

namespace structaudit::application {

using namespace domain::analysis;

StructuralAuditService::StructuralAuditService(ProfileCatalog catalog, bool quiet)
    : m_catalog(std::move(catalog)), m_quiet(quiet) {}

const AnalysisProfile& StructuralAuditService::profileFor(const std::string& mode, bool* recognized) const {
    return m_catalog.profileFor(ParseMode(mode, recognized));
}

void StructuralAuditService::validate(const std::string& text, const AnalysisProfile& profile) const {
    if (text.size() > profile.maxDocumentBytes) {
        throw MalformedInputError("Document has " + std::to_string(text.size()) + " bytes; limit is " +
                                  std::to_string(profile.maxDocumentBytes));
    }
    if (!domain::text::IsValidUtf8(text)) {
        throw MalformedInputError("Document is not valid UTF-8");
    }
}

StructuralReport StructuralAuditService::analyze(const std::string& text, const std::string& mode,
                                                 const std::optional<std::string>& reference) const {
    bool recognized = true;
    const AnalysisProfile& profile = profileFor(mode, &recognized);
    if (!recognized) {
        std::cerr << "[StructuralAuditService] Unknown mode '" << mode << "'; using "
                  << ModeToString(profile.mode) << std::endl;
    }
    validate(text, profile);

    const auto doc = domain::document::DocumentParser::Parse(text);

    StructuralReport report;
    report.mode = profile.mode;
    report.requestedMode = mode;
    report.modeRecognized = recognized;
    report.referenceProvided = reference.has_value() && !reference->empty();

    DuplicateDetector duplicates(profile);
    report.findings.duplicateParagraphs = duplicates.findParagraphDuplicates(doc);
    report.findings.duplicateSections = duplicates.findSectionDuplicates(doc);
    report.findings.headingNumberingIssues = HeadingNumbering::FindIssues(doc);
    report.findings.headingSemanticIssues = HeadingSemanticsAnalyzer(profile).analyze(doc);
    report.findings.tableMisplacements = TablePlacementAnalyzer(profile).findMisplacements(doc);
    report.findings.tableHeadingLevelIssues = TablePlacementAnalyzer::FindHeadingLevelIssues(doc);
    report.findings.headingMarkdownArtifacts = TablePlacementAnalyzer::FindMarkdownArtifacts(doc);
    report.issues = FixPlanner::Plan(report.findings, profile);

    if (!m_quiet) {
        std::cout << "[StructuralAuditService] " << ModeToString(profile.mode) << ": "
                  << doc.sections.size() << " sections, " << doc.paragraphs.size() << " paragraphs, "
                  << report.totalIssues() << " issues" << std::endl;
    }
    return report;
}

ApplyResult StructuralAuditService::apply(const std::string& text, const std::vector<FixIssue>& approved,
                                          const std::string& mode) const {
    const AnalysisProfile& profile = profileFor(mode);
    ApplyResult result = FixApplicator(profile).apply(text, approved);

    for (const auto& skipped : result.skipped) {
        std::cerr << "[StructuralAuditService] Skipped " << skipped.issueId << " ("
                  << SkipReasonToString(skipped.reason) << "): " << skipped.detail << std::endl;
    }
    if (!m_quiet) {
        std::cout << "[StructuralAuditService] Applied " << result.fixesApplied.size() << " of "
                  << approved.size() << " fixes; " << result.originalSize << " -> " << result.newSize
                  << " bytes" << std::endl;
    }
    return result;
}

std::vector<CrossDocumentDuplicate> StructuralAuditService::findCrossDocumentDuplicates(
    const std::vector<SourceText>& sources, const std::string& mode) const {
    const AnalysisProfile& profile = profileFor(mode);

    std::vector<NamedDocument> batch;
    batch.reserve(sources.size());
    for (const auto& source : sources) {
        try {
            validate(source.text, profile);
        } catch (const MalformedInputError& e) {
            throw MalformedInputError(source.name + ": " + e.what());
        }
        batch.push_back({source.name, domain::document::DocumentParser::Parse(source.text)});
    }

    auto result = DuplicateDetector(profile).findCrossDocumentDuplicates(batch);
    if (!m_quiet) {
        std::cout << "[StructuralAuditService] " << batch.size() << " documents, "
                  << result.size() << " paragraphs repeated across documents" << std::endl;
    }
    return result;
}

ApplyResult StructuralAuditService::autoFix(const std::string& text, const std::string& mode) const {
    const StructuralReport report = analyze(text, mode);
    std::vector<FixIssue> approved;
    for (const auto& issue : report.issues) {
        if (issue.autoApplicable) approved.push_back(issue);
    }
    return apply(text, approved, mode);
}

} // namespace structaudit::application
