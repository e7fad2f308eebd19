/**
 * @file FixPlanner.cpp
 * @brief Implementation of FixPlanner.
 */

#include "application/FixPlanner.hpp"

#include <algorithm>
#include <unordered_map>

namespace structaudit::application {

using namespace domain::analysis;

namespace {

RenameHeadingFix ToRenamePayload(const HeadingIssue& issue) {
    RenameHeadingFix fix;
    fix.kind = issue.kind;
    fix.action = issue.action;
    fix.line = issue.line;
    fix.oldRaw = issue.oldRaw;
    fix.newRaw = issue.newRaw;
    fix.oldTitle = issue.oldTitle;
    fix.newTitle = issue.newTitle;
    return fix;
}

} // namespace

bool FixPlanner::IsAutoApplicable(const FixIssue& issue, const AnalysisProfile& profile) {
    if (issue.action == FixAction::Renumber) return true;
    if (const auto* rename = std::get_if<RenameHeadingFix>(&issue.payload)) {
        if (rename->action == "RENAME_RECOMMENDED") return false;
    }
    return issue.confidence >= profile.autoApplyConfidenceFloor;
}

std::vector<FixIssue> FixPlanner::Plan(const AnalysisFindings& findings, const AnalysisProfile& profile) {
    std::vector<FixIssue> issues;

    for (const auto& dup : findings.duplicateParagraphs) {
        RemoveParagraphFix fix;
        fix.kind = dup.kind;
        fix.fingerprint = dup.secondFingerprint;
        fix.keepFingerprint = dup.firstFingerprint;
        fix.occurrences = dup.occurrences;
        fix.line = dup.secondLine;
        fix.duplicateOfLine = dup.firstLine;
        fix.preview = dup.preview;
        issues.emplace_back(dup.id, RemoveParagraphFix::Type,
                            dup.kind == MatchKind::Exact ? Severity::High : Severity::Medium, FixAction::Remove,
                            dup.confidence, dup.secondLine, dup.reason, fix);
    }

    for (const auto& dup : findings.duplicateSections) {
        MergeSectionFix fix;
        fix.kind = dup.kind;
        fix.keepKey = dup.firstFingerprint;
        fix.dropKey = dup.secondFingerprint;
        fix.level = dup.level;
        fix.title = dup.title;
        fix.keptLine = dup.firstLine;
        fix.droppedLine = dup.secondLine;
        issues.emplace_back(dup.id, MergeSectionFix::Type, Severity::High, FixAction::Merge, dup.confidence,
                            dup.secondLine, dup.reason, fix);
    }

    for (const auto& heading : findings.headingNumberingIssues) {
        RenumberFix fix{heading.line, heading.oldRaw, heading.newRaw};
        issues.emplace_back(heading.id, RenumberFix::Type, Severity::Medium, FixAction::Renumber, heading.confidence,
                            heading.line, heading.reason, fix);
    }

    for (const auto& heading : findings.headingSemanticIssues) {
        issues.emplace_back(heading.id, "heading_semantic", Severity::Low, FixAction::Rename, heading.confidence,
                            heading.line, heading.reason, ToRenamePayload(heading));
    }

    for (const auto& move : findings.tableMisplacements) {
        MoveTableFix fix;
        fix.strategy = move.strategy;
        fix.headingText = move.table.headingText;
        fix.normalizedHeading = move.table.normalizedHeading;
        fix.rowCount = move.table.rowCount;
        fix.tableOccurrence = move.tableOccurrence;
        fix.anchorHeading = move.anchorHeading;
        fix.anchorOccurrence = move.anchorOccurrence;
        fix.currentHeading = move.currentHeading;
        fix.targetHeading = move.targetHeading;
        issues.emplace_back(move.id, MoveTableFix::Type, Severity::Medium, FixAction::Move, move.confidence,
                            move.table.headingLine + 1, move.reason, fix);
    }

    for (const auto& heading : findings.tableHeadingLevelIssues) {
        issues.emplace_back(heading.id, "table_heading_level", Severity::Low, FixAction::Rename, heading.confidence,
                            heading.line, heading.reason, ToRenamePayload(heading));
    }

    for (const auto& heading : findings.headingMarkdownArtifacts) {
        issues.emplace_back(heading.id, "heading_markdown_artifact", Severity::Low, FixAction::Rename,
                            heading.confidence, heading.line, heading.reason, ToRenamePayload(heading));
    }

    // Ids are content-derived; two findings may still hash alike (e.g. repeated sections).
    std::unordered_map<std::string, int> seen;
    for (auto& issue : issues) {
        int& count = seen[issue.id];
        if (count > 0) issue.id += "_" + std::to_string(count + 1);
        ++count;
        issue.autoApplicable = IsAutoApplicable(issue, profile);
    }

    std::stable_sort(issues.begin(), issues.end(), [](const FixIssue& a, const FixIssue& b) {
        if (a.severity != b.severity) return static_cast<int>(a.severity) > static_cast<int>(b.severity);
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.line != b.line) return a.line < b.line;
        return a.id < b.id;
    });
    return issues;
}

} // namespace structaudit::application
