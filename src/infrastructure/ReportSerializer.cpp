/**
 * @file ReportSerializer.cpp
 * @brief Implementation of ReportSerializer.
 */

#include "infrastructure/ReportSerializer.hpp"
#include <stdexcept>
#include <type_traits>

namespace structaudit::infrastructure {

using json = nlohmann::json;
using namespace domain::analysis;

namespace {

json DuplicateToJson(const DuplicateCandidate& dup, const char* type) {
    json j = {
        {"id", dup.id},
        {"type", type},
        {"kind", MatchKindToString(dup.kind)},
        {"line", dup.secondLine},
        {"fingerprint", dup.secondFingerprint},
        {"duplicate_of", {{"index", dup.firstIndex}, {"line", dup.firstLine}, {"fingerprint", dup.firstFingerprint}}},
        {"similarity", dup.sequenceRatio},
        {"jaccard", dup.jaccard},
        {"confidence", dup.confidence},
        {"preview", dup.preview},
        {"reason", dup.reason}
    };
    if (dup.level > 0) {
        j["title"] = dup.title;
        j["level"] = dup.level;
    } else {
        j["occurrences"] = dup.occurrences;
    }
    return j;
}

json HeadingToJson(const HeadingIssue& issue, const char* type) {
    return {
        {"id", issue.id},
        {"type", type},
        {"kind", HeadingIssueKindToString(issue.kind)},
        {"line", issue.line},
        {"level", issue.level},
        {"old_raw", issue.oldRaw},
        {"new_raw", issue.newRaw},
        {"old_title", issue.oldTitle},
        {"new_title", issue.newTitle},
        {"confidence", issue.confidence},
        {"action", issue.action},
        {"reason", issue.reason}
    };
}

json MisplacementToJson(const TableMisplacement& move) {
    return {
        {"id", move.id},
        {"type", "table_misplacement"},
        {"strategy", StrategyToString(move.strategy)},
        {"table", {
            {"id", move.table.id},
            {"heading", move.table.headingText},
            {"line", move.table.headingLine + 1},
            {"end_line", move.table.endLine},
            {"row_count", move.table.rowCount}
        }},
        {"current_section", move.currentHeading},
        {"target_section", move.targetHeading},
        {"current_similarity", move.currentSimilarity},
        {"parent_similarity", move.parentSimilarity},
        {"confidence", move.confidence},
        {"reason", move.reason}
    };
}

json PayloadToJson(const FixPayload& payload) {
    json j;
    std::visit([&](auto&& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, RemoveParagraphFix>) {
            j = {
                {"match", MatchKindToString(p.kind)},
                {"fingerprint", p.fingerprint},
                {"keep_fingerprint", p.keepFingerprint},
                {"occurrences", p.occurrences},
                {"line", p.line},
                {"duplicate_of_line", p.duplicateOfLine},
                {"preview", p.preview}
            };
        }
        else if constexpr (std::is_same_v<T, MergeSectionFix>) {
            j = {
                {"match", MatchKindToString(p.kind)},
                {"keep_key", p.keepKey},
                {"drop_key", p.dropKey},
                {"level", p.level},
                {"title", p.title},
                {"kept_line", p.keptLine},
                {"dropped_line", p.droppedLine}
            };
        }
        else if constexpr (std::is_same_v<T, RenumberFix>) {
            j = {
                {"line", p.line},
                {"old_raw", p.oldRaw},
                {"new_raw", p.newRaw}
            };
        }
        else if constexpr (std::is_same_v<T, MoveTableFix>) {
            j = {
                {"strategy", StrategyToString(p.strategy)},
                {"heading", p.headingText},
                {"normalized_heading", p.normalizedHeading},
                {"row_count", p.rowCount},
                {"table_occurrence", p.tableOccurrence},
                {"anchor_heading", p.anchorHeading},
                {"anchor_occurrence", p.anchorOccurrence},
                {"current_heading", p.currentHeading},
                {"target_heading", p.targetHeading}
            };
        }
        else if constexpr (std::is_same_v<T, RenameHeadingFix>) {
            j = {
                {"heading_kind", HeadingIssueKindToString(p.kind)},
                {"action", p.action},
                {"line", p.line},
                {"old_raw", p.oldRaw},
                {"new_raw", p.newRaw},
                {"old_title", p.oldTitle},
                {"new_title", p.newTitle}
            };
        }
        j["kind"] = T::Type;
    }, payload);
    return j;
}

FixPayload PayloadFromJson(const json& j) {
    const std::string kind = j.at("kind").get<std::string>();
    if (kind == RemoveParagraphFix::Type) {
        RemoveParagraphFix p;
        p.kind = MatchKindFromString(j.at("match").get<std::string>());
        p.fingerprint = j.at("fingerprint").get<std::string>();
        p.keepFingerprint = j.at("keep_fingerprint").get<std::string>();
        p.occurrences = j.value("occurrences", static_cast<size_t>(2));
        p.line = j.value("line", static_cast<size_t>(0));
        p.duplicateOfLine = j.value("duplicate_of_line", static_cast<size_t>(0));
        p.preview = j.value("preview", std::string());
        return p;
    }
    if (kind == MergeSectionFix::Type) {
        MergeSectionFix p;
        p.kind = MatchKindFromString(j.at("match").get<std::string>());
        p.keepKey = j.at("keep_key").get<std::string>();
        p.dropKey = j.at("drop_key").get<std::string>();
        p.level = j.at("level").get<int>();
        p.title = j.value("title", std::string());
        p.keptLine = j.value("kept_line", static_cast<size_t>(0));
        p.droppedLine = j.value("dropped_line", static_cast<size_t>(0));
        return p;
    }
    if (kind == RenumberFix::Type) {
        RenumberFix p;
        p.line = j.value("line", static_cast<size_t>(0));
        p.oldRaw = j.value("old_raw", std::string());
        p.newRaw = j.value("new_raw", std::string());
        return p;
    }
    if (kind == MoveTableFix::Type) {
        MoveTableFix p;
        p.strategy = StrategyFromString(j.at("strategy").get<std::string>());
        p.headingText = j.value("heading", std::string());
        p.normalizedHeading = j.at("normalized_heading").get<std::string>();
        p.rowCount = j.at("row_count").get<size_t>();
        p.tableOccurrence = j.value("table_occurrence", static_cast<size_t>(0));
        p.anchorHeading = j.at("anchor_heading").get<std::string>();
        p.anchorOccurrence = j.value("anchor_occurrence", static_cast<size_t>(0));
        p.currentHeading = j.value("current_heading", std::string());
        p.targetHeading = j.value("target_heading", std::string());
        return p;
    }
    if (kind == RenameHeadingFix::Type) {
        RenameHeadingFix p;
        p.kind = HeadingIssueKindFromString(j.value("heading_kind", std::string()));
        p.action = j.value("action", std::string());
        p.line = j.value("line", static_cast<size_t>(0));
        p.oldRaw = j.at("old_raw").get<std::string>();
        p.newRaw = j.at("new_raw").get<std::string>();
        p.oldTitle = j.value("old_title", std::string());
        p.newTitle = j.value("new_title", std::string());
        return p;
    }
    throw std::invalid_argument("Unknown payload kind: " + kind);
}

} // namespace

json ReportSerializer::ToJson(const application::StructuralReport& report) {
    const auto& f = report.findings;
    json j;
    j["mode"] = ModeToString(report.mode);
    j["requested_mode"] = report.requestedMode;
    j["mode_recognized"] = report.modeRecognized;
    j["reference_provided"] = report.referenceProvided;

    j["duplicate_paragraphs"] = json::array();
    for (const auto& dup : f.duplicateParagraphs) j["duplicate_paragraphs"].push_back(DuplicateToJson(dup, "duplicate_paragraph"));
    j["duplicate_sections"] = json::array();
    for (const auto& dup : f.duplicateSections) j["duplicate_sections"].push_back(DuplicateToJson(dup, "duplicate_section"));
    j["heading_numbering_issues"] = json::array();
    for (const auto& h : f.headingNumberingIssues) j["heading_numbering_issues"].push_back(HeadingToJson(h, "heading_numbering"));
    j["heading_semantic_issues"] = json::array();
    for (const auto& h : f.headingSemanticIssues) j["heading_semantic_issues"].push_back(HeadingToJson(h, "heading_semantic"));
    j["table_misplacements"] = json::array();
    for (const auto& m : f.tableMisplacements) j["table_misplacements"].push_back(MisplacementToJson(m));
    j["table_heading_level_issues"] = json::array();
    for (const auto& h : f.tableHeadingLevelIssues) j["table_heading_level_issues"].push_back(HeadingToJson(h, "table_heading_level"));
    j["heading_markdown_artifacts"] = json::array();
    for (const auto& h : f.headingMarkdownArtifacts) j["heading_markdown_artifacts"].push_back(HeadingToJson(h, "heading_markdown_artifact"));

    j["issues"] = json::array();
    for (const auto& issue : report.issues) j["issues"].push_back(IssueToJson(issue));
    j["total_issues"] = report.totalIssues();
    return j;
}

json ReportSerializer::IssueToJson(const FixIssue& issue) {
    return {
        {"id", issue.id},
        {"type", issue.type},
        {"severity", SeverityToString(issue.severity)},
        {"action", FixActionToString(issue.action)},
        {"confidence", issue.confidence},
        {"line", issue.line},
        {"description", issue.description},
        {"auto_applicable", issue.autoApplicable},
        {"payload", PayloadToJson(issue.payload)}
    };
}

FixIssue ReportSerializer::IssueFromJson(const json& j) {
    try {
        FixIssue issue(j.at("id").get<std::string>(),
                       j.at("type").get<std::string>(),
                       SeverityFromString(j.value("severity", std::string("BAIXA"))),
                       FixActionFromString(j.at("action").get<std::string>()),
                       j.at("confidence").get<double>(),
                       j.value("line", static_cast<size_t>(0)),
                       j.value("description", std::string()),
                       PayloadFromJson(j.at("payload")));
        issue.autoApplicable = j.value("auto_applicable", false);
        return issue;
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed issue: ") + e.what());
    }
}

std::vector<FixIssue> ReportSerializer::IssuesFromReport(const json& report) {
    std::vector<FixIssue> issues;
    if (!report.is_object() || !report.contains("issues") || !report["issues"].is_array()) {
        throw std::invalid_argument("Report has no 'issues' array");
    }
    for (const auto& item : report["issues"]) issues.push_back(IssueFromJson(item));
    return issues;
}

json ReportSerializer::ApplyResultToJson(const application::ApplyResult& result) {
    json j;
    j["fixes_applied"] = result.fixesApplied;
    j["skipped"] = json::array();
    for (const auto& skipped : result.skipped) {
        j["skipped"].push_back({
            {"id", skipped.issueId},
            {"reason", application::SkipReasonToString(skipped.reason)},
            {"detail", skipped.detail}
        });
    }
    j["moves"] = json::array();
    for (const auto& move : result.moveOutcomes) {
        j["moves"].push_back({{"id", move.issueId}, {"success", move.success}, {"detail", move.detail}});
    }
    j["original_size"] = result.originalSize;
    j["new_size"] = result.newSize;
    return j;
}

json ReportSerializer::CrossDocumentDuplicatesToJson(const std::vector<CrossDocumentDuplicate>& duplicates,
                                                     size_t documentsAnalyzed) {
    json j;
    j["files_analyzed"] = documentsAnalyzed;
    j["cross_file_duplicates"] = json::array();
    for (const auto& dup : duplicates) {
        json occurrences = json::array();
        for (const auto& o : dup.occurrences) {
            occurrences.push_back({{"file", o.document}, {"paragraph", o.paragraph}, {"line", o.line}, {"preview", o.preview}});
        }
        j["cross_file_duplicates"].push_back({
            {"id", dup.id},
            {"fingerprint", dup.fingerprint},
            {"files", dup.documents},
            {"occurrences", occurrences}
        });
    }
    j["total_cross_file_duplicates"] = duplicates.size();
    return j;
}

} // namespace structaudit::infrastructure
