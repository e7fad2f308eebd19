/**
 * @file Issues.hpp
 * @brief Detector outputs: duplicate candidates, heading issues and table findings.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace structaudit::domain::analysis {

enum class MatchKind {
    Exact,
    Near
};

inline std::string MatchKindToString(MatchKind kind) {
    return kind == MatchKind::Exact ? "exact" : "near";
}

inline MatchKind MatchKindFromString(const std::string& name) {
    return name == "near" ? MatchKind::Near : MatchKind::Exact;
}

enum class RepetitionClass {
    Legitimate,
    Duplicate
};

/**
 * @struct DuplicateCandidate
 * @brief A pair of paragraphs (or sections) judged to repeat each other.
 *
 * `first*` is the occurrence that is kept, `second*` the later one proposed for removal.
 */
struct DuplicateCandidate {
    std::string id;                 ///< dup_para_<fingerprint> or dup_section_<index>.
    MatchKind kind = MatchKind::Exact;
    RepetitionClass classification = RepetitionClass::Duplicate;
    int firstIndex = -1;            ///< Paragraph id or section index.
    int secondIndex = -1;
    size_t firstLine = 0;           ///< 1-based.
    size_t secondLine = 0;          ///< 1-based.
    std::string firstFingerprint;
    std::string secondFingerprint;
    size_t occurrences = 2;         ///< Group size for exact paragraph matches.
    double sequenceRatio = 0.0;
    double jaccard = 0.0;
    double confidence = 0.0;
    std::string title;              ///< Section title (section duplicates only).
    int level = 0;                  ///< Section level (section duplicates only).
    std::string preview;
    std::string reason;
};

/// One place a cross-document repeated paragraph appears.
struct CrossDocumentOccurrence {
    std::string document;
    int paragraph = -1;
    size_t line = 0;                ///< 1-based.
    std::string preview;
};

/**
 * @struct CrossDocumentDuplicate
 * @brief A paragraph fingerprint shared by two or more documents of a batch.
 *
 * `documents` lists each document once, in batch order. Occurrences follow the same order.
 */
struct CrossDocumentDuplicate {
    std::string id;                 ///< cross_dup_<fingerprint>.
    std::string fingerprint;
    std::vector<std::string> documents;
    std::vector<CrossDocumentOccurrence> occurrences;
};

enum class HeadingIssueKind {
    NumberingDrift,
    SemanticMismatch,
    NearDuplicate,
    ParentChildDrift,
    MarkdownArtifact,
    TableHeadingLevel
};

inline std::string HeadingIssueKindToString(HeadingIssueKind kind) {
    switch (kind) {
        case HeadingIssueKind::NumberingDrift: return "numbering_drift";
        case HeadingIssueKind::SemanticMismatch: return "semantic_mismatch";
        case HeadingIssueKind::NearDuplicate: return "near_duplicate";
        case HeadingIssueKind::ParentChildDrift: return "parent_child_drift";
        case HeadingIssueKind::MarkdownArtifact: return "markdown_artifact";
        case HeadingIssueKind::TableHeadingLevel: return "table_heading_level";
        default: return "unknown";
    }
}

inline HeadingIssueKind HeadingIssueKindFromString(const std::string& name) {
    if (name == "semantic_mismatch") return HeadingIssueKind::SemanticMismatch;
    if (name == "near_duplicate") return HeadingIssueKind::NearDuplicate;
    if (name == "parent_child_drift") return HeadingIssueKind::ParentChildDrift;
    if (name == "markdown_artifact") return HeadingIssueKind::MarkdownArtifact;
    if (name == "table_heading_level") return HeadingIssueKind::TableHeadingLevel;
    return HeadingIssueKind::NumberingDrift;
}

/**
 * @struct HeadingIssue
 * @brief A heading line that should be rewritten. `newRaw` is the full replacement line.
 */
struct HeadingIssue {
    std::string id;
    HeadingIssueKind kind = HeadingIssueKind::NumberingDrift;
    size_t line = 0;                ///< 1-based.
    int level = 0;
    std::string oldRaw;
    std::string newRaw;
    std::string oldTitle;
    std::string newTitle;
    double confidence = 0.0;
    std::string action;             ///< RENUMBER, RENAME_RECOMMENDED, DEMOTE or CLEAN.
    std::string reason;
};

/**
 * @struct TableBlock
 * @brief A table-introducing heading plus the well-formed markdown table that follows it.
 */
struct TableBlock {
    std::string id;
    int headingSection = -1;        ///< Section created by the table heading.
    std::string headingText;        ///< Raw heading line.
    std::string normalizedHeading;
    size_t headingLine = 0;         ///< 0-based.
    size_t tableStart = 0;          ///< 0-based, header row.
    size_t endLine = 0;             ///< Exclusive, one past the last row.
    size_t rowCount = 0;            ///< Data rows, header and separator excluded.
};

enum class TablePlacementStrategy {
    H2IntroToSectionEnd,
    SubtopicToParent
};

inline std::string StrategyToString(TablePlacementStrategy strategy) {
    return strategy == TablePlacementStrategy::H2IntroToSectionEnd ? "h2_intro_to_section_end" : "subtopic_to_parent";
}

inline TablePlacementStrategy StrategyFromString(const std::string& name) {
    return name == "subtopic_to_parent" ? TablePlacementStrategy::SubtopicToParent
                                        : TablePlacementStrategy::H2IntroToSectionEnd;
}

/**
 * @struct TableMisplacement
 * @brief Proposal to relocate a table block.
 *
 * For h2_intro_to_section_end the target is the end of `targetSection`'s subtree. For
 * subtopic_to_parent the block goes immediately before `currentSection`'s heading.
 */
struct TableMisplacement {
    std::string id;
    TableBlock table;
    int currentSection = -1;
    int targetSection = -1;
    std::string currentHeading;     ///< Raw heading of currentSection.
    std::string targetHeading;      ///< Raw heading of targetSection.
    std::string anchorHeading;      ///< Raw heading the destination is computed from.
    size_t anchorOccurrence = 0;    ///< Index among headings with the same raw text.
    size_t tableOccurrence = 0;     ///< Index among table blocks with the same signature.
    TablePlacementStrategy strategy = TablePlacementStrategy::H2IntroToSectionEnd;
    double currentSimilarity = 0.0;
    double parentSimilarity = 0.0;
    double confidence = 0.0;
    std::string reason;
};

} // namespace structaudit::domain::analysis
