/**
 * @file FixIssue.hpp
 * @brief The human-in-the-loop unit: one reviewable, applicable fix.
 */

#pragma once

#include "domain/analysis/Issues.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace structaudit::domain::analysis {

enum class Severity {
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4
};

inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::Critical: return "CRITICA";
        case Severity::High: return "ALTA";
        case Severity::Medium: return "MEDIA";
        case Severity::Low: return "BAIXA";
        default: return "BAIXA";
    }
}

inline Severity SeverityFromString(const std::string& name) {
    if (name == "CRITICA") return Severity::Critical;
    if (name == "ALTA") return Severity::High;
    if (name == "MEDIA") return Severity::Medium;
    return Severity::Low;
}

enum class FixAction {
    Remove,
    Merge,
    Renumber,
    Move,
    Rename
};

inline std::string FixActionToString(FixAction action) {
    switch (action) {
        case FixAction::Remove: return "REMOVE";
        case FixAction::Merge: return "MERGE";
        case FixAction::Renumber: return "RENUMBER";
        case FixAction::Move: return "MOVE";
        case FixAction::Rename: return "RENAME";
        default: return "RENAME";
    }
}

inline FixAction FixActionFromString(const std::string& name) {
    if (name == "REMOVE") return FixAction::Remove;
    if (name == "MERGE") return FixAction::Merge;
    if (name == "RENUMBER") return FixAction::Renumber;
    if (name == "MOVE") return FixAction::Move;
    if (name == "RENAME") return FixAction::Rename;
    throw std::invalid_argument("Unknown fix action: " + name);
}

// Payloads. Each carries only content-derived locators, never line offsets to trust blindly.

struct RemoveParagraphFix {
    static constexpr const char* Type = "duplicate_paragraph";
    MatchKind kind = MatchKind::Exact;
    std::string fingerprint;        ///< Paragraph to delete (later occurrence).
    std::string keepFingerprint;    ///< Occurrence that stays.
    size_t occurrences = 2;
    size_t line = 0;                ///< 1-based, informational.
    size_t duplicateOfLine = 0;     ///< 1-based line of the kept occurrence.
    std::string preview;
};

struct MergeSectionFix {
    static constexpr const char* Type = "duplicate_section";
    MatchKind kind = MatchKind::Exact;
    std::string keepKey;            ///< Section key fingerprint of the kept section.
    std::string dropKey;            ///< Section key fingerprint of the section to drop.
    int level = 0;
    std::string title;
    size_t keptLine = 0;
    size_t droppedLine = 0;
};

struct RenumberFix {
    static constexpr const char* Type = "heading_numbering";
    size_t line = 0;
    std::string oldRaw;
    std::string newRaw;
};

struct MoveTableFix {
    static constexpr const char* Type = "table_misplacement";
    TablePlacementStrategy strategy = TablePlacementStrategy::H2IntroToSectionEnd;
    std::string headingText;
    std::string normalizedHeading;
    size_t rowCount = 0;
    size_t tableOccurrence = 0;
    std::string anchorHeading;
    size_t anchorOccurrence = 0;
    std::string currentHeading;
    std::string targetHeading;
};

struct RenameHeadingFix {
    static constexpr const char* Type = "heading_rename";
    HeadingIssueKind kind = HeadingIssueKind::SemanticMismatch;
    std::string action;             ///< RENAME_RECOMMENDED, DEMOTE or CLEAN.
    size_t line = 0;
    std::string oldRaw;
    std::string newRaw;
    std::string oldTitle;
    std::string newTitle;
};

using FixPayload = std::variant<RemoveParagraphFix, MergeSectionFix, RenumberFix, MoveTableFix, RenameHeadingFix>;

/**
 * @class FixIssue
 * @brief A reported issue with everything the applicator needs to act on it.
 */
class FixIssue {
public:
    std::string id;
    std::string type;               ///< duplicate_paragraph, heading_semantic, table_misplacement, ...
    Severity severity = Severity::Low;
    FixAction action = FixAction::Rename;
    double confidence = 0.0;
    size_t line = 0;                ///< 1-based, for ordering and display.
    std::string description;
    bool autoApplicable = false;
    FixPayload payload;

    FixIssue(std::string issueId, std::string issueType, Severity s, FixAction a, double conf, size_t ln,
             std::string desc, FixPayload p)
        : id(std::move(issueId)),
          type(std::move(issueType)),
          severity(s),
          action(a),
          confidence(conf),
          line(ln),
          description(std::move(desc)),
          payload(std::move(p)) {
        if (id.empty()) throw std::invalid_argument("FixIssue id must not be empty");
        if (!(confidence >= 0.0 && confidence <= 1.0)) {
            throw std::invalid_argument("FixIssue confidence out of range for " + id);
        }
    }
};

} // namespace structaudit::domain::analysis
