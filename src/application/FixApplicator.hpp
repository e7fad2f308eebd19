/**
 * @file FixApplicator.hpp
 * @brief Applies approved fixes to document text, best-effort.
 */

#pragma once

#include "domain/analysis/AnalysisProfile.hpp"
#include "domain/analysis/FixIssue.hpp"

#include <optional>
#include <string>
#include <vector>

namespace structaudit::application {

enum class SkipReason {
    FixNotApplicable,
    IntegrityViolation
};

inline std::string SkipReasonToString(SkipReason reason) {
    return reason == SkipReason::IntegrityViolation ? "IntegrityViolation" : "FixNotApplicable";
}

struct SkippedFix {
    std::string issueId;
    SkipReason reason = SkipReason::FixNotApplicable;
    std::string detail;
};

struct MoveOutcome {
    std::string issueId;
    bool success = false;
    std::string detail;
};

/**
 * @struct ApplyResult
 * @brief New text plus a record of what was applied and what was skipped.
 */
struct ApplyResult {
    std::string newText;
    std::vector<std::string> fixesApplied;
    std::vector<SkippedFix> skipped;
    std::vector<MoveOutcome> moveOutcomes;
    size_t originalSize = 0;
    size_t newSize = 0;
};

/**
 * @class FixApplicator
 * @brief Mutates text for a batch of approved fixes.
 *
 * Fixes run in phases: REMOVE and MERGE, then MOVE, then RENAME, then a single RENUMBER pass.
 * Each fix re-parses the current text and re-locates its target by content. A fix whose target
 * is gone is skipped, and a MOVE that would change the table signature is rolled back. Earlier
 * fixes stay applied either way.
 */
class FixApplicator {
public:
    explicit FixApplicator(const domain::analysis::AnalysisProfile& profile);

    ApplyResult apply(const std::string& text, const std::vector<domain::analysis::FixIssue>& approved) const;

private:
    struct StepResult {
        std::optional<std::string> text;
        SkipReason reason = SkipReason::FixNotApplicable;
        std::string detail;
    };

    StepResult removeParagraph(const std::string& text, const domain::analysis::RemoveParagraphFix& fix) const;
    StepResult mergeSection(const std::string& text, const domain::analysis::MergeSectionFix& fix) const;
    StepResult moveTable(const std::string& text, const domain::analysis::MoveTableFix& fix) const;
    StepResult renameHeading(const std::string& text, const domain::analysis::RenameHeadingFix& fix) const;

    domain::analysis::AnalysisProfile m_profile;
};

} // namespace structaudit::application
