/**
 * @file FixPlanner.hpp
 * @brief Aggregates detector outputs into one ordered, stably identified issue list.
 */

#pragma once

#include "domain/analysis/AnalysisProfile.hpp"
#include "domain/analysis/FixIssue.hpp"
#include "domain/analysis/Issues.hpp"

#include <vector>

namespace structaudit::application {

/**
 * @struct AnalysisFindings
 * @brief Raw detector outputs, one array per report category.
 */
struct AnalysisFindings {
    std::vector<domain::analysis::DuplicateCandidate> duplicateParagraphs;
    std::vector<domain::analysis::DuplicateCandidate> duplicateSections;
    std::vector<domain::analysis::HeadingIssue> headingNumberingIssues;
    std::vector<domain::analysis::HeadingIssue> headingSemanticIssues;
    std::vector<domain::analysis::TableMisplacement> tableMisplacements;
    std::vector<domain::analysis::HeadingIssue> tableHeadingLevelIssues;
    std::vector<domain::analysis::HeadingIssue> headingMarkdownArtifacts;

    size_t total() const {
        return duplicateParagraphs.size() + duplicateSections.size() + headingNumberingIssues.size() +
               headingSemanticIssues.size() + tableMisplacements.size() + tableHeadingLevelIssues.size() +
               headingMarkdownArtifacts.size();
    }
};

/**
 * @class FixPlanner
 * @brief Turns findings into FixIssues.
 *
 * Ordering is severity desc, confidence desc, line asc, id asc. Ids come from content
 * (fingerprints, heading text), so unchanged text always yields the same list.
 */
class FixPlanner {
public:
    static std::vector<domain::analysis::FixIssue> Plan(const AnalysisFindings& findings,
                                                        const domain::analysis::AnalysisProfile& profile);

    /**
     * @brief Auto-apply policy: RENUMBER always, RENAME_RECOMMENDED never, anything else at or
     * above the profile's confidence floor.
     */
    static bool IsAutoApplicable(const domain::analysis::FixIssue& issue,
                                 const domain::analysis::AnalysisProfile& profile);
};

} // namespace structaudit::application
