/**
 * @file HeadingSemanticsAnalyzer.hpp
 * @brief Advisory checks on whether heading titles still describe their bodies.
 */

#pragma once

#include "domain/analysis/AnalysisProfile.hpp"
#include "domain/analysis/Issues.hpp"
#include "domain/document/Document.hpp"

#include <optional>
#include <string>
#include <vector>

namespace structaudit::domain::analysis {

/**
 * @class HeadingSemanticsAnalyzer
 * @brief Runs three independent detectors (parent/child drift, title/body mismatch,
 * near-duplicate siblings). A heading may get one issue from each.
 *
 * Every issue carries a replacement title derived from the body and the action
 * RENAME_RECOMMENDED. A heading for which no replacement can be derived is not reported.
 */
class HeadingSemanticsAnalyzer {
public:
    explicit HeadingSemanticsAnalyzer(const AnalysisProfile& profile);

    std::vector<HeadingIssue> analyze(const document::Document& doc) const;

    /**
     * @brief Picks a title from the first sentence-like chunk of the body.
     *
     * Fences, tables, headings and list markers are stripped, only lines of at least 28
     * code points are kept, and the first chunk with four or more words whose normalized
     * form differs from `currentTitle` wins. The result is cut to 12 words and upper-cased
     * when `currentTitle` is all caps.
     */
    static std::optional<std::string> DeriveTitleFromBody(const std::string& body, const std::string& currentTitle);

private:
    std::optional<HeadingIssue> checkParentDrift(const document::Document& doc, const document::Section& section) const;
    std::optional<HeadingIssue> checkTitleMismatch(const document::Document& doc, const document::Section& section) const;
    std::optional<HeadingIssue> checkSiblingDuplicate(const document::Document& doc, const document::Section& section) const;

    AnalysisProfile m_profile;
};

} // namespace structaudit::domain::analysis
