/**
 * @file DuplicateDetector.hpp
 * @brief Exact and near-duplicate detection for paragraphs and sections.
 */

#pragma once

#include "domain/analysis/AnalysisProfile.hpp"
#include "domain/analysis/Issues.hpp"
#include "domain/document/Document.hpp"

#include <string>
#include <vector>

namespace structaudit::domain::analysis {

/// One document of a batch, under the name reports use for it (usually its path).
struct NamedDocument {
    std::string name;
    document::Document doc;
};

/**
 * @class DuplicateDetector
 * @brief Finds repeated paragraphs and sections left behind by chunked generation.
 *
 * Exact matches are grouped by fingerprint. Near matches compare every remaining paragraph
 * with at most `maxScanCandidates` following ones, so a pair beyond that window may be
 * missed but is never reported wrongly.
 */
class DuplicateDetector {
public:
    explicit DuplicateDetector(const AnalysisProfile& profile);

    std::vector<DuplicateCandidate> findParagraphDuplicates(const document::Document& doc) const;
    std::vector<DuplicateCandidate> findSectionDuplicates(const document::Document& doc) const;

    /**
     * @brief Exact paragraph repeats that cross document boundaries in a batch.
     *
     * Repeats inside a single document are left to findParagraphDuplicates. Nothing here
     * is a fix: which copy should go is an editorial decision.
     */
    std::vector<CrossDocumentDuplicate> findCrossDocumentDuplicates(const std::vector<NamedDocument>& batch) const;

    /**
     * @brief Comparison key of a section: comparable title plus the leading body text,
     * both normalized. The fix applicator uses its fingerprint to find the section again.
     */
    static std::string SectionKey(const document::Document& doc, const document::Section& section, size_t leadChars);

private:
    AnalysisProfile m_profile;
};

} // namespace structaudit::domain::analysis
