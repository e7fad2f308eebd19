/**
 * @file TablePlacementAnalyzer.hpp
 * @brief Synthesis-table detection, relocation proposals and table heading hygiene.
 */

#pragma once

#include "domain/analysis/AnalysisProfile.hpp"
#include "domain/analysis/Issues.hpp"
#include "domain/document/Document.hpp"

#include <string>
#include <utility>
#include <vector>

namespace structaudit::domain::analysis {

/**
 * @struct TableSignature
 * @brief What a table move must preserve: the sorted (normalized heading, row count) pairs and
 * the sorted multiset of heading lines.
 */
struct TableSignature {
    std::vector<std::pair<std::string, size_t>> tables;
    std::vector<std::string> headings;

    bool operator==(const TableSignature& other) const {
        return tables == other.tables && headings == other.headings;
    }
    bool operator!=(const TableSignature& other) const { return !(*this == other); }
};

/**
 * @class TablePlacementAnalyzer
 * @brief Finds table blocks and proposes moves.
 *
 * Two strategies are applied:
 * - h2_intro_to_section_end: a table sitting between an H2 heading and its first H3 child
 *   belongs at the end of the H2 section.
 * - subtopic_to_parent: a table closing a numbered subsection whose vocabulary matches the
 *   parent clearly better goes right before the subsection heading.
 * A subtopic_to_parent move never lands in an H2 intro (before the H2's first H3), which is
 * the spot the first strategy moves tables out of.
 */
class TablePlacementAnalyzer {
public:
    explicit TablePlacementAnalyzer(const AnalysisProfile& profile);

    static std::vector<TableBlock> FindTableBlocks(const document::Document& doc);

    std::vector<TableMisplacement> findMisplacements(const document::Document& doc) const;

    /** @brief Table headings above level 4, with a demoted "#### Title" replacement. */
    static std::vector<HeadingIssue> FindHeadingLevelIssues(const document::Document& doc);

    /** @brief Headings keeping stray '#' runs or a repeated numeric prefix, with a cleaned line. */
    static std::vector<HeadingIssue> FindMarkdownArtifacts(const document::Document& doc);

    static TableSignature Signature(const document::Document& doc);

    /** @brief Index of `section` among sections with the same raw heading. */
    static size_t HeadingOccurrence(const document::Document& doc, const document::Section& section);

    /** @brief Index of `block` among blocks with the same (normalized heading, row count). */
    static size_t TableOccurrence(const std::vector<TableBlock>& blocks, size_t position);

private:
    AnalysisProfile m_profile;
};

} // namespace structaudit::domain::analysis
