/**
 * @file TablePlacementAnalyzer.cpp
 * @brief Implementation of TablePlacementAnalyzer.
 */

#include "domain/analysis/TablePlacementAnalyzer.hpp"
#include "domain/analysis/HeadingKeywords.hpp"
#include "domain/analysis/SimilarityEngine.hpp"
#include "domain/text/Fingerprint.hpp"
#include "domain/text/TextUtils.hpp"

#include <algorithm>
#include <cstdio>
#include <regex>

namespace structaudit::domain::analysis {

namespace {

constexpr size_t kContextLines = 8;
constexpr double kH2IntroConfidence = 0.92;
constexpr double kHeadingLevelConfidence = 0.90;
constexpr double kArtifactConfidence = 0.95;
constexpr double kSubtopicMaxConfidence = 0.90;

const std::regex& SeparatorPattern() {
    static const std::regex pattern(R"(^\|?\s*:?-+:?\s*(\|\s*:?-+:?\s*)+\|?$)");
    return pattern;
}

const std::regex& RepeatedNumberingPattern() {
    static const std::regex pattern(R"(^\d{1,6}(?:\.\d{1,6})*\.\s+|^\d{1,6}(?:\.\d{1,6})+\s+)");
    return pattern;
}

bool IsTableRow(const std::string& line) {
    return text::StartsWith(text::Trim(line), "|");
}

bool IsHeaderRow(const std::string& line) {
    std::string trimmed = text::Trim(line);
    if (trimmed.find('|') == std::string::npos) return false;
    size_t cells = 0;
    std::string current;
    auto closeCell = [&]() {
        if (!text::IsBlank(current)) ++cells;
        current.clear();
    };
    for (char c : trimmed) {
        if (c == '|') {
            closeCell();
        } else {
            current.push_back(c);
        }
    }
    closeCell();
    return cells >= 2;
}

std::string Percent(double value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.0f%%", value * 100.0);
    return buf;
}

std::string TrailingContext(const document::Document& doc, size_t begin, size_t end) {
    std::vector<std::string> picked;
    for (size_t i = end; i > begin && picked.size() < kContextLines; --i) {
        const std::string& line = doc.lines[i - 1];
        if (doc.fenced[i - 1] || text::IsBlank(line) || IsTableRow(line)) continue;
        picked.push_back(line);
    }
    std::reverse(picked.begin(), picked.end());
    std::string joined;
    for (const auto& line : picked) joined += line + "\n";
    return joined;
}

std::string BlockText(const document::Document& doc, const TableBlock& block) {
    std::string joined = doc.sections[block.headingSection].title;
    for (size_t i = block.tableStart; i < block.endLine; ++i) joined += "\n" + doc.lines[i];
    return joined;
}

std::string MisplacementId(const TableBlock& block, size_t occurrence, TablePlacementStrategy strategy) {
    return "table_move_" +
           text::HexDigest(text::Fnv1a64(block.normalizedHeading + "|" + std::to_string(block.rowCount) + "|" +
                                         std::to_string(occurrence) + "|" + StrategyToString(strategy)), 12);
}

// A non-table H3 child of `h2` whose heading comes before `line`.
bool HasSubtopicBefore(const document::Document& doc, const document::Section& h2, size_t line) {
    for (int child : doc.children(h2.index)) {
        const auto& sub = doc.sections[child];
        if (sub.level == 3 && !IsTableKeywordTitle(sub.title) && sub.headingLine < line) return true;
    }
    return false;
}

std::string StripHashRuns(const std::string& title) {
    std::string cleaned;
    for (const auto& word : text::SplitWords(title)) {
        if (std::all_of(word.begin(), word.end(), [](char c) { return c == '#'; })) continue;
        if (!cleaned.empty()) cleaned += " ";
        cleaned += word;
    }
    return cleaned;
}

} // namespace

TablePlacementAnalyzer::TablePlacementAnalyzer(const AnalysisProfile& profile) : m_profile(profile) {}

std::vector<TableBlock> TablePlacementAnalyzer::FindTableBlocks(const document::Document& doc) {
    std::vector<TableBlock> blocks;
    for (const auto& section : doc.sections) {
        if (!IsTableKeywordTitle(section.title)) continue;

        size_t line = section.bodyStart;
        while (line < section.bodyEnd && text::IsBlank(doc.lines[line])) ++line;
        if (line + 1 >= section.bodyEnd) continue;
        if (doc.fenced[line] || !IsHeaderRow(doc.lines[line])) continue;
        if (!std::regex_match(text::Trim(doc.lines[line + 1]), SeparatorPattern())) continue;

        TableBlock block;
        block.headingSection = section.index;
        block.headingText = section.rawHeading;
        block.normalizedHeading = text::Normalize(section.title);
        block.headingLine = section.headingLine;
        block.tableStart = line;
        size_t end = line + 2;
        while (end < section.bodyEnd && !doc.fenced[end] && IsTableRow(doc.lines[end])) ++end;
        block.endLine = end;
        block.rowCount = end - line - 2;
        blocks.push_back(std::move(block));
    }

    for (size_t i = 0; i < blocks.size(); ++i) {
        blocks[i].id = "table_" +
            text::HexDigest(text::Fnv1a64(blocks[i].normalizedHeading + "|" + std::to_string(blocks[i].rowCount) + "|" +
                                          std::to_string(TableOccurrence(blocks, i))), 12);
    }
    return blocks;
}

size_t TablePlacementAnalyzer::TableOccurrence(const std::vector<TableBlock>& blocks, size_t position) {
    size_t occurrence = 0;
    for (size_t i = 0; i < position && i < blocks.size(); ++i) {
        if (blocks[i].normalizedHeading == blocks[position].normalizedHeading &&
            blocks[i].rowCount == blocks[position].rowCount) {
            ++occurrence;
        }
    }
    return occurrence;
}

size_t TablePlacementAnalyzer::HeadingOccurrence(const document::Document& doc, const document::Section& section) {
    size_t occurrence = 0;
    for (int i = 0; i < section.index; ++i) {
        if (doc.sections[i].rawHeading == section.rawHeading) ++occurrence;
    }
    return occurrence;
}

std::vector<TableMisplacement> TablePlacementAnalyzer::findMisplacements(const document::Document& doc) const {
    std::vector<TableMisplacement> result;
    const auto blocks = FindTableBlocks(doc);

    for (size_t b = 0; b < blocks.size(); ++b) {
        const TableBlock& block = blocks[b];
        const auto& heading = doc.sections[block.headingSection];

        TableMisplacement move;
        move.table = block;
        move.tableOccurrence = TableOccurrence(blocks, b);

        // h2_intro_to_section_end
        if (heading.parent >= 0 && doc.sections[heading.parent].level == 2) {
            const auto& h2 = doc.sections[heading.parent];
            bool subtopicAfter = false;
            for (int child : doc.children(h2.index)) {
                const auto& sub = doc.sections[child];
                if (sub.level == 3 && !IsTableKeywordTitle(sub.title) && sub.headingLine > heading.headingLine) {
                    subtopicAfter = true;
                }
            }
            if (!HasSubtopicBefore(doc, h2, heading.headingLine) && subtopicAfter) {
                move.id = MisplacementId(block, move.tableOccurrence, TablePlacementStrategy::H2IntroToSectionEnd);
                move.strategy = TablePlacementStrategy::H2IntroToSectionEnd;
                move.currentSection = h2.index;
                move.targetSection = h2.index;
                move.currentHeading = h2.rawHeading;
                move.targetHeading = h2.rawHeading;
                move.anchorHeading = h2.rawHeading;
                move.anchorOccurrence = HeadingOccurrence(doc, h2);
                move.confidence = kH2IntroConfidence;
                move.reason = "Tabela entre o título \"" + h2.title +
                              "\" e o primeiro subtópico; deve fechar a seção";
                result.push_back(std::move(move));
                continue;
            }
        }

        // subtopic_to_parent: the section the table closes, by position.
        int current = -1;
        for (int i = heading.index - 1; i >= 0; --i) {
            if (!IsTableKeywordTitle(doc.sections[i].title)) {
                current = i;
                break;
            }
        }
        if (current < 0) continue;
        const auto& subsection = doc.sections[current];
        if (!subsection.isNumbered() || subsection.level < 3 || subsection.parent < 0) continue;
        const auto& parent = doc.sections[subsection.parent];
        // Landing before an H2's first subtopic puts the table back in the H2 intro.
        if (parent.level == 2 && !HasSubtopicBefore(doc, parent, subsection.headingLine)) continue;

        const TokenSet tableTokens = SimilarityEngine::Tokens(BlockText(doc, block), m_profile.minTokenLength);
        const TokenSet currentTokens = SimilarityEngine::Tokens(
            TrailingContext(doc, subsection.bodyStart, std::min(subsection.bodyEnd, heading.headingLine)),
            m_profile.minTokenLength);
        const TokenSet parentTokens = SimilarityEngine::Tokens(
            TrailingContext(doc, parent.bodyStart, parent.bodyEnd), m_profile.minTokenLength);

        const double currentSimilarity = SimilarityEngine::Jaccard(tableTokens, currentTokens);
        const double parentSimilarity = SimilarityEngine::Jaccard(tableTokens, parentTokens);
        const double margin = parentSimilarity - currentSimilarity;
        if (margin < m_profile.tableParentMargin || parentSimilarity < m_profile.tableParentMinSimilarity) continue;

        move.id = MisplacementId(block, move.tableOccurrence, TablePlacementStrategy::SubtopicToParent);
        move.strategy = TablePlacementStrategy::SubtopicToParent;
        move.currentSection = subsection.index;
        move.targetSection = parent.index;
        move.currentHeading = subsection.rawHeading;
        move.targetHeading = parent.rawHeading;
        move.anchorHeading = subsection.rawHeading;
        move.anchorOccurrence = HeadingOccurrence(doc, subsection);
        move.currentSimilarity = currentSimilarity;
        move.parentSimilarity = parentSimilarity;
        move.confidence = std::min(kSubtopicMaxConfidence, 0.60 + 2.0 * margin);
        move.reason = "Tabela mais próxima do tópico \"" + parent.title + "\" (" + Percent(parentSimilarity) +
                      ") do que do subtópico \"" + subsection.title + "\" (" + Percent(currentSimilarity) + ")";
        result.push_back(std::move(move));
    }
    return result;
}

std::vector<HeadingIssue> TablePlacementAnalyzer::FindHeadingLevelIssues(const document::Document& doc) {
    std::vector<HeadingIssue> issues;
    for (const auto& block : FindTableBlocks(doc)) {
        const auto& section = doc.sections[block.headingSection];
        if (section.level >= 4) continue;

        const std::string title = StripHashRuns(section.title);
        HeadingIssue issue;
        issue.id = "table_heading_level_" +
                   text::HexDigest(text::Fnv1a64(std::to_string(section.headingLine) + "|" + section.rawHeading), 12);
        issue.kind = HeadingIssueKind::TableHeadingLevel;
        issue.line = section.headingLine + 1;
        issue.level = section.level;
        issue.oldRaw = section.rawHeading;
        issue.newRaw = document::ComposeHeadingLine(4, "", title);
        issue.oldTitle = section.title;
        issue.newTitle = title;
        issue.confidence = kHeadingLevelConfidence;
        issue.action = "DEMOTE";
        issue.reason = "Título de tabela no nível H" + std::to_string(section.level) + "; tabelas fecham com H4";
        issues.push_back(std::move(issue));
    }
    return issues;
}

std::vector<HeadingIssue> TablePlacementAnalyzer::FindMarkdownArtifacts(const document::Document& doc) {
    std::vector<bool> demoted(doc.sections.size(), false);
    for (const auto& block : FindTableBlocks(doc)) {
        if (doc.sections[block.headingSection].level < 4) demoted[block.headingSection] = true;
    }

    std::vector<HeadingIssue> issues;
    for (const auto& section : doc.sections) {
        if (demoted[section.index]) continue;

        std::string title = StripHashRuns(section.title);
        const bool strayHashes = title != section.title;
        bool repeatedPrefix = false;
        std::smatch match;
        while (std::regex_search(title, match, RepeatedNumberingPattern())) {
            title = text::Trim(match.suffix().str());
            repeatedPrefix = true;
        }
        if ((!strayHashes && !repeatedPrefix) || title.empty() || title == section.title) continue;

        HeadingIssue issue;
        issue.id = "heading_artifact_" +
                   text::HexDigest(text::Fnv1a64(std::to_string(section.headingLine) + "|" + section.rawHeading), 12);
        issue.kind = HeadingIssueKind::MarkdownArtifact;
        issue.line = section.headingLine + 1;
        issue.level = section.level;
        issue.oldRaw = section.rawHeading;
        issue.newRaw = document::ComposeHeadingLine(section.level, section.numberingText, title);
        issue.oldTitle = section.title;
        issue.newTitle = title;
        issue.confidence = kArtifactConfidence;
        issue.action = "CLEAN";
        issue.reason = repeatedPrefix ? "Numeração duplicada no título" : "Marcadores '#' residuais no título";
        issues.push_back(std::move(issue));
    }
    return issues;
}

TableSignature TablePlacementAnalyzer::Signature(const document::Document& doc) {
    TableSignature signature;
    for (const auto& block : FindTableBlocks(doc)) {
        signature.tables.emplace_back(block.normalizedHeading, block.rowCount);
    }
    for (const auto& section : doc.sections) {
        signature.headings.push_back(text::Trim(section.rawHeading));
    }
    std::sort(signature.tables.begin(), signature.tables.end());
    std::sort(signature.headings.begin(), signature.headings.end());
    return signature;
}

} // namespace structaudit::domain::analysis
