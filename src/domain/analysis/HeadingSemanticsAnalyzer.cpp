/**
 * @file HeadingSemanticsAnalyzer.cpp
 * @brief Implementation of HeadingSemanticsAnalyzer.
 */

#include "domain/analysis/HeadingSemanticsAnalyzer.hpp"
#include "domain/analysis/HeadingKeywords.hpp"
#include "domain/analysis/SimilarityEngine.hpp"
#include "domain/text/Fingerprint.hpp"
#include "domain/text/TextUtils.hpp"

#include <algorithm>
#include <cstdio>
#include <initializer_list>
#include <regex>

namespace structaudit::domain::analysis {

namespace {

constexpr size_t kMinDerivationLineChars = 28;
constexpr size_t kMinTitleWords = 4;
constexpr size_t kMaxTitleWords = 12;
constexpr double kMaxConfidence = 0.95;

std::string Format(double value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

double Margin(double value, double threshold, double span) {
    if (span <= 0.0) return 1.0;
    return std::clamp((value - threshold) / span, 0.0, 1.0);
}

bool IsSkipped(const document::Section& section) {
    return IsNumberingExempt(section.level, section.title) || IsTableKeywordTitle(section.title);
}

std::vector<std::string> SentenceChunks(const std::string& joined) {
    std::vector<std::string> chunks;
    std::string current;
    for (size_t i = 0; i < joined.size(); ++i) {
        const char c = joined[i];
        const bool terminal = c == '.' || c == '!' || c == '?' || c == ';' || c == ':';
        const bool atBoundary = i + 1 == joined.size() || joined[i + 1] == ' ';
        if (terminal && atBoundary) {
            chunks.push_back(text::Trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!text::IsBlank(current)) chunks.push_back(text::Trim(current));
    return chunks;
}

} // namespace

HeadingSemanticsAnalyzer::HeadingSemanticsAnalyzer(const AnalysisProfile& profile) : m_profile(profile) {}

std::optional<std::string> HeadingSemanticsAnalyzer::DeriveTitleFromBody(const std::string& body, const std::string& currentTitle) {
    static const std::regex listMarker(R"(^(?:[-*+]|\d+[.)]|>)\s+)");
    static const std::regex leadingNumber(R"(^\d+(?:\.\d+)*\.?\s+)");

    std::vector<std::string> kept;
    bool inFence = false;
    for (const auto& line : text::SplitLines(body)) {
        std::string trimmed = text::Trim(line);
        if (text::StartsWith(trimmed, "```") || text::StartsWith(trimmed, "~~~")) {
            inFence = !inFence;
            continue;
        }
        if (inFence || trimmed.empty()) continue;
        if (trimmed[0] == '|' || trimmed[0] == '#') continue;

        trimmed = std::regex_replace(trimmed, listMarker, "", std::regex_constants::format_first_only);
        trimmed = std::regex_replace(trimmed, leadingNumber, "", std::regex_constants::format_first_only);
        trimmed.erase(std::remove_if(trimmed.begin(), trimmed.end(),
                                     [](char c) { return c == '*' || c == '_' || c == '`'; }),
                      trimmed.end());
        trimmed = text::CollapseWhitespace(trimmed);
        if (text::CodePointLength(trimmed) >= kMinDerivationLineChars) kept.push_back(trimmed);
    }
    if (kept.empty()) return std::nullopt;

    std::string joined;
    for (const auto& line : kept) {
        if (!joined.empty()) joined += " ";
        joined += line;
    }

    const std::string current = text::Normalize(currentTitle);
    for (const auto& chunk : SentenceChunks(joined)) {
        const auto words = text::SplitWords(chunk);
        if (words.size() < kMinTitleWords) continue;

        std::string candidate;
        for (size_t i = 0; i < words.size() && i < kMaxTitleWords; ++i) {
            if (i > 0) candidate += " ";
            candidate += words[i];
        }
        while (!candidate.empty() && std::string(",;:-").find(candidate.back()) != std::string::npos) {
            candidate.pop_back();
        }
        candidate = text::Trim(candidate);
        if (candidate.empty() || text::Normalize(candidate) == current) continue;

        if (text::IsAllCaps(currentTitle)) candidate = text::ToUpperUtf8(candidate);
        return candidate;
    }
    return std::nullopt;
}

std::vector<HeadingIssue> HeadingSemanticsAnalyzer::analyze(const document::Document& doc) const {
    std::vector<HeadingIssue> issues;
    for (const auto& section : doc.sections) {
        if (IsSkipped(section)) continue;

        for (auto candidate : {checkParentDrift(doc, section), checkTitleMismatch(doc, section),
                               checkSiblingDuplicate(doc, section)}) {
            if (candidate) issues.push_back(std::move(*candidate));
        }
    }
    return issues;
}

namespace {

std::optional<HeadingIssue> MakeIssue(const document::Document& doc, const document::Section& section,
                                      HeadingIssueKind kind, double confidence, const std::string& reason) {
    auto derived = HeadingSemanticsAnalyzer::DeriveTitleFromBody(doc.bodyText(section), section.title);
    if (!derived) return std::nullopt;

    HeadingIssue issue;
    const std::string kindName = HeadingIssueKindToString(kind);
    issue.id = "heading_semantic_" +
               text::HexDigest(text::Fnv1a64(kindName + "|" + std::to_string(section.headingLine) + "|" +
                                             section.rawHeading), 12);
    issue.kind = kind;
    issue.line = section.headingLine + 1;
    issue.level = section.level;
    issue.oldRaw = section.rawHeading;
    issue.newRaw = document::ComposeHeadingLine(section.level, section.numberingText, *derived);
    issue.oldTitle = section.title;
    issue.newTitle = *derived;
    issue.confidence = std::min(confidence, kMaxConfidence);
    issue.action = "RENAME_RECOMMENDED";
    issue.reason = reason;
    return issue;
}

} // namespace

std::optional<HeadingIssue> HeadingSemanticsAnalyzer::checkParentDrift(const document::Document& doc,
                                                                        const document::Section& section) const {
    if (section.parent < 0) return std::nullopt;
    const auto& parent = doc.sections[section.parent];
    if (IsSkipped(parent)) return std::nullopt;

    const std::string childTitle = ComparableTitle(section.title);
    const std::string parentTitle = ComparableTitle(parent.title);
    if (childTitle.empty() || parentTitle.empty()) return std::nullopt;

    const double titleSimilarity = SimilarityEngine::SequenceRatio(childTitle, parentTitle);
    if (titleSimilarity < m_profile.titleSimilarityThreshold) return std::nullopt;

    const TokenSet childTokens = SimilarityEngine::Tokens(doc.bodyText(section), m_profile.minTokenLength);
    const TokenSet parentTokens = SimilarityEngine::Tokens(doc.bodyText(parent), m_profile.minTokenLength);
    if (childTokens.empty() || parentTokens.empty()) return std::nullopt;

    const double overlap = SimilarityEngine::Jaccard(childTokens, parentTokens);
    if (overlap > m_profile.parentBodyOverlapMax) return std::nullopt;

    const double confidence = 0.55 +
        0.20 * Margin(titleSimilarity, m_profile.titleSimilarityThreshold, 1.0 - m_profile.titleSimilarityThreshold) +
        0.20 * Margin(m_profile.parentBodyOverlapMax - overlap, 0.0, m_profile.parentBodyOverlapMax);
    return MakeIssue(doc, section, HeadingIssueKind::ParentChildDrift, confidence,
                     "Título repete o da seção pai (similaridade " + Format(titleSimilarity) +
                     ") mas o conteúdo diverge (sobreposição " + Format(overlap) + ")");
}

std::optional<HeadingIssue> HeadingSemanticsAnalyzer::checkTitleMismatch(const document::Document& doc,
                                                                          const document::Section& section) const {
    const std::string body = doc.bodyText(section);
    if (text::CodePointLength(body) < m_profile.titleMismatchMinBodyChars) return std::nullopt;

    const TokenSet titleTokens = SimilarityEngine::Tokens(ComparableTitle(section.title), m_profile.minTokenLength);
    if (titleTokens.empty()) return std::nullopt;
    const TokenSet bodyTokens = SimilarityEngine::Tokens(body, m_profile.minTokenLength);

    const double coverage = SimilarityEngine::Coverage(titleTokens, bodyTokens);
    if (coverage >= m_profile.titleMismatchThreshold) return std::nullopt;

    const double confidence = 0.60 + 0.35 * Margin(m_profile.titleMismatchThreshold - coverage, 0.0,
                                                   m_profile.titleMismatchThreshold);
    return MakeIssue(doc, section, HeadingIssueKind::SemanticMismatch, confidence,
                     "Palavras do título quase ausentes do conteúdo (cobertura " + Format(coverage) + ")");
}

std::optional<HeadingIssue> HeadingSemanticsAnalyzer::checkSiblingDuplicate(const document::Document& doc,
                                                                             const document::Section& section) const {
    const std::string title = ComparableTitle(section.title);
    if (title.empty()) return std::nullopt;
    const TokenSet bodyTokens = SimilarityEngine::Tokens(doc.bodyText(section), m_profile.minTokenLength);
    if (bodyTokens.empty()) return std::nullopt;

    for (int i = section.index - 1; i >= 0; --i) {
        const auto& sibling = doc.sections[i];
        if (sibling.parent != section.parent || sibling.level != section.level || IsSkipped(sibling)) continue;

        const std::string siblingTitle = ComparableTitle(sibling.title);
        if (siblingTitle.empty()) continue;
        const double titleSimilarity = SimilarityEngine::SequenceRatio(title, siblingTitle);
        if (titleSimilarity < m_profile.titleSimilarityThreshold) continue;

        const TokenSet siblingTokens = SimilarityEngine::Tokens(doc.bodyText(sibling), m_profile.minTokenLength);
        if (siblingTokens.empty()) continue;
        const double bodySimilarity = SimilarityEngine::Jaccard(bodyTokens, siblingTokens);
        if (bodySimilarity >= m_profile.siblingBodySimilarityMax) continue;

        const double confidence = 0.55 +
            0.20 * Margin(titleSimilarity, m_profile.titleSimilarityThreshold, 1.0 - m_profile.titleSimilarityThreshold) +
            0.20 * Margin(m_profile.siblingBodySimilarityMax - bodySimilarity, 0.0, m_profile.siblingBodySimilarityMax);
        return MakeIssue(doc, section, HeadingIssueKind::NearDuplicate, confidence,
                         "Título quase igual ao da seção irmã na linha " + std::to_string(sibling.headingLine + 1) +
                         " com conteúdo diferente");
    }
    return std::nullopt;
}

} // namespace structaudit::domain::analysis
