/**
 * @file DuplicateDetector.cpp
 * @brief Implementation of DuplicateDetector.
 */

#include "domain/analysis/DuplicateDetector.hpp"
#include "domain/analysis/FingerprintIndex.hpp"
#include "domain/analysis/HeadingKeywords.hpp"
#include "domain/analysis/SimilarityEngine.hpp"
#include "domain/text/Fingerprint.hpp"
#include "domain/text/TextUtils.hpp"

#include <algorithm>
#include <cstdio>
#include <unordered_set>
#include <utility>

namespace structaudit::domain::analysis {

namespace {

constexpr size_t kPreviewChars = 80;

std::string Preview(const std::string& raw) {
    std::string flat = raw;
    std::replace(flat.begin(), flat.end(), '\n', ' ');
    return text::Utf8Prefix(text::CollapseWhitespace(flat), kPreviewChars);
}

std::string Percent(double value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.0f%%", value * 100.0);
    return buf;
}

struct Scored {
    double sequence = 0.0;
    double jaccard = 0.0;
    bool qualifies = false;
};

// Jaccard first: it is cheap and can qualify a pair on its own. The sequence ratio is only
// computed when it can still matter (for qualification or for confidence).
Scored ScorePair(const std::string& normA, const TokenSet& tokensA,
                 const std::string& normB, const TokenSet& tokensB,
                 const AnalysisProfile& profile) {
    Scored scored;
    scored.jaccard = SimilarityEngine::Jaccard(tokensA, tokensB);
    const bool jaccardQualifies = scored.jaccard >= profile.nearJaccardThreshold;
    if (!jaccardQualifies && SimilarityEngine::QuickRatio(normA, normB) < profile.nearSimilarityThreshold) {
        return scored;
    }
    scored.sequence = SimilarityEngine::SequenceRatio(normA, normB);
    scored.qualifies = jaccardQualifies || scored.sequence >= profile.nearSimilarityThreshold;
    return scored;
}

} // namespace

DuplicateDetector::DuplicateDetector(const AnalysisProfile& profile) : m_profile(profile) {}

std::vector<DuplicateCandidate> DuplicateDetector::findParagraphDuplicates(const document::Document& doc) const {
    std::vector<DuplicateCandidate> result;

    std::vector<document::Paragraph> eligible;
    for (const auto& para : doc.paragraphs) {
        if (para.length >= m_profile.minParagraphChars) eligible.push_back(para);
    }

    // Exact pass.
    const FingerprintIndex index = FingerprintIndex::Build(eligible);
    std::unordered_set<int> grouped;
    for (const auto& group : index.repeatedGroups()) {
        for (int id : group.paragraphIds) grouped.insert(id);

        const auto& first = doc.paragraphs[group.paragraphIds[0]];
        const auto& second = doc.paragraphs[group.paragraphIds[1]];
        if (SimilarityEngine::IsLegitimateRepetition(first.text)) continue;

        DuplicateCandidate dup;
        dup.id = "dup_para_" + group.fingerprint;
        dup.kind = MatchKind::Exact;
        dup.firstIndex = first.id;
        dup.secondIndex = second.id;
        dup.firstLine = first.startLine + 1;
        dup.secondLine = second.startLine + 1;
        dup.firstFingerprint = group.fingerprint;
        dup.secondFingerprint = group.fingerprint;
        dup.occurrences = group.paragraphIds.size();
        dup.sequenceRatio = 1.0;
        dup.jaccard = 1.0;
        dup.confidence = SimilarityEngine::Confidence(MatchKind::Exact, 1.0, 1.0, m_profile.nearSimilarityThreshold);
        dup.preview = Preview(second.text);
        dup.reason = "Parágrafo repetido " + std::to_string(dup.occurrences) + " vezes (primeira ocorrência na linha " +
                     std::to_string(dup.firstLine) + ")";
        result.push_back(std::move(dup));
    }

    // Near pass over what the exact pass did not group.
    std::vector<const document::Paragraph*> pool;
    for (const auto& para : eligible) {
        if (grouped.count(para.id)) continue;
        if (SimilarityEngine::IsLegitimateRepetition(para.text)) continue;
        pool.push_back(&doc.paragraphs[para.id]);
    }

    std::vector<TokenSet> tokens;
    tokens.reserve(pool.size());
    for (const auto* para : pool) tokens.push_back(SimilarityEngine::Tokens(para->text, m_profile.minTokenLength));

    std::unordered_set<int> reported;
    for (size_t i = 0; i < pool.size(); ++i) {
        if (reported.count(pool[i]->id)) continue;
        const size_t windowEnd = std::min(pool.size(), i + 1 + m_profile.maxScanCandidates);
        for (size_t j = i + 1; j < windowEnd; ++j) {
            if (reported.count(pool[j]->id)) continue;
            Scored scored = ScorePair(pool[i]->normalized, tokens[i], pool[j]->normalized, tokens[j], m_profile);
            if (!scored.qualifies) continue;

            const auto& first = *pool[i];
            const auto& second = *pool[j];
            DuplicateCandidate dup;
            dup.id = "dup_para_" + second.fingerprint;
            dup.kind = MatchKind::Near;
            dup.firstIndex = first.id;
            dup.secondIndex = second.id;
            dup.firstLine = first.startLine + 1;
            dup.secondLine = second.startLine + 1;
            dup.firstFingerprint = first.fingerprint;
            dup.secondFingerprint = second.fingerprint;
            dup.sequenceRatio = scored.sequence;
            dup.jaccard = scored.jaccard;
            dup.confidence = SimilarityEngine::Confidence(MatchKind::Near, scored.sequence, scored.jaccard,
                                                          m_profile.nearSimilarityThreshold);
            dup.preview = Preview(second.text);
            dup.reason = "Parágrafo quase idêntico ao da linha " + std::to_string(dup.firstLine) +
                         " (sequência " + Percent(scored.sequence) + ", palavras-chave " + Percent(scored.jaccard) + ")";
            reported.insert(second.id);
            result.push_back(std::move(dup));
        }
    }

    std::sort(result.begin(), result.end(), [](const DuplicateCandidate& a, const DuplicateCandidate& b) {
        return a.secondLine < b.secondLine;
    });
    return result;
}

std::vector<CrossDocumentDuplicate> DuplicateDetector::findCrossDocumentDuplicates(const std::vector<NamedDocument>& batch) const {
    // Paragraph ids are only unique per document, so the batch gets its own numbering and
    // `origin` maps it back.
    std::vector<document::Paragraph> pooled;
    std::vector<std::pair<size_t, int>> origin;
    for (size_t d = 0; d < batch.size(); ++d) {
        for (const auto& para : batch[d].doc.paragraphs) {
            if (para.length < m_profile.minParagraphChars) continue;
            if (SimilarityEngine::IsLegitimateRepetition(para.text)) continue;
            document::Paragraph copy = para;
            copy.id = static_cast<int>(pooled.size());
            pooled.push_back(std::move(copy));
            origin.emplace_back(d, para.id);
        }
    }

    std::vector<CrossDocumentDuplicate> result;
    const FingerprintIndex index = FingerprintIndex::Build(pooled);
    for (const auto& group : index.repeatedGroups()) {
        CrossDocumentDuplicate dup;
        dup.id = "cross_dup_" + group.fingerprint;
        dup.fingerprint = group.fingerprint;
        for (int pooledId : group.paragraphIds) {
            const auto& [docIndex, paraId] = origin[pooledId];
            const auto& source = batch[docIndex];
            if (std::find(dup.documents.begin(), dup.documents.end(), source.name) == dup.documents.end()) {
                dup.documents.push_back(source.name);
            }
            const auto& para = source.doc.paragraphs[paraId];
            dup.occurrences.push_back({source.name, para.id, para.startLine + 1, Preview(para.text)});
        }
        if (dup.documents.size() < 2) continue;
        result.push_back(std::move(dup));
    }
    return result;
}

std::string DuplicateDetector::SectionKey(const document::Document& doc, const document::Section& section, size_t leadChars) {
    const std::string title = ComparableTitle(section.title);
    const std::string body = text::Utf8Prefix(text::Normalize(doc.bodyText(section)), leadChars);
    return text::Trim(title + " " + body);
}

std::vector<DuplicateCandidate> DuplicateDetector::findSectionDuplicates(const document::Document& doc) const {
    struct Entry {
        const document::Section* section;
        std::string key;
        std::string fingerprint;
        TokenSet tokens;
    };

    std::vector<Entry> entries;
    for (const auto& section : doc.sections) {
        if (IsTableKeywordTitle(section.title) || IsNumberingExempt(section.level, section.title)) continue;
        if (text::IsBlank(doc.bodyText(section))) continue;
        std::string key = SectionKey(doc, section, m_profile.sectionLeadChars);
        if (text::CodePointLength(key) < m_profile.minParagraphChars) continue;
        Entry entry{&section, key, text::FingerprintNormalized(key), SimilarityEngine::Tokens(key, m_profile.minTokenLength)};
        entries.push_back(std::move(entry));
    }

    std::vector<DuplicateCandidate> result;
    std::unordered_set<int> reported;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (reported.count(entries[i].section->index)) continue;
        const size_t windowEnd = std::min(entries.size(), i + 1 + m_profile.maxScanCandidates);
        for (size_t j = i + 1; j < windowEnd; ++j) {
            const auto& a = entries[i];
            const auto& b = entries[j];
            if (a.section->level != b.section->level || reported.count(b.section->index)) continue;

            DuplicateCandidate dup;
            if (a.fingerprint == b.fingerprint) {
                dup.kind = MatchKind::Exact;
                dup.sequenceRatio = 1.0;
                dup.jaccard = 1.0;
            } else {
                Scored scored = ScorePair(a.key, a.tokens, b.key, b.tokens, m_profile);
                if (!scored.qualifies) continue;
                dup.kind = MatchKind::Near;
                dup.sequenceRatio = scored.sequence;
                dup.jaccard = scored.jaccard;
            }

            dup.id = "dup_section_" + std::to_string(b.section->index);
            dup.firstIndex = a.section->index;
            dup.secondIndex = b.section->index;
            dup.firstLine = a.section->headingLine + 1;
            dup.secondLine = b.section->headingLine + 1;
            dup.firstFingerprint = a.fingerprint;
            dup.secondFingerprint = b.fingerprint;
            dup.confidence = SimilarityEngine::Confidence(dup.kind, dup.sequenceRatio, dup.jaccard,
                                                          m_profile.nearSimilarityThreshold);
            dup.title = b.section->title;
            dup.level = b.section->level;
            dup.preview = Preview(b.section->rawHeading);
            dup.reason = "Seção \"" + b.section->title + "\" repete a seção da linha " + std::to_string(dup.firstLine) +
                         (dup.kind == MatchKind::Exact ? " (conteúdo idêntico)" : " (conteúdo semelhante)");
            reported.insert(b.section->index);
            result.push_back(std::move(dup));
        }
    }
    return result;
}

} // namespace structaudit::domain::analysis
