/**
 * @file SimilarityEngine.hpp
 * @brief Approximate string similarity and the legitimate-repetition whitelist.
 */

#pragma once

#include "domain/analysis/Issues.hpp"

#include <set>
#include <string>

namespace structaudit::domain::analysis {

using TokenSet = std::set<std::string>;

/**
 * @class SimilarityEngine
 * @brief Stateless scoring helpers shared by every detector.
 */
class SimilarityEngine {
public:
    /**
     * @brief Content keywords of a text.
     * Normalized alphanumeric tokens of at least `minLength` code points, minus stopwords and
     * pure-digit tokens.
     */
    static TokenSet Tokens(const std::string& input, size_t minLength);

    /** @brief |a ∩ b| / |a ∪ b|. Zero when both are empty. */
    static double Jaccard(const TokenSet& a, const TokenSet& b);

    /** @brief |part ∩ whole| / |part|. Zero when part is empty. */
    static double Coverage(const TokenSet& part, const TokenSet& whole);

    /**
     * @brief Matching-blocks ratio 2*M/T over code points, in [0, 1].
     * Same definition as Ratcliff/Obershelp "gestalt" matching without junk heuristics.
     */
    static double SequenceRatio(const std::string& a, const std::string& b);

    /** @brief Cheap upper bound of SequenceRatio based on the character multiset. */
    static double QuickRatio(const std::string& a, const std::string& b);

    /**
     * @brief True when repeating this text is expected (table introducers, legal citations,
     * structural markers) and must never be reported as a duplicate.
     */
    static bool IsLegitimateRepetition(const std::string& text);

    /**
     * @brief Confidence of a duplicate match.
     * Exact matches score 0.99. Near matches blend the sequence ratio (relative to its
     * threshold) with the keyword Jaccard, capped at 0.98.
     */
    static double Confidence(MatchKind kind, double sequenceRatio, double jaccard, double threshold);
};

} // namespace structaudit::domain::analysis
