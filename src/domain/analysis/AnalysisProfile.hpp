/**
 * @file AnalysisProfile.hpp
 * @brief Mode-tuned thresholds for every detector.
 *
 * Profiles are plain values: built once per call and passed by const reference.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace structaudit::domain::analysis {

/**
 * @enum AnalysisMode
 * @brief Document genre. Selects a threshold profile.
 */
enum class AnalysisMode {
    Apostila,    ///< Course handouts. Tolerant to repetition.
    Fidelidade,  ///< Faithful transcript rendering. Tolerant.
    Audiencia,   ///< Court hearing. Strict.
    Reuniao,     ///< Meeting minutes. Strict.
    Depoimento   ///< Deposition. Strict.
};

inline std::string ModeToString(AnalysisMode mode) {
    switch (mode) {
        case AnalysisMode::Apostila: return "APOSTILA";
        case AnalysisMode::Fidelidade: return "FIDELIDADE";
        case AnalysisMode::Audiencia: return "AUDIENCIA";
        case AnalysisMode::Reuniao: return "REUNIAO";
        case AnalysisMode::Depoimento: return "DEPOIMENTO";
        default: return "APOSTILA";
    }
}

/**
 * @brief Maps a mode string (case-insensitive, accents ignored) to a mode.
 * @param recognized Set to false when the name is unknown and APOSTILA was returned instead.
 */
AnalysisMode ParseMode(const std::string& name, bool* recognized = nullptr);

inline bool IsStrictMode(AnalysisMode mode) {
    return mode == AnalysisMode::Audiencia || mode == AnalysisMode::Reuniao || mode == AnalysisMode::Depoimento;
}

/**
 * @struct AnalysisProfile
 * @brief All tunable thresholds. Defaults come from ForMode; settings.json may override them.
 */
struct AnalysisProfile {
    AnalysisMode mode = AnalysisMode::Apostila;

    // Duplicates
    size_t minParagraphChars = 80;
    size_t minTokenLength = 4;
    double nearSimilarityThreshold = 0.92;
    double nearJaccardThreshold = 0.85;
    size_t maxScanCandidates = 400;
    size_t sectionLeadChars = 400;

    // Heading semantics
    double titleMismatchThreshold = 0.18;
    size_t titleMismatchMinBodyChars = 190;
    double titleSimilarityThreshold = 0.90;
    double parentBodyOverlapMax = 0.30;
    double siblingBodySimilarityMax = 0.50;

    // Table placement
    double tableParentMargin = 0.08;
    double tableParentMinSimilarity = 0.08;

    // Policy and limits
    double autoApplyConfidenceFloor = 0.90;
    size_t maxDocumentBytes = 8u * 1024u * 1024u;

    static AnalysisProfile ForMode(AnalysisMode mode);
};

/**
 * @class ProfileCatalog
 * @brief One profile per mode. Read-only once built; safe to share between threads.
 */
class ProfileCatalog {
public:
    /** @brief Built-in thresholds for every mode. */
    static ProfileCatalog Defaults();

    explicit ProfileCatalog(std::map<AnalysisMode, AnalysisProfile> profiles);

    const AnalysisProfile& profileFor(AnalysisMode mode) const;

private:
    std::map<AnalysisMode, AnalysisProfile> m_profiles;
};

} // namespace structaudit::domain::analysis
