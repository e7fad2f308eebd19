/**
 * @file AnalysisProfile.cpp
 * @brief Built-in profiles per mode.
 */

#include "domain/analysis/AnalysisProfile.hpp"
#include "domain/text/TextUtils.hpp"

#include <initializer_list>
#include <utility>

namespace structaudit::domain::analysis {

AnalysisMode ParseMode(const std::string& name, bool* recognized) {
    const std::string key = text::ToUpperUtf8(text::FoldDiacritics(text::Trim(name)));
    if (recognized) *recognized = true;

    if (key == "APOSTILA") return AnalysisMode::Apostila;
    if (key == "FIDELIDADE") return AnalysisMode::Fidelidade;
    if (key == "AUDIENCIA") return AnalysisMode::Audiencia;
    if (key == "REUNIAO") return AnalysisMode::Reuniao;
    if (key == "DEPOIMENTO") return AnalysisMode::Depoimento;

    if (recognized) *recognized = false;
    return AnalysisMode::Apostila;
}

AnalysisProfile AnalysisProfile::ForMode(AnalysisMode mode) {
    AnalysisProfile profile;
    profile.mode = mode;
    if (IsStrictMode(mode)) {
        profile.minParagraphChars = 60;
        profile.minTokenLength = 3;
        profile.nearSimilarityThreshold = 0.88;
        profile.nearJaccardThreshold = 0.80;
        profile.maxScanCandidates = 600;
        profile.titleMismatchThreshold = 0.24;
        profile.titleMismatchMinBodyChars = 150;
    }
    return profile;
}

ProfileCatalog ProfileCatalog::Defaults() {
    std::map<AnalysisMode, AnalysisProfile> profiles;
    for (auto mode : {AnalysisMode::Apostila, AnalysisMode::Fidelidade, AnalysisMode::Audiencia,
                      AnalysisMode::Reuniao, AnalysisMode::Depoimento}) {
        profiles[mode] = AnalysisProfile::ForMode(mode);
    }
    return ProfileCatalog(std::move(profiles));
}

ProfileCatalog::ProfileCatalog(std::map<AnalysisMode, AnalysisProfile> profiles) : m_profiles(std::move(profiles)) {
    for (auto mode : {AnalysisMode::Apostila, AnalysisMode::Fidelidade, AnalysisMode::Audiencia,
                      AnalysisMode::Reuniao, AnalysisMode::Depoimento}) {
        if (!m_profiles.count(mode)) m_profiles[mode] = AnalysisProfile::ForMode(mode);
        m_profiles[mode].mode = mode;
    }
}

const AnalysisProfile& ProfileCatalog::profileFor(AnalysisMode mode) const {
    return m_profiles.at(mode);
}

} // namespace structaudit::domain::analysis
