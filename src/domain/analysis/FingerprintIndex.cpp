/**
 * @file FingerprintIndex.cpp
 * @brief Implementation of FingerprintIndex.
 */

#include "domain/analysis/FingerprintIndex.hpp"

namespace structaudit::domain::analysis {

FingerprintIndex FingerprintIndex::Build(const std::vector<document::Paragraph>& paragraphs) {
    FingerprintIndex index;
    for (const auto& para : paragraphs) {
        auto it = index.m_byFingerprint.find(para.fingerprint);
        if (it == index.m_byFingerprint.end()) {
            index.m_byFingerprint[para.fingerprint] = index.m_groups.size();
            index.m_groups.push_back({para.fingerprint, {para.id}});
        } else {
            index.m_groups[it->second].paragraphIds.push_back(para.id);
        }
    }
    return index;
}

std::vector<FingerprintGroup> FingerprintIndex::repeatedGroups() const {
    std::vector<FingerprintGroup> repeated;
    for (const auto& group : m_groups) {
        if (group.paragraphIds.size() > 1) repeated.push_back(group);
    }
    return repeated;
}

const std::vector<int>& FingerprintIndex::members(const std::string& fingerprint) const {
    static const std::vector<int> kEmpty;
    auto it = m_byFingerprint.find(fingerprint);
    return it == m_byFingerprint.end() ? kEmpty : m_groups[it->second].paragraphIds;
}

} // namespace structaudit::domain::analysis
