/**
 * @file FingerprintIndex.hpp
 * @brief Groups paragraphs by fingerprint for exact-duplicate detection.
 */

#pragma once

#include "domain/document/Document.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace structaudit::domain::analysis {

/**
 * @struct FingerprintGroup
 * @brief Paragraph ids sharing one fingerprint, in document order.
 */
struct FingerprintGroup {
    std::string fingerprint;
    std::vector<int> paragraphIds;
};

/**
 * @class FingerprintIndex
 * @brief Immutable fingerprint -> paragraphs map. Groups keep first-occurrence order.
 */
class FingerprintIndex {
public:
    /** @brief Indexes the given paragraphs (typically already filtered by length). */
    static FingerprintIndex Build(const std::vector<document::Paragraph>& paragraphs);

    const std::vector<FingerprintGroup>& groups() const { return m_groups; }

    /** @brief Groups with more than one member. */
    std::vector<FingerprintGroup> repeatedGroups() const;

    /** @brief Members of a fingerprint, empty when unknown. */
    const std::vector<int>& members(const std::string& fingerprint) const;

    size_t count(const std::string& fingerprint) const { return members(fingerprint).size(); }

private:
    std::vector<FingerprintGroup> m_groups;
    std::unordered_map<std::string, size_t> m_byFingerprint;
};

} // namespace structaudit::domain::analysis
