/**
 * @file HeadingKeywords.cpp
 * @brief Implementation of the heading keyword helpers.
 */

#include "domain/analysis/HeadingKeywords.hpp"
#include "domain/text/Fingerprint.hpp"
#include "domain/text/TextUtils.hpp"

#include <vector>

namespace structaudit::domain::analysis {

namespace {

// Singular or plural ("quadro", "quadros"), never a longer word ("bancario").
bool HasKeyword(const std::string& normalized, const std::vector<std::string>& keywords) {
    for (const auto& word : text::SplitWords(normalized)) {
        for (const auto& keyword : keywords) {
            if (word == keyword || word == keyword + "s") return true;
        }
    }
    return false;
}

} // namespace

bool IsTableKeywordTitle(const std::string& title) {
    static const std::vector<std::string> keywords = {"tabela", "quadro", "sintese", "pegadinha", "banca"};
    return HasKeyword(text::Normalize(title), keywords);
}

bool IsNumberingExempt(int level, const std::string& title) {
    static const std::vector<std::string> topLevel = {"sumario", "bibliografia", "referencia"};
    static const std::vector<std::string> nested = {"quadro", "tabela", "sintese", "esquema", "pegadinha", "banca", "resumo"};
    const std::string normalized = text::Normalize(title);
    return HasKeyword(normalized, level == 2 ? topLevel : nested);
}

std::string ComparableTitle(const std::string& title) {
    std::string normalized = text::Normalize(title);
    const std::string suffix = " continuacao";
    if (normalized == "continuacao") return {};
    if (normalized.size() > suffix.size() &&
        normalized.compare(normalized.size() - suffix.size(), suffix.size(), suffix) == 0) {
        normalized.erase(normalized.size() - suffix.size());
    }
    return normalized;
}

} // namespace structaudit::domain::analysis
