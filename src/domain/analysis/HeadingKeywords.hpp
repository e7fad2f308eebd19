/**
 * @file HeadingKeywords.hpp
 * @brief Keyword classification of heading titles shared by the numbering, table and
 * duplicate detectors.
 */

#pragma once

#include <string>

namespace structaudit::domain::analysis {

/** @brief Title names a table block: tabela, quadro, síntese, pegadinha, banca. */
bool IsTableKeywordTitle(const std::string& title);

/**
 * @brief Headings the numbering normalizer leaves untouched.
 * Level 2: sumário, bibliografia, referências. Levels 3-4: table-introducing titles
 * (quadro, tabela, síntese, esquema, pegadinha, banca) and resumo.
 */
bool IsNumberingExempt(int level, const std::string& title);

/** @brief Normalized title with emoji, trailing "(Continuação)" and stray hashes removed. */
std::string ComparableTitle(const std::string& title);

} // namespace structaudit::domain::analysis
