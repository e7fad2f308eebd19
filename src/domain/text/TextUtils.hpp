/**
 * @file TextUtils.hpp
 * @brief UTF-8 aware string helpers shared by the parser and the detectors.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace structaudit::domain::text {

/** @brief Splits on '\n'. A trailing newline yields a final empty line so JoinLines round-trips. */
std::vector<std::string> SplitLines(const std::string& text);

/** @brief Inverse of SplitLines. */
std::string JoinLines(const std::vector<std::string>& lines);

std::string Trim(const std::string& s);
std::string RTrim(const std::string& s);
bool IsBlank(const std::string& s);
bool StartsWith(const std::string& text, const std::string& prefix);

/** @brief Collapses runs of whitespace to a single space and trims the ends. */
std::string CollapseWhitespace(const std::string& s);

/** @brief Splits on ASCII whitespace, dropping empty pieces. */
std::vector<std::string> SplitWords(const std::string& s);

/**
 * @brief Replaces Latin-1 accented letters (and the ordinal indicators) with their ASCII base.
 * Other multi-byte sequences are copied unchanged.
 */
std::string FoldDiacritics(const std::string& s);

/** @brief Lowercases ASCII and Latin-1 letters, leaving every other byte untouched. */
std::string ToLowerUtf8(const std::string& s);

/** @brief Uppercases ASCII and Latin-1 letters, leaving every other byte untouched. */
std::string ToUpperUtf8(const std::string& s);

/** @brief Number of code points, assuming valid UTF-8. */
size_t CodePointLength(const std::string& s);

/** @brief Returns at most maxCodePoints code points without splitting a sequence. */
std::string Utf8Prefix(const std::string& s, size_t maxCodePoints);

/** @brief Strict validation: rejects overlong forms, surrogates and code points above U+10FFFF. */
bool IsValidUtf8(const std::string& s);

/** @brief True when the text has letters and none of them is lowercase. */
bool IsAllCaps(const std::string& s);

/** @brief FNV-1a 64 bit. Stable across platforms and runs. */
uint64_t Fnv1a64(const std::string& s);

/** @brief Lowercase hex of the hash, truncated to the first `digits` characters. */
std::string HexDigest(uint64_t value, size_t digits = 16);

} // namespace structaudit::domain::text
