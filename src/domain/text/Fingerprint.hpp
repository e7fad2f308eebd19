/**
 * @file Fingerprint.hpp
 * @brief Text normalization and paragraph fingerprints used for exact-duplicate grouping.
 */

#pragma once

#include <string>

namespace structaudit::domain::text {

/**
 * @brief Canonical comparison form of a text.
 *
 * Lowercases, folds diacritics, replaces markdown decoration and every other non-word
 * character with a space, then collapses whitespace. Idempotent.
 */
std::string Normalize(const std::string& text);

/** @brief Truncated FNV-1a digest of Normalize(text), 12 hex characters. */
std::string Fingerprint(const std::string& text);

/** @brief Digest of an already normalized text. Fingerprint(t) == FingerprintNormalized(Normalize(t)). */
std::string FingerprintNormalized(const std::string& normalized);

} // namespace structaudit::domain::text
