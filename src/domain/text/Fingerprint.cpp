/**
 * @file Fingerprint.cpp
 * @brief Implementation of Normalize and Fingerprint.
 */

#include "domain/text/Fingerprint.hpp"
#include "domain/text/TextUtils.hpp"

#include <cctype>
#include <cstdint>

namespace structaudit::domain::text {

namespace {

constexpr size_t kFingerprintDigits = 12;

// Punctuation, symbols, dingbats, emoji and variation selectors count as separators.
bool IsWordCodePoint(uint32_t cp) {
    if (cp >= 0x80 && cp <= 0xBF) return false;
    if (cp == 0xD7 || cp == 0xF7) return false;
    if (cp >= 0x2000 && cp <= 0x2BFF) return false;
    if (cp >= 0x3000 && cp <= 0x303F) return false;
    if (cp >= 0xFE00 && cp <= 0xFE0F) return false;
    if (cp >= 0xFF00 && cp <= 0xFF0F) return false;
    if (cp >= 0x1F000) return false;
    return true;
}

size_t SequenceLength(unsigned char lead) {
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

} // namespace

std::string Normalize(const std::string& text) {
    const std::string folded = ToLowerUtf8(FoldDiacritics(text));

    std::string spaced;
    spaced.reserve(folded.size());
    for (size_t i = 0; i < folded.size();) {
        unsigned char c = static_cast<unsigned char>(folded[i]);
        if (c < 0x80) {
            spaced.push_back(std::isalnum(c) ? static_cast<char>(c) : ' ');
            ++i;
            continue;
        }
        size_t len = SequenceLength(c);
        if (i + len > folded.size()) len = folded.size() - i;
        uint32_t cp = len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
        for (size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(folded[i + k]) & 0x3F);
        }
        if (len > 1 && IsWordCodePoint(cp)) {
            spaced.append(folded, i, len);
        } else {
            spaced.push_back(' ');
        }
        i += len;
    }
    return CollapseWhitespace(spaced);
}

std::string FingerprintNormalized(const std::string& normalized) {
    return HexDigest(Fnv1a64(normalized), kFingerprintDigits);
}

std::string Fingerprint(const std::string& text) {
    return FingerprintNormalized(Normalize(text));
}

} // namespace structaudit::domain::text
