/**
 * @file TextUtils.cpp
 * @brief Implementation of the UTF-8 string helpers.
 */

#include "domain/text/TextUtils.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace structaudit::domain::text {

namespace {

// ASCII replacements for U+00C0..U+00FF, indexed by (second byte - 0x80) of the C3 sequence.
const char* const kLatin1Fold[64] = {
    "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",
    "D", "N", "O", "O", "O", "O", "O", " ", "O", "U", "U", "U", "U", "Y", "TH", "ss",
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    "d", "n", "o", "o", "o", "o", "o", " ", "o", "u", "u", "u", "u", "y", "th", "y"
};

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool IsLatin1Upper(unsigned char second) {
    return second >= 0x80 && second <= 0x9E && second != 0x97;
}

bool IsLatin1Lower(unsigned char second) {
    return second >= 0x9F && second <= 0xBF && second != 0xB7;
}

} // namespace

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string JoinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string RTrim(const std::string& s) {
    size_t last = s.find_last_not_of(" \t\r\n\f\v");
    if (last == std::string::npos) return {};
    return s.substr(0, last + 1);
}

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string CollapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::vector<std::string> SplitWords(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream ss(s);
    std::string word;
    while (ss >> word) words.push_back(word);
    return words;
}

std::string FoldDiacritics(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == 0xC3 && i + 1 < s.size()) {
            unsigned char next = static_cast<unsigned char>(s[i + 1]);
            if (next >= 0x80 && next <= 0xBF) {
                out += kLatin1Fold[next - 0x80];
                ++i;
                continue;
            }
        }
        if (c == 0xC2 && i + 1 < s.size()) {
            unsigned char next = static_cast<unsigned char>(s[i + 1]);
            if (next == 0xBA) { out.push_back('o'); ++i; continue; } // º
            if (next == 0xAA) { out.push_back('a'); ++i; continue; } // ª
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string ToLowerUtf8(const std::string& s) {
    std::string out = s;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (c < 0x80) {
            out[i] = static_cast<char>(std::tolower(c));
        } else if (c == 0xC3 && i + 1 < out.size()) {
            unsigned char next = static_cast<unsigned char>(out[i + 1]);
            if (IsLatin1Upper(next)) out[i + 1] = static_cast<char>(next + 0x20);
            ++i;
        }
    }
    return out;
}

std::string ToUpperUtf8(const std::string& s) {
    std::string out = s;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (c < 0x80) {
            out[i] = static_cast<char>(std::toupper(c));
        } else if (c == 0xC3 && i + 1 < out.size()) {
            unsigned char next = static_cast<unsigned char>(out[i + 1]);
            // ß and ÿ have no single-byte-pair uppercase form.
            if (IsLatin1Lower(next) && next != 0x9F && next != 0xBF) {
                out[i + 1] = static_cast<char>(next - 0x20);
            }
            ++i;
        }
    }
    return out;
}

size_t CodePointLength(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if (!IsContinuation(c)) ++count;
    }
    return count;
}

std::string Utf8Prefix(const std::string& s, size_t maxCodePoints) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!IsContinuation(static_cast<unsigned char>(s[i]))) {
            if (count == maxCodePoints) return s.substr(0, i);
            ++count;
        }
    }
    return s;
}

bool IsValidUtf8(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if (!IsContinuation(cc)) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

bool IsAllCaps(const std::string& s) {
    bool hasLetter = false;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            if (std::islower(c)) return false;
            if (std::isupper(c)) hasLetter = true;
        } else if (c == 0xC3 && i + 1 < s.size()) {
            unsigned char next = static_cast<unsigned char>(s[i + 1]);
            if (IsLatin1Lower(next)) return false;
            if (IsLatin1Upper(next)) hasLetter = true;
            ++i;
        }
    }
    return hasLetter;
}

uint64_t Fnv1a64(const std::string& s) {
    const uint64_t FNV_OFFSET = 14695981039346656037ULL;
    const uint64_t FNV_PRIME = 1099511628211ULL;
    uint64_t h = FNV_OFFSET;
    for (unsigned char c : s) {
        h ^= c;
        h *= FNV_PRIME;
    }
    return h;
}

std::string HexDigest(uint64_t value, size_t digits) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    std::string hex(buf);
    if (digits < hex.size()) hex.resize(digits);
    return hex;
}

} // namespace structaudit::domain::text
