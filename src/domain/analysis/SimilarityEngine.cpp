/**
 * @file SimilarityEngine.cpp
 * @brief Implementation of SimilarityEngine.
 */

#include "domain/analysis/SimilarityEngine.hpp"
#include "domain/text/Fingerprint.hpp"
#include "domain/text/TextUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <regex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace structaudit::domain::analysis {

namespace {

const std::unordered_set<std::string>& Stopwords() {
    // Already folded: tokens are compared after Normalize().
    static const std::unordered_set<std::string> words = {
        "a", "o", "as", "os", "um", "uma", "uns", "umas", "de", "do", "da", "dos", "das",
        "em", "no", "na", "nos", "nas", "ao", "aos", "por", "pelo", "pela", "pelos", "pelas",
        "para", "com", "sem", "sob", "sobre", "entre", "ate", "apos", "que", "qual", "quais",
        "quando", "onde", "como", "porque", "pois", "mas", "porem", "tambem", "ainda", "apenas",
        "mais", "menos", "muito", "muita", "muitos", "muitas", "isso", "isto", "esse", "essa",
        "esses", "essas", "este", "esta", "estes", "estas", "aquele", "aquela", "aqueles",
        "aquelas", "ele", "ela", "eles", "elas", "seu", "sua", "seus", "suas", "nao", "sim",
        "ser", "sao", "foi", "sera", "seja", "sendo", "estar", "esta", "estao", "ter", "tem",
        "tinha", "havia", "pode", "podem", "deve", "devem", "cada", "todo", "toda", "todos",
        "todas", "mesmo", "mesma", "outro", "outra", "outros", "outras", "assim", "entao",
        "aqui", "ali", "caso", "forma", "modo", "voce", "voces", "gente", "dessa", "desse",
        "deste", "desta", "nesse", "nessa", "neste", "nesta", "num", "numa", "lhe", "lhes",
        "the", "and", "for", "with", "this", "that", "from", "are", "was"
    };
    return words;
}

bool IsAllDigits(const std::string& token) {
    return !token.empty() && std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<uint32_t> DecodeCodePoints(const std::string& s) {
    std::vector<uint32_t> out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        uint32_t cp = c;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        if (i + len > s.size()) len = s.size() - i;
        for (size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

struct MatchingBlock {
    size_t a;
    size_t b;
    size_t size;
};

/**
 * @class BlockMatcher
 * @brief Longest-common-block recursion over code point sequences.
 */
class BlockMatcher {
public:
    BlockMatcher(const std::vector<uint32_t>& a, const std::vector<uint32_t>& b) : m_a(a), m_b(b) {
        for (size_t j = 0; j < m_b.size(); ++j) m_b2j[m_b[j]].push_back(j);
    }

    size_t totalMatched() const {
        size_t matched = 0;
        std::vector<std::array<size_t, 4>> queue;
        queue.push_back({0, m_a.size(), 0, m_b.size()});
        while (!queue.empty()) {
            auto [alo, ahi, blo, bhi] = queue.back();
            queue.pop_back();
            MatchingBlock block = longestMatch(alo, ahi, blo, bhi);
            if (block.size == 0) continue;
            matched += block.size;
            if (alo < block.a && blo < block.b) queue.push_back({alo, block.a, blo, block.b});
            if (block.a + block.size < ahi && block.b + block.size < bhi) {
                queue.push_back({block.a + block.size, ahi, block.b + block.size, bhi});
            }
        }
        return matched;
    }

private:
    MatchingBlock longestMatch(size_t alo, size_t ahi, size_t blo, size_t bhi) const {
        MatchingBlock best{alo, blo, 0};
        std::unordered_map<size_t, size_t> j2len;
        std::unordered_map<size_t, size_t> next;
        for (size_t i = alo; i < ahi; ++i) {
            next.clear();
            auto it = m_b2j.find(m_a[i]);
            if (it != m_b2j.end()) {
                for (size_t j : it->second) {
                    if (j < blo) continue;
                    if (j >= bhi) break;
                    size_t k = 1;
                    if (j > 0) {
                        auto prev = j2len.find(j - 1);
                        if (prev != j2len.end()) k = prev->second + 1;
                    }
                    next[j] = k;
                    if (k > best.size) best = {i + 1 - k, j + 1 - k, k};
                }
            }
            j2len.swap(next);
        }
        return best;
    }

    const std::vector<uint32_t>& m_a;
    const std::vector<uint32_t>& m_b;
    std::unordered_map<uint32_t, std::vector<size_t>> m_b2j;
};

const std::regex& CitationPattern() {
    static const std::regex pattern(
        R"(\b(art|arts|artigo|lei|sumula|decreto|resp|re|adi|adc|adpf|hc|ms|tema|informativo|cpc|cpp|clt|lc|ec|inc|inciso)\s+\d)"
        R"(|\b(stf|stj|tst|tse|tcu|trf\d?)\b)");
    return pattern;
}

bool StartsWithAny(const std::string& value, std::initializer_list<const char*> prefixes) {
    for (const char* prefix : prefixes) {
        if (text::StartsWith(value, prefix)) return true;
    }
    return false;
}

constexpr size_t kShortCitationChars = 160;
constexpr size_t kTableIntroducerChars = 240;

} // namespace

TokenSet SimilarityEngine::Tokens(const std::string& input, size_t minLength) {
    TokenSet tokens;
    const auto& stopwords = Stopwords();
    for (const auto& word : text::SplitWords(text::Normalize(input))) {
        if (text::CodePointLength(word) < minLength) continue;
        if (IsAllDigits(word)) continue;
        if (stopwords.count(word)) continue;
        tokens.insert(word);
    }
    return tokens;
}

double SimilarityEngine::Jaccard(const TokenSet& a, const TokenSet& b) {
    if (a.empty() && b.empty()) return 0.0;
    size_t common = 0;
    for (const auto& token : a) {
        if (b.count(token)) ++common;
    }
    const size_t unionSize = a.size() + b.size() - common;
    return unionSize == 0 ? 0.0 : static_cast<double>(common) / static_cast<double>(unionSize);
}

double SimilarityEngine::Coverage(const TokenSet& part, const TokenSet& whole) {
    if (part.empty()) return 0.0;
    size_t common = 0;
    for (const auto& token : part) {
        if (whole.count(token)) ++common;
    }
    return static_cast<double>(common) / static_cast<double>(part.size());
}

double SimilarityEngine::SequenceRatio(const std::string& a, const std::string& b) {
    const auto ca = DecodeCodePoints(a);
    const auto cb = DecodeCodePoints(b);
    const size_t total = ca.size() + cb.size();
    if (total == 0) return 1.0;
    BlockMatcher matcher(ca, cb);
    return 2.0 * static_cast<double>(matcher.totalMatched()) / static_cast<double>(total);
}

double SimilarityEngine::QuickRatio(const std::string& a, const std::string& b) {
    const auto ca = DecodeCodePoints(a);
    const auto cb = DecodeCodePoints(b);
    const size_t total = ca.size() + cb.size();
    if (total == 0) return 1.0;
    std::unordered_map<uint32_t, long> available;
    for (uint32_t c : cb) ++available[c];
    size_t matches = 0;
    for (uint32_t c : ca) {
        auto it = available.find(c);
        if (it != available.end() && it->second > 0) {
            --it->second;
            ++matches;
        }
    }
    return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

bool SimilarityEngine::IsLegitimateRepetition(const std::string& raw) {
    const std::string trimmed = text::Trim(raw);
    if (trimmed.empty()) return true;

    // Structural markers: headings, tables, fences, callouts, comments.
    if (StartsWithAny(trimmed, {"#", "|", "```", "~~~", "> [!", "<!--", "---"})) return true;

    const std::string norm = text::Normalize(trimmed);
    const size_t length = text::CodePointLength(trimmed);

    // Table and quadro-sintese introducers.
    if (length <= kTableIntroducerChars &&
        (norm.find("quadro sintese") != std::string::npos ||
         StartsWithAny(norm, {"quadro ", "tabela ", "sintese ", "esquema ", "resumo "}))) {
        return true;
    }

    // Lines that open with a legal citation.
    if (text::StartsWith(trimmed, "§") ||
        StartsWithAny(norm, {"art ", "arts ", "artigo ", "lei ", "sumula ", "decreto ", "inciso ",
                             "paragrafo unico", "cf ", "constituicao federal", "enunciado ",
                             "informativo ", "tema "})) {
        return true;
    }

    // Short citation-like lines.
    if (length <= kShortCitationChars && std::regex_search(norm, CitationPattern())) {
        return true;
    }
    return false;
}

double SimilarityEngine::Confidence(MatchKind kind, double sequenceRatio, double jaccard, double threshold) {
    if (kind == MatchKind::Exact) return 0.99;
    const double relative = threshold > 0.0 ? std::clamp(sequenceRatio / threshold, 0.0, 1.0) : 1.0;
    return std::clamp(0.62 * relative + 0.38 * jaccard, 0.0, 0.98);
}

} // namespace structaudit::domain::analysis
