/**
 * @file HeadingNumbering.hpp
 * @brief Recomputes hierarchical H2-H4 numbering ("1.", "1.2.", "1.2.3.").
 */

#pragma once

#include "domain/analysis/Issues.hpp"
#include "domain/document/Document.hpp"

#include <string>
#include <vector>

namespace structaudit::domain::analysis {

struct RenumberResult {
    std::string text;
    bool changed = false;
};

/**
 * @class HeadingNumbering
 * @brief Counter-based numbering normalizer.
 *
 * Exempt headings (sumário/bibliografia/referências at level 2, table introducers and
 * resumo at levels 3-4) are neither rewritten nor counted. A level 3 or 4 heading with no
 * numbered ancestor above it is left as written. Titles are never altered.
 */
class HeadingNumbering {
public:
    /** @brief Rewrites every heading whose prefix or spacing differs. Idempotent. */
    static RenumberResult Renumber(const std::string& text);

    /** @brief One numbering_drift issue per heading Renumber would rewrite. */
    static std::vector<HeadingIssue> FindIssues(const document::Document& doc);

private:
    struct Rewrite {
        size_t line = 0;
        int level = 0;
        std::string oldRaw;
        std::string newRaw;
        std::string title;
    };

    static std::vector<Rewrite> ComputeRewrites(const document::Document& doc);
};

} // namespace structaudit::domain::analysis
