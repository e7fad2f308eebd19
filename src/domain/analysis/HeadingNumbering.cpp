/**
 * @file HeadingNumbering.cpp
 * @brief Implementation of HeadingNumbering.
 */

#include "domain/analysis/HeadingNumbering.hpp"
#include "domain/analysis/HeadingKeywords.hpp"
#include "domain/text/TextUtils.hpp"

#include <array>

namespace structaudit::domain::analysis {

std::vector<HeadingNumbering::Rewrite> HeadingNumbering::ComputeRewrites(const document::Document& doc) {
    std::vector<Rewrite> rewrites;
    std::array<int, 5> counters{0, 0, 0, 0, 0};

    for (const auto& section : doc.sections) {
        if (IsNumberingExempt(section.level, section.title)) continue;

        bool orphan = false;
        for (int level = 2; level < section.level; ++level) {
            if (counters[level] == 0) orphan = true;
        }
        if (orphan) continue;

        ++counters[section.level];
        for (int deeper = section.level + 1; deeper <= 4; ++deeper) counters[deeper] = 0;

        std::string prefix;
        for (int level = 2; level <= section.level; ++level) {
            prefix += std::to_string(counters[level]) + ".";
        }

        const std::string expected = document::ComposeHeadingLine(section.level, prefix, section.title);
        if (expected != section.rawHeading) {
            rewrites.push_back({section.headingLine, section.level, section.rawHeading, expected, section.title});
        }
    }
    return rewrites;
}

RenumberResult HeadingNumbering::Renumber(const std::string& source) {
    document::Document doc = document::DocumentParser::Parse(source);
    const auto rewrites = ComputeRewrites(doc);

    RenumberResult result;
    if (rewrites.empty()) {
        result.text = source;
        return result;
    }
    for (const auto& rewrite : rewrites) doc.replaceLine(rewrite.line, rewrite.newRaw);
    result.text = doc.text();
    result.changed = true;
    return result;
}

std::vector<HeadingIssue> HeadingNumbering::FindIssues(const document::Document& doc) {
    std::vector<HeadingIssue> issues;
    for (const auto& rewrite : ComputeRewrites(doc)) {
        HeadingIssue issue;
        issue.id = "heading_numbering_" +
                   text::HexDigest(text::Fnv1a64(std::to_string(rewrite.line) + "|" + rewrite.oldRaw), 12);
        issue.kind = HeadingIssueKind::NumberingDrift;
        issue.line = rewrite.line + 1;
        issue.level = rewrite.level;
        issue.oldRaw = rewrite.oldRaw;
        issue.newRaw = rewrite.newRaw;
        issue.oldTitle = rewrite.title;
        issue.newTitle = rewrite.title;
        issue.confidence = 1.0;
        issue.action = "RENUMBER";
        issue.reason = "Numeração esperada: \"" + rewrite.newRaw + "\"";
        issues.push_back(std::move(issue));
    }
    return issues;
}

} // namespace structaudit::domain::analysis
