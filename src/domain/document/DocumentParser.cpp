/**
 * @file DocumentParser.cpp
 * @brief Line scanner that rebuilds the section tree and paragraph list.
 */

#include "domain/document/Document.hpp"
#include "domain/text/Fingerprint.hpp"
#include "domain/text/TextUtils.hpp"

#include <cstddef>
#include <regex>

namespace structaudit::domain::document {

namespace {

const std::regex& HeadingPattern() {
    static const std::regex pattern(R"(^(#{2,4})\s+(.+)$)");
    return pattern;
}

const std::regex& NumberingPattern() {
    static const std::regex pattern(R"(^(\d{1,6}(?:\.\d{1,6})*\.?)\s+(.*)$)");
    return pattern;
}

bool IsFenceDelimiter(const std::string& line) {
    std::string trimmed = text::Trim(line);
    return text::StartsWith(trimmed, "```") || text::StartsWith(trimmed, "~~~");
}

std::vector<int> ParseNumbering(const std::string& numberingText) {
    std::vector<int> parts;
    std::string current;
    for (char c : numberingText) {
        if (c == '.') {
            if (!current.empty()) parts.push_back(std::stoi(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) parts.push_back(std::stoi(current));
    return parts;
}

} // namespace

std::optional<HeadingLine> ParseHeadingLine(const std::string& line) {
    const std::string trimmed = text::RTrim(line);
    std::smatch match;
    if (!std::regex_match(trimmed, match, HeadingPattern())) {
        return std::nullopt;
    }

    HeadingLine heading;
    heading.level = static_cast<int>(match[1].length());
    heading.text = text::Trim(match[2].str());

    std::smatch numberMatch;
    if (std::regex_match(heading.text, numberMatch, NumberingPattern())) {
        heading.numberingText = numberMatch[1].str();
        heading.numbering = ParseNumbering(heading.numberingText);
        heading.title = text::Trim(numberMatch[2].str());
    } else {
        heading.title = heading.text;
    }
    return heading;
}

std::string ComposeHeadingLine(int level, const std::string& numberingText, const std::string& title) {
    std::string line(static_cast<size_t>(level), '#');
    line += " ";
    if (!numberingText.empty()) {
        line += numberingText;
        line += " ";
    }
    line += title;
    return line;
}

std::string Document::text() const {
    return text::JoinLines(lines);
}

std::string Document::bodyText(const Section& section) const {
    std::vector<std::string> body;
    for (size_t i = section.bodyStart; i < section.bodyEnd && i < lines.size(); ++i) {
        body.push_back(lines[i]);
    }
    return text::Trim(text::JoinLines(body));
}

std::vector<int> Document::children(int sectionIndex) const {
    std::vector<int> result;
    for (const auto& section : sections) {
        if (section.parent == sectionIndex) result.push_back(section.index);
    }
    return result;
}

std::optional<int> Document::sectionAtHeadingLine(size_t line) const {
    for (const auto& section : sections) {
        if (section.headingLine == line) return section.index;
    }
    return std::nullopt;
}

std::string LineTerminator(const std::string& line) {
    return (!line.empty() && line.back() == '\r') ? "\r" : "";
}

void Document::replaceLine(size_t index, const std::string& content) {
    if (index >= lines.size()) return;
    lines[index] = content + LineTerminator(lines[index]);
}

Document DocumentParser::Parse(const std::string& source) {
    Document doc;
    doc.lines = text::SplitLines(source);
    doc.fenced.assign(doc.lines.size(), false);

    // Pass 1: fences and headings.
    bool inFence = false;
    for (size_t i = 0; i < doc.lines.size(); ++i) {
        const std::string& line = doc.lines[i];
        if (IsFenceDelimiter(line)) {
            doc.fenced[i] = true;
            inFence = !inFence;
            continue;
        }
        if (inFence) {
            doc.fenced[i] = true;
            continue;
        }

        auto heading = ParseHeadingLine(line);
        if (!heading) continue;

        Section section;
        section.index = static_cast<int>(doc.sections.size());
        section.level = heading->level;
        section.numbering = heading->numbering;
        section.numberingText = heading->numberingText;
        section.title = heading->title;
        section.rawHeading = line.substr(0, line.size() - LineTerminator(line).size());
        section.headingLine = i;
        section.bodyStart = i + 1;

        for (int p = section.index - 1; p >= 0; --p) {
            if (doc.sections[p].level < section.level) {
                section.parent = p;
                break;
            }
        }
        doc.sections.push_back(section);
    }

    // Pass 2: spans.
    const size_t total = doc.lines.size();
    for (size_t s = 0; s < doc.sections.size(); ++s) {
        Section& section = doc.sections[s];
        section.bodyEnd = (s + 1 < doc.sections.size()) ? doc.sections[s + 1].headingLine : total;
        section.subtreeEnd = total;
        for (size_t n = s + 1; n < doc.sections.size(); ++n) {
            if (doc.sections[n].level <= section.level) {
                section.subtreeEnd = doc.sections[n].headingLine;
                break;
            }
        }
    }

    // Pass 3: paragraphs. Headings and blank lines outside fences close a paragraph.
    std::vector<int> owner(total, -1);
    std::vector<bool> isHeading(total, false);
    for (const auto& section : doc.sections) {
        isHeading[section.headingLine] = true;
        for (size_t i = section.bodyStart; i < section.bodyEnd; ++i) owner[i] = section.index;
    }

    auto flush = [&](size_t start, size_t end) {
        if (start >= end) return;
        std::vector<std::string> block(doc.lines.begin() + static_cast<std::ptrdiff_t>(start),
                                       doc.lines.begin() + static_cast<std::ptrdiff_t>(end));
        Paragraph para;
        para.id = static_cast<int>(doc.paragraphs.size());
        para.section = owner[start];
        para.startLine = start;
        para.endLine = end;
        para.text = text::JoinLines(block);
        para.normalized = text::Normalize(para.text);
        para.fingerprint = text::FingerprintNormalized(para.normalized);
        para.length = text::CodePointLength(text::Trim(para.text));
        doc.paragraphs.push_back(std::move(para));
    };

    size_t start = 0;
    bool open = false;
    for (size_t i = 0; i < total; ++i) {
        const bool breaks = isHeading[i] || (!doc.fenced[i] && text::IsBlank(doc.lines[i]));
        if (breaks) {
            if (open) flush(start, i);
            open = false;
            continue;
        }
        if (!open) {
            start = i;
            open = true;
        }
    }
    if (open) flush(start, total);

    return doc;
}

} // namespace structaudit::domain::document
