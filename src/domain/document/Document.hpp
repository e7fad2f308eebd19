/**
 * @file Document.hpp
 * @brief Hierarchical view of a markdown-like document: lines, sections and paragraphs.
 *
 * Every structure here is a pure derived view. It is rebuilt from text on each call
 * and never mutated in place.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace structaudit::domain::document {

/**
 * @struct HeadingLine
 * @brief Decomposition of a single `##`..`####` heading line.
 */
struct HeadingLine {
    int level = 0;                 ///< 2, 3 or 4.
    std::vector<int> numbering;    ///< Leading numeric prefix, e.g. {1, 2} for "1.2.". Empty if none.
    std::string numberingText;     ///< Prefix as written, without trailing spaces ("1.2.").
    std::string title;             ///< Title with the numeric prefix removed.
    std::string text;              ///< Everything after the hashes (prefix + title).
};

/**
 * @brief Parses a heading line. Returns nullopt for anything that is not a level 2-4 heading.
 */
std::optional<HeadingLine> ParseHeadingLine(const std::string& line);

/** @brief Composes "### 1.2. Title" (or "### Title" when numbering is empty). */
std::string ComposeHeadingLine(int level, const std::string& numberingText, const std::string& title);

/**
 * @struct Section
 * @brief A structural node created by a level 2-4 heading.
 *
 * `bodyStart..bodyEnd` is the section's own body (up to the next heading of any level), so
 * bodies of different sections never overlap. `bodyStart..subtreeEnd` also covers the
 * descendants, which makes a parent's span strictly contain its children's spans.
 */
struct Section {
    int index = 0;
    int level = 0;
    std::vector<int> numbering;
    std::string numberingText;
    std::string title;        ///< Cleaned title.
    std::string rawHeading;   ///< The heading line as in the document, without a CRLF '\r'.
    size_t headingLine = 0;   ///< 0-based.
    size_t bodyStart = 0;
    size_t bodyEnd = 0;       ///< Exclusive.
    size_t subtreeEnd = 0;    ///< Exclusive.
    int parent = -1;          ///< Nearest preceding section of strictly lower level, -1 for none.

    bool isNumbered() const { return !numbering.empty(); }
};

/**
 * @struct Paragraph
 * @brief Contiguous non-blank lines inside a body (or the preamble before the first heading).
 */
struct Paragraph {
    int id = 0;
    int section = -1;          ///< Owning section index, -1 for the preamble.
    size_t startLine = 0;
    size_t endLine = 0;        ///< Exclusive.
    std::string text;
    std::string normalized;
    std::string fingerprint;
    size_t length = 0;         ///< Code points of the trimmed text.
};

/**
 * @struct Document
 * @brief The parsed document. `lines` joined with '\n' reproduces the source text exactly.
 */
struct Document {
    std::vector<std::string> lines;
    std::vector<bool> fenced;  ///< True for fence delimiters and the lines between them.
    std::vector<Section> sections;
    std::vector<Paragraph> paragraphs;

    std::string text() const;

    /** @brief Own body of a section (children excluded), lines joined with '\n'. */
    std::string bodyText(const Section& section) const;

    /** @brief Direct children of a section, in document order. */
    std::vector<int> children(int sectionIndex) const;

    /** @brief Section whose heading sits exactly on `line`, if any. */
    std::optional<int> sectionAtHeadingLine(size_t line) const;

    /** @brief Replaces a line's content, keeping its '\r' when the line had one. */
    void replaceLine(size_t index, const std::string& content);
};

/** @brief "\r" for a CRLF line, "" otherwise. */
std::string LineTerminator(const std::string& line);

/**
 * @class DocumentParser
 * @brief Turns flat text into a Document. Stateless.
 */
class DocumentParser {
public:
    static Document Parse(const std::string& text);
};

} // namespace structaudit::domain::document
