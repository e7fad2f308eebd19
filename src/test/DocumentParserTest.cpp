#include <cassert>
#include <iostream>
#include <string>

#include "domain/document/Document.hpp"

using namespace structaudit::domain::document;

namespace {

void testHeadingLine() {
    std::cout << "[Test] Heading line decomposition..." << std::endl;
    auto h = ParseHeadingLine("### 1.2. Atos Administrativos  ");
    assert(h && "level 3 heading should parse");
    assert(h->level == 3);
    assert(h->numberingText == "1.2.");
    assert((h->numbering == std::vector<int>{1, 2}));
    assert(h->title == "Atos Administrativos");

    auto plain = ParseHeadingLine("## Introdução");
    assert(plain && plain->numbering.empty());
    assert(plain->title == "Introdução");

    assert(!ParseHeadingLine("# Título do documento"));
    assert(!ParseHeadingLine("##### Nível cinco"));
    assert(!ParseHeadingLine("##"));
    assert(!ParseHeadingLine("texto ## com hashes"));

    assert(ComposeHeadingLine(2, "3.", "Poderes") == "## 3. Poderes");
    assert(ComposeHeadingLine(4, "", "Quadro") == "#### Quadro");
    std::cout << "[PASS] Heading line decomposition" << std::endl;
}

void testSectionTree() {
    std::cout << "[Test] Section tree and spans..." << std::endl;
    const std::string text =
        "# Apostila\n"
        "Preâmbulo do documento.\n"
        "\n"
        "## 1. Primeiro\n"
        "Corpo um.\n"
        "\n"
        "### 1.1. Sub\n"
        "Corpo sub.\n"
        "#### 1.1.1. Detalhe\n"
        "Corpo detalhe.\n"
        "## 2. Segundo\n"
        "Corpo dois.\n";
    Document doc = DocumentParser::Parse(text);

    assert(doc.text() == text && "lines must round-trip exactly");
    assert(doc.sections.size() == 4);

    const auto& first = doc.sections[0];
    const auto& sub = doc.sections[1];
    const auto& detail = doc.sections[2];
    const auto& second = doc.sections[3];

    assert(first.parent == -1 && sub.parent == 0 && detail.parent == 1 && second.parent == -1);
    assert(first.headingLine == 3 && first.bodyStart == 4 && first.bodyEnd == 6);
    assert(first.subtreeEnd == second.headingLine);
    assert(sub.subtreeEnd == second.headingLine);

    // Own bodies never overlap; subtrees strictly contain their children.
    for (size_t i = 0; i + 1 < doc.sections.size(); ++i) {
        assert(doc.sections[i].bodyEnd <= doc.sections[i + 1].headingLine);
    }
    assert(first.headingLine < sub.headingLine && sub.subtreeEnd <= first.subtreeEnd);
    assert(sub.headingLine < detail.headingLine && detail.subtreeEnd <= sub.subtreeEnd);

    assert(doc.bodyText(first) == "Corpo um.");
    assert((doc.children(0) == std::vector<int>{1}));
    assert(doc.sectionAtHeadingLine(6).value() == 1);
    assert(!doc.sectionAtHeadingLine(5));
    std::cout << "[PASS] Section tree and spans" << std::endl;
}

void testFencesAndParagraphs() {
    std::cout << "[Test] Fenced code and paragraphs..." << std::endl;
    const std::string text =
        "## 1. Código\n"
        "\n"
        "Primeira linha\n"
        "continua aqui.\n"
        "\n"
        "```\n"
        "## não é título\n"
        "\n"
        "ainda código\n"
        "```\n"
        "\n"
        "Último parágrafo.\n";
    Document doc = DocumentParser::Parse(text);

    assert(doc.sections.size() == 1 && "headings inside fences are ignored");
    assert(doc.fenced[6] && doc.fenced[5] && doc.fenced[9] && !doc.fenced[11]);

    assert(doc.paragraphs.size() == 3);
    assert(doc.paragraphs[0].text == "Primeira linha\ncontinua aqui.");
    assert(doc.paragraphs[0].startLine == 2 && doc.paragraphs[0].endLine == 4);
    assert(doc.paragraphs[1].startLine == 5 && doc.paragraphs[1].endLine == 10 && "blank lines inside a fence do not split it");
    assert(doc.paragraphs[2].section == 0);
    assert(doc.paragraphs[2].normalized == "ultimo paragrafo");
    assert(doc.paragraphs[2].length == 17);
    std::cout << "[PASS] Fenced code and paragraphs" << std::endl;
}

void testEmptyDocument() {
    std::cout << "[Test] Empty document..." << std::endl;
    Document doc = DocumentParser::Parse("");
    assert(doc.sections.empty());
    assert(doc.paragraphs.empty());
    assert(doc.text().empty());
    std::cout << "[PASS] Empty document" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DocumentParser tests..." << std::endl;
    testHeadingLine();
    testSectionTree();
    testFencesAndParagraphs();
    testEmptyDocument();
    std::cout << "[PASS] DocumentParser" << std::endl;
    return 0;
}
