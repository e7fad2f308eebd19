#include <cassert>
#include <iostream>
#include <string>

#include "domain/analysis/AnalysisProfile.hpp"
#include "domain/analysis/HeadingSemanticsAnalyzer.hpp"
#include "domain/document/Document.hpp"
#include "domain/text/TextUtils.hpp"

using namespace structaudit::domain;
using analysis::AnalysisMode;
using analysis::AnalysisProfile;
using analysis::HeadingIssueKind;
using analysis::HeadingSemanticsAnalyzer;

namespace {

HeadingSemanticsAnalyzer MakeAnalyzer() {
    return HeadingSemanticsAnalyzer(AnalysisProfile::ForMode(AnalysisMode::Apostila));
}

void testTitleBodyMismatch() {
    std::cout << "[Test] Title unrelated to its body..." << std::endl;
    const std::string text =
        "## 1. Direito Administrativo\n"
        "\n"
        "Visão panorâmica do tema.\n"
        "\n"
        "### 1.1. Introdução Geral\n"
        "\n"
        "A licitação pública é o procedimento administrativo pelo qual a Administração seleciona a proposta mais "
        "vantajosa para o contrato. O edital vincula a Administração e os licitantes durante todo o certame. A "
        "modalidade pregão é obrigatória para bens e serviços comuns, com inversão das fases de habilitação e "
        "julgamento. A homologação encerra o procedimento e autoriza a adjudicação do objeto ao vencedor.\n";
    const auto issues = MakeAnalyzer().analyze(document::DocumentParser::Parse(text));

    assert(issues.size() == 1);
    const auto& issue = issues[0];
    assert(issue.kind == HeadingIssueKind::SemanticMismatch);
    assert(issue.line == 5);
    assert(issue.action == "RENAME_RECOMMENDED");
    assert(issue.confidence > 0.6 && issue.confidence <= 0.95);
    assert(issue.oldRaw == "### 1.1. Introdução Geral");
    assert(issue.newTitle ==
           "A licitação pública é o procedimento administrativo pelo qual a Administração seleciona");
    assert(issue.newRaw == "### 1.1. " + issue.newTitle);
    assert(issue.id.rfind("heading_semantic_", 0) == 0);
    std::cout << "[PASS] Title unrelated to its body" << std::endl;
}

void testParentChildDrift() {
    std::cout << "[Test] Child repeating its parent title..." << std::endl;
    const std::string text =
        "## 2. Contratos Administrativos\n"
        "\n"
        "As cláusulas exorbitantes permitem alteração unilateral do contrato pela Administração.\n"
        "\n"
        "### 2.1. Contratos Administrativos\n"
        "\n"
        "Servidores estáveis só perdem o cargo por sentença judicial transitada em julgado.\n";
    const auto issues = MakeAnalyzer().analyze(document::DocumentParser::Parse(text));

    assert(issues.size() == 1);
    assert(issues[0].kind == HeadingIssueKind::ParentChildDrift);
    assert(issues[0].line == 5);
    assert(issues[0].confidence <= 0.95);
    assert(issues[0].newTitle.rfind("Servidores estáveis", 0) == 0);
    std::cout << "[PASS] Child repeating its parent title" << std::endl;
}

void testSiblingNearDuplicate() {
    std::cout << "[Test] Sibling with near-identical title..." << std::endl;
    const std::string text =
        "## 1. Poderes\n"
        "\n"
        "Texto curto do tópico.\n"
        "\n"
        "### 1.1. Poder de Polícia\n"
        "\n"
        "O poder de polícia limita direitos individuais em benefício do interesse público.\n"
        "\n"
        "### 1.2. Poder de Policia\n"
        "\n"
        "A remuneração dos servidores depende de lei específica de iniciativa privativa.\n";
    const auto issues = MakeAnalyzer().analyze(document::DocumentParser::Parse(text));

    assert(issues.size() == 1);
    assert(issues[0].kind == HeadingIssueKind::NearDuplicate);
    assert(issues[0].line == 9);
    assert(issues[0].newRaw.rfind("### 1.2. A remuneração dos servidores", 0) == 0);
    std::cout << "[PASS] Sibling with near-identical title" << std::endl;
}

void testDetectorsReportIndependently() {
    std::cout << "[Test] One heading flagged by two detectors..." << std::endl;
    const std::string text =
        "## 1. Poderes\n"
        "\n"
        "Texto curto do tópico.\n"
        "\n"
        "### 1.1. Poder de Polícia\n"
        "\n"
        "O poder de polícia limita direitos individuais em benefício do interesse público.\n"
        "\n"
        "### 1.2. Poder de Policia\n"
        "\n"
        "A remuneração dos servidores depende de lei específica de iniciativa privativa do chefe do Executivo. O teto "
        "remuneratório alcança subsídios, vantagens pessoais e gratificações de qualquer natureza. A revisão geral "
        "anual ocorre sempre na mesma data e sem distinção de índices.\n";
    const auto issues = MakeAnalyzer().analyze(document::DocumentParser::Parse(text));

    assert(issues.size() == 2);
    bool sibling = false;
    bool mismatch = false;
    for (const auto& issue : issues) {
        assert(issue.line == 9);
        if (issue.kind == HeadingIssueKind::NearDuplicate) sibling = true;
        if (issue.kind == HeadingIssueKind::SemanticMismatch) mismatch = true;
    }
    assert(sibling && mismatch);
    assert(issues[0].id != issues[1].id);
    std::cout << "[PASS] One heading flagged by two detectors" << std::endl;
}

void testCoherentDocumentIsQuiet() {
    std::cout << "[Test] Coherent headings..." << std::endl;
    const std::string text =
        "## 1. Licitação\n"
        "\n"
        "A licitação seleciona a proposta mais vantajosa e assegura a isonomia entre os licitantes. A licitação "
        "segue as fases de planejamento, publicação do edital, julgamento das propostas, habilitação dos "
        "licitantes e homologação do resultado pela autoridade competente.\n"
        "\n"
        "## 2. Sumário de Jurisprudência\n"
        "\n"
        "Texto sem relação com o título, mas o título é isento de análise por ser um sumário.\n";
    assert(MakeAnalyzer().analyze(document::DocumentParser::Parse(text)).empty());
    std::cout << "[PASS] Coherent headings" << std::endl;
}

void testDeriveTitle() {
    std::cout << "[Test] Title derivation..." << std::endl;
    assert(!HeadingSemanticsAnalyzer::DeriveTitleFromBody("Curto.", "Título"));
    assert(!HeadingSemanticsAnalyzer::DeriveTitleFromBody("| coluna com texto bem comprido | outra |", "Tabela"));

    const auto fromList = HeadingSemanticsAnalyzer::DeriveTitleFromBody(
        "- **Prazo prescricional** da pretensão indenizatória contra a Fazenda.", "Prazos");
    assert(fromList && *fromList == "Prazo prescricional da pretensão indenizatória contra a Fazenda");

    const auto upper = HeadingSemanticsAnalyzer::DeriveTitleFromBody(
        "O prazo prescricional da ação contra a Fazenda é de cinco anos.", "PRAZOS");
    assert(upper && *upper == text::ToUpperUtf8(*upper));
    assert(upper->rfind("O PRAZO PRESCRICIONAL", 0) == 0);
    std::cout << "[PASS] Title derivation" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting HeadingSemantics tests..." << std::endl;
    testTitleBodyMismatch();
    testParentChildDrift();
    testSiblingNearDuplicate();
    testDetectorsReportIndependently();
    testCoherentDocumentIsQuiet();
    testDeriveTitle();
    std::cout << "[PASS] HeadingSemantics" << std::endl;
    return 0;
}
