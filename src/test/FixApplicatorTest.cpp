#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/FixApplicator.hpp"
#include "application/StructuralAuditService.hpp"
#include "domain/analysis/TablePlacementAnalyzer.hpp"
#include "domain/document/Document.hpp"

using namespace structaudit;
using application::SkipReason;
using application::StructuralAuditService;
using domain::analysis::AnalysisMode;
using domain::analysis::AnalysisProfile;
using domain::analysis::FixAction;
using domain::analysis::FixIssue;
using domain::analysis::ProfileCatalog;
using domain::analysis::TablePlacementAnalyzer;
using domain::document::DocumentParser;

namespace {

const std::string kLic =
    "A licitação destina-se a garantir a observância do princípio da isonomia e a seleção da proposta mais vantajosa.";
const std::string kCon =
    "O contrato administrativo é regido por cláusulas exorbitantes que conferem prerrogativas à Administração.";

StructuralAuditService QuietService() {
    return StructuralAuditService(ProfileCatalog::Defaults(), true);
}

std::vector<FixIssue> Select(const std::vector<FixIssue>& issues, FixAction action) {
    std::vector<FixIssue> picked;
    for (const auto& issue : issues) {
        if (issue.action == action) picked.push_back(issue);
    }
    return picked;
}

std::vector<FixIssue> SelectType(const std::vector<FixIssue>& issues, const std::string& type) {
    std::vector<FixIssue> picked;
    for (const auto& issue : issues) {
        if (issue.type == type) picked.push_back(issue);
    }
    return picked;
}

application::FixApplicator Applicator() {
    return application::FixApplicator(AnalysisProfile::ForMode(AnalysisMode::Apostila));
}

void testRemoveExactDuplicate() {
    std::cout << "[Test] Remove exact duplicate paragraph..." << std::endl;
    const std::string p =
        "A responsabilidade civil do Estado exige a demonstração do dano e do nexo causal entre a conduta e o resultado.";
    const std::string text = "## 1. Responsabilidade\n\n" + p + "\n\nTexto curto de ligação.\n\n" + p + "\n";

    const auto report = QuietService().analyze(text, "APOSTILA");
    const auto removals = Select(report.issues, FixAction::Remove);
    assert(removals.size() == 1);
    assert(removals[0].autoApplicable);

    const auto result = Applicator().apply(text, removals);
    assert(result.fixesApplied.size() == 1);
    assert(result.skipped.empty());
    assert(result.newText == "## 1. Responsabilidade\n\n" + p + "\n\nTexto curto de ligação.\n");
    assert(result.newSize < result.originalSize);
    assert(result.fixesApplied[0].rfind("REMOVE " + removals[0].id, 0) == 0);
    std::cout << "[PASS] Remove exact duplicate paragraph" << std::endl;
}

void testRemoveNearDuplicateKeepsFirst() {
    std::cout << "[Test] Remove near duplicate keeps the first paragraph..." << std::endl;
    const std::string a =
        "No processo 1001234, a parte autora recorreu da decisão que fixou a multa no processo principal, e a parte "
        "autora sustentou que a decisão sobre a multa no processo principal ignorou o prazo da parte autora para "
        "cumprir a decisão.";
    const std::string b =
        "No processo 1001289, a parte autora recorre da decisão que fixou a multa no processo principal, e a parte "
        "autora sustentou que a decisão sobre a multa no processo principal ignora o prazo da parte autora para "
        "cumpra a decisão.";
    const std::string text = "## 1. Recursos\n\n" + a + "\n\n" + b + "\n";

    const auto report = QuietService().analyze(text, "APOSTILA");
    const auto removals = SelectType(report.issues, "duplicate_paragraph");
    assert(removals.size() == 1);
    assert(!removals[0].autoApplicable && "gray-zone near duplicates need review");

    const auto result = Applicator().apply(text, removals);
    assert(result.newText == "## 1. Recursos\n\n" + a + "\n");
    std::cout << "[PASS] Remove near duplicate keeps the first paragraph" << std::endl;
}

void testMergeThenStaleRemove() {
    std::cout << "[Test] Merge section, then skip the stale paragraph fix..." << std::endl;
    const std::string text = "## 1. Licitações\n\n" + kLic + "\n\n## 2. Contratos\n\n" + kCon + "\n\n## 3. Licitações\n\n" +
                             kLic + "\n";
    const auto report = QuietService().analyze(text, "APOSTILA");
    assert(report.issues.size() == 2);
    assert(report.issues[0].action == FixAction::Merge && "section fix sorts before the paragraph inside it");
    assert(report.issues[1].action == FixAction::Remove);

    const auto result = Applicator().apply(text, report.issues);
    assert(result.fixesApplied.size() == 1);
    assert(result.skipped.size() == 1);
    assert(result.skipped[0].issueId == report.issues[1].id);
    assert(result.skipped[0].reason == SkipReason::FixNotApplicable);
    assert(result.newText == "## 1. Licitações\n\n" + kLic + "\n\n## 2. Contratos\n\n" + kCon + "\n");
    std::cout << "[PASS] Merge section, then skip the stale paragraph fix" << std::endl;
}

void testMergeKeepsUniqueSubsections() {
    std::cout << "[Test] Merge keeps the dropped section's own subsections..." << std::endl;
    const std::string intro =
        "O regime jurídico administrativo assenta na supremacia do interesse público e na indisponibilidade do "
        "interesse público pela Administração.";
    const std::string supremacy = "A supremacia do interesse público justifica as prerrogativas da Administração.";
    const std::string selfReview = "A autotutela permite anular atos ilegais e revogar atos inconvenientes, nos termos da "
                                   "súmula 473 do STF.";
    const std::string text = "## 1. Regime Jurídico\n\n" + intro + "\n\n### 1.1. Supremacia do Interesse Público\n\n" +
                             supremacy + "\n\n## 2. Regime Jurídico\n\n" + intro + "\n\n### 2.1. Autotutela\n\n" +
                             selfReview + "\n";

    const auto service = QuietService();
    const auto merges = Select(service.analyze(text, "APOSTILA").issues, FixAction::Merge);
    assert(merges.size() == 1);
    assert(merges[0].autoApplicable);

    const auto result = Applicator().apply(text, merges);
    assert(result.fixesApplied.size() == 1);
    assert(result.newText == "## 1. Regime Jurídico\n\n" + intro + "\n\n### 1.1. Supremacia do Interesse Público\n\n" +
                                 supremacy + "\n\n### 2.1. Autotutela\n\n" + selfReview + "\n");

    const auto fixed = service.autoFix(text, "APOSTILA");
    assert(fixed.newText.find("Autotutela") != std::string::npos);
    assert(fixed.newText.find("súmula 473") != std::string::npos);
    assert(fixed.newText.find("## 2. Regime Jurídico") == std::string::npos);
    std::cout << "[PASS] Merge keeps the dropped section's own subsections" << std::endl;
}

void testRenumberRunsLast() {
    std::cout << "[Test] Renumbering runs after structural fixes..." << std::endl;
    const std::string text = "## 1. Licitações\n\n" + kLic + "\n\n## 2. Licitações\n\n" + kLic + "\n\n## 4. Contratos\n\n" +
                             kCon + "\n";
    const auto report = QuietService().analyze(text, "APOSTILA");

    std::vector<FixIssue> approved = Select(report.issues, FixAction::Renumber);
    assert(approved.size() == 1);
    for (const auto& merge : Select(report.issues, FixAction::Merge)) approved.push_back(merge);
    assert(approved.size() == 2);

    const auto result = Applicator().apply(text, approved);
    assert(result.skipped.empty());
    assert(result.newText == "## 1. Licitações\n\n" + kLic + "\n\n## 2. Contratos\n\n" + kCon + "\n");

    const auto again = Applicator().apply(result.newText, Select(report.issues, FixAction::Renumber));
    assert(again.fixesApplied.empty());
    assert(again.skipped.size() == 1 && again.skipped[0].detail == "numbering already consistent");
    assert(again.newText == result.newText);
    std::cout << "[PASS] Renumbering runs after structural fixes" << std::endl;
}

void testMoveIntroTableToSectionEnd() {
    std::cout << "[Test] Move table to the end of its H2 section..." << std::endl;
    const std::string text =
        "## 1. Atos Administrativos\n"
        "\n"
        "#### Quadro-síntese: Atos\n"
        "\n"
        "| Atributo | Descrição |\n"
        "| --- | --- |\n"
        "| Presunção | legitimidade |\n"
        "| Imperatividade | coercitividade |\n"
        "\n"
        "### 1.1. Conceito\n"
        "\n"
        "Ato administrativo é a manifestação unilateral de vontade da Administração.\n"
        "\n"
        "### 1.2. Atributos\n"
        "\n"
        "Os atributos distinguem o ato administrativo dos atos privados.\n";
    const std::string expected =
        "## 1. Atos Administrativos\n"
        "\n"
        "### 1.1. Conceito\n"
        "\n"
        "Ato administrativo é a manifestação unilateral de vontade da Administração.\n"
        "\n"
        "### 1.2. Atributos\n"
        "\n"
        "Os atributos distinguem o ato administrativo dos atos privados.\n"
        "\n"
        "#### Quadro-síntese: Atos\n"
        "\n"
        "| Atributo | Descrição |\n"
        "| --- | --- |\n"
        "| Presunção | legitimidade |\n"
        "| Imperatividade | coercitividade |\n";

    const auto service = QuietService();
    const auto moves = Select(service.analyze(text, "APOSTILA").issues, FixAction::Move);
    assert(moves.size() == 1);
    assert(moves[0].autoApplicable);

    const auto result = Applicator().apply(text, moves);
    assert(result.newText == expected);
    assert(result.moveOutcomes.size() == 1 && result.moveOutcomes[0].success);
    assert(TablePlacementAnalyzer::Signature(DocumentParser::Parse(text)) ==
           TablePlacementAnalyzer::Signature(DocumentParser::Parse(result.newText)));

    // Re-analysis proposes no further move.
    assert(Select(service.analyze(result.newText, "APOSTILA").issues, FixAction::Move).empty());
    std::cout << "[PASS] Move table to the end of its H2 section" << std::endl;
}

void testMoveSubtopicTableToParent() {
    std::cout << "[Test] Move table back to its parent topic..." << std::endl;
    const std::string text =
        "## 1. Atos\n"
        "\n"
        "Intro curta.\n"
        "\n"
        "### 1.1. Atos Vinculados e Discricionários\n"
        "\n"
        "Os atos discricionários admitem juízo de conveniência e oportunidade pelo administrador.\n"
        "\n"
        "#### 1.1.1. Motivação\n"
        "\n"
        "A motivação expõe os fundamentos de fato e de direito do ato.\n"
        "\n"
        "#### Quadro-síntese: Discricionariedade\n"
        "\n"
        "| Ato | Conveniência | Oportunidade |\n"
        "| --- | --- | --- |\n"
        "| Discricionário | juízo do administrador | sim |\n";
    const std::string expected =
        "## 1. Atos\n"
        "\n"
        "Intro curta.\n"
        "\n"
        "### 1.1. Atos Vinculados e Discricionários\n"
        "\n"
        "Os atos discricionários admitem juízo de conveniência e oportunidade pelo administrador.\n"
        "\n"
        "#### Quadro-síntese: Discricionariedade\n"
        "\n"
        "| Ato | Conveniência | Oportunidade |\n"
        "| --- | --- | --- |\n"
        "| Discricionário | juízo do administrador | sim |\n"
        "\n"
        "#### 1.1.1. Motivação\n"
        "\n"
        "A motivação expõe os fundamentos de fato e de direito do ato.\n";

    const auto service = QuietService();
    const auto moves = Select(service.analyze(text, "APOSTILA").issues, FixAction::Move);
    assert(moves.size() == 1);

    const auto result = Applicator().apply(text, moves);
    assert(result.newText == expected);
    assert(Select(service.analyze(result.newText, "APOSTILA").issues, FixAction::Move).empty());
    std::cout << "[PASS] Move table back to its parent topic" << std::endl;
}

void testMoveH3TableToH2Topic() {
    std::cout << "[Test] Move table from a second H3 back to the H2 topic..." << std::endl;
    const std::string intro =
        "## 1. Licitação: modalidades pregão concorrência leilão\n"
        "\n"
        "As modalidades de licitação incluem pregão, concorrência e leilão, cada uma com rito próprio.\n"
        "\n"
        "### 1.1. Fase Preparatória\n"
        "\n"
        "O planejamento da contratação exige estudo técnico preliminar e termo de referência.\n"
        "\n";
    const std::string appeals =
        "### 1.2. Prazos Recursais\n"
        "\n"
        "O prazo para interposição de recurso administrativo conta da intimação do ato.\n";
    const std::string table =
        "#### Quadro-síntese: modalidades licitação\n"
        "\n"
        "| Modalidade | Critério |\n"
        "| --- | --- |\n"
        "| Pregão | menor preço |\n"
        "| Concorrência | técnica e preço |\n"
        "| Leilão | maior lance |\n";

    const auto service = QuietService();
    const std::string text = intro + appeals + "\n" + table;
    const auto moves = Select(service.analyze(text, "APOSTILA").issues, FixAction::Move);
    assert(moves.size() == 1);

    const auto result = Applicator().apply(text, moves);
    assert(result.fixesApplied.size() == 1);
    assert(result.newText == intro + table + "\n" + appeals);
    assert(Select(service.analyze(result.newText, "APOSTILA").issues, FixAction::Move).empty());
    std::cout << "[PASS] Move table from a second H3 back to the H2 topic" << std::endl;
}

void testMoveRolledBackOnIntegrityViolation() {
    std::cout << "[Test] Move that would swallow the table is rolled back..." << std::endl;
    const std::string text =
        "## 1. Tema\n"
        "\n"
        "Introdução breve do tema.\n"
        "\n"
        "#### Quadro-síntese: Tema\n"
        "\n"
        "| A | B |\n"
        "| --- | --- |\n"
        "| 1 | 2 |\n"
        "\n"
        "### 1.1. Subtema\n"
        "\n"
        "Texto do subtema.\n"
        "\n"
        "```\n"
        "codigo sem fechamento\n";
    const auto moves = Select(QuietService().analyze(text, "APOSTILA").issues, FixAction::Move);
    assert(moves.size() == 1);

    const auto result = Applicator().apply(text, moves);
    assert(result.fixesApplied.empty());
    assert(result.skipped.size() == 1);
    assert(result.skipped[0].reason == SkipReason::IntegrityViolation);
    assert(result.moveOutcomes.size() == 1 && !result.moveOutcomes[0].success);
    assert(result.newText == text);
    std::cout << "[PASS] Move that would swallow the table is rolled back" << std::endl;
}

void testRenameAndStaleRename() {
    std::cout << "[Test] Rename heading, then the same fix again..." << std::endl;
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
    const auto renames = SelectType(QuietService().analyze(text, "APOSTILA").issues, "heading_semantic");
    assert(renames.size() == 1);
    assert(!renames[0].autoApplicable);

    const auto result = Applicator().apply(text, renames);
    assert(result.fixesApplied.size() == 1);
    assert(result.newText.find("### 1.1. A licitação pública é o procedimento") != std::string::npos);
    assert(result.newText.find("Introdução Geral") == std::string::npos);

    const auto stale = Applicator().apply(result.newText, renames);
    assert(stale.fixesApplied.empty());
    assert(stale.skipped.size() == 1 && stale.skipped[0].reason == SkipReason::FixNotApplicable);
    assert(stale.newText == result.newText);
    std::cout << "[PASS] Rename heading, then the same fix again" << std::endl;
}

void testEmptyApprovalIsIdentity() {
    std::cout << "[Test] Empty approval..." << std::endl;
    const std::string text = "## 1. Tema\n\nTexto.\n";
    const auto result = Applicator().apply(text, {});
    assert(result.newText == text);
    assert(result.originalSize == result.newSize);
    assert(result.fixesApplied.empty() && result.skipped.empty());
    std::cout << "[PASS] Empty approval" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting FixApplicator tests..." << std::endl;
    testRemoveExactDuplicate();
    testRemoveNearDuplicateKeepsFirst();
    testMergeThenStaleRemove();
    testMergeKeepsUniqueSubsections();
    testRenumberRunsLast();
    testMoveIntroTableToSectionEnd();
    testMoveSubtopicTableToParent();
    testMoveH3TableToH2Topic();
    testMoveRolledBackOnIntegrityViolation();
    testRenameAndStaleRename();
    testEmptyApprovalIsIdentity();
    std::cout << "[PASS] FixApplicator" << std::endl;
    return 0;
}
