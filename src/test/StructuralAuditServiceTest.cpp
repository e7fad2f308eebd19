#include <cassert>
#include <iostream>
#include <map>
#include <string>

#include "application/StructuralAuditService.hpp"

using namespace structaudit;
using application::MalformedInputError;
using application::StructuralAuditService;
using namespace domain::analysis;

namespace {

const std::string kLic =
    "A licitação destina-se a garantir a observância do princípio da isonomia e a seleção da proposta mais vantajosa.";
const std::string kCon =
    "O contrato administrativo é regido por cláusulas exorbitantes que conferem prerrogativas à Administração.";

StructuralAuditService QuietService() {
    return StructuralAuditService(ProfileCatalog::Defaults(), true);
}

void testMalformedInput() {
    std::cout << "[Test] Malformed input..." << std::endl;
    const auto service = QuietService();
    bool threw = false;
    try {
        service.analyze(std::string("## 1. Tema\n\xC3\x28", 13), "APOSTILA");
    } catch (const MalformedInputError&) {
        threw = true;
    }
    assert(threw && "invalid UTF-8 is rejected");

    AnalysisProfile tiny = AnalysisProfile::ForMode(AnalysisMode::Apostila);
    tiny.maxDocumentBytes = 16;
    std::map<AnalysisMode, AnalysisProfile> profiles;
    profiles[AnalysisMode::Apostila] = tiny;
    StructuralAuditService limited(ProfileCatalog(profiles), true);
    threw = false;
    try {
        limited.analyze("## 1. Um documento maior que dezesseis bytes\n", "APOSTILA");
    } catch (const MalformedInputError&) {
        threw = true;
    }
    assert(threw && "oversized document is rejected");
    std::cout << "[PASS] Malformed input" << std::endl;
}

void testModes() {
    std::cout << "[Test] Mode selection..." << std::endl;
    const auto service = QuietService();

    const auto unknown = service.analyze("## 1. Tema\n\nTexto.\n", "XYZ");
    assert(!unknown.modeRecognized);
    assert(unknown.mode == AnalysisMode::Apostila);
    assert(unknown.requestedMode == "XYZ");

    const auto hearing = service.analyze("## 1. Tema\n\nTexto.\n", "audiência");
    assert(hearing.modeRecognized);
    assert(hearing.mode == AnalysisMode::Audiencia);

    bool recognized = true;
    assert(service.profileFor("reuniao", &recognized).minParagraphChars == 60);
    assert(recognized);
    assert(service.profileFor("APOSTILA").minParagraphChars == 80);

    const auto withReference = service.analyze("## 1. Tema\n\nTexto.\n", "APOSTILA", std::string("transcrição"));
    assert(withReference.referenceProvided);
    assert(!service.analyze("## 1. Tema\n\nTexto.\n", "APOSTILA").referenceProvided);
    std::cout << "[PASS] Mode selection" << std::endl;
}

void testDeterministicReport() {
    std::cout << "[Test] Deterministic report..." << std::endl;
    const std::string text = "## 1. Licitações\n\n" + kLic + "\n\n## 2. Contratos\n\n" + kCon + "\n\n## 4. Licitações\n\n" +
                             kLic + "\n";
    const auto service = QuietService();
    const auto first = service.analyze(text, "APOSTILA");
    const auto second = service.analyze(text, "APOSTILA");

    assert(first.totalIssues() == 3);
    assert(first.findings.total() == 3);
    assert(first.totalIssues() == second.totalIssues());
    for (size_t i = 0; i < first.issues.size(); ++i) {
        assert(first.issues[i].id == second.issues[i].id);
        assert(first.issues[i].confidence == second.issues[i].confidence);
    }
    for (size_t i = 1; i < first.issues.size(); ++i) {
        const auto& a = first.issues[i - 1];
        const auto& b = first.issues[i];
        assert(static_cast<int>(a.severity) > static_cast<int>(b.severity) ||
               (a.severity == b.severity && a.confidence >= b.confidence));
    }
    std::cout << "[PASS] Deterministic report" << std::endl;
}

void testAutoFix() {
    std::cout << "[Test] Automatic fixes..." << std::endl;
    const auto service = QuietService();

    const auto renumbered = service.autoFix("## 1. Introdução\n\nTexto.\n\n## 3. Conceitos\n\nTexto.\n", "APOSTILA");
    assert(renumbered.newText == "## 1. Introdução\n\nTexto.\n\n## 2. Conceitos\n\nTexto.\n");
    assert(renumbered.fixesApplied.size() == 1);

    const std::string text = "## 1. Licitações\n\n" + kLic + "\n\n## 2. Licitações\n\n" + kLic + "\n\n## 4. Contratos\n\n" +
                             kCon + "\n";
    const auto fixed = service.autoFix(text, "APOSTILA");
    assert(fixed.newText == "## 1. Licitações\n\n" + kLic + "\n\n## 2. Contratos\n\n" + kCon + "\n");
    assert(fixed.fixesApplied.size() == 2 && "merge and renumber; the paragraph fix went stale");
    assert(fixed.skipped.size() == 1);

    const auto clean = service.autoFix(fixed.newText, "APOSTILA");
    assert(clean.newText == fixed.newText);
    assert(clean.fixesApplied.empty());

    const std::string crlf = "## 1. Tema\r\n\r\nTexto.\r\n\r\n### 1.1. Sub\r\n\r\nMais texto.\r\n";
    assert(service.analyze(crlf, "APOSTILA").issues.empty());
    const auto crlfFixed = service.autoFix(crlf, "APOSTILA");
    assert(crlfFixed.fixesApplied.empty());
    assert(crlfFixed.newText == crlf);
    std::cout << "[PASS] Automatic fixes" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting StructuralAuditService tests..." << std::endl;
    testMalformedInput();
    testModes();
    testDeterministicReport();
    testAutoFix();
    std::cout << "[PASS] StructuralAuditService" << std::endl;
    return 0;
}
