#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "domain/analysis/SimilarityEngine.hpp"

using namespace structaudit::domain::analysis;

namespace {

bool Near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

void testTokens() {
    std::cout << "[Test] Token extraction..." << std::endl;
    const TokenSet tokens = SimilarityEngine::Tokens("Os processos de Licitação em 2024 para obras", 4);
    assert(tokens.count("processos"));
    assert(tokens.count("licitacao"));
    assert(tokens.count("obras"));
    assert(!tokens.count("2024") && "numbers are not tokens");
    assert(!tokens.count("para") && "stopwords are dropped");
    assert(tokens.size() == 3);

    assert(SimilarityEngine::Tokens("ato lei", 3).count("ato"));
    assert(SimilarityEngine::Tokens("ato lei", 4).empty());
    std::cout << "[PASS] Token extraction" << std::endl;
}

void testSetMeasures() {
    std::cout << "[Test] Jaccard and coverage..." << std::endl;
    const TokenSet a = {"licitacao", "pregao"};
    const TokenSet b = {"pregao", "contrato"};
    assert(Near(SimilarityEngine::Jaccard(a, b), 1.0 / 3.0));
    assert(Near(SimilarityEngine::Jaccard(a, a), 1.0));
    assert(Near(SimilarityEngine::Jaccard({}, {}), 0.0));
    assert(Near(SimilarityEngine::Coverage(a, {"licitacao"}), 0.5));
    assert(Near(SimilarityEngine::Coverage({}, b), 0.0));
    std::cout << "[PASS] Jaccard and coverage" << std::endl;
}

void testSequenceRatio() {
    std::cout << "[Test] Sequence ratio..." << std::endl;
    assert(Near(SimilarityEngine::SequenceRatio("", ""), 1.0));
    assert(Near(SimilarityEngine::SequenceRatio("abcd", "abcd"), 1.0));
    assert(Near(SimilarityEngine::SequenceRatio("abc", "xyz"), 0.0));
    assert(Near(SimilarityEngine::SequenceRatio("abcd", "bcde"), 0.75));
    // Code points, not bytes: one accented letter differs by exactly one unit.
    assert(Near(SimilarityEngine::SequenceRatio("acao", "ação"), 0.5));
    assert(SimilarityEngine::QuickRatio("abcd", "dcba") >= SimilarityEngine::SequenceRatio("abcd", "dcba"));
    assert(Near(SimilarityEngine::QuickRatio("abcd", "dcba"), 1.0));
    std::cout << "[PASS] Sequence ratio" << std::endl;
}

void testLegitimateRepetition() {
    std::cout << "[Test] Legitimate repetition..." << std::endl;
    assert(SimilarityEngine::IsLegitimateRepetition(
        "Art. 37 da Constituição Federal: a administração pública obedecerá aos princípios da legalidade."));
    assert(SimilarityEngine::IsLegitimateRepetition("Súmula 473 do STF: a administração pode anular seus próprios atos."));
    assert(SimilarityEngine::IsLegitimateRepetition("| Coluna | Valor |"));
    assert(SimilarityEngine::IsLegitimateRepetition("#### Quadro-síntese"));
    assert(SimilarityEngine::IsLegitimateRepetition("Quadro-síntese dos atos administrativos"));
    assert(SimilarityEngine::IsLegitimateRepetition("Conforme decidido no RE 1234, a tese foi fixada."));
    assert(SimilarityEngine::IsLegitimateRepetition("   "));

    assert(!SimilarityEngine::IsLegitimateRepetition(
        "A responsabilidade civil do Estado exige a demonstração do dano e do nexo causal."));
    assert(!SimilarityEngine::IsLegitimateRepetition("O recurso foi interposto tempestivamente pela parte autora."));
    std::cout << "[PASS] Legitimate repetition" << std::endl;
}

void testConfidence() {
    std::cout << "[Test] Duplicate confidence..." << std::endl;
    assert(Near(SimilarityEngine::Confidence(MatchKind::Exact, 0.1, 0.1, 0.92), 0.99));
    assert(Near(SimilarityEngine::Confidence(MatchKind::Near, 0.92, 0.6, 0.92), 0.62 + 0.38 * 0.6));
    assert(Near(SimilarityEngine::Confidence(MatchKind::Near, 0.46, 0.0, 0.92), 0.31));
    assert(SimilarityEngine::Confidence(MatchKind::Near, 1.0, 1.0, 0.92) <= 0.98);
    std::cout << "[PASS] Duplicate confidence" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SimilarityEngine tests..." << std::endl;
    testTokens();
    testSetMeasures();
    testSequenceRatio();
    testLegitimateRepetition();
    testConfidence();
    std::cout << "[PASS] SimilarityEngine" << std::endl;
    return 0;
}
