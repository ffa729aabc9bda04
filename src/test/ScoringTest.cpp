#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "domain/compliance/services/FusionArbiter.hpp"
#include "domain/compliance/services/RichnessScorer.hpp"

using namespace ethoscope::domain::compliance;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

LinguisticBundle BundleWith(int tokens, int posCategories) {
    static const char* tags[] = {"NOUN", "VERB", "ADJ", "ADV", "PRON", "DET", "ADP", "AUX", "CCONJ", "PUNCT"};
    LinguisticBundle bundle;
    bundle.tokenCount = tokens;
    for (int i = 0; i < posCategories; ++i) {
        bundle.posDistribution[tags[i]] = 1;
    }
    return bundle;
}

void TestRichness() {
    const RichnessSettings settings;
    assert(Near(RichnessScorer::score(BundleWith(20, 5), settings), 1.0));
    assert(Near(RichnessScorer::score(BundleWith(10, 5), settings), 0.5));
    assert(Near(RichnessScorer::score(BundleWith(40, 10), settings), 1.0));
    assert(Near(RichnessScorer::score(BundleWith(14, 4), settings), 0.56));

    // No signal is a valid input.
    assert(Near(RichnessScorer::score(BundleWith(0, 0), settings), 0.0));
    assert(Near(RichnessScorer::score(BundleWith(12, 0), settings), 0.0));

    // Zero-count categories add no diversity.
    auto bundle = BundleWith(20, 4);
    bundle.posDistribution["X"] = 0;
    assert(RichnessScorer::posDiversity(bundle) == 4);

    // Calibration points are configuration.
    RichnessSettings tight;
    tight.tokenNorm = 10.0;
    tight.posNorm = 2.0;
    assert(Near(RichnessScorer::score(BundleWith(5, 2), tight), 0.5));
}

void TestFusionFormula() {
    FusionSettings settings;  // 0.6/0.2/0.2, K = 5
    FusionArbiter arbiter(settings);

    ComplianceResult compliant;
    compliant.compliant = true;
    compliant.requiredValuesPresent = {"respect", "fairness"};

    LinguisticAnalysis linguistic;
    linguistic.bundle = BundleWith(14, 4);
    linguistic.bundle.sentenceCount = 2;
    Entity e;
    e.text = "Alice";
    e.label = "PERSON";
    linguistic.entities.push_back(e);

    const double richness = 0.56;
    auto result = arbiter.fuse(compliant, richness, 3, std::nullopt, std::nullopt, linguistic, {});
    assert(Near(result.conceptScore, 0.6));
    assert(Near(result.structuralScore, 0.832));
    assert(Near(result.coherence, 0.832));
    assert(Near(result.weightsUsed.at("structural"), 1.0));
    assert(Near(result.weightsUsed.at("sentiment"), 0.0));
    assert(Near(result.weightsUsed.at("compliance"), 0.6));
    assert(result.summary.conceptCount == 3);
    assert(result.summary.entityCount == 1);
    assert(result.summary.sentenceCount == 2);
    assert(result.entities.size() == 1 && result.entities[0].text == "Alice");
    assert(result.compliance == compliant);

    // Idempotent
    auto again = arbiter.fuse(compliant, richness, 3, std::nullopt, std::nullopt, linguistic, {});
    assert(result.coherence == again.coherence);

    // Sentiment blends in with the fusion weights.
    SentimentSignal sentiment{"joy", 0.5};
    auto blended = arbiter.fuse(compliant, richness, 3, sentiment, std::nullopt, linguistic, {{"joy", 0.5}});
    assert(Near(blended.coherence, 0.66 * 0.832 + 0.34 * 0.5));
    assert(Near(blended.weightsUsed.at("structural"), 0.66));
    assert(Near(blended.weightsUsed.at("sentiment"), 0.34));
    assert(blended.sentiment && blended.sentiment->label == "joy");
    assert(blended.emotions.at("joy") == 0.5);

    // A violation removes the compliance term.
    ComplianceResult blocked;
    blocked.compliant = false;
    Finding finding;
    finding.ruleKind = "prohibited_concept";
    finding.severity = Severity::Violation;
    blocked.violations.push_back(finding);
    auto gated = arbiter.fuse(blocked, richness, 3, std::nullopt, std::nullopt, linguistic, {});
    assert(Near(gated.coherence, 0.232));
    assert(gated.summary.violationCount == 1);

    // Concept score saturates; the interaction context is reported only.
    InteractionContext interaction{7};
    auto saturated = arbiter.fuse(compliant, 1.0, 50, std::nullopt, interaction, linguistic, {});
    assert(Near(saturated.conceptScore, 1.0));
    assert(Near(saturated.coherence, 1.0));
    assert(saturated.summary.priorInteractionCount == 7);
    auto withoutContext = arbiter.fuse(compliant, 1.0, 50, std::nullopt, std::nullopt, linguistic, {});
    assert(saturated.coherence == withoutContext.coherence);
}

void TestConfiguredNormalization() {
    FusionSettings settings;
    settings.conceptNormalization = 10.0;
    settings.structural = {0.5, 0.25, 0.25};
    FusionArbiter arbiter(settings);

    assert(Near(arbiter.conceptScore(3), 0.3));
    assert(Near(arbiter.conceptScore(0), 0.0));
    assert(Near(arbiter.structuralScore(true, 0.4, 0.3), 0.5 + 0.1 + 0.075));
}

} // namespace

int main() {
    std::cout << "[Test] Starting Scoring Test..." << std::endl;

    TestRichness();
    TestFusionFormula();
    TestConfiguredNormalization();

    std::cout << "[PASS] Scoring Test." << std::endl;
    return 0;
}
