/**
 * @file FusionArbiter.hpp
 * @brief Combines the compliance verdict and quality signals into one coherence score.
 */

#pragma once

#include <optional>
#include "domain/compliance/value_objects/ComplianceResult.hpp"
#include "domain/compliance/value_objects/EngineConfig.hpp"
#include "domain/compliance/value_objects/FusionResult.hpp"
#include "domain/compliance/value_objects/LinguisticSignals.hpp"

namespace ethoscope::domain::compliance {

/**
 * @class FusionArbiter
 * @brief Pure aggregation step with a single computed field (coherence).
 *
 * structuralScore = wCompliance * [compliant] + wRichness * richness + wConcept * conceptScore
 * coherence       = structuralScore                                   (no sentiment signal)
 *                 = wStructural * structuralScore + wSentiment * confidence  (otherwise)
 * The result is clamped to [0, 1]. The interaction context is reported but
 * does not move the score.
 */
class FusionArbiter {
public:
    explicit FusionArbiter(FusionSettings settings);

    /**
     * @brief Builds the unified result record.
     * @param compliance Verdict of the rule engine.
     * @param richness Output of the RichnessScorer, in [0, 1].
     * @param conceptCount Number of concepts extracted from the text.
     * @param sentiment Optional dominant-emotion confidence.
     * @param interaction Optional prior-interaction context.
     * @param linguistic Passed through unmodified.
     * @param emotions Passed through unmodified.
     */
    FusionResult fuse(const ComplianceResult& compliance,
                      double richness,
                      size_t conceptCount,
                      const std::optional<SentimentSignal>& sentiment,
                      const std::optional<InteractionContext>& interaction,
                      const LinguisticAnalysis& linguistic,
                      const EmotionVector& emotions) const;

    /** @brief min(1, conceptCount / K). */
    double conceptScore(size_t conceptCount) const;

    double structuralScore(bool compliant, double richness, double conceptTerm) const;

private:
    FusionSettings m_settings;
};

} // namespace ethoscope::domain::compliance
