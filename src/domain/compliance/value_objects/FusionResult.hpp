/**
 * @file FusionResult.hpp
 * @brief Unified output record returned to the caller.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "ComplianceResult.hpp"
#include "LinguisticSignals.hpp"

namespace ethoscope::domain::compliance {

/**
 * @struct FusionSummary
 * @brief Counters describing the inputs the coherence score was computed from.
 */
struct FusionSummary {
    int conceptCount = 0;
    int entityCount = 0;
    int relationshipCount = 0;
    int sentenceCount = 0;
    int violationCount = 0;
    int warningCount = 0;
    int priorInteractionCount = 0;
};

/**
 * @struct FusionResult
 * @brief Built fresh per request; never mutated after being returned.
 */
struct FusionResult {
    double coherence = 0.0;           ///< In [0, 1].
    double richness = 0.0;
    double conceptScore = 0.0;
    double structuralScore = 0.0;

    std::optional<SentimentSignal> sentiment;
    EmotionVector emotions;
    std::vector<Concept> concepts;
    std::vector<Entity> entities;
    std::vector<Relationship> relationships;
    LinguisticBundle linguisticFeatures;
    ComplianceResult compliance;

    std::map<std::string, double> weightsUsed;
    FusionSummary summary;
};

} // namespace ethoscope::domain::compliance
