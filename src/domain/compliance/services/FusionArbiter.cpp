/**
 * @file FusionArbiter.cpp
 * @brief Implementation of FusionArbiter.
 */

#include "domain/compliance/services/FusionArbiter.hpp"

#include <algorithm>

namespace ethoscope::domain::compliance {

FusionArbiter::FusionArbiter(FusionSettings settings) : m_settings(std::move(settings)) {}

double FusionArbiter::conceptScore(size_t conceptCount) const {
    return std::min(1.0, static_cast<double>(conceptCount) / m_settings.conceptNormalization);
}

double FusionArbiter::structuralScore(bool compliant, double richness, double conceptTerm) const {
    const auto& w = m_settings.structural;
    const double complianceTerm = compliant ? 1.0 : 0.0;
    return complianceTerm * w.compliance + richness * w.richness + conceptTerm * w.concepts;
}

FusionResult FusionArbiter::fuse(const ComplianceResult& compliance,
                                 double richness,
                                 size_t conceptCount,
                                 const std::optional<SentimentSignal>& sentiment,
                                 const std::optional<InteractionContext>& interaction,
                                 const LinguisticAnalysis& linguistic,
                                 const EmotionVector& emotions) const {
    FusionResult result;
    result.richness = richness;
    result.conceptScore = conceptScore(conceptCount);
    result.structuralScore = structuralScore(compliance.compliant, richness, result.conceptScore);

    double structuralWeight = 1.0;
    double sentimentWeight = 0.0;
    double coherence = result.structuralScore;
    if (sentiment) {
        structuralWeight = m_settings.fusion.structural;
        sentimentWeight = m_settings.fusion.sentiment;
        coherence = structuralWeight * result.structuralScore + sentimentWeight * sentiment->confidence;
    }
    result.coherence = std::clamp(coherence, 0.0, 1.0);

    result.weightsUsed = {
        {"structural", structuralWeight},
        {"sentiment", sentimentWeight},
        {"compliance", m_settings.structural.compliance},
        {"richness", m_settings.structural.richness},
        {"concept", m_settings.structural.concepts}
    };

    result.sentiment = sentiment;
    result.emotions = emotions;
    result.concepts = linguistic.concepts;
    result.entities = linguistic.entities;
    result.relationships = linguistic.relationships;
    result.linguisticFeatures = linguistic.bundle;
    result.compliance = compliance;

    result.summary.conceptCount = static_cast<int>(conceptCount);
    result.summary.entityCount = static_cast<int>(linguistic.entities.size());
    result.summary.relationshipCount = static_cast<int>(linguistic.relationships.size());
    result.summary.sentenceCount = linguistic.bundle.sentenceCount;
    result.summary.violationCount = static_cast<int>(compliance.violations.size());
    result.summary.warningCount = static_cast<int>(compliance.warnings.size());
    result.summary.priorInteractionCount = interaction ? interaction->priorInteractionCount : 0;
    return result;
}

} // namespace ethoscope::domain::compliance
