/**
 * @file CoherenceService.cpp
 * @brief Implementation of CoherenceService.
 */

#include "application/CoherenceService.hpp"
#include "domain/compliance/EngineErrors.hpp"
#include "domain/compliance/services/ConceptCategorizer.hpp"
#include "domain/compliance/services/FusionArbiter.hpp"
#include "domain/compliance/services/RichnessScorer.hpp"
#include "domain/compliance/services/RuleEngine.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ethoscope::application {

using namespace ethoscope::domain::compliance;

namespace {

bool IsUnitScore(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

CoherenceService::CoherenceService(std::shared_ptr<EngineConfigStore> configStore,
                                   std::shared_ptr<infrastructure::PersistenceService> persistence)
    : m_configStore(std::move(configStore)), m_persistence(std::move(persistence)) {
    if (!m_configStore) {
        throw std::invalid_argument("CoherenceService: config store is required.");
    }
}

void CoherenceService::validateInput(const AnalysisInput& input) {
    if (!input.emotions) {
        throw MalformedInput("EmotionVector is missing.");
    }
    for (const auto& [label, score] : *input.emotions) {
        if (!IsUnitScore(score)) {
            throw MalformedInput("emotion '" + label + "' score must lie in [0, 1].");
        }
    }

    const auto& bundle = input.linguistic.bundle;
    if (bundle.tokenCount < 0) throw MalformedInput("tokenCount must not be negative.");
    if (bundle.sentenceCount < 0) throw MalformedInput("sentenceCount must not be negative.");
    if (!std::isfinite(bundle.avgTokenLength) || bundle.avgTokenLength < 0.0) {
        throw MalformedInput("avgTokenLength must be a non-negative number.");
    }
    for (const auto& [pos, count] : bundle.posDistribution) {
        if (count < 0) throw MalformedInput("POS count for '" + pos + "' must not be negative.");
    }

    if (input.sentiment && !IsUnitScore(input.sentiment->confidence)) {
        throw MalformedInput("sentiment confidence must lie in [0, 1].");
    }
    if (input.interaction && input.interaction->priorInteractionCount < 0) {
        throw MalformedInput("priorInteractionCount must not be negative.");
    }
}

FusionResult CoherenceService::process(const AnalysisInput& input) const {
    validateInput(input);

    // One snapshot for the whole request.
    const std::shared_ptr<const EngineConfig> config = m_configStore->current();

    const RuleEngine engine;
    ComplianceResult compliance = engine.evaluate(input.linguistic, *input.emotions, config->rules);
    if (!compliance.compliant) {
        std::cerr << "[CoherenceService] " << compliance.violations.size()
                  << " violation(s); first: " << compliance.violations.front().reason << std::endl;
    }

    const double richness = RichnessScorer::score(input.linguistic.bundle, config->richness);

    const FusionArbiter arbiter(config->fusion);
    FusionResult result = arbiter.fuse(compliance,
                                       richness,
                                       input.linguistic.concepts.size(),
                                       input.sentiment,
                                       input.interaction,
                                       input.linguistic,
                                       *input.emotions);

    dispatchPersistence(input.linguistic);

    std::ostringstream line;
    line << std::fixed << std::setprecision(3) << result.coherence;
    std::cout << "[CoherenceService] Fusion complete. Coherence: " << line.str() << std::endl;
    return result;
}

void CoherenceService::dispatchPersistence(const LinguisticAnalysis& linguistic) const {
    if (!m_persistence) return;

    for (const auto& item : linguistic.concepts) {
        Concept stored = item;
        if (stored.category.empty()) {
            stored.category = ConceptCategorizer::categorize(stored.entityType);
        }
        m_persistence->submitConcept(stored, 1);
    }
    for (const auto& rel : linguistic.relationships) {
        m_persistence->submitRelationship(rel, rel.strength);
    }
}

} // namespace ethoscope::application
