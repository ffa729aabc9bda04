/**
 * @file CoherenceService.hpp
 * @brief Application service turning one analyzer bundle into a compliance-gated coherence result.
 */

#pragma once

#include <memory>
#include "application/EngineConfigStore.hpp"
#include "domain/compliance/value_objects/FusionResult.hpp"
#include "domain/compliance/value_objects/LinguisticSignals.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ethoscope::application {

/**
 * @class CoherenceService
 * @brief Orchestrates validation, rule evaluation, scoring and fusion.
 *
 * Stateless per request; safe to call from many threads at once. Each call
 * captures one configuration snapshot. Concepts and relationships are handed
 * to the PersistenceService afterwards without waiting for the store.
 */
class CoherenceService {
public:
    /**
     * @param configStore Source of the active configuration.
     * @param persistence Optional knowledge writer; nullptr disables persistence.
     */
    CoherenceService(std::shared_ptr<EngineConfigStore> configStore,
                     std::shared_ptr<infrastructure::PersistenceService> persistence);

    /**
     * @brief Evaluates one text.
     * @throws domain::compliance::MalformedInput if the input breaks the analyzer contract.
     */
    domain::compliance::FusionResult process(const domain::compliance::AnalysisInput& input) const;

    /**
     * @brief Checks the analyzer contract without evaluating anything.
     * @throws domain::compliance::MalformedInput on the first broken field.
     */
    static void validateInput(const domain::compliance::AnalysisInput& input);

private:
    void dispatchPersistence(const domain::compliance::LinguisticAnalysis& linguistic) const;

    std::shared_ptr<EngineConfigStore> m_configStore;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
};

} // namespace ethoscope::application
