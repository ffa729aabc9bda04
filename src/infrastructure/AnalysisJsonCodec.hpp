/**
 * @file AnalysisJsonCodec.hpp
 * @brief JSON mapping of the analyzer data contract and of the engine's results.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/compliance/value_objects/ComplianceResult.hpp"
#include "domain/compliance/value_objects/FusionResult.hpp"
#include "domain/compliance/value_objects/LinguisticSignals.hpp"

namespace ethoscope::infrastructure {

/**
 * @class AnalysisJsonCodec
 * @brief Static helpers; decoding throws MalformedInput for a missing or mistyped required field.
 */
class AnalysisJsonCodec {
public:
    /**
     * @brief Reads a full analyzer bundle.
     *
     * Required: linguistic_features, entities, concepts, relationships, emotions.
     * Optional: sentiment {label, score}, interaction {interaction_count}.
     */
    static domain::compliance::AnalysisInput DecodeAnalysisInput(const nlohmann::json& j);

    static domain::compliance::LinguisticBundle DecodeBundle(const nlohmann::json& j);
    static domain::compliance::Entity DecodeEntity(const nlohmann::json& j);
    static domain::compliance::Concept DecodeConcept(const nlohmann::json& j);
    static domain::compliance::Relationship DecodeRelationship(const nlohmann::json& j);

    static nlohmann::json EncodeBundle(const domain::compliance::LinguisticBundle& bundle);
    static nlohmann::json EncodeEntity(const domain::compliance::Entity& entity);
    static nlohmann::json EncodeConcept(const domain::compliance::Concept& item);
    static nlohmann::json EncodeRelationship(const domain::compliance::Relationship& relationship);
    static nlohmann::json EncodeFinding(const domain::compliance::Finding& finding);
    static nlohmann::json EncodeComplianceResult(const domain::compliance::ComplianceResult& result);

    /** @brief Caller-facing record. Keys are sorted, so equal results dump to equal text. */
    static nlohmann::json EncodeFusionResult(const domain::compliance::FusionResult& result);
};

} // namespace ethoscope::infrastructure
