/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the engine configuration (rules, weights, calibration).
 *
 * Keeps JSON parsing of the configuration in one place. Every failure is
 * reported as InvalidConfiguration; nothing falls back to defaults silently.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/compliance/value_objects/EngineConfig.hpp"

namespace ethoscope::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads and validates a configuration file.
     * @param path Path to the JSON file.
     * @throws domain::compliance::InvalidConfiguration if the file is missing, unparsable or invalid.
     */
    static domain::compliance::EngineConfig LoadFromFile(const std::string& path);

    /**
     * @brief Builds and validates a configuration from parsed JSON.
     *
     * Sections that are absent keep the values of EngineConfig::Defaults();
     * an absent "rules" array keeps the default rule set unless the legacy
     * "prohibited_concepts"/"required_virtues" arrays are present.
     */
    static domain::compliance::EngineConfig Parse(const nlohmann::json& j);

    /**
     * @brief Parses a single rule object ({"kind": ..., ...}).
     */
    static domain::compliance::Rule ParseRule(const nlohmann::json& j);

    /** @brief Serializes a configuration in the format accepted by Parse(). */
    static nlohmann::json ToJson(const domain::compliance::EngineConfig& config);
};

} // namespace ethoscope::infrastructure
