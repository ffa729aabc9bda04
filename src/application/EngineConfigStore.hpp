/**
 * @file EngineConfigStore.hpp
 * @brief Holds the currently published engine configuration and swaps it on reload.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "domain/compliance/value_objects/EngineConfig.hpp"

namespace ethoscope::application {

/**
 * @class EngineConfigStore
 * @brief Publishes immutable configuration snapshots.
 *
 * Readers take a shared_ptr to the current snapshot and keep using it for
 * the whole request, so they observe either the old or the new configuration,
 * never a mix. A rejected configuration leaves the active one in place.
 */
class EngineConfigStore {
public:
    /** @brief Starts with EngineConfig::Defaults(). */
    EngineConfigStore();

    /**
     * @brief Starts with the given configuration.
     * @throws domain::compliance::InvalidConfiguration if it does not validate.
     */
    explicit EngineConfigStore(domain::compliance::EngineConfig initial);

    /** @brief Thread-safe snapshot of the active configuration. */
    std::shared_ptr<const domain::compliance::EngineConfig> current() const;

    /**
     * @brief Validates and atomically replaces the active configuration.
     * @throws domain::compliance::InvalidConfiguration, leaving the old snapshot active.
     */
    void publish(domain::compliance::EngineConfig config);

    /**
     * @brief Loads a JSON configuration file and publishes it.
     * @return false (and logs) if the file could not be loaded or validated.
     */
    bool reloadFromFile(const std::string& path);

    /** @brief Number of configurations published so far, including the initial one. */
    unsigned long generation() const;

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<const domain::compliance::EngineConfig> m_current;
    unsigned long m_generation = 0;
};

} // namespace ethoscope::application
