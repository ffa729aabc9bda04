/**
 * @file EngineConfigStore.cpp
 * @brief Implementation of EngineConfigStore.
 */

#include "application/EngineConfigStore.hpp"
#include "infrastructure/ConfigLoader.hpp"

#include <iostream>

namespace ethoscope::application {

using domain::compliance::EngineConfig;

EngineConfigStore::EngineConfigStore() : EngineConfigStore(EngineConfig::Defaults()) {}

EngineConfigStore::EngineConfigStore(EngineConfig initial) {
    initial.validate();
    m_current = std::make_shared<const EngineConfig>(std::move(initial));
    m_generation = 1;
}

std::shared_ptr<const EngineConfig> EngineConfigStore::current() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

void EngineConfigStore::publish(EngineConfig config) {
    // Validate outside the lock; readers keep the old snapshot until the swap.
    config.validate();
    const size_t ruleCount = config.rules.size();
    auto next = std::make_shared<const EngineConfig>(std::move(config));
    unsigned long published = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_current = std::move(next);
        published = ++m_generation;
    }
    std::cout << "[EngineConfigStore] Published configuration #" << published
              << " (" << ruleCount << " rules)." << std::endl;
}

bool EngineConfigStore::reloadFromFile(const std::string& path) {
    try {
        publish(infrastructure::ConfigLoader::LoadFromFile(path));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[EngineConfigStore] Reload from " << path << " rejected, keeping active configuration: "
                  << e.what() << std::endl;
    }
    return false;
}

unsigned long EngineConfigStore::generation() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

} // namespace ethoscope::application
