/**
 * @file RichnessScorer.hpp
 * @brief Domain service deriving a linguistic-quality signal from token statistics.
 */

#pragma once

#include <algorithm>
#include "domain/compliance/value_objects/EngineConfig.hpp"
#include "domain/compliance/value_objects/LinguisticSignals.hpp"

namespace ethoscope::domain::compliance {

class RichnessScorer {
public:
    /**
     * @brief min(1, (tokenCount / tokenNorm) * (posDiversity / posNorm)).
     *
     * Volume and grammatical variety are rewarded multiplicatively. POS
     * categories with a zero count do not add diversity.
     */
    static double score(const LinguisticBundle& bundle, const RichnessSettings& settings) {
        const double volume = static_cast<double>(bundle.tokenCount) / settings.tokenNorm;
        const double variety = static_cast<double>(posDiversity(bundle)) / settings.posNorm;
        return std::clamp(volume * variety, 0.0, 1.0);
    }

    static int posDiversity(const LinguisticBundle& bundle) {
        return static_cast<int>(std::count_if(bundle.posDistribution.begin(), bundle.posDistribution.end(),
                                              [](const auto& entry) { return entry.second > 0; }));
    }
};

} // namespace ethoscope::domain::compliance
