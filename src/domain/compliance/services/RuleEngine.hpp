/**
 * @file RuleEngine.hpp
 * @brief Evaluates a rule set against the signals of one text.
 */

#pragma once

#include "domain/compliance/value_objects/ComplianceResult.hpp"
#include "domain/compliance/value_objects/LinguisticSignals.hpp"
#include "domain/compliance/value_objects/Rule.hpp"

namespace ethoscope::domain::compliance {

/**
 * @class RuleEngine
 * @brief Stateless, deterministic compliance evaluation.
 *
 * Each rule is applied independently to the whole feature set. Findings are
 * appended in rule-set order and, within a rule, in scan order, so the same
 * inputs always produce the same result. The verdict is computed once at the
 * end: compliant iff no Violation finding was produced.
 */
class RuleEngine {
public:
    ComplianceResult evaluate(const LinguisticAnalysis& analysis,
                              const EmotionVector& emotions,
                              const RuleSet& rules) const;
};

} // namespace ethoscope::domain::compliance
