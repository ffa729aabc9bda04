/**
 * @file ComplianceResult.hpp
 * @brief Verdict of the rule engine for one text.
 */

#pragma once

#include <set>
#include <string>
#include <vector>
#include "Severity.hpp"

namespace ethoscope::domain::compliance {

/**
 * @struct Finding
 * @brief Traceable record of a rule that fired and the evidence it fired on.
 */
struct Finding {
    std::string ruleKind;
    Severity severity = Severity::Warning;
    std::string matchedText;
    std::string matchedLemma;
    std::string reason;
    std::string subject;   ///< Relationship findings only.
    std::string object;    ///< Relationship findings only.

    bool operator==(const Finding& other) const {
        return ruleKind == other.ruleKind &&
               severity == other.severity &&
               matchedText == other.matchedText &&
               matchedLemma == other.matchedLemma &&
               reason == other.reason &&
               subject == other.subject &&
               object == other.object;
    }
};

/**
 * @struct ComplianceResult
 * @brief Invariant: compliant == violations.empty().
 */
struct ComplianceResult {
    bool compliant = true;
    std::vector<Finding> violations;
    std::vector<Finding> warnings;
    std::set<std::string> requiredValuesPresent;
    int ethicalPatternCount = 0;
    int harmPatternCount = 0;
    int commandPatternCount = 0;

    bool operator==(const ComplianceResult& other) const {
        return compliant == other.compliant &&
               violations == other.violations &&
               warnings == other.warnings &&
               requiredValuesPresent == other.requiredValuesPresent &&
               ethicalPatternCount == other.ethicalPatternCount &&
               harmPatternCount == other.harmPatternCount &&
               commandPatternCount == other.commandPatternCount;
    }
};

} // namespace ethoscope::domain::compliance
