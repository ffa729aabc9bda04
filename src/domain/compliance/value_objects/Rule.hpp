/**
 * @file Rule.hpp
 * @brief Closed set of compliance rule kinds.
 */

#pragma once

#include <set>
#include <string>
#include <variant>
#include <vector>
#include "Severity.hpp"

namespace ethoscope::domain::compliance {

/// Any matching lemma is a Violation.
struct ProhibitedConcept {
    static constexpr const char* Kind = "prohibited_concept";
    std::set<std::string> lemmas;
};

/// Positive signal, collected into ComplianceResult::requiredValuesPresent.
struct RequiredVirtue {
    static constexpr const char* Kind = "required_virtue";
    std::set<std::string> lemmas;
};

/// Fires when the emotion score is strictly above the threshold.
struct EmotionThreshold {
    static constexpr const char* Kind = "emotion_threshold";
    std::string emotion;
    double threshold = 0.0;
    Severity severity = Severity::Warning;
};

/// Fires only when every listed emotion is strictly above the joint threshold.
struct EmotionCombination {
    static constexpr const char* Kind = "emotion_combination";
    std::set<std::string> emotions;
    double jointThreshold = 0.0;
    Severity severity = Severity::Violation;
};

struct RelationshipPattern {
    static constexpr const char* Kind = "relationship_pattern";
    std::set<std::string> predicateLemmas;
    Severity severity = Severity::Violation;
};

/**
 * @struct CommandPattern
 * @brief Contiguous POS sequence inside one sentence, e.g. {"VERB", "NOUN|PRON"}.
 *
 * Each element may list alternatives separated by '|'. `tagSequence` is either
 * empty or parallel to `posSequence` and narrows a position to fine-grained
 * tags (e.g. {"VB|VBP", ""} accepts base and present verbs only); an empty
 * element leaves its position unconstrained.
 */
struct CommandPattern {
    static constexpr const char* Kind = "command_pattern";
    static constexpr const char* FindingKind = "command";
    std::vector<std::string> posSequence;
    Severity severity = Severity::Warning;
    bool requireNoSubject = true;
    std::vector<std::string> tagSequence;
};

using Rule = std::variant<
    ProhibitedConcept,
    RequiredVirtue,
    EmotionThreshold,
    EmotionCombination,
    RelationshipPattern,
    CommandPattern
>;

/// Ordered; order fixes the output order of findings.
using RuleSet = std::vector<Rule>;

} // namespace ethoscope::domain::compliance
