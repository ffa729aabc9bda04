/**
 * @file EngineConfig.hpp
 * @brief Value Object holding the rule set and all scoring calibration.
 *
 * Invariant: a constructed-and-validated EngineConfig is never modified. Hot
 * reload replaces the whole object.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include "Rule.hpp"
#include "../EngineErrors.hpp"

namespace ethoscope::domain::compliance {

struct StructuralWeights {
    double compliance = 0.6;
    double richness = 0.2;
    double concepts = 0.2;
};

struct FusionWeights {
    double structural = 0.66;
    double sentiment = 0.34;
};

struct RichnessSettings {
    double tokenNorm = 20.0;  ///< Token count of a "fully rich" short utterance.
    double posNorm = 5.0;     ///< Distinct POS categories of a "fully rich" utterance.
};

/**
 * @struct FusionSettings
 * @brief Calibration consumed by the FusionArbiter.
 */
struct FusionSettings {
    StructuralWeights structural;
    FusionWeights fusion;
    double conceptNormalization = 5.0;  ///< K in conceptScore = min(1, conceptCount / K).
};

class EngineConfig {
public:
    static constexpr double WeightTolerance = 1e-3;

    RuleSet rules;
    FusionSettings fusion;
    RichnessSettings richness;

    /**
     * @brief Built-in rule set and calibration used when no file is supplied.
     */
    static EngineConfig Defaults() {
        EngineConfig config;
        config.rules.push_back(ProhibitedConcept{{"violence", "harm", "deception", "theft", "abuse", "manipulation"}});
        config.rules.push_back(RequiredVirtue{{"temperance", "prudence", "justice", "fortitude",
                                               "wisdom", "compassion", "truthfulness",
                                               "respect", "dignity", "fairness", "equality", "rights"}});
        config.rules.push_back(EmotionThreshold{"anger", 0.8, Severity::Warning});
        config.rules.push_back(EmotionThreshold{"disgust", 0.85, Severity::Warning});
        config.rules.push_back(EmotionCombination{{"anger", "disgust"}, 0.9, Severity::Violation});
        config.rules.push_back(RelationshipPattern{{"harm", "hurt", "damage", "destroy", "kill", "attack"}, Severity::Violation});
        config.rules.push_back(CommandPattern{{"VERB", "NOUN|PRON"}, Severity::Warning, true, {"VB|VBP", ""}});
        return config;
    }

    /**
     * @brief Checks every invariant of the configuration.
     * @throws InvalidConfiguration on the first broken invariant.
     */
    void validate() const {
        const auto& s = fusion.structural;
        if (s.compliance < 0.0 || s.richness < 0.0 || s.concepts < 0.0) {
            throw InvalidConfiguration("structural weights must be non-negative.");
        }
        if (std::fabs(s.compliance + s.richness + s.concepts - 1.0) > WeightTolerance) {
            throw InvalidConfiguration("structural weights must sum to 1.0.");
        }
        const auto& f = fusion.fusion;
        if (f.structural < 0.0 || f.sentiment < 0.0) {
            throw InvalidConfiguration("fusion weights must be non-negative.");
        }
        if (std::fabs(f.structural + f.sentiment - 1.0) > WeightTolerance) {
            throw InvalidConfiguration("fusion weights must sum to 1.0.");
        }
        if (!(fusion.conceptNormalization > 0.0)) {
            throw InvalidConfiguration("concept.normalization_constant must be positive.");
        }
        if (!(richness.tokenNorm > 0.0) || !(richness.posNorm > 0.0)) {
            throw InvalidConfiguration("richness norms must be positive.");
        }
        for (size_t i = 0; i < rules.size(); ++i) {
            std::visit([i](auto&& rule) { validateRule(rule, i); }, rules[i]);
        }
    }

private:
    static std::string position(size_t index) {
        return "rule #" + std::to_string(index) + ": ";
    }

    static void checkThreshold(double value, size_t index) {
        if (!(value >= 0.0 && value <= 1.0)) {
            throw InvalidConfiguration(position(index) + "threshold must lie in [0, 1].");
        }
    }

    static void validateRule(const ProhibitedConcept& rule, size_t index) {
        if (rule.lemmas.empty()) throw InvalidConfiguration(position(index) + "prohibited_concept without lemmas.");
    }

    static void validateRule(const RequiredVirtue& rule, size_t index) {
        if (rule.lemmas.empty()) throw InvalidConfiguration(position(index) + "required_virtue without lemmas.");
    }

    /// Analyzer emotion labels are lower case; any other name could never match.
    static void checkEmotionName(const std::string& name, size_t index) {
        if (name.empty()) throw InvalidConfiguration(position(index) + "empty emotion name.");
        const bool lowerCase = std::none_of(name.begin(), name.end(), [](unsigned char c) {
            return std::isupper(c) != 0;
        });
        if (!lowerCase) {
            throw InvalidConfiguration(position(index) + "emotion name '" + name + "' must be lower case.");
        }
    }

    static void validateRule(const EmotionThreshold& rule, size_t index) {
        checkEmotionName(rule.emotion, index);
        checkThreshold(rule.threshold, index);
    }

    static void validateRule(const EmotionCombination& rule, size_t index) {
        if (rule.emotions.empty()) throw InvalidConfiguration(position(index) + "emotion_combination without emotions.");
        for (const auto& emotion : rule.emotions) {
            checkEmotionName(emotion, index);
        }
        checkThreshold(rule.jointThreshold, index);
    }

    static void validateRule(const RelationshipPattern& rule, size_t index) {
        if (rule.predicateLemmas.empty()) {
            throw InvalidConfiguration(position(index) + "relationship_pattern without predicate lemmas.");
        }
    }

    static void validateRule(const CommandPattern& rule, size_t index) {
        if (rule.posSequence.empty()) throw InvalidConfiguration(position(index) + "command_pattern without POS sequence.");
        for (const auto& element : rule.posSequence) {
            if (element.empty()) throw InvalidConfiguration(position(index) + "command_pattern with empty POS element.");
        }
        if (!rule.tagSequence.empty() && rule.tagSequence.size() != rule.posSequence.size()) {
            throw InvalidConfiguration(position(index) + "command_pattern tag sequence must match the POS sequence length.");
        }
    }
};

} // namespace ethoscope::domain::compliance
