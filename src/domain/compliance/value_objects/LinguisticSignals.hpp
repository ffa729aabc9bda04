/**
 * @file LinguisticSignals.hpp
 * @brief Value Objects produced by the upstream linguistic and affective analyzers.
 *
 * These types form the data contract consumed by the compliance engine.
 * They are produced once per request and never modified by the engine.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ethoscope::domain::compliance {

/**
 * @struct TaggedToken
 * @brief A single token of the analyzed text with its grammatical annotations.
 */
struct TaggedToken {
    std::string text;
    std::string lemma;
    std::string pos;   ///< Coarse part-of-speech (e.g. "VERB").
    std::string tag;   ///< Fine-grained tag (e.g. "VBP").
    std::string dep;   ///< Dependency label (e.g. "nsubj").
    int sentence = 0;  ///< Index of the sentence containing the token.
};

/**
 * @struct LinguisticBundle
 * @brief Token and POS statistics of one text.
 *
 * An empty POS distribution or lemma list is valid and means "no signal".
 */
struct LinguisticBundle {
    int tokenCount = 0;
    std::map<std::string, int> posDistribution;
    std::vector<std::string> keyLemmas;      ///< Discovery order, may repeat.
    std::vector<std::string> sentences;
    int sentenceCount = 0;
    std::vector<std::string> dependencyTypes;
    double avgTokenLength = 0.0;
    std::vector<TaggedToken> tokens;         ///< Ordered token stream, may be empty.
};

struct Entity {
    std::string text;
    std::string label;   ///< Open-ended NER tag.
    std::string lemma;
    std::string rootPos;
    std::string rootDep;
};

struct Concept {
    std::string name;
    std::string lemma;
    std::string entityType;
    std::string posTag;
    std::string category;
    int frequency = 1;
};

/**
 * @struct Relationship
 * @brief Dependency-derived subject-predicate-object triple.
 */
struct Relationship {
    std::string subject;
    std::string predicate;
    std::string predicateLemma;
    std::string object;
    std::string dependencyType;
    std::string verbTense;
    double strength = 1.0;
};

/// Emotion label -> score in [0, 1].
using EmotionVector = std::map<std::string, double>;

/**
 * @struct SentimentSignal
 * @brief Dominant emotion label and the analyzer's confidence in it.
 */
struct SentimentSignal {
    std::string label;
    double confidence = 0.0;
};

struct InteractionContext {
    int priorInteractionCount = 0;
};

/**
 * @struct LinguisticAnalysis
 * @brief Everything the linguistic analyzer hands over for one text.
 */
struct LinguisticAnalysis {
    LinguisticBundle bundle;
    std::vector<Entity> entities;
    std::vector<Concept> concepts;
    std::vector<Relationship> relationships;
};

/**
 * @struct AnalysisInput
 * @brief Complete per-request input of the engine.
 *
 * Invariant: `emotions` must be present (possibly empty) for the request to be
 * evaluated. `sentiment` and `interaction` are genuinely optional.
 */
struct AnalysisInput {
    LinguisticAnalysis linguistic;
    std::optional<EmotionVector> emotions;
    std::optional<SentimentSignal> sentiment;
    std::optional<InteractionContext> interaction;
};

} // namespace ethoscope::domain::compliance
