/**
 * @file AnalysisJsonCodec.cpp
 * @brief Implementation of AnalysisJsonCodec.
 */

#include "infrastructure/AnalysisJsonCodec.hpp"
#include "domain/compliance/EngineErrors.hpp"

#include <cstdint>
#include <limits>
#include <type_traits>

namespace ethoscope::infrastructure {

using json = nlohmann::json;
using namespace ethoscope::domain::compliance;

namespace {

const json& Require(const json& j, const char* key, const std::string& context) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        throw MalformedInput(context + ": missing field '" + key + "'.");
    }
    return j[key];
}

/// Counts must be JSON integers that fit an int; get<int>() would truncate or wrap.
int ToInt(const json& value, const std::string& what) {
    if (!value.is_number_integer()) {
        throw MalformedInput(what + " must be an integer.");
    }
    const bool fits = value.is_number_unsigned()
        ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
          value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) {
        throw MalformedInput(what + " is out of range.");
    }
    return static_cast<int>(value.get<std::int64_t>());
}

template <typename T>
T RequireAs(const json& j, const char* key, const std::string& context) {
    const json& value = Require(j, key, context);
    if constexpr (std::is_same_v<T, int>) {
        return ToInt(value, context + ": field '" + key + "'");
    } else {
        try {
            return value.get<T>();
        } catch (const json::exception&) {
            throw MalformedInput(context + ": field '" + key + "' has the wrong type.");
        }
    }
}

std::map<std::string, int> RequireCounts(const json& j, const char* key, const std::string& context) {
    const json& value = Require(j, key, context);
    if (!value.is_object()) {
        throw MalformedInput(context + ": field '" + key + "' must be an object.");
    }
    std::map<std::string, int> counts;
    for (const auto& entry : value.items()) {
        counts[entry.key()] = ToInt(entry.value(), context + ": " + key + "['" + entry.key() + "']");
    }
    return counts;
}

template <typename T>
T OptionalAs(const json& j, const char* key, T fallback, const std::string& context) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    return RequireAs<T>(j, key, context);
}

const json& RequireArray(const json& j, const char* key, const std::string& context) {
    const json& value = Require(j, key, context);
    if (!value.is_array()) {
        throw MalformedInput(context + ": field '" + key + "' must be an array.");
    }
    return value;
}

TaggedToken DecodeToken(const json& j) {
    const std::string ctx = "token";
    TaggedToken token;
    token.text = RequireAs<std::string>(j, "text", ctx);
    token.lemma = OptionalAs<std::string>(j, "lemma", token.text, ctx);
    token.pos = RequireAs<std::string>(j, "pos", ctx);
    token.tag = OptionalAs<std::string>(j, "tag", "", ctx);
    token.dep = OptionalAs<std::string>(j, "dep", "", ctx);
    token.sentence = OptionalAs<int>(j, "sentence", 0, ctx);
    return token;
}

} // namespace

LinguisticBundle AnalysisJsonCodec::DecodeBundle(const json& j) {
    const std::string ctx = "linguistic_features";
    if (!j.is_object()) throw MalformedInput(ctx + " must be an object.");

    LinguisticBundle bundle;
    bundle.tokenCount = RequireAs<int>(j, "token_count", ctx);
    bundle.posDistribution = RequireCounts(j, "pos_distribution", ctx);
    bundle.keyLemmas = RequireAs<std::vector<std::string>>(j, "key_lemmas", ctx);
    bundle.sentences = RequireAs<std::vector<std::string>>(j, "sentences", ctx);
    bundle.sentenceCount = RequireAs<int>(j, "sentence_count", ctx);
    bundle.dependencyTypes = RequireAs<std::vector<std::string>>(j, "dependency_types", ctx);
    bundle.avgTokenLength = RequireAs<double>(j, "avg_token_length", ctx);
    if (j.contains("tokens") && !j["tokens"].is_null()) {
        for (const auto& t : RequireArray(j, "tokens", ctx)) {
            bundle.tokens.push_back(DecodeToken(t));
        }
    }
    return bundle;
}

Entity AnalysisJsonCodec::DecodeEntity(const json& j) {
    const std::string ctx = "entity";
    Entity entity;
    entity.text = RequireAs<std::string>(j, "text", ctx);
    entity.label = RequireAs<std::string>(j, "label", ctx);
    entity.lemma = OptionalAs<std::string>(j, "lemma", entity.text, ctx);
    entity.rootPos = OptionalAs<std::string>(j, "root_pos", "", ctx);
    entity.rootDep = OptionalAs<std::string>(j, "root_dep", "", ctx);
    return entity;
}

Concept AnalysisJsonCodec::DecodeConcept(const json& j) {
    const std::string ctx = "concept";
    Concept item;
    item.name = RequireAs<std::string>(j, "name", ctx);
    item.lemma = OptionalAs<std::string>(j, "lemma", item.name, ctx);
    item.entityType = OptionalAs<std::string>(j, "entity_type", "unknown", ctx);
    item.posTag = OptionalAs<std::string>(j, "pos_tag", "UNKNOWN", ctx);
    item.category = OptionalAs<std::string>(j, "category", "", ctx);
    item.frequency = OptionalAs<int>(j, "frequency", 1, ctx);
    return item;
}

Relationship AnalysisJsonCodec::DecodeRelationship(const json& j) {
    const std::string ctx = "relationship";
    Relationship rel;
    rel.subject = RequireAs<std::string>(j, "subject", ctx);
    rel.predicate = RequireAs<std::string>(j, "predicate", ctx);
    rel.predicateLemma = OptionalAs<std::string>(j, "predicate_lemma", rel.predicate, ctx);
    rel.object = RequireAs<std::string>(j, "object", ctx);
    rel.dependencyType = OptionalAs<std::string>(j, "dependency_type", "unknown", ctx);
    rel.verbTense = OptionalAs<std::string>(j, "verb_tense", "", ctx);
    rel.strength = OptionalAs<double>(j, "strength", 1.0, ctx);
    return rel;
}

AnalysisInput AnalysisJsonCodec::DecodeAnalysisInput(const json& j) {
    const std::string ctx = "analysis";
    if (!j.is_object()) throw MalformedInput("analysis bundle must be a JSON object.");

    AnalysisInput input;
    input.linguistic.bundle = DecodeBundle(Require(j, "linguistic_features", ctx));
    for (const auto& e : RequireArray(j, "entities", ctx)) {
        input.linguistic.entities.push_back(DecodeEntity(e));
    }
    for (const auto& c : RequireArray(j, "concepts", ctx)) {
        input.linguistic.concepts.push_back(DecodeConcept(c));
    }
    for (const auto& r : RequireArray(j, "relationships", ctx)) {
        input.linguistic.relationships.push_back(DecodeRelationship(r));
    }

    input.emotions = RequireAs<EmotionVector>(j, "emotions", ctx);

    if (j.contains("sentiment") && !j["sentiment"].is_null()) {
        const json& s = j["sentiment"];
        SentimentSignal sentiment;
        sentiment.label = RequireAs<std::string>(s, "label", "sentiment");
        sentiment.confidence = RequireAs<double>(s, "score", "sentiment");
        input.sentiment = sentiment;
    }
    if (j.contains("interaction") && !j["interaction"].is_null()) {
        InteractionContext interaction;
        interaction.priorInteractionCount = RequireAs<int>(j["interaction"], "interaction_count", "interaction");
        input.interaction = interaction;
    }
    return input;
}

json AnalysisJsonCodec::EncodeBundle(const LinguisticBundle& bundle) {
    json tokens = json::array();
    for (const auto& t : bundle.tokens) {
        tokens.push_back({
            {"text", t.text},
            {"lemma", t.lemma},
            {"pos", t.pos},
            {"tag", t.tag},
            {"dep", t.dep},
            {"sentence", t.sentence}
        });
    }
    return {
        {"token_count", bundle.tokenCount},
        {"pos_distribution", bundle.posDistribution},
        {"key_lemmas", bundle.keyLemmas},
        {"sentences", bundle.sentences},
        {"sentence_count", bundle.sentenceCount},
        {"dependency_types", bundle.dependencyTypes},
        {"avg_token_length", bundle.avgTokenLength},
        {"tokens", tokens}
    };
}

json AnalysisJsonCodec::EncodeEntity(const Entity& entity) {
    return {
        {"text", entity.text},
        {"label", entity.label},
        {"lemma", entity.lemma},
        {"root_pos", entity.rootPos},
        {"root_dep", entity.rootDep}
    };
}

json AnalysisJsonCodec::EncodeConcept(const Concept& item) {
    return {
        {"name", item.name},
        {"lemma", item.lemma},
        {"entity_type", item.entityType},
        {"pos_tag", item.posTag},
        {"category", item.category},
        {"frequency", item.frequency}
    };
}

json AnalysisJsonCodec::EncodeRelationship(const Relationship& relationship) {
    return {
        {"subject", relationship.subject},
        {"predicate", relationship.predicate},
        {"predicate_lemma", relationship.predicateLemma},
        {"object", relationship.object},
        {"dependency_type", relationship.dependencyType},
        {"verb_tense", relationship.verbTense},
        {"strength", relationship.strength}
    };
}

json AnalysisJsonCodec::EncodeFinding(const Finding& finding) {
    json j = {
        {"rule_kind", finding.ruleKind},
        {"severity", SeverityToString(finding.severity)},
        {"matched_text", finding.matchedText},
        {"matched_lemma", finding.matchedLemma},
        {"reason", finding.reason}
    };
    if (!finding.subject.empty() || !finding.object.empty()) {
        j["subject"] = finding.subject;
        j["object"] = finding.object;
    }
    return j;
}

json AnalysisJsonCodec::EncodeComplianceResult(const ComplianceResult& result) {
    json violations = json::array();
    for (const auto& f : result.violations) violations.push_back(EncodeFinding(f));
    json warnings = json::array();
    for (const auto& f : result.warnings) warnings.push_back(EncodeFinding(f));

    return {
        {"compliant", result.compliant},
        {"violations", violations},
        {"warnings", warnings},
        {"required_values_present", result.requiredValuesPresent},
        {"ethical_pattern_count", result.ethicalPatternCount},
        {"harm_pattern_count", result.harmPatternCount},
        {"command_pattern_count", result.commandPatternCount}
    };
}

json AnalysisJsonCodec::EncodeFusionResult(const FusionResult& result) {
    json concepts = json::array();
    for (const auto& c : result.concepts) concepts.push_back(EncodeConcept(c));
    json entities = json::array();
    for (const auto& e : result.entities) entities.push_back(EncodeEntity(e));
    json relationships = json::array();
    for (const auto& r : result.relationships) relationships.push_back(EncodeRelationship(r));

    json sentiment = nullptr;
    if (result.sentiment) {
        sentiment = {
            {"label", result.sentiment->label},
            {"score", result.sentiment->confidence}
        };
    }

    const auto& s = result.summary;
    return {
        {"coherence", result.coherence},
        {"richness", result.richness},
        {"concept_score", result.conceptScore},
        {"structural_score", result.structuralScore},
        {"sentiment", sentiment},
        {"emotions", result.emotions},
        {"concepts", concepts},
        {"entities", entities},
        {"relationships", relationships},
        {"linguistic_features", EncodeBundle(result.linguisticFeatures)},
        {"compliance", EncodeComplianceResult(result.compliance)},
        {"weights_used", result.weightsUsed},
        {"summary", {
            {"concept_count", s.conceptCount},
            {"entity_count", s.entityCount},
            {"relationship_count", s.relationshipCount},
            {"sentence_count", s.sentenceCount},
            {"violation_count", s.violationCount},
            {"warning_count", s.warningCount},
            {"prior_interaction_count", s.priorInteractionCount}
        }}
    };
}

} // namespace ethoscope::infrastructure
