/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/compliance/services/MorphologicalMatcher.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <type_traits>

namespace ethoscope::infrastructure {

using json = nlohmann::json;
using namespace ethoscope::domain::compliance;

namespace {

template <typename T>
T Get(const json& j, const char* key, const std::string& context) {
    if (!j.contains(key)) {
        throw InvalidConfiguration(context + ": missing '" + key + "'.");
    }
    try {
        return j[key].get<T>();
    } catch (const json::exception&) {
        throw InvalidConfiguration(context + ": '" + key + "' has the wrong type.");
    }
}

template <typename T>
T GetOr(const json& j, const char* key, T fallback, const std::string& context) {
    if (!j.contains(key)) return fallback;
    return Get<T>(j, key, context);
}

std::set<std::string> GetLemmaSet(const json& j, const char* key, const std::string& context) {
    std::set<std::string> out;
    for (const auto& lemma : Get<std::vector<std::string>>(j, key, context)) {
        if (!lemma.empty()) out.insert(MorphologicalMatcher::normalize(lemma));
    }
    return out;
}

std::string GetEmotionName(const json& j, const char* key, const std::string& context) {
    return MorphologicalMatcher::normalize(Get<std::string>(j, key, context));
}

std::set<std::string> GetEmotionSet(const json& j, const char* key, const std::string& context) {
    std::set<std::string> out;
    for (const auto& emotion : Get<std::vector<std::string>>(j, key, context)) {
        // Empty names are kept so that validation rejects them.
        out.insert(MorphologicalMatcher::normalize(emotion));
    }
    return out;
}

Severity GetSeverity(const json& j, Severity fallback, const std::string& context) {
    if (!j.contains("severity")) return fallback;
    const auto name = Get<std::string>(j, "severity", context);
    auto severity = SeverityFromString(name);
    if (!severity) {
        throw InvalidConfiguration(context + ": unknown severity '" + name + "'.");
    }
    return *severity;
}

const json& Section(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.contains(key)) return empty;
    if (!j[key].is_object()) {
        throw InvalidConfiguration(std::string("section '") + key + "' must be an object.");
    }
    return j[key];
}

} // namespace

Rule ConfigLoader::ParseRule(const json& j) {
    if (!j.is_object()) throw InvalidConfiguration("rule entries must be objects.");
    const std::string kind = Get<std::string>(j, "kind", "rule");
    const std::string ctx = "rule '" + kind + "'";

    if (kind == ProhibitedConcept::Kind) {
        return ProhibitedConcept{GetLemmaSet(j, "lemmas", ctx)};
    }
    if (kind == RequiredVirtue::Kind) {
        return RequiredVirtue{GetLemmaSet(j, "lemmas", ctx)};
    }
    if (kind == EmotionThreshold::Kind) {
        return EmotionThreshold{GetEmotionName(j, "emotion", ctx),
                                Get<double>(j, "threshold", ctx),
                                GetSeverity(j, Severity::Warning, ctx)};
    }
    if (kind == EmotionCombination::Kind) {
        return EmotionCombination{GetEmotionSet(j, "emotions", ctx),
                                  Get<double>(j, "joint_threshold", ctx),
                                  GetSeverity(j, Severity::Violation, ctx)};
    }
    if (kind == RelationshipPattern::Kind) {
        return RelationshipPattern{GetLemmaSet(j, "predicate_lemmas", ctx),
                                   GetSeverity(j, Severity::Violation, ctx)};
    }
    if (kind == CommandPattern::Kind) {
        return CommandPattern{Get<std::vector<std::string>>(j, "pos_sequence", ctx),
                              GetSeverity(j, Severity::Warning, ctx),
                              GetOr<bool>(j, "require_no_subject", true, ctx),
                              GetOr<std::vector<std::string>>(j, "tag_sequence", {}, ctx)};
    }
    throw InvalidConfiguration("unknown rule kind '" + kind + "'.");
}

EngineConfig ConfigLoader::Parse(const json& j) {
    if (!j.is_object()) throw InvalidConfiguration("configuration root must be an object.");

    EngineConfig config = EngineConfig::Defaults();

    if (j.contains("rules")) {
        if (!j["rules"].is_array()) throw InvalidConfiguration("'rules' must be an array.");
        config.rules.clear();
        for (const auto& rule : j["rules"]) {
            config.rules.push_back(ParseRule(rule));
        }
    } else if (j.contains("prohibited_concepts") || j.contains("required_virtues")) {
        // Legacy flat format: only lemma lists.
        config.rules.clear();
        if (j.contains("prohibited_concepts")) {
            config.rules.push_back(ProhibitedConcept{GetLemmaSet(j, "prohibited_concepts", "legacy rules")});
        }
        if (j.contains("required_virtues")) {
            config.rules.push_back(RequiredVirtue{GetLemmaSet(j, "required_virtues", "legacy rules")});
        }
    }

    const json& weights = Section(j, "weights");
    const json& structural = Section(weights, "structural");
    auto& s = config.fusion.structural;
    s.compliance = GetOr<double>(structural, "compliance", s.compliance, "weights.structural");
    s.richness = GetOr<double>(structural, "richness", s.richness, "weights.structural");
    s.concepts = GetOr<double>(structural, "concept", s.concepts, "weights.structural");

    const json& fusion = Section(weights, "fusion");
    auto& f = config.fusion.fusion;
    f.structural = GetOr<double>(fusion, "structural", f.structural, "weights.fusion");
    f.sentiment = GetOr<double>(fusion, "sentiment", f.sentiment, "weights.fusion");

    const json& richness = Section(j, "richness");
    config.richness.tokenNorm = GetOr<double>(richness, "token_norm", config.richness.tokenNorm, "richness");
    config.richness.posNorm = GetOr<double>(richness, "pos_norm", config.richness.posNorm, "richness");

    const json& conceptSection = Section(j, "concept");
    config.fusion.conceptNormalization =
        GetOr<double>(conceptSection, "normalization_constant", config.fusion.conceptNormalization, "concept");

    config.validate();
    return config;
}

EngineConfig ConfigLoader::LoadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw InvalidConfiguration("configuration file not found: " + path);
    }

    json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const json::exception& e) {
        throw InvalidConfiguration("cannot parse " + path + ": " + e.what());
    }

    EngineConfig config = Parse(j);
    std::cout << "[ConfigLoader] Loaded " << config.rules.size() << " rules from " << path << std::endl;
    return config;
}

json ConfigLoader::ToJson(const EngineConfig& config) {
    json rules = json::array();
    for (const auto& rule : config.rules) {
        std::visit([&rules](auto&& r) {
            using T = std::decay_t<decltype(r)>;
            json j = {{"kind", T::Kind}};
            if constexpr (std::is_same_v<T, ProhibitedConcept> || std::is_same_v<T, RequiredVirtue>) {
                j["lemmas"] = r.lemmas;
            }
            else if constexpr (std::is_same_v<T, EmotionThreshold>) {
                j["emotion"] = r.emotion;
                j["threshold"] = r.threshold;
                j["severity"] = SeverityToString(r.severity);
            }
            else if constexpr (std::is_same_v<T, EmotionCombination>) {
                j["emotions"] = r.emotions;
                j["joint_threshold"] = r.jointThreshold;
                j["severity"] = SeverityToString(r.severity);
            }
            else if constexpr (std::is_same_v<T, RelationshipPattern>) {
                j["predicate_lemmas"] = r.predicateLemmas;
                j["severity"] = SeverityToString(r.severity);
            }
            else if constexpr (std::is_same_v<T, CommandPattern>) {
                j["pos_sequence"] = r.posSequence;
                j["severity"] = SeverityToString(r.severity);
                j["require_no_subject"] = r.requireNoSubject;
                if (!r.tagSequence.empty()) j["tag_sequence"] = r.tagSequence;
            }
            rules.push_back(std::move(j));
        }, rule);
    }

    const auto& s = config.fusion.structural;
    const auto& f = config.fusion.fusion;
    return {
        {"rules", rules},
        {"weights", {
            {"structural", {{"compliance", s.compliance}, {"richness", s.richness}, {"concept", s.concepts}}},
            {"fusion", {{"structural", f.structural}, {"sentiment", f.sentiment}}}
        }},
        {"richness", {{"token_norm", config.richness.tokenNorm}, {"pos_norm", config.richness.posNorm}}},
        {"concept", {{"normalization_constant", config.fusion.conceptNormalization}}}
    };
}

} // namespace ethoscope::infrastructure
