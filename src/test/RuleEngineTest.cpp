#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/compliance/services/RuleEngine.hpp"
#include "domain/compliance/value_objects/EngineConfig.hpp"

using namespace ethoscope::domain::compliance;

namespace {

LinguisticAnalysis WithLemmas(std::vector<std::string> lemmas) {
    LinguisticAnalysis analysis;
    analysis.bundle.keyLemmas = std::move(lemmas);
    analysis.bundle.tokenCount = static_cast<int>(analysis.bundle.keyLemmas.size());
    return analysis;
}

TaggedToken Token(const std::string& text, const std::string& pos, const std::string& dep, int sentence = 0) {
    TaggedToken t;
    t.text = text;
    t.lemma = text;
    t.pos = pos;
    t.dep = dep;
    t.sentence = sentence;
    return t;
}

TaggedToken TaggedWord(const std::string& text, const std::string& pos, const std::string& tag, const std::string& dep) {
    TaggedToken t = Token(text, pos, dep);
    t.tag = tag;
    return t;
}

void CheckVerdictInvariant(const ComplianceResult& result) {
    assert(result.compliant == result.violations.empty());
}

void TestProhibitedConceptMorphology() {
    RuleEngine engine;
    RuleSet rules = {ProhibitedConcept{{"manipulation"}}};

    auto result = engine.evaluate(WithLemmas({"manipulate"}), {}, rules);
    CheckVerdictInvariant(result);
    assert(!result.compliant);
    assert(result.violations.size() == 1);
    assert(result.warnings.empty());
    assert(result.violations[0].ruleKind == "prohibited_concept");
    assert(result.violations[0].severity == Severity::Violation);
    assert(result.violations[0].matchedText == "manipulate");
    assert(result.violations[0].matchedLemma == "manipulation");
    assert(result.harmPatternCount == 1);

    // The same lemma seen again (key lemma twice, then as concept) is reported once.
    auto analysis = WithLemmas({"manipulate", "Manipulate"});
    Concept c;
    c.name = "manipulate";
    c.lemma = "manipulate";
    analysis.concepts.push_back(c);
    result = engine.evaluate(analysis, {}, rules);
    assert(result.violations.size() == 1);

    // Relationship objects are scanned too.
    auto relAnalysis = WithLemmas({"plan"});
    Relationship rel;
    rel.subject = "they";
    rel.predicate = "planned";
    rel.predicateLemma = "plan";
    rel.object = "theft";
    relAnalysis.relationships.push_back(rel);
    result = engine.evaluate(relAnalysis, {}, {ProhibitedConcept{{"theft"}}});
    assert(!result.compliant);
    assert(result.violations.size() == 1);
    assert(result.violations[0].matchedText == "theft");

    // Clean text
    result = engine.evaluate(WithLemmas({"garden", "water"}), {}, rules);
    CheckVerdictInvariant(result);
    assert(result.compliant);
    assert(result.violations.empty());
}

void TestRequiredVirtue() {
    RuleEngine engine;
    RuleSet rules = {RequiredVirtue{{"respect", "fairness"}}};

    auto result = engine.evaluate(WithLemmas({"respect", "fairness"}), {}, rules);
    CheckVerdictInvariant(result);
    assert(result.compliant);
    assert(result.violations.empty() && result.warnings.empty());
    assert(result.requiredValuesPresent.size() == 2);
    assert(result.requiredValuesPresent.count("respect") == 1);
    assert(result.requiredValuesPresent.count("fairness") == 1);
    assert(result.ethicalPatternCount == 2);

    // Inflected forms count towards the configured virtue name.
    result = engine.evaluate(WithLemmas({"respectful"}), {}, rules);
    assert(result.requiredValuesPresent.size() == 1);
    assert(*result.requiredValuesPresent.begin() == "respect");
}

void TestEmotionThreshold() {
    RuleEngine engine;
    RuleSet rules = {EmotionThreshold{"anger", 0.8, Severity::Warning}};
    const auto analysis = WithLemmas({});

    auto result = engine.evaluate(analysis, {{"anger", 0.8}}, rules);
    assert(result.warnings.empty());

    result = engine.evaluate(analysis, {{"anger", 0.8000001}}, rules);
    CheckVerdictInvariant(result);
    assert(result.compliant);
    assert(result.warnings.size() == 1);
    assert(result.warnings[0].ruleKind == "emotion_threshold");
    assert(result.warnings[0].matchedText == "anger");

    // Zero threshold does not fire on zero or missing scores.
    RuleSet zero = {EmotionThreshold{"fear", 0.0, Severity::Violation}};
    assert(engine.evaluate(analysis, {}, zero).compliant);
    assert(engine.evaluate(analysis, {{"fear", 0.0}}, zero).compliant);
    result = engine.evaluate(analysis, {{"fear", 0.01}}, zero);
    CheckVerdictInvariant(result);
    assert(!result.compliant);
    assert(result.violations.size() == 1);
}

void TestEmotionCombination() {
    RuleEngine engine;
    RuleSet rules = {EmotionCombination{{"anger", "disgust"}, 0.8, Severity::Violation}};
    const auto analysis = WithLemmas({});

    auto result = engine.evaluate(analysis, {{"anger", 0.9}, {"disgust", 0.5}}, rules);
    assert(result.compliant);
    assert(result.violations.empty() && result.warnings.empty());

    result = engine.evaluate(analysis, {{"anger", 0.9}, {"disgust", 0.85}}, rules);
    CheckVerdictInvariant(result);
    assert(!result.compliant);
    assert(result.violations.size() == 1);
    assert(result.violations[0].ruleKind == "emotion_combination");
    assert(result.violations[0].matchedText == "anger+disgust");

    // A missing member of the combination never triggers.
    result = engine.evaluate(analysis, {{"anger", 0.99}}, rules);
    assert(result.compliant);
}

void TestRelationshipPattern() {
    RuleEngine engine;
    RuleSet rules = {RelationshipPattern{{"harm", "attack"}, Severity::Violation}};

    auto analysis = WithLemmas({"want"});
    Relationship rel;
    rel.subject = "I";
    rel.predicate = "harm";
    rel.predicateLemma = "harm";
    rel.object = "John";
    rel.dependencyType = "nsubj-dobj";
    analysis.relationships.push_back(rel);

    Relationship benign;
    benign.subject = "Mary";
    benign.predicate = "supports";
    benign.predicateLemma = "support";
    benign.object = "John";
    analysis.relationships.push_back(benign);

    auto result = engine.evaluate(analysis, {}, rules);
    CheckVerdictInvariant(result);
    assert(!result.compliant);
    assert(result.violations.size() == 1);
    const auto& finding = result.violations[0];
    assert(finding.ruleKind == "relationship_pattern");
    assert(finding.subject == "I");
    assert(finding.object == "John");
    assert(finding.matchedLemma == "harm");
    assert(result.harmPatternCount == 1);

    RuleSet soft = {RelationshipPattern{{"attack"}, Severity::Warning}};
    rel.predicate = "attacked";
    rel.predicateLemma = "attack";
    analysis.relationships = {rel};
    result = engine.evaluate(analysis, {}, soft);
    assert(result.compliant);
    assert(result.warnings.size() == 1);
}

void TestCommandPattern() {
    RuleEngine engine;
    RuleSet rules = {CommandPattern{{"VERB", "NOUN|PRON"}, Severity::Warning, true}};

    // "Give me the money."
    LinguisticAnalysis imperative;
    imperative.bundle.tokens = {
        Token("Give", "VERB", "ROOT"), Token("me", "PRON", "dative"),
        Token("the", "DET", "det"), Token("money", "NOUN", "dobj")
    };
    auto result = engine.evaluate(imperative, {}, rules);
    CheckVerdictInvariant(result);
    assert(result.compliant);
    assert(result.warnings.size() == 1);
    assert(result.warnings[0].ruleKind == "command");
    assert(result.warnings[0].matchedText == "Give me");
    assert(result.commandPatternCount == 1);

    // "I give you advice." has a subject before the verb.
    LinguisticAnalysis declarative;
    declarative.bundle.tokens = {
        Token("I", "PRON", "nsubj"), Token("give", "VERB", "ROOT"),
        Token("you", "PRON", "dative"), Token("advice", "NOUN", "dobj")
    };
    result = engine.evaluate(declarative, {}, rules);
    assert(result.warnings.empty());

    RuleSet lenient = {CommandPattern{{"VERB", "NOUN|PRON"}, Severity::Warning, false}};
    result = engine.evaluate(declarative, {}, lenient);
    assert(result.warnings.size() == 1);

    // The subject of an earlier sentence does not cover the next one: "I agree. Take it."
    LinguisticAnalysis twoSentences;
    twoSentences.bundle.tokens = {
        Token("I", "PRON", "nsubj", 0), Token("agree", "VERB", "ROOT", 0),
        Token("Take", "VERB", "ROOT", 1), Token("it", "PRON", "dobj", 1)
    };
    result = engine.evaluate(twoSentences, {}, rules);
    assert(result.warnings.size() == 1);
    assert(result.warnings[0].matchedText == "Take it");

    // A pattern never spans a sentence boundary.
    LinguisticAnalysis split;
    split.bundle.tokens = {Token("Stop", "VERB", "ROOT", 0), Token("Everyone", "PRON", "nsubj", 1)};
    assert(engine.evaluate(split, {}, rules).warnings.empty());

    // No token stream, no signal.
    assert(engine.evaluate(WithLemmas({"give"}), {}, rules).warnings.empty());
}

void TestCommandPatternVerbForms() {
    RuleEngine engine;
    const auto defaults = EngineConfig::Defaults();

    // "Running code is fun." The gerund is a clausal subject, not an order.
    LinguisticAnalysis gerund;
    gerund.bundle.tokens = {
        TaggedWord("Running", "VERB", "VBG", "csubj"), TaggedWord("code", "NOUN", "NN", "dobj"),
        TaggedWord("is", "AUX", "VBZ", "ROOT"), TaggedWord("fun", "ADJ", "JJ", "acomp")
    };
    auto result = engine.evaluate(gerund, {}, defaults.rules);
    assert(result.commandPatternCount == 0);
    assert(result.warnings.empty());

    // "Destroyed buildings remain." Past participle.
    LinguisticAnalysis participle;
    participle.bundle.tokens = {
        TaggedWord("Destroyed", "VERB", "VBN", "amod"), TaggedWord("buildings", "NOUN", "NNS", "nsubj"),
        TaggedWord("remain", "VERB", "VBP", "ROOT")
    };
    assert(engine.evaluate(participle, {}, defaults.rules).commandPatternCount == 0);

    // "Give me the money." Base form still counts.
    LinguisticAnalysis imperative;
    imperative.bundle.tokens = {
        TaggedWord("Give", "VERB", "VB", "ROOT"), TaggedWord("me", "PRON", "PRP", "dative"),
        TaggedWord("the", "DET", "DT", "det"), TaggedWord("money", "NOUN", "NN", "dobj")
    };
    result = engine.evaluate(imperative, {}, defaults.rules);
    assert(result.commandPatternCount == 1);
    assert(result.warnings.size() == 1);
    assert(result.warnings[0].matchedText == "Give me");

    // Without a tag sequence only the coarse POS is checked.
    RuleSet coarse = {CommandPattern{{"VERB", "NOUN|PRON"}, Severity::Warning, true}};
    assert(engine.evaluate(gerund, {}, coarse).commandPatternCount == 1);

    // A tag sequence of the wrong length is rejected.
    EngineConfig config;
    config.rules = {CommandPattern{{"VERB", "NOUN"}, Severity::Warning, true, {"VB"}}};
    bool rejected = false;
    try {
        config.validate();
    } catch (const InvalidConfiguration&) {
        rejected = true;
    }
    assert(rejected);
}

void TestOrderingAndDeterminism() {
    RuleEngine engine;
    RuleSet rules = {
        EmotionThreshold{"anger", 0.5, Severity::Warning},
        ProhibitedConcept{{"harm", "violence"}},
        CommandPattern{{"VERB", "NOUN|PRON"}, Severity::Warning, true},
        RelationshipPattern{{"harm"}, Severity::Violation}
    };

    LinguisticAnalysis analysis = WithLemmas({"violence", "harm"});
    analysis.bundle.tokens = {Token("Harm", "VERB", "ROOT"), Token("him", "PRON", "dobj")};
    Relationship rel;
    rel.subject = "you";
    rel.predicate = "harm";
    rel.predicateLemma = "harm";
    rel.object = "him";
    analysis.relationships.push_back(rel);
    const EmotionVector emotions = {{"anger", 0.7}};

    auto first = engine.evaluate(analysis, emotions, rules);
    auto second = engine.evaluate(analysis, emotions, rules);
    assert(first == second);
    CheckVerdictInvariant(first);

    assert(first.warnings.size() == 2);
    assert(first.warnings[0].ruleKind == "emotion_threshold");
    assert(first.warnings[1].ruleKind == "command");

    // Prohibited findings in scan order (the predicate "harm" repeats a seen lemma),
    // then the relationship finding of the later rule.
    assert(first.violations.size() == 3);
    assert(first.violations[0].ruleKind == "prohibited_concept");
    assert(first.violations[0].matchedText == "violence");
    assert(first.violations[1].ruleKind == "prohibited_concept");
    assert(first.violations[1].matchedText == "harm");
    assert(first.violations[2].ruleKind == "relationship_pattern");
    assert(first.violations[2].subject == "you");

    const auto defaults = EngineConfig::Defaults();
    auto a = engine.evaluate(analysis, emotions, defaults.rules);
    auto b = engine.evaluate(analysis, emotions, defaults.rules);
    assert(a == b);
    CheckVerdictInvariant(a);
}

} // namespace

int main() {
    std::cout << "[Test] Starting RuleEngine Test..." << std::endl;

    TestProhibitedConceptMorphology();
    TestRequiredVirtue();
    TestEmotionThreshold();
    TestEmotionCombination();
    TestRelationshipPattern();
    TestCommandPattern();
    TestCommandPatternVerbForms();
    TestOrderingAndDeterminism();

    std::cout << "[PASS] RuleEngine Test." << std::endl;
    return 0;
}
