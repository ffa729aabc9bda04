/**
 * @file RuleEngine.cpp
 * @brief Implementation of RuleEngine.
 */

#include "domain/compliance/services/RuleEngine.hpp"
#include "domain/compliance/services/MorphologicalMatcher.hpp"

#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace ethoscope::domain::compliance {

namespace {

/// One word form eligible for lemma rules, with where it was found.
struct Candidate {
    std::string text;
    std::string lemma;
    const char* source;
};

std::vector<Candidate> CollectCandidates(const LinguisticAnalysis& analysis) {
    std::vector<Candidate> candidates;
    for (const auto& lemma : analysis.bundle.keyLemmas) {
        candidates.push_back({lemma, lemma, "key lemmas"});
    }
    for (const auto& item : analysis.concepts) {
        candidates.push_back({item.name, item.lemma, "concepts"});
    }
    for (const auto& rel : analysis.relationships) {
        candidates.push_back({rel.predicate, rel.predicateLemma, "relationship predicate"});
        candidates.push_back({rel.object, rel.object, "relationship object"});
    }
    return candidates;
}

std::string FormatScore(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << value;
    return ss.str();
}

std::vector<std::string> SplitAlternatives(const std::string& element) {
    std::vector<std::string> out;
    std::stringstream ss(element);
    std::string part;
    while (std::getline(ss, part, '|')) {
        if (!part.empty()) out.push_back(MorphologicalMatcher::normalize(part));
    }
    return out;
}

bool IsSubjectDependency(const std::string& dep) {
    return dep == "nsubj" || dep == "nsubjpass" || dep == "expl";
}

/**
 * @brief Visitor applying one rule to the shared inputs.
 *
 * Every rule kind needs an overload here; a missing one fails to compile.
 */
class RuleEvaluator {
public:
    RuleEvaluator(const LinguisticAnalysis& analysis,
                  const EmotionVector& emotions,
                  const std::vector<Candidate>& candidates,
                  ComplianceResult& result)
        : m_analysis(analysis), m_emotions(emotions), m_candidates(candidates), m_result(result) {}

    void operator()(const ProhibitedConcept& rule) {
        std::unordered_set<std::string> seen;
        for (const auto& candidate : m_candidates) {
            for (const auto& prohibited : rule.lemmas) {
                if (!MorphologicalMatcher::matches(candidate.lemma, prohibited)) continue;
                if (!seen.insert(MorphologicalMatcher::normalize(candidate.lemma) + '\x1f' + prohibited).second) continue;

                Finding finding;
                finding.ruleKind = ProhibitedConcept::Kind;
                finding.severity = Severity::Violation;
                finding.matchedText = candidate.text;
                finding.matchedLemma = prohibited;
                finding.reason = "'" + candidate.lemma + "' matches prohibited concept '" + prohibited +
                                 "' (" + candidate.source + ").";
                record(std::move(finding));
                m_result.harmPatternCount++;
            }
        }
    }

    void operator()(const RequiredVirtue& rule) {
        std::unordered_set<std::string> seen;
        for (const auto& candidate : m_candidates) {
            for (const auto& virtue : rule.lemmas) {
                if (!MorphologicalMatcher::matches(candidate.lemma, virtue)) continue;
                if (!seen.insert(MorphologicalMatcher::normalize(candidate.lemma) + '\x1f' + virtue).second) continue;
                m_result.requiredValuesPresent.insert(virtue);
                m_result.ethicalPatternCount++;
            }
        }
    }

    void operator()(const EmotionThreshold& rule) {
        auto it = m_emotions.find(rule.emotion);
        if (it == m_emotions.end() || !(it->second > rule.threshold)) return;

        Finding finding;
        finding.ruleKind = EmotionThreshold::Kind;
        finding.severity = rule.severity;
        finding.matchedText = rule.emotion;
        finding.matchedLemma = rule.emotion;
        finding.reason = rule.emotion + " score " + FormatScore(it->second) +
                         " exceeds threshold " + FormatScore(rule.threshold) + ".";
        record(std::move(finding));
    }

    void operator()(const EmotionCombination& rule) {
        std::string joined;
        std::string scores;
        for (const auto& emotion : rule.emotions) {
            auto it = m_emotions.find(emotion);
            if (it == m_emotions.end() || !(it->second > rule.jointThreshold)) return;
            if (!joined.empty()) {
                joined += "+";
                scores += ", ";
            }
            joined += emotion;
            scores += emotion + "=" + FormatScore(it->second);
        }

        Finding finding;
        finding.ruleKind = EmotionCombination::Kind;
        finding.severity = rule.severity;
        finding.matchedText = joined;
        finding.matchedLemma = joined;
        finding.reason = "Joint emotions above " + FormatScore(rule.jointThreshold) + ": " + scores + ".";
        record(std::move(finding));
    }

    void operator()(const RelationshipPattern& rule) {
        for (const auto& rel : m_analysis.relationships) {
            for (const auto& lemma : rule.predicateLemmas) {
                if (!MorphologicalMatcher::matches(rel.predicateLemma, lemma)) continue;

                Finding finding;
                finding.ruleKind = RelationshipPattern::Kind;
                finding.severity = rule.severity;
                finding.matchedText = rel.predicate;
                finding.matchedLemma = lemma;
                finding.subject = rel.subject;
                finding.object = rel.object;
                finding.reason = "Relationship '" + rel.subject + " -> " + rel.predicate + " -> " + rel.object +
                                 "' uses flagged predicate '" + lemma + "'.";
                record(std::move(finding));
                m_result.harmPatternCount++;
                break;
            }
        }
    }

    void operator()(const CommandPattern& rule) {
        const auto& tokens = m_analysis.bundle.tokens;
        const size_t width = rule.posSequence.size();
        if (width == 0 || tokens.size() < width) return;

        std::vector<std::vector<std::string>> alternatives;
        alternatives.reserve(width);
        for (const auto& element : rule.posSequence) {
            alternatives.push_back(SplitAlternatives(element));
        }
        // Empty inner vector: any tag.
        std::vector<std::vector<std::string>> tagAlternatives(width);
        for (size_t k = 0; k < rule.tagSequence.size() && k < width; ++k) {
            tagAlternatives[k] = SplitAlternatives(rule.tagSequence[k]);
        }

        std::string sequenceLabel;
        for (const auto& element : rule.posSequence) {
            if (!sequenceLabel.empty()) sequenceLabel += " ";
            sequenceLabel += element;
        }

        for (size_t start = 0; start + width <= tokens.size(); ++start) {
            if (!matchesAt(tokens, start, alternatives, tagAlternatives)) continue;
            if (rule.requireNoSubject && hasSubjectBefore(tokens, start)) continue;

            Finding finding;
            finding.ruleKind = CommandPattern::FindingKind;
            finding.severity = rule.severity;
            for (size_t k = start; k < start + width; ++k) {
                if (k > start) {
                    finding.matchedText += " ";
                    finding.matchedLemma += " ";
                }
                finding.matchedText += tokens[k].text;
                finding.matchedLemma += tokens[k].lemma;
            }
            finding.reason = "Imperative construction '" + finding.matchedText + "' (" + sequenceLabel + ").";
            record(std::move(finding));
            m_result.commandPatternCount++;
        }
    }

private:
    static bool containsValue(const std::vector<std::string>& options, const std::string& value) {
        const std::string normalized = MorphologicalMatcher::normalize(value);
        for (const auto& option : options) {
            if (option == normalized) return true;
        }
        return false;
    }

    static bool matchesAt(const std::vector<TaggedToken>& tokens, size_t start,
                          const std::vector<std::vector<std::string>>& alternatives,
                          const std::vector<std::vector<std::string>>& tagAlternatives) {
        const int sentence = tokens[start].sentence;
        for (size_t k = 0; k < alternatives.size(); ++k) {
            const auto& token = tokens[start + k];
            if (token.sentence != sentence) return false;
            if (!containsValue(alternatives[k], token.pos)) return false;
            if (!tagAlternatives[k].empty() && !containsValue(tagAlternatives[k], token.tag)) return false;
        }
        return true;
    }

    static bool hasSubjectBefore(const std::vector<TaggedToken>& tokens, size_t start) {
        const int sentence = tokens[start].sentence;
        for (size_t k = 0; k < start; ++k) {
            if (tokens[k].sentence == sentence && IsSubjectDependency(tokens[k].dep)) return true;
        }
        return false;
    }

    void record(Finding finding) {
        if (finding.severity == Severity::Violation) {
            m_result.violations.push_back(std::move(finding));
        } else {
            m_result.warnings.push_back(std::move(finding));
        }
    }

    const LinguisticAnalysis& m_analysis;
    const EmotionVector& m_emotions;
    const std::vector<Candidate>& m_candidates;
    ComplianceResult& m_result;
};

} // namespace

ComplianceResult RuleEngine::evaluate(const LinguisticAnalysis& analysis,
                                      const EmotionVector& emotions,
                                      const RuleSet& rules) const {
    ComplianceResult result;
    const std::vector<Candidate> candidates = CollectCandidates(analysis);

    RuleEvaluator evaluator(analysis, emotions, candidates, result);
    for (const auto& rule : rules) {
        std::visit(evaluator, rule);
    }

    result.compliant = result.violations.empty();
    return result;
}

} // namespace ethoscope::domain::compliance
