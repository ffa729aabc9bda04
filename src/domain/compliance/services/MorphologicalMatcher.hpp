/**
 * @file MorphologicalMatcher.hpp
 * @brief Tolerant lemma comparison used by the rule engine.
 */

#pragma once

#include <string>

namespace ethoscope::domain::compliance {

/**
 * @class MorphologicalMatcher
 * @brief Decides whether two word forms denote the same concept.
 *
 * Two non-empty forms match when they are equal ignoring case, or when both
 * have at least MinStemLength characters and agree (ignoring case) on their
 * first min(len(a), len(b)) - SuffixAllowance characters. This tolerates regular
 * suffix inflection ("manipulate"/"manipulation", "deceive"/"deception")
 * without a stemmer. The relation is pure and commutative.
 */
class MorphologicalMatcher {
public:
    static constexpr size_t MinStemLength = 4;
    static constexpr size_t SuffixAllowance = 3;

    static bool matches(const std::string& a, const std::string& b);

    /** @brief ASCII lower-casing used for every comparison in the engine. */
    static std::string normalize(const std::string& input);
};

} // namespace ethoscope::domain::compliance
