/**
 * @file MorphologicalMatcher.cpp
 * @brief Implementation of MorphologicalMatcher.
 */

#include "domain/compliance/services/MorphologicalMatcher.hpp"

#include <algorithm>
#include <cctype>

namespace ethoscope::domain::compliance {

std::string MorphologicalMatcher::normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool MorphologicalMatcher::matches(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return false;

    const std::string left = normalize(a);
    const std::string right = normalize(b);
    if (left == right) return true;

    // Short words only match exactly ("act" vs "art").
    if (left.size() < MinStemLength || right.size() < MinStemLength) return false;

    const size_t stem = std::min(left.size(), right.size()) - SuffixAllowance;
    if (stem == 0) return false;
    return left.compare(0, stem, right, 0, stem) == 0;
}

} // namespace ethoscope::domain::compliance
