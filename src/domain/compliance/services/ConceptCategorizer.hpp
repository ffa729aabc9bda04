/**
 * @file ConceptCategorizer.hpp
 * @brief Maps named-entity labels to coarse conceptual categories.
 */

#pragma once

#include <map>
#include <string>

namespace ethoscope::domain::compliance {

class ConceptCategorizer {
public:
    static constexpr const char* DefaultCategory = "general";

    /** @brief Unknown labels fall back to DefaultCategory. */
    static std::string categorize(const std::string& label) {
        static const std::map<std::string, std::string> categories = {
            {"PERSON", "agent"},
            {"ORG", "organization"},
            {"GPE", "location"},
            {"LOC", "location"},
            {"DATE", "temporal"},
            {"TIME", "temporal"},
            {"MONEY", "value"},
            {"PERCENT", "value"},
            {"PRODUCT", "artifact"},
            {"EVENT", "event"},
            {"WORK_OF_ART", "artifact"},
            {"LAW", "concept"},
            {"LANGUAGE", "concept"},
            {"NORP", "group"}
        };
        auto it = categories.find(label);
        return it != categories.end() ? it->second : DefaultCategory;
    }
};

} // namespace ethoscope::domain::compliance
