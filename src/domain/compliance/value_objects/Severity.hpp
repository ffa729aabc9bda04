/**
 * @file Severity.hpp
 * @brief Value Object defining how strongly a rule finding affects compliance.
 */

#pragma once

#include <optional>
#include <string>

namespace ethoscope::domain::compliance {

/**
 * @enum Severity
 * @brief Only Violation findings block compliance.
 */
enum class Severity {
    Warning,    ///< Soft signal, reported but never blocking.
    Violation   ///< Hard block.
};

/**
 * @brief Helper to convert severity to string for serialization/logging.
 */
inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::Warning: return "warning";
        case Severity::Violation: return "violation";
        default: return "unknown";
    }
}

/**
 * @brief Parses a configured severity name (case-sensitive, lower case).
 * @return std::nullopt for names that do not denote a severity.
 */
inline std::optional<Severity> SeverityFromString(const std::string& name) {
    if (name == "warning") return Severity::Warning;
    if (name == "violation") return Severity::Violation;
    return std::nullopt;
}

} // namespace ethoscope::domain::compliance
