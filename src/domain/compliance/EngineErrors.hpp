/**
 * @file EngineErrors.hpp
 * @brief Error kinds raised by the compliance and fusion engine.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ethoscope::domain::compliance {

/**
 * @class MalformedInput
 * @brief A required field of the analyzer contract is absent or out of range.
 *
 * The request is rejected as a whole; no partial verdict is produced.
 */
class MalformedInput : public std::invalid_argument {
public:
    explicit MalformedInput(const std::string& message)
        : std::invalid_argument("MalformedInput: " + message) {}
};

/**
 * @class InvalidConfiguration
 * @brief Rule set or weights rejected at load time. The active configuration is kept.
 */
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& message)
        : std::invalid_argument("InvalidConfiguration: " + message) {}
};

/**
 * @class PersistenceUnavailable
 * @brief The knowledge store could not be written. Never surfaces to the caller.
 */
class PersistenceUnavailable : public std::runtime_error {
public:
    explicit PersistenceUnavailable(const std::string& message)
        : std::runtime_error("PersistenceUnavailable: " + message) {}
};

} // namespace ethoscope::domain::compliance
