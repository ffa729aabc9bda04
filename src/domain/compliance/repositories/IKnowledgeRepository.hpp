/**
 * @file IKnowledgeRepository.hpp
 * @brief Interface for the durable store of deduplicated concepts and relationships.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../value_objects/LinguisticSignals.hpp"

namespace ethoscope::domain::compliance {

/**
 * @struct StoredRelationship
 * @brief A relationship as kept by the store, with its accumulated counters.
 */
struct StoredRelationship {
    Relationship relationship;  ///< `strength` holds the accumulated strength.
    int occurrences = 0;
};

/**
 * @class IKnowledgeRepository
 * @brief Upsert-only persistence boundary. Implementations throw
 *        PersistenceUnavailable when the store cannot be written.
 */
class IKnowledgeRepository {
public:
    virtual ~IKnowledgeRepository() = default;

    /**
     * @brief Inserts the concept keyed by (name, entityType) or adds to its frequency.
     * @param item Concept as seen in the current text.
     * @param frequencyDelta Added to the stored frequency (first sighting stores it as is).
     */
    virtual void upsertConcept(const Concept& item, int frequencyDelta) = 0;

    /**
     * @brief Inserts the relationship keyed by (subject, predicateLemma, object,
     *        dependencyType) or accumulates its strength.
     */
    virtual void upsertRelationship(const Relationship& relationship, double strengthDelta) = 0;

    virtual size_t conceptCount() const = 0;

    virtual size_t relationshipCount() const = 0;

    virtual std::optional<Concept> findConcept(const std::string& name, const std::string& entityType) const = 0;

    /** @brief Most frequent concepts first; ties ordered by name. */
    virtual std::vector<Concept> topConcepts(size_t limit) const = 0;

    /** @brief All stored relationships whose subject equals `subject`. */
    virtual std::vector<StoredRelationship> findRelationships(const std::string& subject) const = 0;
};

} // namespace ethoscope::domain::compliance
