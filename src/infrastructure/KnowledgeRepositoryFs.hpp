/**
 * @file KnowledgeRepositoryFs.hpp
 * @brief File-system backed store of concepts and relationships.
 */

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include "domain/compliance/repositories/IKnowledgeRepository.hpp"

namespace ethoscope::infrastructure {

/**
 * @class KnowledgeRepositoryFs
 * @brief Keeps the store in memory and mirrors it to <root>/knowledge/knowledge.json.
 *
 * Every upsert writes a full snapshot (temp file + rename). When the write
 * fails, PersistenceUnavailable is thrown and the in-memory state is left as it
 * was, so a retried upsert is not counted twice.
 *
 * On load, entries that cannot be decoded are skipped and the file is copied to
 * quarantinePath() before anything overwrites it. A snapshot that cannot be
 * parsed at all is moved there and the store starts empty.
 */
class KnowledgeRepositoryFs : public domain::compliance::IKnowledgeRepository {
public:
    /**
     * @brief Opens (and loads) the store under projectRoot.
     * @throws domain::compliance::PersistenceUnavailable if a damaged snapshot cannot be set aside.
     */
    explicit KnowledgeRepositoryFs(std::string projectRoot);

    void upsertConcept(const domain::compliance::Concept& item, int frequencyDelta) override;
    void upsertRelationship(const domain::compliance::Relationship& relationship, double strengthDelta) override;

    size_t conceptCount() const override;
    size_t relationshipCount() const override;
    std::optional<domain::compliance::Concept> findConcept(const std::string& name,
                                                           const std::string& entityType) const override;
    std::vector<domain::compliance::Concept> topConcepts(size_t limit) const override;
    std::vector<domain::compliance::StoredRelationship> findRelationships(const std::string& subject) const override;

    /** @brief Path of the JSON snapshot. */
    std::string snapshotPath() const;

    /** @brief Where a damaged snapshot is set aside. */
    std::string quarantinePath() const;

private:
    using ConceptKey = std::pair<std::string, std::string>;
    using RelationshipKey = std::tuple<std::string, std::string, std::string, std::string>;

    struct State {
        std::map<ConceptKey, domain::compliance::Concept> concepts;
        std::map<RelationshipKey, domain::compliance::StoredRelationship> relationships;
    };

    /**
     * @throws domain::compliance::PersistenceUnavailable if a damaged snapshot cannot be set aside.
     */
    void load();
    void quarantine(const std::string& reason, bool keepOriginal) const;
    void writeSnapshot(const State& state) const;

    std::string m_projectRoot;
    State m_state;
    mutable std::mutex m_mutex;
};

} // namespace ethoscope::infrastructure
