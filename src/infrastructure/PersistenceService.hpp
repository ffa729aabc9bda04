/**
 * @file PersistenceService.hpp
 * @brief Background, fire-and-forget dispatch of knowledge upserts.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <variant>
#include "domain/compliance/repositories/IKnowledgeRepository.hpp"

namespace ethoscope::infrastructure {

struct ConceptUpsert {
    domain::compliance::Concept item;
    int frequencyDelta = 1;
};

struct RelationshipUpsert {
    domain::compliance::Relationship relationship;
    double strengthDelta = 1.0;
};

/**
 * @struct WriteTask
 * @brief A single queued upsert request.
 */
struct WriteTask {
    std::variant<ConceptUpsert, RelationshipUpsert> request;
};

/**
 * @struct RetryPolicy
 * @brief How the worker handles PersistenceUnavailable.
 */
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds backoff{50};
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that applies upserts sequentially.
 *
 * Submitting never blocks on the store. Writes that keep failing with
 * PersistenceUnavailable are retried on the worker and then dropped with an
 * error log; failures never reach the submitter.
 */
class PersistenceService {
public:
    explicit PersistenceService(std::shared_ptr<domain::compliance::IKnowledgeRepository> repository,
                                RetryPolicy policy = {});
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /** @brief Queues a concept upsert keyed by (name, entityType). */
    void submitConcept(const domain::compliance::Concept& item, int frequencyDelta = 1);

    /** @brief Queues a relationship upsert. */
    void submitRelationship(const domain::compliance::Relationship& relationship, double strengthDelta);

    /**
     * @brief Blocks until every task queued so far has been applied or dropped.
     */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /** @brief Number of tasks dropped after exhausting their retries. */
    size_t droppedCount() const;

private:
    void enqueue(WriteTask task);

    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Applies one task, retrying while the store is unavailable.
     */
    void performWrite(const WriteTask& task);

    void apply(const WriteTask& task);

    std::shared_ptr<domain::compliance::IKnowledgeRepository> m_repository;
    RetryPolicy m_policy;

    // Thread Safety
    std::queue<WriteTask> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;
    size_t m_dropped = 0;

    // Worker Control
    std::thread m_worker;
    bool m_running = true;
};

} // namespace ethoscope::infrastructure
