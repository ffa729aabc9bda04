/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/compliance/EngineErrors.hpp"
#include <iostream>
#include <type_traits>

namespace ethoscope::infrastructure {

using domain::compliance::PersistenceUnavailable;

PersistenceService::PersistenceService(std::shared_ptr<domain::compliance::IKnowledgeRepository> repository,
                                       RetryPolicy policy)
    : m_repository(std::move(repository)), m_policy(policy) {
    if (m_policy.maxAttempts < 1) m_policy.maxAttempts = 1;
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::submitConcept(const domain::compliance::Concept& item, int frequencyDelta) {
    enqueue(WriteTask{ConceptUpsert{item, frequencyDelta}});
}

void PersistenceService::submitRelationship(const domain::compliance::Relationship& relationship, double strengthDelta) {
    enqueue(WriteTask{RelationshipUpsert{relationship, strengthDelta}});
}

void PersistenceService::enqueue(WriteTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Write submitted after stop, dropping." << std::endl;
            m_dropped++;
            return;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] {
        return m_queue.empty() && !m_busy;
    });
}

size_t PersistenceService::droppedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

void PersistenceService::workerLoop() {
    while (true) {
        WriteTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Process outside lock
        performWrite(task);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

void PersistenceService::apply(const WriteTask& task) {
    std::visit([this](auto&& request) {
        using T = std::decay_t<decltype(request)>;
        if constexpr (std::is_same_v<T, ConceptUpsert>) {
            m_repository->upsertConcept(request.item, request.frequencyDelta);
        } else if constexpr (std::is_same_v<T, RelationshipUpsert>) {
            m_repository->upsertRelationship(request.relationship, request.strengthDelta);
        }
    }, task.request);
}

void PersistenceService::performWrite(const WriteTask& task) {
    for (int attempt = 1; attempt <= m_policy.maxAttempts; ++attempt) {
        try {
            apply(task);
            return;
        } catch (const PersistenceUnavailable& e) {
            std::cerr << "[PersistenceService] Attempt " << attempt << "/" << m_policy.maxAttempts
                      << " failed: " << e.what() << std::endl;
            if (attempt < m_policy.maxAttempts) {
                std::this_thread::sleep_for(m_policy.backoff);
            }
        } catch (const std::exception& e) {
            // Not a transient failure; retrying would not help.
            std::cerr << "[PersistenceService] Write rejected: " << e.what() << std::endl;
            break;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_dropped++;
    std::cerr << "[PersistenceService] Dropping write after failures (" << m_dropped << " dropped so far)." << std::endl;
}

} // namespace ethoscope::infrastructure
