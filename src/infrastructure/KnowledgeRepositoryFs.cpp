/**
 * @file KnowledgeRepositoryFs.cpp
 * @brief Implementation of KnowledgeRepositoryFs.
 */

#include "infrastructure/KnowledgeRepositoryFs.hpp"
#include "infrastructure/AnalysisJsonCodec.hpp"
#include "domain/compliance/EngineErrors.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace ethoscope::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using domain::compliance::Concept;
using domain::compliance::PersistenceUnavailable;
using domain::compliance::Relationship;
using domain::compliance::StoredRelationship;

KnowledgeRepositoryFs::KnowledgeRepositoryFs(std::string projectRoot)
    : m_projectRoot(std::move(projectRoot)) {
    load();
}

std::string KnowledgeRepositoryFs::snapshotPath() const {
    // Structure: <root>/knowledge/knowledge.json
    return (fs::path(m_projectRoot) / "knowledge" / "knowledge.json").string();
}

std::string KnowledgeRepositoryFs::quarantinePath() const {
    return snapshotPath() + ".corrupt";
}

void KnowledgeRepositoryFs::quarantine(const std::string& reason, bool keepOriginal) const {
    const fs::path path = snapshotPath();
    const fs::path aside = quarantinePath();
    std::error_code ec;
    if (keepOriginal) {
        fs::copy_file(path, aside, fs::copy_options::overwrite_existing, ec);
    } else {
        fs::rename(path, aside, ec);
    }
    if (ec) {
        // Writing a new snapshot now would overwrite counts that were never loaded.
        throw PersistenceUnavailable("cannot set aside snapshot " + path.string() + " (" + reason + "): " +
                                     ec.message());
    }
    std::cerr << "[KnowledgeRepositoryFs] " << reason << "; previous snapshot saved as " << aside.string()
              << std::endl;
}

void KnowledgeRepositoryFs::load() {
    const fs::path path = snapshotPath();
    std::error_code ec;
    if (!fs::exists(path, ec)) return;

    json j;
    try {
        std::ifstream f(path);
        j = json::parse(f);
    } catch (const std::exception& e) {
        quarantine(std::string("Unreadable snapshot: ") + e.what(), false);
        return;
    }
    if (!j.is_object() || !j.contains("concepts") || !j["concepts"].is_array() ||
        !j.contains("relationships") || !j["relationships"].is_array()) {
        quarantine("Snapshot does not have the expected layout", false);
        return;
    }

    // Bad entries are skipped one by one; the rest of the store survives.
    State state;
    size_t skipped = 0;
    for (const auto& c : j["concepts"]) {
        try {
            Concept item = AnalysisJsonCodec::DecodeConcept(c);
            state.concepts[{item.name, item.entityType}] = item;
        } catch (const std::exception& e) {
            std::cerr << "[KnowledgeRepositoryFs] Skipping concept entry: " << e.what() << std::endl;
            skipped++;
        }
    }
    for (const auto& r : j["relationships"]) {
        try {
            StoredRelationship stored;
            stored.relationship = AnalysisJsonCodec::DecodeRelationship(r);
            stored.occurrences = r.value("occurrences", 1);
            const auto& rel = stored.relationship;
            state.relationships[{rel.subject, rel.predicateLemma, rel.object, rel.dependencyType}] = stored;
        } catch (const std::exception& e) {
            std::cerr << "[KnowledgeRepositoryFs] Skipping relationship entry: " << e.what() << std::endl;
            skipped++;
        }
    }
    if (skipped > 0) {
        quarantine(std::to_string(skipped) + " snapshot entries could not be read", true);
    }

    m_state = std::move(state);
    std::cout << "[KnowledgeRepositoryFs] Loaded " << m_state.concepts.size() << " concepts and "
              << m_state.relationships.size() << " relationships from " << path.string() << std::endl;
}

void KnowledgeRepositoryFs::writeSnapshot(const State& state) const {
    json j = {
        {"concepts", json::array()},
        {"relationships", json::array()}
    };
    for (const auto& [key, item] : state.concepts) {
        j["concepts"].push_back(AnalysisJsonCodec::EncodeConcept(item));
    }
    for (const auto& [key, stored] : state.relationships) {
        json r = AnalysisJsonCodec::EncodeRelationship(stored.relationship);
        r["occurrences"] = stored.occurrences;
        j["relationships"].push_back(std::move(r));
    }

    fs::path finalPath = snapshotPath();

    // Create unique temp path: knowledge.json.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        fs::create_directories(finalPath.parent_path());
    } catch (const std::exception& e) {
        throw PersistenceUnavailable(std::string("cannot create knowledge directory: ") + e.what());
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw PersistenceUnavailable("cannot open temp file " + tempPath.string());
        }
        ofs << j.dump(2);
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw PersistenceUnavailable("write failed for " + tempPath.string());
        }
    }

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw PersistenceUnavailable("rename failed: " + ec.message());
    }
}

void KnowledgeRepositoryFs::upsertConcept(const Concept& item, int frequencyDelta) {
    std::lock_guard<std::mutex> lock(m_mutex);
    State next = m_state;

    auto it = next.concepts.find({item.name, item.entityType});
    if (it == next.concepts.end()) {
        Concept stored = item;
        stored.frequency = frequencyDelta;
        next.concepts.emplace(ConceptKey{item.name, item.entityType}, std::move(stored));
    } else {
        it->second.frequency += frequencyDelta;
    }

    writeSnapshot(next);
    m_state = std::move(next);
}

void KnowledgeRepositoryFs::upsertRelationship(const Relationship& relationship, double strengthDelta) {
    std::lock_guard<std::mutex> lock(m_mutex);
    State next = m_state;

    RelationshipKey key{relationship.subject, relationship.predicateLemma, relationship.object,
                        relationship.dependencyType};
    auto it = next.relationships.find(key);
    if (it == next.relationships.end()) {
        StoredRelationship stored;
        stored.relationship = relationship;
        stored.relationship.strength = strengthDelta;
        stored.occurrences = 1;
        next.relationships.emplace(std::move(key), std::move(stored));
    } else {
        it->second.relationship.strength += strengthDelta;
        it->second.occurrences++;
    }

    writeSnapshot(next);
    m_state = std::move(next);
}

size_t KnowledgeRepositoryFs::conceptCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.concepts.size();
}

size_t KnowledgeRepositoryFs::relationshipCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.relationships.size();
}

std::optional<Concept> KnowledgeRepositoryFs::findConcept(const std::string& name, const std::string& entityType) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_state.concepts.find({name, entityType});
    if (it == m_state.concepts.end()) return std::nullopt;
    return it->second;
}

std::vector<Concept> KnowledgeRepositoryFs::topConcepts(size_t limit) const {
    std::vector<Concept> all;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        all.reserve(m_state.concepts.size());
        for (const auto& [key, item] : m_state.concepts) {
            all.push_back(item);
        }
    }
    std::stable_sort(all.begin(), all.end(), [](const Concept& a, const Concept& b) {
        if (a.frequency != b.frequency) return a.frequency > b.frequency;
        return a.name < b.name;
    });
    if (all.size() > limit) all.resize(limit);
    return all;
}

std::vector<StoredRelationship> KnowledgeRepositoryFs::findRelationships(const std::string& subject) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<StoredRelationship> out;
    for (const auto& [key, stored] : m_state.relationships) {
        if (stored.relationship.subject == subject) out.push_back(stored);
    }
    return out;
}

} // namespace ethoscope::infrastructure
