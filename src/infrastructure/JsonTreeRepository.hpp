/**
 * @file JsonTreeRepository.hpp
 * @brief TreeRepository persisted as a single JSON document.
 */

#pragma once
#include "domain/TreeRepository.hpp"
#include <filesystem>
#include <mutex>

namespace ideasorter::infrastructure {

/**
 * @class JsonTreeRepository
 * @brief Keeps the tree and the unclassified inbox in memory and mirrors them to disk.
 *
 * Document layout: {"groups": [...], "unclassified": [{"text", "received_at"}]}.
 * Every batch is reconciled on a copy, written atomically and only then
 * published, so a failed write leaves both memory and disk unchanged.
 */
class JsonTreeRepository : public domain::TreeRepository {
public:
    /** @param filePath Document path; loaded immediately when it exists. */
    explicit JsonTreeRepository(const std::filesystem::path& filePath);

    domain::KnowledgeTree loadTree() override;
    domain::ChangeSet applyBatch(const std::vector<domain::CanonicalMutation>& batch,
                                 const CommitStep& beforeCommit = {}) override;
    void storeUnclassified(const domain::UnclassifiedNote& note) override;
    std::vector<domain::UnclassifiedNote> unclassified() override;
    void clear() override;

    const std::filesystem::path& path() const { return m_path; }

private:
    void load();
    void persist(const domain::KnowledgeTree& tree, const std::vector<domain::UnclassifiedNote>& inbox) const;

    std::filesystem::path m_path;
    std::mutex m_mutex;
    domain::KnowledgeTree m_tree;
    std::vector<domain::UnclassifiedNote> m_unclassified;
};

} // namespace ideasorter::infrastructure
