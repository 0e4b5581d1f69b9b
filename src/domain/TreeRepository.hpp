/**
 * @file TreeRepository.hpp
 * @brief Interface for durable storage of the knowledge tree.
 */

#pragma once
#include <functional>
#include <string>
#include <vector>
#include "domain/KnowledgeTree.hpp"
#include "domain/Mutation.hpp"

namespace ideasorter::domain {

/**
 * @struct UnclassifiedNote
 * @brief A note kept aside because the oracle could not be reached.
 */
struct UnclassifiedNote {
    std::string text;
    std::string receivedAt; ///< ISO local time.
};

/**
 * @class TreeRepository
 * @brief Abstract store of the tree and of the unclassified inbox.
 *
 * A batch is applied as one transaction: readers never observe a partially
 * applied batch, and a failed write leaves the previous tree in place.
 */
class TreeRepository {
public:
    /**
     * @brief Work that must succeed together with the batch, run after
     * reconciliation and before the new tree is written. It may update the
     * change set (e.g. fill in reminder ids); throwing aborts the batch.
     */
    using CommitStep = std::function<void(ChangeSet&)>;

    virtual ~TreeRepository() = default;

    /** @brief Consistent snapshot of the current tree. */
    virtual KnowledgeTree loadTree() = 0;

    /**
     * @brief Reconciles and persists an ordered batch.
     * @param beforeCommit Optional step run before the write; its exception
     *        propagates and leaves the tree untouched.
     * @throws PersistenceError when the new state cannot be written.
     */
    virtual ChangeSet applyBatch(const std::vector<CanonicalMutation>& batch,
                                 const CommitStep& beforeCommit = {}) = 0;

    /** @brief Keeps a note for later classification. */
    virtual void storeUnclassified(const UnclassifiedNote& note) = 0;

    virtual std::vector<UnclassifiedNote> unclassified() = 0;

    /** @brief Removes every group and the unclassified inbox. */
    virtual void clear() = 0;
};

} // namespace ideasorter::domain
