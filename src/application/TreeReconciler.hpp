/**
 * @file TreeReconciler.hpp
 * @brief Applies canonical mutations to a knowledge tree value.
 */

#pragma once
#include <vector>
#include "domain/KnowledgeTree.hpp"
#include "domain/Mutation.hpp"

namespace ideasorter::application {

/**
 * @class TreeReconciler
 * @brief Pure add/delete/rename/remind state machine over the tree.
 *
 * Conflicts (missing rename target, nothing to delete) are recorded in the
 * ChangeSet with no structural change. Re-applying an add batch is a no-op.
 */
class TreeReconciler {
public:
    struct Result {
        domain::KnowledgeTree tree;
        domain::ChangeSet changes;
    };

    /** @brief Applies an ordered batch to a copy of tree. */
    static Result Reconcile(const domain::KnowledgeTree& tree, const std::vector<domain::CanonicalMutation>& batch);

    /** @brief Applies one mutation in place. */
    static domain::ChangeSet Apply(domain::KnowledgeTree& tree, const domain::CanonicalMutation& mutation);

private:
    static void ApplyAdd(domain::KnowledgeTree& tree, const domain::CanonicalMutation& m, domain::ChangeSet& out);
    static void ApplyDelete(domain::KnowledgeTree& tree, const domain::CanonicalMutation& m, domain::ChangeSet& out);
    static void ApplyRemind(const domain::CanonicalMutation& m, domain::ChangeSet& out);
};

} // namespace ideasorter::application
