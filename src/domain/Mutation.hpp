/**
 * @file Mutation.hpp
 * @brief Classification proposals, canonical mutations and change sets.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/LocalDateTime.hpp"

namespace ideasorter::domain {

/**
 * @enum MutationAction
 * @brief What a mutation does to the tree.
 */
enum class MutationAction {
    Add,
    Delete,
    Remind
};

/** @brief "add" / "delete" / "remind". */
std::string ActionToString(MutationAction action);

/** @brief Parses an action name (case-insensitive); unknown values map to Add. */
MutationAction ActionFromString(const std::string& value);

/**
 * @struct GroupRename
 * @brief Renames an existing group to disambiguate it from a new one.
 */
struct GroupRename {
    std::string oldName;
    std::string newName;
};

/**
 * @struct ClassificationProposal
 * @brief Raw oracle proposal, after decoding but before any correction.
 */
struct ClassificationProposal {
    MutationAction action = MutationAction::Add;
    bool makesSense = true;
    std::optional<std::string> reason;
    std::optional<std::string> group;
    std::optional<std::string> subgroup;
    std::optional<std::string> idea;
    bool isNewGroup = false;
    bool isNewSubgroup = false;
    bool inheritParentIdeas = false;
    std::optional<GroupRename> rename;
    std::optional<std::string> remindAt; ///< Unvalidated timestamp text.

    /**
     * @brief Reads one proposal object. Missing or mistyped fields keep their
     * defaults; empty strings count as null.
     */
    static ClassificationProposal FromJson(const nlohmann::json& j);
};

/**
 * @struct CanonicalMutation
 * @brief Safety-checked instruction consumed by the tree reconciler.
 *
 * Invariant: rename is set only together with isNewGroup.
 */
struct CanonicalMutation {
    MutationAction action = MutationAction::Add;
    bool makesSense = true;
    std::optional<std::string> reason;
    std::optional<std::string> group;
    std::optional<std::string> subgroup;
    std::optional<std::string> idea;
    bool isNewGroup = false;
    bool isNewSubgroup = false;
    bool inheritParentIdeas = false;
    std::optional<GroupRename> rename;
    std::optional<LocalDateTime> remindAt;

    /** @brief A makes_sense=false mutation carrying the reason. */
    static CanonicalMutation NoOp(const std::string& reason);

    /** @brief Clears every creation flag and the rename (non-first batch elements). */
    void clearCreationFlags();

    /** @brief Result shape exposed to callers (camelCase keys, nulls for absent fields). */
    nlohmann::json toJson() const;
};

/**
 * @enum ChangeKind
 * @brief Kind of structural change made by the reconciler.
 */
enum class ChangeKind {
    GroupRenamed,
    GroupCreated,
    SubgroupCreated,
    IdeaAdded,
    IdeaRemoved,
    SubgroupRemoved,
    GroupRemoved,
    ReminderScheduled
};

std::string ChangeKindToString(ChangeKind kind);

/**
 * @struct StructuralChange
 * @brief One observable change made while applying a batch.
 */
struct StructuralChange {
    ChangeKind kind;
    std::string group;
    std::string subgroup;
    std::string detail; ///< Idea text, new name, or reminder message.
};

/**
 * @struct ReminderRecord
 * @brief Standalone scheduled notification produced by a remind mutation.
 */
struct ReminderRecord {
    std::string id;
    std::string message;
    LocalDateTime fireAt;
    bool sent = false;
};

/**
 * @struct ChangeSet
 * @brief Everything a batch did. Conflicts are recorded, never thrown.
 */
struct ChangeSet {
    std::vector<StructuralChange> changes;
    std::vector<std::string> conflicts;
    std::vector<ReminderRecord> reminders;

    bool empty() const { return changes.empty(); }
    void append(const ChangeSet& other);
};

} // namespace ideasorter::domain
