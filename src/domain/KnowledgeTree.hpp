/**
 * @file KnowledgeTree.hpp
 * @brief Two-level knowledge tree: groups, optional subgroups, ideas.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ideasorter::domain {

/**
 * @struct Subgroup
 * @brief Second-level node scoping ideas by place or context.
 */
struct Subgroup {
    std::string name;               ///< Unique (case-insensitive) within its group.
    std::vector<std::string> ideas; ///< Insertion ordered.
};

/**
 * @struct Group
 * @brief Top-level category node.
 */
struct Group {
    std::string name;                ///< Unique (case-insensitive) within the tree.
    std::vector<std::string> ideas;  ///< Root-level ideas, insertion ordered.
    std::vector<Subgroup> subgroups; ///< Insertion ordered.

    /** @brief Case-insensitive subgroup lookup. Returns nullptr when absent. */
    Subgroup* findSubgroup(const std::string& subgroupName);
    const Subgroup* findSubgroup(const std::string& subgroupName) const;

    /** @brief Removes a subgroup by case-insensitive name. */
    bool removeSubgroup(const std::string& subgroupName);
};

/**
 * @class KnowledgeTree
 * @brief Value type holding every group. Copying it copies the whole tree.
 */
class KnowledgeTree {
public:
    KnowledgeTree() = default;
    explicit KnowledgeTree(std::vector<Group> groups);

    /** @brief Case-insensitive group lookup. Returns nullptr when absent. */
    Group* findGroup(const std::string& groupName);
    const Group* findGroup(const std::string& groupName) const;

    /** @brief Exact (byte-for-byte) group lookup, used by renames. */
    Group* findGroupExact(const std::string& groupName);

    /** @brief Appends a new empty group. Caller checks uniqueness first. */
    Group& addGroup(const std::string& groupName);

    /** @brief Removes a group with all its subgroups and ideas. */
    bool removeGroup(const std::string& groupName);

    const std::vector<Group>& groups() const { return m_groups; }
    bool empty() const { return m_groups.empty(); }
    void clear() { m_groups.clear(); }

    /** @brief Names of all groups, in order. */
    std::vector<std::string> groupNames() const;

    /** @brief Serializes to [{"name","ideas","subgroups":[{"name","ideas"}]}]. */
    nlohmann::json toJson() const;

    /** @brief Parses the toJson() layout; malformed entries are skipped. */
    static KnowledgeTree FromJson(const nlohmann::json& j);

private:
    std::vector<Group> m_groups;
};

bool operator==(const Subgroup& a, const Subgroup& b);
bool operator==(const Group& a, const Group& b);
bool operator==(const KnowledgeTree& a, const KnowledgeTree& b);

} // namespace ideasorter::domain
