/**
 * @file GroupLockRegistry.hpp
 * @brief Per-group mutexes serializing read-modify-write cycles on the tree.
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ideasorter::application {

/**
 * @class GroupLockRegistry
 * @brief Hands out locks keyed by normalized group name.
 *
 * Several names are always locked in sorted key order, so two batches that
 * touch overlapping groups cannot deadlock.
 */
class GroupLockRegistry {
public:
    /**
     * @class Guard
     * @brief Holds a set of group locks until destroyed.
     */
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&&) = default;
        Guard& operator=(Guard&&) = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        /** @brief True when every name (normalized) is held by this guard. */
        bool covers(const std::vector<std::string>& groupNames) const;

        const std::set<std::string>& keys() const { return m_keys; }

    private:
        friend class GroupLockRegistry;

        std::set<std::string> m_keys;
        std::vector<std::shared_ptr<std::mutex>> m_mutexes; // outlives m_locks
        std::vector<std::unique_lock<std::mutex>> m_locks;
    };

    /** @brief Blocks until every named group is locked. Empty names are ignored. */
    Guard lock(const std::vector<std::string>& groupNames);

    /** @brief Number of distinct group keys seen so far. */
    size_t size() const;

private:
    std::shared_ptr<std::mutex> mutexFor(const std::string& key);

    mutable std::mutex m_registryMutex;
    std::map<std::string, std::shared_ptr<std::mutex>> m_locks;
};

} // namespace ideasorter::application
