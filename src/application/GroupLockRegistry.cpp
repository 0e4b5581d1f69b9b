/**
 * @file GroupLockRegistry.cpp
 * @brief Implementation of GroupLockRegistry.
 */

#include "application/GroupLockRegistry.hpp"
#include "domain/TextUtils.hpp"

namespace ideasorter::application {

bool GroupLockRegistry::Guard::covers(const std::vector<std::string>& groupNames) const {
    for (const auto& name : groupNames) {
        std::string key = domain::text::NormalizeKey(name);
        if (!key.empty() && m_keys.count(key) == 0) return false;
    }
    return true;
}

std::shared_ptr<std::mutex> GroupLockRegistry::mutexFor(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto& slot = m_locks[key];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

GroupLockRegistry::Guard GroupLockRegistry::lock(const std::vector<std::string>& groupNames) {
    Guard guard;
    for (const auto& name : groupNames) {
        std::string key = domain::text::NormalizeKey(name);
        if (!key.empty()) guard.m_keys.insert(key);
    }

    // std::set iterates in sorted order.
    for (const auto& key : guard.m_keys) {
        auto mutex = mutexFor(key);
        guard.m_locks.emplace_back(*mutex);
        guard.m_mutexes.push_back(std::move(mutex));
    }
    return guard;
}

size_t GroupLockRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    return m_locks.size();
}

} // namespace ideasorter::application
