/**
 * @file JsonReminderStore.hpp
 * @brief ReminderScheduler persisted as a JSON file.
 */

#pragma once
#include "domain/ReminderScheduler.hpp"
#include <filesystem>
#include <mutex>

namespace ideasorter::infrastructure {

/**
 * @class JsonReminderStore
 * @brief Durable reminder list. markSent is persisted before it returns true,
 * so a restart never delivers the same reminder twice.
 */
class JsonReminderStore : public domain::ReminderScheduler {
public:
    explicit JsonReminderStore(const std::filesystem::path& filePath);

    domain::ReminderRecord schedule(const std::string& message, const domain::LocalDateTime& fireAt) override;
    std::vector<domain::ReminderRecord> dueReminders(const domain::LocalDateTime& now) override;
    bool markSent(const std::string& id) override;
    bool cancel(const std::string& id) override;
    std::vector<domain::ReminderRecord> all() override;

private:
    void load();
    void persist(const std::vector<domain::ReminderRecord>& records, long long nextId) const;

    std::filesystem::path m_path;
    std::mutex m_mutex;
    std::vector<domain::ReminderRecord> m_records;
    long long m_nextId = 1;
};

} // namespace ideasorter::infrastructure
