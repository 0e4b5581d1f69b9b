/**
 * @file ReminderScheduler.hpp
 * @brief Interface for the reminder scheduling collaborator.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Mutation.hpp"
#include "domain/LocalDateTime.hpp"

namespace ideasorter::domain {

/**
 * @class ReminderScheduler
 * @brief Keeps scheduled notifications until a poller delivers them.
 */
class ReminderScheduler {
public:
    virtual ~ReminderScheduler() = default;

    /**
     * @brief Stores a new unsent reminder.
     * @return The stored record with its assigned id.
     * @throws PersistenceError when the reminder cannot be written.
     */
    virtual ReminderRecord schedule(const std::string& message, const LocalDateTime& fireAt) = 0;

    /** @brief Unsent reminders whose fire time is at or before now, oldest first. */
    virtual std::vector<ReminderRecord> dueReminders(const LocalDateTime& now) = 0;

    /**
     * @brief Claims a reminder for delivery.
     * @return True only for the first call on an unsent reminder.
     */
    virtual bool markSent(const std::string& id) = 0;

    /**
     * @brief Removes an undelivered reminder (rollback of a failed batch).
     * @return False when the id is unknown or already sent.
     * @throws PersistenceError when the removal cannot be written.
     */
    virtual bool cancel(const std::string& id) = 0;

    virtual std::vector<ReminderRecord> all() = 0;
};

} // namespace ideasorter::domain
