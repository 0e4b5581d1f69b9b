/**
 * @file ReminderPoller.hpp
 * @brief Background job delivering due reminders.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "domain/ReminderScheduler.hpp"

namespace ideasorter::application {

/**
 * @class ReminderPoller
 * @brief Polls the scheduler at a fixed interval and hands each due reminder
 * to a delivery callback after claiming it with markSent.
 */
class ReminderPoller {
public:
    using DeliveryCallback = std::function<void(const domain::ReminderRecord&)>;
    using Clock = std::function<domain::LocalDateTime()>;

    ReminderPoller(std::shared_ptr<domain::ReminderScheduler> scheduler,
                   std::chrono::milliseconds interval,
                   DeliveryCallback deliver,
                   Clock clock = &domain::LocalDateTime::Now);
    ~ReminderPoller();

    /** @brief Starts the worker thread (no-op when already running). */
    void start();

    /** @brief Wakes and joins the worker thread. */
    void stop();

    /**
     * @brief Delivers everything due right now.
     * @return Number of reminders delivered by this call.
     */
    size_t pollOnce();

private:
    void workerLoop();

    std::shared_ptr<domain::ReminderScheduler> m_scheduler;
    std::chrono::milliseconds m_interval;
    DeliveryCallback m_deliver;
    Clock m_clock;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    std::atomic<bool> m_running{false};
};

} // namespace ideasorter::application
