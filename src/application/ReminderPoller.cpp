/**
 * @file ReminderPoller.cpp
 * @brief Implementation of ReminderPoller.
 */

#include "application/ReminderPoller.hpp"
#include "domain/Errors.hpp"
#include <iostream>

namespace ideasorter::application {

ReminderPoller::ReminderPoller(std::shared_ptr<domain::ReminderScheduler> scheduler,
                               std::chrono::milliseconds interval,
                               DeliveryCallback deliver,
                               Clock clock)
    : m_scheduler(std::move(scheduler)),
      m_interval(interval),
      m_deliver(std::move(deliver)),
      m_clock(std::move(clock)) {}

ReminderPoller::~ReminderPoller() {
    stop();
}

void ReminderPoller::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;
    m_running = true;
    m_worker = std::thread(&ReminderPoller::workerLoop, this);
}

void ReminderPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

size_t ReminderPoller::pollOnce() {
    size_t delivered = 0;
    for (const auto& reminder : m_scheduler->dueReminders(m_clock())) {
        try {
            if (!m_scheduler->markSent(reminder.id)) continue;
        } catch (const domain::PersistenceError& e) {
            std::cerr << "[ReminderPoller] Could not claim reminder " << reminder.id << ": " << e.what() << std::endl;
            continue;
        }
        std::cout << "[ReminderPoller] Delivering reminder " << reminder.id << ": " << reminder.message << std::endl;
        if (m_deliver) m_deliver(reminder);
        ++delivered;
    }
    return delivered;
}

void ReminderPoller::workerLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, m_interval, [this] { return !m_running; });
            if (!m_running) return;
        }

        try {
            pollOnce();
        } catch (const std::exception& e) {
            std::cerr << "[ReminderPoller] Poll failed: " << e.what() << std::endl;
        }
    }
}

} // namespace ideasorter::application
