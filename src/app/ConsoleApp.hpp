/**
 * @file ConsoleApp.hpp
 * @brief Line-oriented console front end for IdeaSorter.
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include "application/NoteProcessingService.hpp"
#include "application/GroupSummaryService.hpp"
#include "domain/ReminderScheduler.hpp"
#include "domain/TreeRepository.hpp"

namespace ideasorter::app {

/**
 * @struct ConsoleServices
 * @brief Everything the console drives. All pointers must be set.
 */
struct ConsoleServices {
    std::shared_ptr<domain::TreeRepository> repository;
    std::shared_ptr<domain::ReminderScheduler> reminders;
    std::shared_ptr<application::NoteProcessingService> noteService;
    std::shared_ptr<application::GroupSummaryService> summaryService;
};

/**
 * @class ConsoleApp
 * @brief Reads notes and commands, prints results and delivered reminders.
 *
 * Reminders arrive from the poller thread. The output lock is held only while
 * printing, never across an oracle call, so a slow classification does not
 * hold back reminder delivery.
 */
class ConsoleApp {
public:
    ConsoleApp(ConsoleServices services, std::ostream& out, std::ostream& err);

    /**
     * @brief Handles one input line (command or note).
     * @return False when the line asks to quit.
     */
    bool handleLine(const std::string& line);

    /** @brief Prints a reminder; safe to call from any thread. */
    void deliverReminder(const domain::ReminderRecord& reminder);

    /** @brief Prompt/read loop until EOF or quit. */
    int Run(std::istream& in);

private:
    void printHelp();
    void showTree();
    void clearTree();
    void summarize();
    void listReminders();
    void processNote(const std::string& note);

    ConsoleServices m_services;
    std::ostream& m_out;
    std::ostream& m_err;
    std::mutex m_outputMutex;
};

} // namespace ideasorter::app
