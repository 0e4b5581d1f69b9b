/**
 * @file ConsoleApp.cpp
 * @brief Implementation of the console front end.
 */

#include "app/ConsoleApp.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <iostream>
#include <optional>
#include <utility>

namespace ideasorter::app {

namespace {

void PrintTree(std::ostream& out, const domain::KnowledgeTree& tree) {
    if (tree.empty()) {
        out << "(empty)" << std::endl;
        return;
    }
    for (const auto& group : tree.groups()) {
        out << "* " << group.name << std::endl;
        for (const auto& idea : group.ideas) {
            out << "    - " << idea << std::endl;
        }
        for (const auto& sub : group.subgroups) {
            out << "    > " << sub.name << std::endl;
            for (const auto& idea : sub.ideas) {
                out << "        - " << idea << std::endl;
            }
        }
    }
}

void PrintResult(std::ostream& out, const application::NoteProcessingResult& result) {
    out << "[" << application::StatusToString(result.status) << "]";
    if (!result.message.empty()) out << " " << result.message;
    out << std::endl;

    out << result.toJson().dump(2) << std::endl;

    for (const auto& change : result.changes.changes) {
        out << "  + " << domain::ChangeKindToString(change.kind) << ": " << change.group;
        if (!change.subgroup.empty()) out << " / " << change.subgroup;
        if (!change.detail.empty()) out << " -> " << change.detail;
        out << std::endl;
    }
    for (const auto& conflict : result.changes.conflicts) {
        out << "  ! " << conflict << std::endl;
    }
}

void PrintSummary(std::ostream& out, const application::SummaryReport& report) {
    for (const auto& group : report.groups) {
        out << "## " << group.suggestedTitle << " (" << group.groupName << ")" << std::endl;
        out << group.summary << std::endl;
        for (const auto& point : group.keyPoints) {
            out << "  [" << point.category << "] " << point.text << std::endl;
        }
        out << std::endl;
    }
    if (!report.globalSummary.empty()) {
        out << "== " << report.globalSummary << std::endl;
    }
}

} // namespace

ConsoleApp::ConsoleApp(ConsoleServices services, std::ostream& out, std::ostream& err)
    : m_services(std::move(services)), m_out(out), m_err(err) {}

void ConsoleApp::deliverReminder(const domain::ReminderRecord& reminder) {
    std::lock_guard<std::mutex> lock(m_outputMutex);
    m_out << "\n*** REMINDER: " << reminder.message << " ***" << std::endl;
}

void ConsoleApp::printHelp() {
    std::lock_guard<std::mutex> lock(m_outputMutex);
    m_out << "Type a note and press Enter to classify it.\n"
          << "Commands:\n"
          << "  show | ver           print the knowledge tree\n"
          << "  clear | limpiar      remove every group\n"
          << "  process | procesar   summarize the groups\n"
          << "  reminders            list scheduled reminders\n"
          << "  help                 this text\n"
          << "  quit | salir         exit" << std::endl;
}

void ConsoleApp::showTree() {
    domain::KnowledgeTree tree = m_services.repository->loadTree();
    std::lock_guard<std::mutex> lock(m_outputMutex);
    PrintTree(m_out, tree);
}

void ConsoleApp::clearTree() {
    try {
        m_services.repository->clear();
        std::lock_guard<std::mutex> lock(m_outputMutex);
        m_out << "[Console] Tree cleared." << std::endl;
    } catch (const domain::PersistenceError& e) {
        std::lock_guard<std::mutex> lock(m_outputMutex);
        m_err << "[Console] Clear failed: " << e.what() << std::endl;
    }
}

void ConsoleApp::summarize() {
    std::optional<application::SummaryReport> report;
    std::string failure;
    try {
        report = m_services.summaryService->processGroups(m_services.repository->loadTree());
    } catch (const domain::DecodeError& e) {
        failure = std::string(e.what()) + "\n" + e.rawText();
    } catch (const domain::OracleUnavailableError& e) {
        failure = std::string("Oracle unavailable: ") + e.what();
    }

    std::lock_guard<std::mutex> lock(m_outputMutex);
    if (report) {
        PrintSummary(m_out, *report);
    } else {
        m_err << "[Console] " << failure << std::endl;
    }
}

void ConsoleApp::listReminders() {
    auto reminders = m_services.reminders->all();
    std::lock_guard<std::mutex> lock(m_outputMutex);
    for (const auto& r : reminders) {
        m_out << "  " << r.id << "  " << r.fireAt.toIsoString() << "  "
              << (r.sent ? "sent   " : "pending") << "  " << r.message << std::endl;
    }
}

void ConsoleApp::processNote(const std::string& note) {
    auto result = m_services.noteService->processNote(note);
    std::lock_guard<std::mutex> lock(m_outputMutex);
    PrintResult(m_out, result);
}

bool ConsoleApp::handleLine(const std::string& line) {
    const std::string input = domain::text::Trim(line);
    if (input.empty()) return true;
    const std::string command = domain::text::ToLower(input);

    if (command == "quit" || command == "salir" || command == "exit") {
        return false;
    } else if (command == "help" || command == "ayuda") {
        printHelp();
    } else if (command == "show" || command == "ver") {
        showTree();
    } else if (command == "clear" || command == "limpiar") {
        clearTree();
    } else if (command == "process" || command == "procesar") {
        summarize();
    } else if (command == "reminders" || command == "recordatorios") {
        listReminders();
    } else {
        processNote(input);
    }
    return true;
}

int ConsoleApp::Run(std::istream& in) {
    {
        std::lock_guard<std::mutex> lock(m_outputMutex);
        m_out << "IdeaSorter - note classifier. Type 'help' for commands." << std::endl;
    }

    std::string line;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_outputMutex);
            m_out << "> " << std::flush;
        }
        if (!std::getline(in, line)) break;
        if (!handleLine(line)) break;
    }
    return 0;
}

} // namespace ideasorter::app
