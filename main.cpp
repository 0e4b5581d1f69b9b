#include <iostream>
#include <memory>
#include <string>
#include <filesystem>
#include <chrono>

#include "app/ConsoleApp.hpp"
#include "application/NoteProcessingService.hpp"
#include "application/GroupSummaryService.hpp"
#include "application/ReminderPoller.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OllamaOracle.hpp"
#include "infrastructure/JsonTreeRepository.hpp"
#include "infrastructure/JsonReminderStore.hpp"

namespace fs = std::filesystem;
using namespace ideasorter;

// === APPLICATION STATE ===
struct AppState {
    infrastructure::AppConfig config;
    std::shared_ptr<infrastructure::OllamaOracle> oracle;
    std::shared_ptr<infrastructure::JsonTreeRepository> repository;
    std::shared_ptr<infrastructure::JsonReminderStore> reminders;
    std::shared_ptr<application::NoteProcessingService> noteService;
    std::shared_ptr<application::GroupSummaryService> summaryService;
    std::unique_ptr<app::ConsoleApp> console;
    std::unique_ptr<application::ReminderPoller> poller; ///< Declared last: stops before the console goes away.
};

namespace {

bool Init(AppState& state, const fs::path& configPath) {
    state.config = infrastructure::ConfigLoader::Load(configPath);
    std::cout << "[Main] Config: " << configPath << " (locale " << state.config.locale
              << ", data " << state.config.dataDir << ")" << std::endl;

    try {
        fs::path dataDir = state.config.dataDir;
        state.repository = std::make_shared<infrastructure::JsonTreeRepository>(dataDir / "tree.json");
        state.reminders = std::make_shared<infrastructure::JsonReminderStore>(dataDir / "reminders.json");
    } catch (const std::exception& e) {
        std::cerr << "[Main] Cannot open data stores: " << e.what() << std::endl;
        return false;
    }

    state.oracle = std::make_shared<infrastructure::OllamaOracle>(state.config.ollama);
    state.oracle->initialize();

    state.noteService = std::make_shared<application::NoteProcessingService>(
        state.oracle, state.repository, state.reminders, state.config.locale);
    state.summaryService = std::make_shared<application::GroupSummaryService>(state.oracle, state.config.locale);

    state.console = std::make_unique<app::ConsoleApp>(
        app::ConsoleServices{state.repository, state.reminders, state.noteService, state.summaryService},
        std::cout, std::cerr);

    app::ConsoleApp* console = state.console.get();
    state.poller = std::make_unique<application::ReminderPoller>(
        state.reminders,
        std::chrono::seconds(state.config.reminderPollSeconds),
        [console](const domain::ReminderRecord& reminder) { console->deliverReminder(reminder); });
    state.poller->start();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    fs::path configPath = argc > 1 ? fs::path(argv[1]) : infrastructure::ConfigLoader::DefaultConfigPath();

    AppState state;
    if (!Init(state, configPath)) {
        return 1;
    }

    int exitCode = state.console->Run(std::cin);

    state.poller->stop();
    std::cout << "[Main] Bye." << std::endl;
    return exitCode;
}
