#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <sstream>
#include <thread>
#include "app/ConsoleApp.hpp"
#include "infrastructure/JsonTreeRepository.hpp"
#include "infrastructure/JsonReminderStore.hpp"

using namespace ideasorter;
namespace fs = std::filesystem;

// Oracle that holds every classification until the test opens the gate.
class GatedOracle : public domain::IdeaOracle {
public:
    GatedOracle() : m_gate(m_release.get_future().share()) {}

    domain::RawProposal classify(const std::string&, const domain::KnowledgeTree&, const std::string&) override {
        m_entered.set_value();
        m_gate.wait();
        return std::string(R"({"group": "jardín", "is_new_group": true, "idea": "regar rosas"})");
    }

    std::string complete(const std::string&, const std::string&) override {
        return R"({"groups": [], "global_summary": "nada"})";
    }

    std::future<void> entered() { return m_entered.get_future(); }
    void release() { m_release.set_value(); }

private:
    std::promise<void> m_entered;
    std::promise<void> m_release;
    std::shared_future<void> m_gate;
};

static domain::LocalDateTime FixedNow() {
    return *domain::LocalDateTime::FromIsoString("2026-02-28T10:00:00");
}

struct Fixture {
    fs::path root;
    std::shared_ptr<GatedOracle> oracle = std::make_shared<GatedOracle>();
    std::ostringstream out;
    std::ostringstream err;
    std::unique_ptr<app::ConsoleApp> console;

    explicit Fixture(const std::string& name) : root(fs::path("test_console_root") / name) {
        fs::remove_all(root);
        fs::create_directories(root);
        auto repository = std::make_shared<infrastructure::JsonTreeRepository>(root / "tree.json");
        auto reminders = std::make_shared<infrastructure::JsonReminderStore>(root / "reminders.json");
        app::ConsoleServices services{
            repository,
            reminders,
            std::make_shared<application::NoteProcessingService>(oracle, repository, reminders, "es", &FixedNow),
            std::make_shared<application::GroupSummaryService>(oracle, "es")
        };
        console = std::make_unique<app::ConsoleApp>(services, out, err);
    }
};

static void testReminderNotBlockedBySlowNote() {
    std::cout << "[Test] Reminders print while a note waits on the oracle..." << std::endl;
    Fixture fx("slow_note");
    auto entered = fx.oracle->entered();

    std::thread typing([&fx]() { assert(fx.console->handleLine("tengo que regar las rosas")); });
    entered.wait();

    domain::ReminderRecord reminder;
    reminder.id = "rem-1";
    reminder.message = "sacar la basura";
    auto delivery = std::async(std::launch::async, [&fx, &reminder]() { fx.console->deliverReminder(reminder); });
    bool deliveredInTime = delivery.wait_for(std::chrono::seconds(5)) == std::future_status::ready;

    fx.oracle->release();
    typing.join();
    assert(deliveredInTime);

    const std::string text = fx.out.str();
    size_t reminderAt = text.find("*** REMINDER: sacar la basura ***");
    size_t resultAt = text.find("[applied]");
    assert(reminderAt != std::string::npos);
    assert(resultAt != std::string::npos);
    assert(reminderAt < resultAt);
    std::cout << "[PASS] Reminder during slow note" << std::endl;
}

static void testCommands() {
    std::cout << "[Test] Console commands and aliases..." << std::endl;
    Fixture fx("commands");
    assert(fx.console->handleLine("   "));
    assert(fx.console->handleLine("ver"));
    assert(fx.out.str().find("(empty)") != std::string::npos);
    assert(fx.console->handleLine("AYUDA"));
    assert(fx.out.str().find("Commands:") != std::string::npos);
    assert(fx.console->handleLine("procesar"));
    assert(fx.err.str().empty());
    assert(!fx.console->handleLine("salir"));
    assert(!fx.console->handleLine(" quit "));
    std::cout << "[PASS] Commands" << std::endl;
}

int main() {
    std::cout << "=== ConsoleApp Test ===" << std::endl;
    testReminderNotBlockedBySlowNote();
    testCommands();

    std::cout << "[Test] Cleaning up..." << std::endl;
    fs::remove_all("test_console_root");
    std::cout << "=== All ConsoleApp tests passed ===" << std::endl;
    return 0;
}
