#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <thread>
#include <vector>
#include "application/NoteProcessingService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/JsonTreeRepository.hpp"
#include "infrastructure/JsonReminderStore.hpp"

using namespace ideasorter;
using application::NoteProcessingResult;
using Status = NoteProcessingResult::Status;
using json = nlohmann::json;
namespace fs = std::filesystem;

// Mock oracle answering through a test-supplied function.
class MockOracle : public domain::IdeaOracle {
public:
    using Answer = std::function<domain::RawProposal(const std::string&)>;

    explicit MockOracle(Answer answer) : m_answer(std::move(answer)) {}

    domain::RawProposal classify(const std::string& noteText, const domain::KnowledgeTree&, const std::string&) override {
        ++calls;
        return m_answer(noteText);
    }

    std::string complete(const std::string&, const std::string&) override {
        return "{}";
    }

    std::atomic<int> calls{0};

private:
    Answer m_answer;
};

// Repository whose writes always fail.
class FailingRepository : public domain::TreeRepository {
public:
    domain::KnowledgeTree loadTree() override { return {}; }
    domain::ChangeSet applyBatch(const std::vector<domain::CanonicalMutation>&, const CommitStep&) override {
        throw domain::PersistenceError("disk full");
    }
    void storeUnclassified(const domain::UnclassifiedNote&) override {
        throw domain::PersistenceError("disk full");
    }
    std::vector<domain::UnclassifiedNote> unclassified() override { return {}; }
    void clear() override {}
};

// Reminder store that accepts a fixed number of reminders, then fails.
class FlakyScheduler : public domain::ReminderScheduler {
public:
    FlakyScheduler(std::shared_ptr<domain::ReminderScheduler> store, int accepted)
        : m_store(std::move(store)), m_accepted(accepted) {}

    domain::ReminderRecord schedule(const std::string& message, const domain::LocalDateTime& fireAt) override {
        if (m_accepted-- <= 0) throw domain::PersistenceError("reminder store full");
        return m_store->schedule(message, fireAt);
    }
    std::vector<domain::ReminderRecord> dueReminders(const domain::LocalDateTime& now) override {
        return m_store->dueReminders(now);
    }
    bool markSent(const std::string& id) override { return m_store->markSent(id); }
    bool cancel(const std::string& id) override { return m_store->cancel(id); }
    std::vector<domain::ReminderRecord> all() override { return m_store->all(); }

private:
    std::shared_ptr<domain::ReminderScheduler> m_store;
    int m_accepted;
};

static domain::RawProposal ShoppingWithTwoReminders(const std::string&) {
    return json::array({
        {{"action", "add"}, {"group", "compras"}, {"is_new_group", true}, {"idea", "leche"}},
        {{"action", "remind"}, {"idea", "pagar la luz"}, {"remind_at", "2026-03-02T09:00:00"}},
        {{"action", "remind"}, {"idea", "pagar el agua"}, {"remind_at", "2026-03-02T10:00:00"}}
    });
}

static domain::LocalDateTime FixedNow() {
    return *domain::LocalDateTime::FromIsoString("2026-02-28T10:00:00");
}

struct Fixture {
    fs::path root;
    std::shared_ptr<infrastructure::JsonTreeRepository> repository;
    std::shared_ptr<infrastructure::JsonReminderStore> reminders;

    explicit Fixture(const std::string& name) : root(fs::path("test_note_processing") / name) {
        fs::remove_all(root);
        fs::create_directories(root);
        repository = std::make_shared<infrastructure::JsonTreeRepository>(root / "tree.json");
        reminders = std::make_shared<infrastructure::JsonReminderStore>(root / "reminders.json");
    }

    application::NoteProcessingService service(std::shared_ptr<domain::IdeaOracle> oracle, const std::string& locale) {
        return application::NoteProcessingService(oracle, repository, reminders, locale, &FixedNow);
    }
};

static void testReminderShortCircuit() {
    std::cout << "[Test] Reminder notes never reach the oracle..." << std::endl;
    Fixture fx("reminder");
    auto oracle = std::make_shared<MockOracle>([](const std::string&) -> domain::RawProposal { return std::string("{}"); });
    auto service = fx.service(oracle, "en");

    auto result = service.processNote("  Remind me tomorrow at 9 to call the dentist  ");
    assert(result.status == Status::Applied);
    assert(oracle->calls == 0);
    assert(result.mutations.size() == 1);

    json out = result.toJson();
    assert(out[0]["action"] == "remind");
    assert(out[0]["remindAt"] == "2026-03-01T09:00:00");
    assert(out[0]["idea"] == "call the dentist");

    auto stored = fx.reminders->all();
    assert(stored.size() == 1);
    assert(stored[0].message == "call the dentist");
    assert(!result.changes.reminders.empty() && !result.changes.reminders[0].id.empty());
    assert(fx.repository->loadTree().empty());
    std::cout << "[PASS] Reminder short-circuit" << std::endl;
}

static void testFencedListIsSplit() {
    std::cout << "[Test] Fenced oracle answer with a list idea..." << std::endl;
    Fixture fx("split");
    auto oracle = std::make_shared<MockOracle>([](const std::string&) -> domain::RawProposal {
        return std::string("Claro:\n```json\n{\"group\": \"compras\", \"is_new_group\": true, "
                           "\"idea\": \"pan, queso y leche\"}\n```");
    });
    auto service = fx.service(oracle, "es");

    auto result = service.processNote("tengo que comprar pan, queso y leche");
    assert(result.status == Status::Applied);
    assert(result.mutations.size() == 3);
    assert(result.mutations[0].isNewGroup);
    assert(!result.mutations[1].isNewGroup && !result.mutations[2].isNewGroup);

    auto tree = fx.repository->loadTree();
    assert((tree.findGroup("compras")->ideas == std::vector<std::string>{"pan", "queso", "leche"}));
    std::cout << "[PASS] List split" << std::endl;
}

static void testStructuredToolAnswer() {
    std::cout << "[Test] Structured answers skip the decoder..." << std::endl;
    Fixture fx("structured");
    auto oracle = std::make_shared<MockOracle>([](const std::string&) -> domain::RawProposal {
        return json::array({
            {{"action", "add"}, {"group", "Huerto"}, {"is_new_group", true}, {"idea", "plantar tomates"}},
            {{"action", "add"}, {"group", "Huerto"}, {"subgroup", "Riego"}, {"is_new_subgroup", true},
             {"idea", "instalar goteo"}}
        });
    });
    auto service = fx.service(oracle, "es");

    auto result = service.processNote("plantar tomates en el huerto e instalar goteo");
    assert(result.status == Status::Applied);
    auto tree = fx.repository->loadTree();
    const auto* huerto = tree.findGroup("Huerto");
    assert(huerto != nullptr);
    assert(huerto->ideas.size() == 1);
    assert(huerto->findSubgroup("Riego") != nullptr);
    assert(huerto->findSubgroup("Riego")->ideas.size() == 1);
    std::cout << "[PASS] Structured answer" << std::endl;
}

static void testFailureClassesAreDistinct() {
    std::cout << "[Test] Decode failure, rejection and oracle outage are distinguishable..." << std::endl;
    Fixture fx("failures");

    auto garbled = std::make_shared<MockOracle>([](const std::string&) -> domain::RawProposal {
        return std::string("no sé qué decir");
    });
    auto decode = fx.service(garbled, "es").processNote("algo raro");
    assert(decode.status == Status::DecodeFailed);
    assert(decode.isRetryable());
    assert(decode.rawOracleText == "no sé qué decir");

    auto refusing = std::make_shared<MockOracle>([](const std::string&) -> domain::RawProposal {
        return std::string(R"({"makes_sense": false, "reason": "solo ruido"})");
    });
    auto rejected = fx.service(refusing, "es").processNote("asdfgh");
    assert(rejected.status == Status::Rejected);
    assert(!rejected.isRetryable());
    assert(rejected.message == "solo ruido");
    assert(rejected.mutations.size() == 1 && !rejected.mutations[0].makesSense);

    auto offline = std::make_shared<MockOracle>([](const std::string&) -> domain::RawProposal {
        throw domain::OracleUnavailableError("connection refused");
    });
    auto stored = fx.service(offline, "es").processNote("ideas para el cumpleaños");
    assert(stored.status == Status::StoredUnclassified);
    assert(stored.isRetryable());
    auto inbox = fx.repository->unclassified();
    assert(inbox.size() == 1);
    assert(inbox[0].text == "ideas para el cumpleaños");
    assert(inbox[0].receivedAt == "2026-02-28T10:00:00");

    auto empty = fx.service(garbled, "es").processNote("   ");
    assert(empty.status == Status::Rejected);
    assert(fx.repository->loadTree().empty());
    std::cout << "[PASS] Failure classes" << std::endl;
}

static void testPersistenceFailure() {
    std::cout << "[Test] Write failures are reported, not thrown..." << std::endl;
    auto oracle = std::make_shared<MockOracle>([](const std::string&) -> domain::RawProposal {
        return std::string(R"({"group": "viajes", "is_new_group": true, "idea": "Roma"})");
    });
    auto repository = std::make_shared<FailingRepository>();
    fs::path root = fs::path("test_note_processing") / "persistence";
    fs::create_directories(root);
    auto reminders = std::make_shared<infrastructure::JsonReminderStore>(root / "reminders.json");
    application::NoteProcessingService service(oracle, repository, reminders, "es", &FixedNow);

    auto result = service.processNote("viaje a Roma en verano");
    assert(result.status == Status::PersistenceFailed);
    assert(!result.isRetryable());
    assert(result.message == "disk full");
    std::cout << "[PASS] Persistence failure" << std::endl;
}

static void testReminderFailureRollsBackBatch() {
    std::cout << "[Test] A failing reminder write undoes the whole batch..." << std::endl;
    Fixture fx("reminder_failure");
    auto oracle = std::make_shared<MockOracle>(&ShoppingWithTwoReminders);
    auto scheduler = std::make_shared<FlakyScheduler>(fx.reminders, 1);
    application::NoteProcessingService service(oracle, fx.repository, scheduler, "es", &FixedNow);

    auto result = service.processNote("comprar leche y pagar la luz y el agua el lunes");
    assert(result.status == Status::PersistenceFailed);
    assert(result.message == "reminder store full");
    assert(result.changes.empty());

    // Neither the tree nor the first reminder survived.
    assert(fx.repository->loadTree().empty());
    infrastructure::JsonTreeRepository reloaded(fx.repository->path());
    assert(reloaded.loadTree().empty());
    assert(fx.reminders->all().empty());
    infrastructure::JsonReminderStore reopened(fx.root / "reminders.json");
    assert(reopened.all().empty());
    std::cout << "[PASS] Reminder failure rollback" << std::endl;
}

static void testTreeWriteFailureCancelsReminders() {
    std::cout << "[Test] A failing tree write cancels the batch reminders..." << std::endl;
    Fixture fx("tree_failure");
    // A directory in place of the document makes the tree write fail.
    fs::create_directories(fx.repository->path());

    auto oracle = std::make_shared<MockOracle>(&ShoppingWithTwoReminders);
    auto result = fx.service(oracle, "es").processNote("comprar leche y pagar la luz y el agua el lunes");
    assert(result.status == Status::PersistenceFailed);
    assert(fx.repository->loadTree().empty());
    assert(fx.reminders->all().empty());
    std::cout << "[PASS] Tree failure rollback" << std::endl;
}

static void testOracleReminderFallbackTime() {
    std::cout << "[Test] Oracle reminders without a valid time fire in five minutes..." << std::endl;
    Fixture fx("oracle_reminder");
    auto oracle = std::make_shared<MockOracle>([](const std::string&) -> domain::RawProposal {
        return std::string(R"({"action": "remind", "idea": "revisar el horno", "remind_at": "luego"})");
    });
    auto result = fx.service(oracle, "es").processNote("no olvides revisar el horno");
    assert(result.status == Status::Applied);
    assert(result.mutations[0].remindAt.has_value());
    assert(result.mutations[0].remindAt->toIsoString() == "2026-02-28T10:05:00");
    assert(fx.reminders->all().size() == 1);
    std::cout << "[PASS] Fallback reminder time" << std::endl;
}

static void testConcurrentNotesShareOneGroup() {
    std::cout << "[Test] Concurrent notes creating the same group..." << std::endl;
    Fixture fx("concurrency");
    auto oracle = std::make_shared<MockOracle>([](const std::string& note) -> domain::RawProposal {
        // Simulate model latency so the batches overlap.
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        std::string crop = note.substr(std::string("plantar ").size());
        crop = crop.substr(0, crop.find(' '));
        return json{{"group", "Proyecto Jardín"}, {"is_new_group", true}, {"idea", crop}};
    });
    auto service = fx.service(oracle, "es");

    const std::vector<std::string> crops = {"tomates", "lechugas", "zanahorias", "pimientos",
                                            "cebollas", "fresas", "calabacines", "pepinos"};
    std::vector<std::thread> threads;
    std::atomic<int> applied{0};
    for (const auto& crop : crops) {
        threads.emplace_back([&service, &applied, crop]() {
            auto result = service.processNote("plantar " + crop + " en el jardín");
            if (result.status == Status::Applied) applied++;
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    assert(applied == static_cast<int>(crops.size()));
    auto tree = fx.repository->loadTree();
    assert(tree.groups().size() == 1);
    assert(tree.findGroup("proyecto jardín")->ideas.size() == crops.size());

    // The same state must be on disk.
    infrastructure::JsonTreeRepository reloaded(fx.repository->path());
    assert(reloaded.loadTree() == tree);
    std::cout << "[PASS] Concurrency" << std::endl;
}

int main() {
    std::cout << "=== NoteProcessingService Test ===" << std::endl;
    testReminderShortCircuit();
    testFencedListIsSplit();
    testStructuredToolAnswer();
    testFailureClassesAreDistinct();
    testPersistenceFailure();
    testReminderFailureRollsBackBatch();
    testTreeWriteFailureCancelsReminders();
    testOracleReminderFallbackTime();
    testConcurrentNotesShareOneGroup();

    std::cout << "[Test] Cleaning up..." << std::endl;
    fs::remove_all("test_note_processing");
    std::cout << "=== All NoteProcessingService tests passed ===" << std::endl;
    return 0;
}
