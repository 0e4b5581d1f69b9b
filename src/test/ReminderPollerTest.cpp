#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>
#include "application/ReminderPoller.hpp"
#include "infrastructure/JsonReminderStore.hpp"

using namespace ideasorter;
namespace fs = std::filesystem;

static domain::LocalDateTime FixedNow() {
    return *domain::LocalDateTime::FromIsoString("2026-02-28T10:00:00");
}

int main() {
    std::cout << "=== ReminderPoller Test ===" << std::endl;
    fs::path root = "test_poller_root";
    fs::remove_all(root);
    fs::create_directories(root);

    auto store = std::make_shared<infrastructure::JsonReminderStore>(root / "reminders.json");
    const int kDue = 20;
    for (int i = 0; i < kDue; ++i) {
        store->schedule("recordatorio " + std::to_string(i), FixedNow().plusMinutes(-i));
    }
    store->schedule("futuro", FixedNow().plusDays(1));

    std::cout << "[Test] Competing pollers deliver each reminder once..." << std::endl;
    std::atomic<int> delivered{0};
    auto count = [&delivered](const domain::ReminderRecord&) { delivered++; };

    application::ReminderPoller first(store, std::chrono::milliseconds(1000), count, &FixedNow);
    application::ReminderPoller second(store, std::chrono::milliseconds(1000), count, &FixedNow);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&first, &second, i]() {
            if (i % 2 == 0) first.pollOnce();
            else second.pollOnce();
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    assert(delivered == kDue);
    assert(first.pollOnce() == 0);
    std::cout << "[PASS] Exactly once" << std::endl;

    std::cout << "[Test] Background worker picks up new reminders..." << std::endl;
    store->schedule("tarde", FixedNow());
    application::ReminderPoller worker(store, std::chrono::milliseconds(10), count, &FixedNow);
    worker.start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (delivered < kDue + 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    worker.stop();
    worker.stop(); // second stop is a no-op
    assert(delivered == kDue + 1);
    std::cout << "[PASS] Worker loop" << std::endl;

    std::cout << "[Test] Cleaning up..." << std::endl;
    fs::remove_all(root);
    std::cout << "=== All ReminderPoller tests passed ===" << std::endl;
    return 0;
}
