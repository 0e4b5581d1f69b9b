#include "infrastructure/JsonReminderStore.hpp"
#include "infrastructure/AtomicFile.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <iostream>

namespace ideasorter::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

JsonReminderStore::JsonReminderStore(const fs::path& filePath) : m_path(filePath) {
    load();
}

void JsonReminderStore::load() {
    std::optional<json> document;
    try {
        document = AtomicFile::ReadJson(m_path);
    } catch (const domain::PersistenceError& e) {
        std::cerr << "[JsonReminderStore] " << e.what() << ". Starting with no reminders." << std::endl;
        return;
    }
    if (!document || !document->is_object()) return;

    if (document->contains("reminders") && (*document)["reminders"].is_array()) {
        for (const auto& item : (*document)["reminders"]) {
            std::optional<domain::LocalDateTime> fireAt;
            if (item.is_object() && item.contains("fire_at") && item["fire_at"].is_string()) {
                fireAt = domain::LocalDateTime::FromIsoString(item["fire_at"].get<std::string>());
            }
            bool wellTyped = fireAt && item.contains("id") && item["id"].is_string() &&
                             (!item.contains("message") || item["message"].is_string()) &&
                             (!item.contains("sent") || item["sent"].is_boolean());
            if (!wellTyped) {
                std::cerr << "[JsonReminderStore] Skipping malformed reminder: " << item.dump() << std::endl;
                continue;
            }
            domain::ReminderRecord record;
            record.id = item["id"].get<std::string>();
            record.message = item.contains("message") ? item["message"].get<std::string>() : "";
            record.fireAt = *fireAt;
            record.sent = item.contains("sent") && item["sent"].get<bool>();
            m_records.push_back(std::move(record));
        }
    }

    long long storedNextId = 1;
    if (document->contains("next_id") && (*document)["next_id"].is_number_integer()) {
        storedNextId = (*document)["next_id"].get<long long>();
    }
    m_nextId = std::max<long long>(storedNextId, static_cast<long long>(m_records.size()) + 1);
}

void JsonReminderStore::persist(const std::vector<domain::ReminderRecord>& records, long long nextId) const {
    json items = json::array();
    for (const auto& r : records) {
        items.push_back({
            {"id", r.id},
            {"message", r.message},
            {"fire_at", r.fireAt.toIsoString()},
            {"sent", r.sent}
        });
    }
    AtomicFile::Write(m_path, json{{"next_id", nextId}, {"reminders", items}}.dump(2));
}

domain::ReminderRecord JsonReminderStore::schedule(const std::string& message, const domain::LocalDateTime& fireAt) {
    std::lock_guard<std::mutex> lock(m_mutex);

    domain::ReminderRecord record;
    record.id = "rem-" + std::to_string(m_nextId);
    record.message = message;
    record.fireAt = fireAt;

    auto records = m_records;
    records.push_back(record);
    persist(records, m_nextId + 1);

    m_records = std::move(records);
    ++m_nextId;
    std::cout << "[JsonReminderStore] Scheduled " << record.id << " at " << fireAt.toIsoString() << std::endl;
    return record;
}

std::vector<domain::ReminderRecord> JsonReminderStore::dueReminders(const domain::LocalDateTime& now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::ReminderRecord> due;
    for (const auto& r : m_records) {
        if (!r.sent && r.fireAt <= now) due.push_back(r);
    }
    std::stable_sort(due.begin(), due.end(), [](const auto& a, const auto& b) { return a.fireAt < b.fireAt; });
    return due;
}

bool JsonReminderStore::markSent(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_records.begin(), m_records.end(), [&](const auto& r) { return r.id == id; });
    if (it == m_records.end() || it->sent) return false;

    auto records = m_records;
    records[static_cast<size_t>(it - m_records.begin())].sent = true;
    persist(records, m_nextId);
    m_records = std::move(records);
    return true;
}

bool JsonReminderStore::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_records.begin(), m_records.end(), [&](const auto& r) { return r.id == id; });
    if (it == m_records.end() || it->sent) return false;

    auto records = m_records;
    records.erase(records.begin() + (it - m_records.begin()));
    persist(records, m_nextId);
    m_records = std::move(records);
    std::cout << "[JsonReminderStore] Cancelled " << id << std::endl;
    return true;
}

std::vector<domain::ReminderRecord> JsonReminderStore::all() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

} // namespace ideasorter::infrastructure
