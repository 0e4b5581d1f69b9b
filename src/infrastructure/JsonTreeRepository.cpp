#include "infrastructure/JsonTreeRepository.hpp"
#include "infrastructure/AtomicFile.hpp"
#include "application/TreeReconciler.hpp"
#include "domain/Errors.hpp"
#include <iostream>

namespace ideasorter::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

JsonTreeRepository::JsonTreeRepository(const fs::path& filePath) : m_path(filePath) {
    load();
}

void JsonTreeRepository::load() {
    std::optional<json> document;
    try {
        document = AtomicFile::ReadJson(m_path);
    } catch (const domain::PersistenceError& e) {
        // Keep the broken file aside instead of overwriting it on the next write.
        fs::path backup = m_path;
        backup += ".corrupt";
        std::error_code ec;
        fs::rename(m_path, backup, ec);
        std::cerr << "[JsonTreeRepository] " << e.what() << ". Starting empty";
        if (!ec) std::cerr << " (old file kept as " << backup << ")";
        std::cerr << std::endl;
        return;
    }
    if (!document) return;

    if (document->is_array()) {
        m_tree = domain::KnowledgeTree::FromJson(*document);
        return;
    }
    if (!document->is_object()) return;

    if (document->contains("groups")) {
        m_tree = domain::KnowledgeTree::FromJson((*document)["groups"]);
    }
    if (document->contains("unclassified") && (*document)["unclassified"].is_array()) {
        for (const auto& item : (*document)["unclassified"]) {
            bool wellTyped = item.is_object() && item.contains("text") && item["text"].is_string() &&
                             (!item.contains("received_at") || item["received_at"].is_string());
            if (!wellTyped) {
                std::cerr << "[JsonTreeRepository] Skipping malformed inbox entry: " << item.dump() << std::endl;
                continue;
            }
            std::string receivedAt = item.contains("received_at") ? item["received_at"].get<std::string>() : "";
            m_unclassified.push_back({item["text"].get<std::string>(), receivedAt});
        }
    }
    std::cout << "[JsonTreeRepository] Loaded " << m_tree.groups().size() << " groups from " << m_path << std::endl;
}

void JsonTreeRepository::persist(const domain::KnowledgeTree& tree,
                                 const std::vector<domain::UnclassifiedNote>& inbox) const {
    json pending = json::array();
    for (const auto& note : inbox) {
        pending.push_back({{"text", note.text}, {"received_at", note.receivedAt}});
    }
    json document = {
        {"groups", tree.toJson()},
        {"unclassified", pending}
    };
    AtomicFile::Write(m_path, document.dump(2));
}

domain::KnowledgeTree JsonTreeRepository::loadTree() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tree;
}

domain::ChangeSet JsonTreeRepository::applyBatch(const std::vector<domain::CanonicalMutation>& batch,
                                                 const CommitStep& beforeCommit) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto result = application::TreeReconciler::Reconcile(m_tree, batch);
    if (beforeCommit) {
        beforeCommit(result.changes);
    }
    if (result.tree == m_tree) {
        return result.changes;
    }

    persist(result.tree, m_unclassified); // throws PersistenceError, m_tree untouched
    m_tree = std::move(result.tree);
    return result.changes;
}

void JsonTreeRepository::storeUnclassified(const domain::UnclassifiedNote& note) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto inbox = m_unclassified;
    inbox.push_back(note);
    persist(m_tree, inbox);
    m_unclassified = std::move(inbox);
}

std::vector<domain::UnclassifiedNote> JsonTreeRepository::unclassified() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_unclassified;
}

void JsonTreeRepository::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    persist(domain::KnowledgeTree(), {});
    m_tree.clear();
    m_unclassified.clear();
}

} // namespace ideasorter::infrastructure
