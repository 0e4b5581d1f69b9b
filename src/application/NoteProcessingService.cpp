/**
 * @file NoteProcessingService.cpp
 * @brief Implementation of the note processing pipeline.
 */

#include "application/NoteProcessingService.hpp"
#include "application/ResponseDecoder.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <iostream>

namespace ideasorter::application {

using domain::CanonicalMutation;
using Status = NoteProcessingResult::Status;

bool NoteProcessingResult::isRetryable() const {
    return status == Status::DecodeFailed || status == Status::StoredUnclassified;
}

nlohmann::json NoteProcessingResult::toJson() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& m : mutations) {
        list.push_back(m.toJson());
    }
    return list;
}

std::string StatusToString(NoteProcessingResult::Status status) {
    switch (status) {
        case Status::Applied: return "applied";
        case Status::Rejected: return "rejected";
        case Status::StoredUnclassified: return "stored_unclassified";
        case Status::DecodeFailed: return "decode_failed";
        case Status::PersistenceFailed: return "persistence_failed";
    }
    return "unknown";
}

NoteProcessingService::NoteProcessingService(std::shared_ptr<domain::IdeaOracle> oracle,
                                             std::shared_ptr<domain::TreeRepository> repository,
                                             std::shared_ptr<domain::ReminderScheduler> scheduler,
                                             const std::string& locale,
                                             Clock clock)
    : m_oracle(std::move(oracle)),
      m_repository(std::move(repository)),
      m_scheduler(std::move(scheduler)),
      m_locale(locale),
      m_clock(std::move(clock)),
      m_lexicon(domain::Lexicon::ForLocale(locale)),
      m_detector(m_lexicon),
      m_normalizer(m_lexicon),
      m_splitter(m_lexicon) {}

std::vector<std::string> NoteProcessingService::TouchedGroups(const std::vector<CanonicalMutation>& batch) {
    std::vector<std::string> names;
    for (const auto& m : batch) {
        if (!m.makesSense) continue;
        if (m.group) names.push_back(*m.group);
        if (m.rename) {
            names.push_back(m.rename->oldName);
            names.push_back(m.rename->newName);
        }
    }
    return names;
}

NoteProcessingResult NoteProcessingService::processNote(const std::string& noteText) {
    NoteProcessingResult result;
    const std::string note = domain::text::Trim(noteText);
    if (note.empty()) {
        result.status = Status::Rejected;
        result.message = "Empty note";
        return result;
    }

    const domain::LocalDateTime now = m_clock();

    if (auto reminder = m_detector.detect(note, now)) {
        std::cout << "[NoteProcessing] Reminder detected for " << reminder->remindAt->toIsoString()
                  << ": " << reminder->idea.value_or("") << std::endl;
        return commit({*reminder}, now);
    }

    domain::KnowledgeTree snapshot = m_repository->loadTree();

    domain::RawProposal raw;
    try {
        raw = m_oracle->classify(note, snapshot, m_locale);
    } catch (const domain::OracleUnavailableError& e) {
        std::cerr << "[NoteProcessing] Oracle unavailable: " << e.what() << ". Storing note unclassified." << std::endl;
        result.message = e.what();
        try {
            m_repository->storeUnclassified({note, now.toIsoString()});
            result.status = Status::StoredUnclassified;
        } catch (const domain::PersistenceError& pe) {
            std::cerr << "[NoteProcessing] Could not store unclassified note: " << pe.what() << std::endl;
            result.status = Status::PersistenceFailed;
            result.message = pe.what();
        }
        return result;
    }

    nlohmann::json decoded;
    if (const auto* text = std::get_if<std::string>(&raw)) {
        try {
            decoded = ResponseDecoder::Decode(*text);
        } catch (const domain::DecodeError& e) {
            std::cerr << "[NoteProcessing] " << e.what() << ". Raw output: " << e.rawText() << std::endl;
            result.status = Status::DecodeFailed;
            result.message = e.what();
            result.rawOracleText = e.rawText();
            return result;
        }
    } else {
        decoded = std::get<nlohmann::json>(raw);
    }

    return normalizeAndCommit(ClassificationNormalizer::ProposalsFromJson(decoded), note, now);
}

NoteProcessingResult NoteProcessingService::normalizeAndCommit(const std::vector<domain::ClassificationProposal>& proposals,
                                                               const std::string& noteText,
                                                               const domain::LocalDateTime& now) {
    std::vector<std::string> wanted =
        TouchedGroups(m_normalizer.normalizeBatch(proposals, m_repository->loadTree(), noteText));

    // The fresh snapshot may resolve different groups than the first guess;
    // widen the lock set until it covers everything the batch touches.
    while (true) {
        GroupLockRegistry::Guard guard = m_groupLocks.lock(wanted);
        domain::KnowledgeTree fresh = m_repository->loadTree();
        std::vector<CanonicalMutation> batch =
            m_splitter.expand(m_normalizer.normalizeBatch(proposals, fresh, noteText), noteText);

        std::vector<std::string> touched = TouchedGroups(batch);
        if (guard.covers(touched)) {
            return commit(std::move(batch), now);
        }
        wanted.insert(wanted.end(), touched.begin(), touched.end());
    }
}

void NoteProcessingService::rollbackReminders(const std::vector<std::string>& reminderIds) {
    for (const auto& id : reminderIds) {
        try {
            m_scheduler->cancel(id);
        } catch (const domain::PersistenceError& e) {
            std::cerr << "[NoteProcessing] Could not roll back reminder " << id << ": " << e.what() << std::endl;
        }
    }
}

NoteProcessingResult NoteProcessingService::commit(std::vector<CanonicalMutation> batch,
                                                   const domain::LocalDateTime& now) {
    NoteProcessingResult result;

    for (auto& m : batch) {
        if (m.makesSense && m.action == domain::MutationAction::Remind && !m.remindAt) {
            m.remindAt = now.plusMinutes(ReminderDetector::kFallbackDelayMinutes);
        }
    }
    result.mutations = batch;

    bool anySensible = std::any_of(batch.begin(), batch.end(), [](const CanonicalMutation& m) { return m.makesSense; });
    if (!anySensible) {
        result.status = Status::Rejected;
        result.message = batch.empty() ? "" : batch.front().reason.value_or("");
        std::cout << "[NoteProcessing] Note rejected: " << result.message << std::endl;
        return result;
    }

    // Reminders are scheduled inside the tree transaction; a failure on
    // either side undoes the reminders already written.
    std::vector<std::string> scheduledIds;
    auto scheduleReminders = [this, &scheduledIds](domain::ChangeSet& changes) {
        for (auto& reminder : changes.reminders) {
            reminder = m_scheduler->schedule(reminder.message, reminder.fireAt);
            scheduledIds.push_back(reminder.id);
        }
    };

    try {
        result.changes = m_repository->applyBatch(batch, scheduleReminders);
    } catch (const domain::PersistenceError& e) {
        std::cerr << "[NoteProcessing] Persistence failed: " << e.what() << std::endl;
        rollbackReminders(scheduledIds);
        result.changes = {};
        result.status = Status::PersistenceFailed;
        result.message = e.what();
        return result;
    }

    for (const auto& m : batch) {
        if (!m.makesSense) continue;
        std::cout << "[NoteProcessing] " << domain::ActionToString(m.action)
                  << " group=" << m.group.value_or("-")
                  << " subgroup=" << m.subgroup.value_or("-")
                  << " idea=" << m.idea.value_or("-") << std::endl;
    }
    for (const auto& conflict : result.changes.conflicts) {
        std::cout << "[NoteProcessing] Conflict (no-op): " << conflict << std::endl;
    }

    result.status = Status::Applied;
    return result;
}

} // namespace ideasorter::application
