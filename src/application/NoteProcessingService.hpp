/**
 * @file NoteProcessingService.hpp
 * @brief Application service turning one user note into tree changes.
 */

#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/IdeaOracle.hpp"
#include "domain/TreeRepository.hpp"
#include "domain/ReminderScheduler.hpp"
#include "domain/Lexicon.hpp"
#include "application/ReminderDetector.hpp"
#include "application/ClassificationNormalizer.hpp"
#include "application/EnumerationSplitter.hpp"
#include "application/GroupLockRegistry.hpp"

namespace ideasorter::application {

/**
 * @struct NoteProcessingResult
 * @brief Outcome of one note, distinguishing every failure class.
 */
struct NoteProcessingResult {
    /**
     * @enum Status
     * @brief Terminal state of the note.
     */
    enum class Status {
        Applied,            ///< Batch reconciled and persisted (conflicts may be listed).
        Rejected,           ///< The oracle said the note makes no sense, or the note was empty.
        StoredUnclassified, ///< Oracle unreachable; note kept in the unclassified inbox.
        DecodeFailed,       ///< Oracle output unreadable after every repair.
        PersistenceFailed   ///< The store could not write the new state.
    };

    Status status = Status::Rejected;
    std::vector<domain::CanonicalMutation> mutations; ///< One element per distilled idea.
    domain::ChangeSet changes;
    std::string message;      ///< Rejection reason or error text.
    std::string rawOracleText; ///< Set for DecodeFailed.

    /** @brief Only decode failures and oracle unavailability are worth retrying. */
    bool isRetryable() const;

    /** @brief Ordered list of mutation objects (camelCase keys). */
    nlohmann::json toJson() const;
};

std::string StatusToString(NoteProcessingResult::Status status);

/**
 * @class NoteProcessingService
 * @brief Runs the full pipeline for a note.
 *
 * trim -> reminder short-circuit -> oracle -> decode -> group locks ->
 * normalize on a fresh snapshot -> enumeration split -> transactional apply
 * -> reminder scheduling. Safe to call from several threads; batches touching
 * the same group are serialized.
 */
class NoteProcessingService {
public:
    using Clock = std::function<domain::LocalDateTime()>;

    NoteProcessingService(std::shared_ptr<domain::IdeaOracle> oracle,
                          std::shared_ptr<domain::TreeRepository> repository,
                          std::shared_ptr<domain::ReminderScheduler> scheduler,
                          const std::string& locale,
                          Clock clock = &domain::LocalDateTime::Now);

    /** @brief Processes one note end to end. Never throws for expected failures. */
    NoteProcessingResult processNote(const std::string& noteText);

    const std::string& locale() const { return m_locale; }

private:
    NoteProcessingResult commit(std::vector<domain::CanonicalMutation> batch, const domain::LocalDateTime& now);

    /** @brief Normalizes under per-group locks, then applies. */
    NoteProcessingResult normalizeAndCommit(const std::vector<domain::ClassificationProposal>& proposals,
                                            const std::string& noteText,
                                            const domain::LocalDateTime& now);

    /** @brief Cancels reminders scheduled by a batch that did not commit. */
    void rollbackReminders(const std::vector<std::string>& reminderIds);

    static std::vector<std::string> TouchedGroups(const std::vector<domain::CanonicalMutation>& batch);

    std::shared_ptr<domain::IdeaOracle> m_oracle;
    std::shared_ptr<domain::TreeRepository> m_repository;
    std::shared_ptr<domain::ReminderScheduler> m_scheduler;
    std::string m_locale;
    Clock m_clock;

    const domain::Lexicon& m_lexicon;
    ReminderDetector m_detector;
    ClassificationNormalizer m_normalizer;
    EnumerationSplitter m_splitter;
    GroupLockRegistry m_groupLocks;
};

} // namespace ideasorter::application
