/**
 * @file ReminderDetector.hpp
 * @brief Deterministic reminder extraction run before any oracle call.
 */

#pragma once
#include <string>
#include <optional>
#include "domain/Lexicon.hpp"
#include "domain/Mutation.hpp"
#include "domain/LocalDateTime.hpp"

namespace ideasorter::application {

/**
 * @class ReminderDetector
 * @brief Turns "remind me tomorrow at 9 to call the dentist" into a remind
 * mutation with an absolute fire time and a distilled message.
 */
class ReminderDetector {
public:
    /** @brief Delay used when the note names no clock time. */
    static constexpr int kFallbackDelayMinutes = 5;

    explicit ReminderDetector(const domain::Lexicon& lexicon);

    /**
     * @brief Detects a reminder request.
     * @param noteText User note.
     * @param now Reference wall-clock time.
     * @return A remind mutation, or nullopt when no trigger phrase is present.
     */
    std::optional<domain::CanonicalMutation> detect(const std::string& noteText,
                                                    const domain::LocalDateTime& now) const;

private:
    const domain::Lexicon& m_lexicon;
};

} // namespace ideasorter::application
