/**
 * @file Lexicon.hpp
 * @brief Language-specific keyword tables used by the deterministic rules.
 */

#pragma once
#include <string>
#include <vector>
#include <utility>

namespace ideasorter::domain {

/**
 * @struct Lexicon
 * @brief Every word list the normalizer, distiller, splitter and reminder
 * detector consult. All entries are lowercase.
 */
struct Lexicon {
    std::string locale;

    /** @brief Phrases that force action=delete. */
    std::vector<std::string> deleteKeywords;

    /** @brief Categories that always exist conceptually, in prompt order. */
    std::vector<std::string> mandatoryCategories;

    /** @brief category -> indicative keywords, checked in order. */
    std::vector<std::pair<std::string, std::vector<std::string>>> categoryKeywords;

    /** @brief Name of the routine/habit category. */
    std::string routineCategory;

    /** @brief activity keyword -> normalized routine subgroup, checked in order. */
    std::vector<std::pair<std::string, std::string>> routineActivities;

    /** @brief Leading intent phrases stripped from ideas. */
    std::vector<std::string> fillerPrefixes;

    std::vector<std::string> stopWords;

    /** @brief Verbs that make an idea a creation command when leading. */
    std::vector<std::string> creationVerbs;

    /** @brief Phrases that mark an idea as a creation command anywhere. */
    std::vector<std::string> creationKeywords;

    /** @brief group/subgroup/category words. */
    std::vector<std::string> structuralWords;

    std::vector<std::string> reminderTriggers;
    std::vector<std::string> dayAfterTomorrowPhrases;
    std::vector<std::string> tomorrowWords;

    /** @brief Phrases containing a tomorrow word that do not mean tomorrow ("por la mañana"). */
    std::vector<std::string> tomorrowExclusions;

    /** @brief weekday name -> 0 (Sunday) .. 6 (Saturday). */
    std::vector<std::pair<std::string, int>> weekdayNames;

    /** @brief Words that may precede a clock time ("at", "a las"). */
    std::vector<std::string> timePrepositions;

    /** @brief Suffixes after a clock time shifting it to the afternoon. */
    std::vector<std::string> pmSuffixes;

    /** @brief Suffixes after a clock time keeping it in the morning. */
    std::vector<std::string> amSuffixes;

    /** @brief Filler words trimmed from the edges of a reminder message. */
    std::vector<std::string> connectorWords;

    /** @brief List conjunctions including surrounding spaces (" y "). */
    std::vector<std::string> conjunctions;

    /** @brief Reason used when the oracle rejects a note without giving one. */
    std::string defaultRejectionReason;

    /** @brief True when name (case-insensitive) is a mandatory category. */
    bool isMandatoryCategory(const std::string& name) const;

    bool isStopWord(const std::string& token) const;

    /** @brief Lexicon for "es" or "en" (region suffixes ignored); other locales get "es". */
    static const Lexicon& ForLocale(const std::string& locale);
};

} // namespace ideasorter::domain
