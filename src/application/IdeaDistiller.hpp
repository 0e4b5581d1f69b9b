/**
 * @file IdeaDistiller.hpp
 * @brief Reduces proposed idea text to a short concept.
 */

#pragma once
#include <string>
#include <optional>
#include "domain/Lexicon.hpp"

namespace ideasorter::application {

/**
 * @class IdeaDistiller
 * @brief Keeps ideas short and never a verbatim copy of the note.
 */
class IdeaDistiller {
public:
    /** @brief Overlap ratio above which a long idea counts as a copy of the note. */
    static constexpr double kVerbatimOverlapRatio = 0.65;
    static constexpr size_t kMaxMeaningfulTokens = 4;
    static constexpr size_t kMaxWords = 5;

    explicit IdeaDistiller(const domain::Lexicon& lexicon);

    /**
     * @brief Distills an idea against the note it came from.
     * @return The distilled text, or nullopt when nothing usable remains or the
     * idea is a group/subgroup creation command.
     */
    std::optional<std::string> distill(const std::optional<std::string>& idea, const std::string& noteText) const;

    /** @brief Removes leading intent phrases ("quiero", "I need to") repeatedly. */
    std::string stripFiller(const std::string& idea) const;

    /** @brief True for "add the subgroup X" style ideas. */
    bool isCreationCommand(const std::string& idea) const;

    /** @brief True when the idea is a list whose items all have 1-4 words. */
    bool isShortList(const std::string& idea) const;

private:
    std::string firstMeaningfulWords(const std::string& idea) const;

    const domain::Lexicon& m_lexicon;
};

} // namespace ideasorter::application
