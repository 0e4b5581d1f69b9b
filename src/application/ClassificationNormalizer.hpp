/**
 * @file ClassificationNormalizer.hpp
 * @brief Converts raw oracle proposals into safe canonical mutations.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/KnowledgeTree.hpp"
#include "domain/Lexicon.hpp"
#include "domain/Mutation.hpp"
#include "application/IdeaDistiller.hpp"

namespace ideasorter::application {

/**
 * @class ClassificationNormalizer
 * @brief Applies the deterministic safety net on top of the oracle.
 *
 * Rules, in order: rejection short-circuit, delete-intent override,
 * delete pass-through, reuse of a group named in the note, mandatory
 * category override (with routine activity subgroups), rename integrity,
 * idea distillation.
 */
class ClassificationNormalizer {
public:
    explicit ClassificationNormalizer(const domain::Lexicon& lexicon);

    /** @brief Normalizes one proposal against the current tree and the note. */
    domain::CanonicalMutation normalize(const domain::ClassificationProposal& proposal,
                                        const domain::KnowledgeTree& tree,
                                        const std::string& noteText) const;

    /**
     * @brief Normalizes every proposal produced for one note.
     *
     * Only the first element keeps creation flags and rename. An empty input
     * yields a single rejected mutation.
     */
    std::vector<domain::CanonicalMutation> normalizeBatch(const std::vector<domain::ClassificationProposal>& proposals,
                                                          const domain::KnowledgeTree& tree,
                                                          const std::string& noteText) const;

    /**
     * @brief Extracts proposal objects from a decoded value: an object, an array
     * of objects, or an object wrapping such an array under "results"/"ideas".
     */
    static std::vector<domain::ClassificationProposal> ProposalsFromJson(const nlohmann::json& value);

    bool isDeleteIntent(const std::string& noteText) const;

    /** @brief Mandatory category whose keyword best matches the note (longest keyword wins). */
    std::optional<std::string> guessCategory(const std::string& noteText) const;

    /** @brief Routine subgroup for the first activity keyword found in the note. */
    std::optional<std::string> routineSubgroup(const std::string& noteText) const;

private:
    /** @brief First existing group whose name appears literally in the note. */
    const domain::Group* findMentionedGroup(const std::string& noteText, const domain::KnowledgeTree& tree) const;

    const domain::Lexicon& m_lexicon;
    IdeaDistiller m_distiller;
};

} // namespace ideasorter::application
