/**
 * @file EnumerationSplitter.hpp
 * @brief Expands a single mutation that hides a list of items.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "domain/Lexicon.hpp"
#include "domain/Mutation.hpp"

namespace ideasorter::application {

/**
 * @class EnumerationSplitter
 * @brief "pan, queso y leche" becomes three add mutations.
 */
class EnumerationSplitter {
public:
    static constexpr size_t kMaxListItemWords = 4;
    static constexpr size_t kMaxTrailingItemWords = 3;
    static constexpr size_t kMinTrailingItems = 3;

    explicit EnumerationSplitter(const domain::Lexicon& lexicon);

    /**
     * @brief Expands the batch when it is a single sensible add mutation whose
     * idea (or, failing that, the note's tail) is an enumeration.
     * Any other batch is returned unchanged.
     */
    std::vector<domain::CanonicalMutation> expand(const std::vector<domain::CanonicalMutation>& batch,
                                                  const std::string& noteText) const;

    /** @brief Items of a delimited idea when every item has 1-4 words. */
    std::optional<std::vector<std::string>> splitIdea(const std::string& idea) const;

    /**
     * @brief Trailing enumeration of at least three short items in the note.
     * A longer leading fragment contributes its last word.
     */
    std::optional<std::vector<std::string>> trailingEnumeration(const std::string& noteText) const;

private:
    std::string stripLeadingStopWords(const std::string& item) const;

    const domain::Lexicon& m_lexicon;
};

} // namespace ideasorter::application
