/**
 * @file IdeaOracle.hpp
 * @brief Interface for the external natural-language classifier.
 */

#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "domain/KnowledgeTree.hpp"

namespace ideasorter::domain {

/**
 * @brief Oracle output: free text that still needs decoding, or an already
 * structured tool-call result (one proposal object or a list of them).
 */
using RawProposal = std::variant<std::string, nlohmann::json>;

/**
 * @class IdeaOracle
 * @brief Abstract classifier proposing where a note belongs.
 *
 * Implementations throw OracleUnavailableError on transport failure or
 * timeout; an explicit "this makes no sense" answer is a regular proposal.
 */
class IdeaOracle {
public:
    virtual ~IdeaOracle() = default;

    /** @brief Optional start-up check (connection, model detection). */
    virtual void initialize() {}

    /**
     * @brief Proposes one or more classifications for a note.
     * @param noteText Trimmed user note.
     * @param existingTree Snapshot used to prefer existing groups.
     * @param locale Language of the prompt and the expected answer.
     */
    virtual RawProposal classify(const std::string& noteText,
                                 const KnowledgeTree& existingTree,
                                 const std::string& locale) = 0;

    /**
     * @brief Plain completion used by the summary service.
     * @return Raw model text (may need decoding).
     */
    virtual std::string complete(const std::string& systemPrompt, const std::string& userPrompt) = 0;
};

} // namespace ideasorter::domain
