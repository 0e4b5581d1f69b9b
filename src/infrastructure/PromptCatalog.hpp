/**
 * @file PromptCatalog.hpp
 * @brief Central storage for classification and summary prompts.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/KnowledgeTree.hpp"
#include "domain/Lexicon.hpp"

namespace ideasorter::infrastructure {

class PromptCatalog {
public:
    /** @brief System rules for note classification in the lexicon's language. */
    static std::string GetClassificationSystemPrompt(const domain::Lexicon& lexicon);

    /**
     * @brief User prompt: few-shot examples, the serialized tree, the mandatory
     * categories and the names of the existing groups, then the note.
     */
    static std::string GetClassificationPrompt(const std::string& noteText,
                                               const domain::KnowledgeTree& tree,
                                               const domain::Lexicon& lexicon);

    /** @brief Tool definitions for /api/chat (add_idea, delete_idea, schedule_reminder, reject_note). */
    static nlohmann::json GetClassificationTools(const domain::Lexicon& lexicon);

    /** @brief System rules for the group summary. */
    static std::string GetSummarySystemPrompt(const std::string& locale);

    /** @brief Prompt summarizing several groups in one call. */
    static std::string GetSummaryPrompt(const nlohmann::json& groups, const std::string& locale);

    /** @brief Prompt summarizing a single group. */
    static std::string GetSingleGroupSummaryPrompt(const nlohmann::json& group, const std::string& locale);

    static std::string GetGlobalSummarySystemPrompt(const std::string& locale);

    /** @brief Plain-text overview built from per-group summaries. */
    static std::string GetGlobalSummaryPrompt(const nlohmann::json& summaries, const std::string& locale);
};

} // namespace ideasorter::infrastructure
