/**
 * @file OllamaOracle.hpp
 * @brief IdeaOracle backed by a local Ollama server.
 */

#pragma once
#include "domain/IdeaOracle.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace ideasorter::infrastructure {

/**
 * @class OllamaOracle
 * @brief Classifies notes through /api/generate (JSON text) or /api/chat tool calls.
 */
class OllamaOracle : public domain::IdeaOracle {
public:
    explicit OllamaOracle(const OllamaSettings& settings);

    /** @brief Lists the server models and warns when the configured one is missing. */
    void initialize() override;

    domain::RawProposal classify(const std::string& noteText,
                                 const domain::KnowledgeTree& existingTree,
                                 const std::string& locale) override;

    std::string complete(const std::string& systemPrompt, const std::string& userPrompt) override;

    /**
     * @brief Maps one tool call onto the proposal object layout.
     * @return nullopt for unknown tool names.
     */
    static std::optional<nlohmann::json> ProposalFromToolCall(const ToolCall& call);

private:
    OllamaSettings m_settings;
    OllamaClient m_client;
};

} // namespace ideasorter::infrastructure
