#include "infrastructure/OllamaOracle.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "domain/Errors.hpp"
#include "domain/Lexicon.hpp"
#include <algorithm>
#include <iostream>

namespace ideasorter::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kSummaryTemperature = 0.3;
}

OllamaOracle::OllamaOracle(const OllamaSettings& settings)
    : m_settings(settings),
      m_client(settings.host, settings.port, settings.timeoutSeconds) {}

void OllamaOracle::initialize() {
    auto models = m_client.getAvailableModels();
    if (models.empty()) {
        std::cerr << "[OllamaOracle] No models reported by " << m_settings.host << ":" << m_settings.port
                  << ". Is Ollama running?" << std::endl;
        return;
    }

    // "llama3.1" also matches "llama3.1:latest".
    bool found = std::any_of(models.begin(), models.end(), [&](const std::string& name) {
        return name == m_settings.model || name.rfind(m_settings.model + ":", 0) == 0;
    });
    if (found) {
        std::cout << "[OllamaOracle] Using model: " << m_settings.model << std::endl;
    } else {
        std::cerr << "[OllamaOracle] Model '" << m_settings.model << "' not installed. Available:";
        for (const auto& name : models) std::cerr << " " << name;
        std::cerr << std::endl;
    }
}

std::optional<json> OllamaOracle::ProposalFromToolCall(const ToolCall& call) {
    json proposal = call.arguments.is_object() ? call.arguments : json::object();

    if (call.name == "add_idea") {
        proposal["action"] = "add";
    } else if (call.name == "delete_idea") {
        proposal["action"] = "delete";
    } else if (call.name == "schedule_reminder") {
        proposal["action"] = "remind";
    } else if (call.name == "reject_note") {
        proposal["action"] = "add";
        proposal["makes_sense"] = false;
    } else {
        std::cerr << "[OllamaOracle] Ignoring unknown tool: " << call.name << std::endl;
        return std::nullopt;
    }
    return proposal;
}

domain::RawProposal OllamaOracle::classify(const std::string& noteText,
                                           const domain::KnowledgeTree& existingTree,
                                           const std::string& locale) {
    const auto& lexicon = domain::Lexicon::ForLocale(locale);
    const std::string system = PromptCatalog::GetClassificationSystemPrompt(lexicon);
    const std::string prompt = PromptCatalog::GetClassificationPrompt(noteText, existingTree, lexicon);

    if (m_settings.useTools) {
        json messages = json::array({
            {{"role", "system"}, {"content", system}},
            {{"role", "user"}, {"content", prompt}}
        });
        auto reply = m_client.chat(m_settings.model, messages,
                                   PromptCatalog::GetClassificationTools(lexicon),
                                   m_settings.temperature);
        if (!reply) {
            throw domain::OracleUnavailableError("Ollama /api/chat did not answer");
        }
        if (reply->toolCalls.empty()) {
            // Model ignored the tools and answered in text.
            return reply->content;
        }

        json proposals = json::array();
        for (const auto& call : reply->toolCalls) {
            if (auto proposal = ProposalFromToolCall(call)) {
                proposals.push_back(std::move(*proposal));
            }
        }
        if (proposals.empty()) return reply->content;
        return proposals;
    }

    auto text = m_client.generate(m_settings.model, system, prompt, m_settings.temperature, true);
    if (!text) {
        throw domain::OracleUnavailableError("Ollama /api/generate did not answer");
    }
    return *text;
}

std::string OllamaOracle::complete(const std::string& systemPrompt, const std::string& userPrompt) {
    auto text = m_client.generate(m_settings.model, systemPrompt, userPrompt, kSummaryTemperature);
    if (!text) {
        throw domain::OracleUnavailableError("Ollama /api/generate did not answer");
    }
    return *text;
}

} // namespace ideasorter::infrastructure
