#include <iostream>
#include <cassert>
#include "domain/Errors.hpp"
#include "infrastructure/OllamaOracle.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "domain/Lexicon.hpp"
#include "domain/Mutation.hpp"

using namespace ideasorter;
using infrastructure::OllamaOracle;
using infrastructure::ToolCall;
using json = nlohmann::json;

static void testToolCallMapping() {
    std::cout << "[Test] Tool calls map onto proposal objects..." << std::endl;
    auto add = OllamaOracle::ProposalFromToolCall(ToolCall{"add_idea", {{"group", "compras"}, {"idea", "pan"}}});
    assert(add.has_value());
    assert((*add)["action"] == "add");
    assert((*add)["group"] == "compras");

    auto del = OllamaOracle::ProposalFromToolCall(ToolCall{"delete_idea", {{"group", "compras"}}});
    assert((*del)["action"] == "delete");

    auto remind = OllamaOracle::ProposalFromToolCall(
        ToolCall{"schedule_reminder", {{"idea", "dentista"}, {"remind_at", "2026-03-01T09:00:00"}}});
    auto proposal = domain::ClassificationProposal::FromJson(*remind);
    assert(proposal.action == domain::MutationAction::Remind);
    assert(proposal.remindAt == std::optional<std::string>("2026-03-01T09:00:00"));

    auto reject = OllamaOracle::ProposalFromToolCall(ToolCall{"reject_note", {{"reason", "ruido"}}});
    assert(!domain::ClassificationProposal::FromJson(*reject).makesSense);

    assert(!OllamaOracle::ProposalFromToolCall(ToolCall{"launch_rocket", json::object()}).has_value());
    std::cout << "[PASS] Tool mapping" << std::endl;
}

static void testPromptsCarryContext() {
    std::cout << "[Test] Classification prompt lists categories and groups..." << std::endl;
    const auto& lexicon = domain::Lexicon::ForLocale("es");
    domain::KnowledgeTree tree;
    tree.addGroup("Proyecto Web").ideas = {"fondo azul"};

    std::string prompt = infrastructure::PromptCatalog::GetClassificationPrompt("cambiar el logo", tree, lexicon);
    assert(prompt.find("cambiar el logo") != std::string::npos);
    assert(prompt.find("Proyecto Web") != std::string::npos);
    assert(prompt.find("vida social") != std::string::npos);

    json tools = infrastructure::PromptCatalog::GetClassificationTools(lexicon);
    assert(tools.is_array() && tools.size() == 4);
    std::cout << "[PASS] Prompts" << std::endl;
}

static void testUnreachableServer() {
    std::cout << "[Test] An unreachable server raises OracleUnavailableError..." << std::endl;
    infrastructure::OllamaSettings settings;
    settings.host = "127.0.0.1";
    settings.port = 1;
    settings.timeoutSeconds = 2;
    OllamaOracle oracle(settings);

    bool thrown = false;
    try {
        oracle.classify("comprar pan", domain::KnowledgeTree(), "es");
    } catch (const domain::OracleUnavailableError&) {
        thrown = true;
    }
    assert(thrown);

    settings.useTools = true;
    OllamaOracle toolOracle(settings);
    thrown = false;
    try {
        toolOracle.classify("comprar pan", domain::KnowledgeTree(), "es");
    } catch (const domain::OracleUnavailableError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Unreachable server" << std::endl;
}

int main() {
    std::cout << "=== OllamaOracle Test ===" << std::endl;
    testToolCallMapping();
    testPromptsCarryContext();
    testUnreachableServer();
    std::cout << "=== All OllamaOracle tests passed ===" << std::endl;
    return 0;
}
