#include <iostream>
#include <cassert>
#include <deque>
#include <string>
#include "application/GroupSummaryService.hpp"
#include "domain/Errors.hpp"

using namespace ideasorter;

// Mock oracle replaying canned completions in order.
class ScriptedOracle : public domain::IdeaOracle {
public:
    explicit ScriptedOracle(std::deque<std::string> replies) : m_replies(std::move(replies)) {}

    domain::RawProposal classify(const std::string&, const domain::KnowledgeTree&, const std::string&) override {
        throw domain::OracleUnavailableError("not used");
    }

    std::string complete(const std::string&, const std::string& userPrompt) override {
        ++calls;
        lastPrompt = userPrompt;
        if (m_replies.empty()) throw domain::OracleUnavailableError("no scripted reply left");
        std::string reply = m_replies.front();
        m_replies.pop_front();
        return reply;
    }

    int calls = 0;
    std::string lastPrompt;

private:
    std::deque<std::string> m_replies;
};

static domain::KnowledgeTree TreeWith(const std::vector<std::string>& names) {
    domain::KnowledgeTree tree;
    for (const auto& name : names) tree.addGroup(name).ideas = {"idea de " + name};
    return tree;
}

static void testEmptyTreeMakesNoCall() {
    std::cout << "[Test] Empty tree yields an empty report..." << std::endl;
    auto oracle = std::make_shared<ScriptedOracle>(std::deque<std::string>{});
    application::GroupSummaryService service(oracle, "es");
    auto report = service.processGroups(domain::KnowledgeTree());
    assert(report.groups.empty());
    assert(report.globalSummary.empty());
    assert(oracle->calls == 0);
    std::cout << "[PASS] Empty tree" << std::endl;
}

static void testSmallTreeSingleCall() {
    std::cout << "[Test] Up to three groups share one call..." << std::endl;
    auto oracle = std::make_shared<ScriptedOracle>(std::deque<std::string>{
        "```json\n{\"groups\": [{\"group_name\": \"compras\", \"suggested_title\": \"Despensa\", "
        "\"summary\": \"Reponer básicos.\", \"key_points\": [{\"text\": \"Comprar pan\", \"category\": \"meta\"}, "
        "\"Pagar la cuenta\"]}, {\"summary\": \"Escapada corta.\"}], \"global_summary\": \"Todo en orden.\"}\n```"
    });
    application::GroupSummaryService service(oracle, "es");
    auto report = service.processGroups(TreeWith({"compras", "viajes"}));

    assert(oracle->calls == 1);
    assert(oracle->lastPrompt.find("idea de viajes") != std::string::npos);
    assert(report.groups.size() == 2);
    assert(report.groups[0].suggestedTitle == "Despensa");
    assert(report.groups[0].keyPoints.size() == 2);
    assert(report.groups[0].keyPoints[0].category == "meta");
    assert(report.groups[0].keyPoints[1].category == "acción");
    // Missing names and titles fall back to the tree.
    assert(report.groups[1].groupName == "viajes");
    assert(report.groups[1].suggestedTitle == "viajes");
    assert(report.globalSummary == "Todo en orden.");

    auto j = report.toJson();
    assert(j["groups"].size() == 2);
    assert(j["global_summary"] == "Todo en orden.");
    std::cout << "[PASS] Single call" << std::endl;
}

static void testLargeTreeOneByOne() {
    std::cout << "[Test] Larger trees are summarized group by group..." << std::endl;
    auto oracle = std::make_shared<ScriptedOracle>(std::deque<std::string>{
        R"({"project_name": "a", "summary": "resumen a"})",
        R"({"group_name": "b", "summary": "resumen b", "key_points": [{"text": "x"}]})",
        R"({"groups": [{"group_name": "c", "summary": "resumen c"}]})",
        R"({"summary": "resumen d"})",
        "  Cuatro frentes abiertos.  "
    });
    application::GroupSummaryService service(oracle, "en");
    auto report = service.processGroups(TreeWith({"a", "b", "c", "d"}));

    assert(oracle->calls == 5);
    assert(report.groups.size() == 4);
    assert(report.groups[0].groupName == "a");
    assert(report.groups[1].keyPoints[0].category == "action");
    assert(report.groups[2].summary == "resumen c");
    assert(report.groups[3].groupName == "d");
    assert(report.globalSummary == "Cuatro frentes abiertos.");
    std::cout << "[PASS] One by one" << std::endl;
}

static void testUnreadableSummaryThrows() {
    std::cout << "[Test] Unreadable summaries raise DecodeError..." << std::endl;
    auto oracle = std::make_shared<ScriptedOracle>(std::deque<std::string>{"lo siento"});
    application::GroupSummaryService service(oracle, "es");
    bool thrown = false;
    try {
        service.processGroups(TreeWith({"compras"}));
    } catch (const domain::DecodeError& e) {
        thrown = true;
        assert(e.rawText() == "lo siento");
    }
    assert(thrown);
    std::cout << "[PASS] DecodeError" << std::endl;
}

static void testRegionalLocaleDefaults() {
    std::cout << "[Test] 'en-US' gets English defaults..." << std::endl;
    auto oracle = std::make_shared<ScriptedOracle>(std::deque<std::string>{
        "{\"groups\": [{\"group_name\": \"shopping\", \"summary\": \"Restock.\", "
        "\"key_points\": [\"Buy bread\"]}], \"global_summary\": \"Fine.\"}"
    });
    application::GroupSummaryService service(oracle, "en-US");
    auto report = service.processGroups(TreeWith({"shopping"}));
    assert(report.groups.size() == 1);
    assert(report.groups[0].keyPoints.size() == 1);
    assert(report.groups[0].keyPoints[0].category == "action");
    assert(oracle->lastPrompt.find("GROUPS:") != std::string::npos);
    std::cout << "[PASS] Regional locale" << std::endl;
}

int main() {
    std::cout << "=== GroupSummaryService Test ===" << std::endl;
    testEmptyTreeMakesNoCall();
    testSmallTreeSingleCall();
    testLargeTreeOneByOne();
    testUnreadableSummaryThrows();
    testRegionalLocaleDefaults();
    std::cout << "=== All GroupSummaryService tests passed ===" << std::endl;
    return 0;
}
