#include "application/GroupSummaryService.hpp"
#include "application/ResponseDecoder.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "domain/Lexicon.hpp"
#include "domain/TextUtils.hpp"
#include <iostream>

namespace ideasorter::application {

using json = nlohmann::json;
using infrastructure::PromptCatalog;

namespace {

std::string StringField(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

json GroupPayload(const domain::Group& group) {
    json subs = json::array();
    for (const auto& sub : group.subgroups) {
        subs.push_back({{"name", sub.name}, {"ideas", sub.ideas}});
    }
    return {{"name", group.name}, {"ideas", group.ideas}, {"subgroups", subs}};
}

} // namespace

json SummaryReport::toJson() const {
    json out = {{"groups", json::array()}, {"global_summary", globalSummary}};
    for (const auto& g : groups) {
        json points = json::array();
        for (const auto& p : g.keyPoints) points.push_back({{"text", p.text}, {"category", p.category}});
        out["groups"].push_back({
            {"group_name", g.groupName},
            {"suggested_title", g.suggestedTitle},
            {"summary", g.summary},
            {"key_points", points}
        });
    }
    return out;
}

GroupSummaryService::GroupSummaryService(std::shared_ptr<domain::IdeaOracle> oracle, std::string locale)
    : m_oracle(std::move(oracle)), m_locale(domain::Lexicon::ForLocale(locale).locale) {}

std::string GroupSummaryService::defaultCategory() const {
    return m_locale == "en" ? "action" : "acción";
}

GroupSummary GroupSummaryService::parseGroup(const json& j, const std::string& fallbackName) const {
    GroupSummary summary;
    summary.groupName = StringField(j, "group_name");
    if (summary.groupName.empty()) summary.groupName = StringField(j, "project_name");
    if (summary.groupName.empty()) summary.groupName = fallbackName;

    summary.suggestedTitle = StringField(j, "suggested_title");
    if (summary.suggestedTitle.empty()) summary.suggestedTitle = summary.groupName;
    summary.summary = StringField(j, "summary");

    if (j.contains("key_points") && j["key_points"].is_array()) {
        for (const auto& item : j["key_points"]) {
            KeyPoint point;
            if (item.is_string()) {
                point.text = item.get<std::string>();
            } else if (item.is_object()) {
                point.text = StringField(item, "text");
                point.category = StringField(item, "category");
            }
            point.text = domain::text::Trim(point.text);
            if (point.text.empty()) continue;
            if (point.category.empty()) point.category = defaultCategory();
            summary.keyPoints.push_back(std::move(point));
        }
    }
    return summary;
}

SummaryReport GroupSummaryService::processGroups(const domain::KnowledgeTree& tree) {
    if (tree.empty()) return {};

    if (tree.groups().size() <= kMaxGroupsPerCall) {
        json payload = json::array();
        for (const auto& group : tree.groups()) payload.push_back(GroupPayload(group));
        return summarizeTogether(payload);
    }
    return summarizeOneByOne(tree);
}

SummaryReport GroupSummaryService::summarizeTogether(const json& groups) {
    std::cout << "[GroupSummary] Summarizing " << groups.size() << " groups in one call" << std::endl;
    std::string raw = m_oracle->complete(PromptCatalog::GetSummarySystemPrompt(m_locale),
                                         PromptCatalog::GetSummaryPrompt(groups, m_locale));
    json decoded = ResponseDecoder::Decode(raw);

    SummaryReport report;
    const json* items = nullptr;
    if (decoded.is_object() && decoded.contains("groups") && decoded["groups"].is_array()) {
        items = &decoded["groups"];
        report.globalSummary = StringField(decoded, "global_summary");
    } else if (decoded.is_array()) {
        items = &decoded;
    }

    if (items) {
        for (size_t i = 0; i < items->size(); ++i) {
            std::string fallback = i < groups.size() ? groups[i].value("name", "") : "";
            report.groups.push_back(parseGroup((*items)[i], fallback));
        }
    }
    return report;
}

SummaryReport GroupSummaryService::summarizeOneByOne(const domain::KnowledgeTree& tree) {
    std::cout << "[GroupSummary] Summarizing " << tree.groups().size() << " groups one by one" << std::endl;
    SummaryReport report;
    const std::string system = PromptCatalog::GetSummarySystemPrompt(m_locale);

    for (const auto& group : tree.groups()) {
        std::string raw = m_oracle->complete(system,
                                             PromptCatalog::GetSingleGroupSummaryPrompt(GroupPayload(group), m_locale));
        json decoded = ResponseDecoder::Decode(raw);
        // Some models still wrap the single group in {"groups": [...]}.
        if (decoded.is_object() && decoded.contains("groups") && decoded["groups"].is_array() && !decoded["groups"].empty()) {
            decoded = decoded["groups"][0];
        }
        report.groups.push_back(parseGroup(decoded, group.name));
    }

    json summaries = json::array();
    for (const auto& g : report.groups) {
        summaries.push_back({{"group_name", g.groupName}, {"summary", g.summary}});
    }
    report.globalSummary = domain::text::Trim(
        m_oracle->complete(PromptCatalog::GetGlobalSummarySystemPrompt(m_locale),
                           PromptCatalog::GetGlobalSummaryPrompt(summaries, m_locale)));
    return report;
}

} // namespace ideasorter::application
