/**
 * @file GroupSummaryService.hpp
 * @brief Oracle-written summaries and key points for the groups of the tree.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/IdeaOracle.hpp"
#include "domain/KnowledgeTree.hpp"

namespace ideasorter::application {

struct KeyPoint {
    std::string text;
    std::string category;
};

struct GroupSummary {
    std::string groupName;
    std::string suggestedTitle;
    std::string summary;
    std::vector<KeyPoint> keyPoints;
};

struct SummaryReport {
    std::vector<GroupSummary> groups;
    std::string globalSummary;

    nlohmann::json toJson() const;
};

/**
 * @class GroupSummaryService
 * @brief Summarizes small trees in a single oracle call; larger ones group by
 * group, followed by a plain-text global summary.
 *
 * Throws DecodeError / OracleUnavailableError from the oracle and decoder.
 */
class GroupSummaryService {
public:
    static constexpr size_t kMaxGroupsPerCall = 3;

    GroupSummaryService(std::shared_ptr<domain::IdeaOracle> oracle, std::string locale);

    /** @brief An empty tree yields an empty report without calling the oracle. */
    SummaryReport processGroups(const domain::KnowledgeTree& tree);

    /** @brief Reads one group object; both "group_name" and "project_name" are accepted. */
    GroupSummary parseGroup(const nlohmann::json& j, const std::string& fallbackName) const;

private:
    SummaryReport summarizeTogether(const nlohmann::json& groups);
    SummaryReport summarizeOneByOne(const domain::KnowledgeTree& tree);
    std::string defaultCategory() const;

    std::shared_ptr<domain::IdeaOracle> m_oracle;
    std::string m_locale;
};

} // namespace ideasorter::application
