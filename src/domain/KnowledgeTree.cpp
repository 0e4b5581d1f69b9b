/**
 * @file KnowledgeTree.cpp
 * @brief Implementation of the knowledge tree value type.
 */

#include "domain/KnowledgeTree.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>

namespace ideasorter::domain {

namespace {

std::vector<std::string> ReadIdeas(const nlohmann::json& node) {
    std::vector<std::string> ideas;
    if (!node.contains("ideas") || !node["ideas"].is_array()) return ideas;
    for (const auto& idea : node["ideas"]) {
        if (idea.is_string()) ideas.push_back(idea.get<std::string>());
    }
    return ideas;
}

} // namespace

Subgroup* Group::findSubgroup(const std::string& subgroupName) {
    for (auto& sub : subgroups) {
        if (text::SameName(sub.name, subgroupName)) return &sub;
    }
    return nullptr;
}

const Subgroup* Group::findSubgroup(const std::string& subgroupName) const {
    for (const auto& sub : subgroups) {
        if (text::SameName(sub.name, subgroupName)) return &sub;
    }
    return nullptr;
}

bool Group::removeSubgroup(const std::string& subgroupName) {
    auto it = std::find_if(subgroups.begin(), subgroups.end(), [&](const Subgroup& sub) {
        return text::SameName(sub.name, subgroupName);
    });
    if (it == subgroups.end()) return false;
    subgroups.erase(it);
    return true;
}

KnowledgeTree::KnowledgeTree(std::vector<Group> groups) : m_groups(std::move(groups)) {}

Group* KnowledgeTree::findGroup(const std::string& groupName) {
    for (auto& group : m_groups) {
        if (text::SameName(group.name, groupName)) return &group;
    }
    return nullptr;
}

const Group* KnowledgeTree::findGroup(const std::string& groupName) const {
    for (const auto& group : m_groups) {
        if (text::SameName(group.name, groupName)) return &group;
    }
    return nullptr;
}

Group* KnowledgeTree::findGroupExact(const std::string& groupName) {
    for (auto& group : m_groups) {
        if (group.name == groupName) return &group;
    }
    return nullptr;
}

Group& KnowledgeTree::addGroup(const std::string& groupName) {
    m_groups.push_back(Group{groupName, {}, {}});
    return m_groups.back();
}

bool KnowledgeTree::removeGroup(const std::string& groupName) {
    auto it = std::find_if(m_groups.begin(), m_groups.end(), [&](const Group& group) {
        return text::SameName(group.name, groupName);
    });
    if (it == m_groups.end()) return false;
    m_groups.erase(it);
    return true;
}

std::vector<std::string> KnowledgeTree::groupNames() const {
    std::vector<std::string> names;
    names.reserve(m_groups.size());
    for (const auto& group : m_groups) names.push_back(group.name);
    return names;
}

nlohmann::json KnowledgeTree::toJson() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& group : m_groups) {
        nlohmann::json subs = nlohmann::json::array();
        for (const auto& sub : group.subgroups) {
            subs.push_back({{"name", sub.name}, {"ideas", sub.ideas}});
        }
        out.push_back({{"name", group.name}, {"ideas", group.ideas}, {"subgroups", subs}});
    }
    return out;
}

KnowledgeTree KnowledgeTree::FromJson(const nlohmann::json& j) {
    std::vector<Group> groups;
    if (!j.is_array()) return KnowledgeTree(std::move(groups));

    for (const auto& node : j) {
        if (!node.is_object() || !node.contains("name") || !node["name"].is_string()) continue;
        Group group;
        group.name = node["name"].get<std::string>();
        group.ideas = ReadIdeas(node);
        if (node.contains("subgroups") && node["subgroups"].is_array()) {
            for (const auto& subNode : node["subgroups"]) {
                if (!subNode.is_object() || !subNode.contains("name") || !subNode["name"].is_string()) continue;
                group.subgroups.push_back(Subgroup{subNode["name"].get<std::string>(), ReadIdeas(subNode)});
            }
        }
        groups.push_back(std::move(group));
    }
    return KnowledgeTree(std::move(groups));
}

bool operator==(const Subgroup& a, const Subgroup& b) {
    return a.name == b.name && a.ideas == b.ideas;
}

bool operator==(const Group& a, const Group& b) {
    return a.name == b.name && a.ideas == b.ideas && a.subgroups == b.subgroups;
}

bool operator==(const KnowledgeTree& a, const KnowledgeTree& b) {
    return a.groups() == b.groups();
}

} // namespace ideasorter::domain
