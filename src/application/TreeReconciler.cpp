/**
 * @file TreeReconciler.cpp
 * @brief Implementation of the tree reconciliation state machine.
 */

#include "application/TreeReconciler.hpp"
#include "domain/TextUtils.hpp"

namespace ideasorter::application {

namespace text = domain::text;
using domain::ChangeKind;
using domain::ChangeSet;
using domain::CanonicalMutation;

namespace {

/** @brief Removes the selected indices (ascending) and reports each removal. */
void RemoveIdeas(std::vector<std::string>& ideas, const std::vector<size_t>& indices,
                 const std::string& group, const std::string& subgroup, ChangeSet& out) {
    for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
        out.changes.push_back({ChangeKind::IdeaRemoved, group, subgroup, ideas[*it]});
        ideas.erase(ideas.begin() + static_cast<std::ptrdiff_t>(*it));
    }
}

} // namespace

TreeReconciler::Result TreeReconciler::Reconcile(const domain::KnowledgeTree& tree,
                                                 const std::vector<CanonicalMutation>& batch) {
    Result result{tree, {}};
    for (const auto& mutation : batch) {
        result.changes.append(Apply(result.tree, mutation));
    }
    return result;
}

ChangeSet TreeReconciler::Apply(domain::KnowledgeTree& tree, const CanonicalMutation& mutation) {
    ChangeSet out;
    if (!mutation.makesSense) return out;

    switch (mutation.action) {
        case domain::MutationAction::Add: ApplyAdd(tree, mutation, out); break;
        case domain::MutationAction::Delete: ApplyDelete(tree, mutation, out); break;
        case domain::MutationAction::Remind: ApplyRemind(mutation, out); break;
    }
    return out;
}

void TreeReconciler::ApplyAdd(domain::KnowledgeTree& tree, const CanonicalMutation& m, ChangeSet& out) {
    if (m.rename) {
        domain::Group* renamed = tree.findGroupExact(m.rename->oldName);
        const domain::Group* clash = tree.findGroup(m.rename->newName);
        if (!renamed) {
            out.conflicts.push_back("Rename target not found: " + m.rename->oldName);
        } else if (clash && clash != renamed) {
            out.conflicts.push_back("Rename would collide with existing group: " + m.rename->newName);
        } else {
            out.changes.push_back({ChangeKind::GroupRenamed, m.rename->oldName, "", m.rename->newName});
            renamed->name = m.rename->newName;
        }
    }

    if (!m.group || text::Trim(*m.group).empty()) {
        out.conflicts.push_back("Add without a target group");
        return;
    }

    domain::Group* group = tree.findGroup(*m.group);
    if (!group) {
        group = &tree.addGroup(text::Trim(*m.group));
        out.changes.push_back({ChangeKind::GroupCreated, group->name, "", ""});
    }

    std::vector<std::string>* ideas = &group->ideas;
    std::string subgroupName;

    if (m.subgroup && !text::Trim(*m.subgroup).empty()) {
        domain::Subgroup* subgroup = group->findSubgroup(*m.subgroup);
        if (!subgroup) {
            domain::Subgroup created;
            created.name = text::Trim(*m.subgroup);
            if (m.inheritParentIdeas) created.ideas = group->ideas;
            group->subgroups.push_back(std::move(created));
            subgroup = &group->subgroups.back();
            out.changes.push_back({ChangeKind::SubgroupCreated, group->name, subgroup->name,
                                   m.inheritParentIdeas ? text::Join(subgroup->ideas, ", ") : ""});
        }
        ideas = &subgroup->ideas;
        subgroupName = subgroup->name;
    }

    if (!m.idea) return;
    std::string idea = text::Trim(*m.idea);
    if (idea.empty() || text::ContainsIdea(*ideas, idea)) return;

    ideas->push_back(idea);
    out.changes.push_back({ChangeKind::IdeaAdded, group->name, subgroupName, idea});
}

void TreeReconciler::ApplyDelete(domain::KnowledgeTree& tree, const CanonicalMutation& m, ChangeSet& out) {
    if (!m.group) {
        out.conflicts.push_back("Delete without a target group");
        return;
    }

    domain::Group* group = tree.findGroup(*m.group);
    if (!group) {
        out.conflicts.push_back("Group not found: " + *m.group);
        return;
    }

    if (m.idea && m.subgroup) {
        domain::Subgroup* subgroup = group->findSubgroup(*m.subgroup);
        if (!subgroup) {
            out.conflicts.push_back("Subgroup not found: " + *m.subgroup);
            return;
        }
        auto matches = text::MatchingIdeas(subgroup->ideas, *m.idea);
        if (matches.empty()) {
            out.conflicts.push_back("Idea not found: " + *m.idea);
            return;
        }
        RemoveIdeas(subgroup->ideas, matches, group->name, subgroup->name, out);
        return;
    }

    if (m.idea) {
        auto rootMatches = text::MatchingIdeas(group->ideas, *m.idea);
        if (!rootMatches.empty()) {
            RemoveIdeas(group->ideas, rootMatches, group->name, "", out);
            return;
        }
        for (auto& subgroup : group->subgroups) {
            auto matches = text::MatchingIdeas(subgroup.ideas, *m.idea);
            if (matches.empty()) continue;
            RemoveIdeas(subgroup.ideas, matches, group->name, subgroup.name, out);
            return;
        }
        out.conflicts.push_back("Idea not found: " + *m.idea);
        return;
    }

    if (m.subgroup) {
        const domain::Subgroup* subgroup = group->findSubgroup(*m.subgroup);
        if (!subgroup) {
            out.conflicts.push_back("Subgroup not found: " + *m.subgroup);
            return;
        }
        std::string removedName = subgroup->name;
        group->removeSubgroup(removedName);
        out.changes.push_back({ChangeKind::SubgroupRemoved, group->name, removedName, ""});
        return;
    }

    std::string removedName = group->name;
    tree.removeGroup(removedName);
    out.changes.push_back({ChangeKind::GroupRemoved, removedName, "", ""});
}

void TreeReconciler::ApplyRemind(const CanonicalMutation& m, ChangeSet& out) {
    if (!m.remindAt) {
        out.conflicts.push_back("Reminder without a fire time");
        return;
    }
    domain::ReminderRecord record;
    record.message = m.idea.value_or("");
    record.fireAt = *m.remindAt;
    out.reminders.push_back(record);
    out.changes.push_back({ChangeKind::ReminderScheduled, "", "", record.message});
}

} // namespace ideasorter::application
