/**
 * @file Mutation.cpp
 * @brief Conversions for proposals, mutations and change sets.
 */

#include "domain/Mutation.hpp"
#include "domain/TextUtils.hpp"

namespace ideasorter::domain {

namespace {

std::optional<std::string> OptionalString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
    std::string value = text::Trim(j[key].get<std::string>());
    if (value.empty()) return std::nullopt;
    return value;
}

bool FlagValue(const nlohmann::json& j, const char* key, bool fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
        std::string s = text::ToLower(text::Trim(v.get<std::string>()));
        if (s == "true") return true;
        if (s == "false") return false;
    }
    if (v.is_number_integer()) return v.get<int>() != 0;
    return fallback;
}

nlohmann::json OrNull(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

std::string ActionToString(MutationAction action) {
    switch (action) {
        case MutationAction::Add: return "add";
        case MutationAction::Delete: return "delete";
        case MutationAction::Remind: return "remind";
    }
    return "add";
}

MutationAction ActionFromString(const std::string& value) {
    std::string token = text::ToLower(text::Trim(value));
    if (token == "delete") return MutationAction::Delete;
    if (token == "remind") return MutationAction::Remind;
    return MutationAction::Add;
}

ClassificationProposal ClassificationProposal::FromJson(const nlohmann::json& j) {
    ClassificationProposal p;
    if (!j.is_object()) return p;

    if (auto action = OptionalString(j, "action")) p.action = ActionFromString(*action);
    p.makesSense = FlagValue(j, "makes_sense", true);
    p.reason = OptionalString(j, "reason");
    p.group = OptionalString(j, "group");
    p.subgroup = OptionalString(j, "subgroup");
    p.idea = OptionalString(j, "idea");
    p.isNewGroup = FlagValue(j, "is_new_group", false);
    p.isNewSubgroup = FlagValue(j, "is_new_subgroup", false);
    p.inheritParentIdeas = FlagValue(j, "inherit_parent_ideas", false);
    p.remindAt = OptionalString(j, "remind_at");

    // Older prompt versions used "rename_group"; both spellings are accepted.
    const char* renameKey = j.contains("rename") ? "rename" : "rename_group";
    if (j.contains(renameKey) && j[renameKey].is_object()) {
        auto oldName = OptionalString(j[renameKey], "old_name");
        auto newName = OptionalString(j[renameKey], "new_name");
        if (oldName && newName) {
            p.rename = GroupRename{*oldName, *newName};
        }
    }
    return p;
}

CanonicalMutation CanonicalMutation::NoOp(const std::string& reason) {
    CanonicalMutation m;
    m.makesSense = false;
    m.reason = reason;
    return m;
}

void CanonicalMutation::clearCreationFlags() {
    isNewGroup = false;
    isNewSubgroup = false;
    inheritParentIdeas = false;
    rename.reset();
}

nlohmann::json CanonicalMutation::toJson() const {
    nlohmann::json j = {
        {"action", ActionToString(action)},
        {"makesSense", makesSense},
        {"reason", OrNull(reason)},
        {"group", OrNull(group)},
        {"subgroup", OrNull(subgroup)},
        {"idea", OrNull(idea)},
        {"isNewGroup", isNewGroup},
        {"isNewSubgroup", isNewSubgroup},
        {"inheritParentIdeas", inheritParentIdeas},
        {"rename", nullptr},
        {"remindAt", nullptr}
    };
    if (rename) {
        j["rename"] = {{"oldName", rename->oldName}, {"newName", rename->newName}};
    }
    if (remindAt) {
        j["remindAt"] = remindAt->toIsoString();
    }
    return j;
}

std::string ChangeKindToString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::GroupRenamed: return "group_renamed";
        case ChangeKind::GroupCreated: return "group_created";
        case ChangeKind::SubgroupCreated: return "subgroup_created";
        case ChangeKind::IdeaAdded: return "idea_added";
        case ChangeKind::IdeaRemoved: return "idea_removed";
        case ChangeKind::SubgroupRemoved: return "subgroup_removed";
        case ChangeKind::GroupRemoved: return "group_removed";
        case ChangeKind::ReminderScheduled: return "reminder_scheduled";
    }
    return "unknown";
}

void ChangeSet::append(const ChangeSet& other) {
    changes.insert(changes.end(), other.changes.begin(), other.changes.end());
    conflicts.insert(conflicts.end(), other.conflicts.begin(), other.conflicts.end());
    reminders.insert(reminders.end(), other.reminders.begin(), other.reminders.end());
}

} // namespace ideasorter::domain
