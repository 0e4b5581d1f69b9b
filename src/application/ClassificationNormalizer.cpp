/**
 * @file ClassificationNormalizer.cpp
 * @brief Implementation of the classification safety net.
 */

#include "application/ClassificationNormalizer.hpp"
#include "domain/TextUtils.hpp"

namespace ideasorter::application {

namespace text = domain::text;
using domain::CanonicalMutation;
using domain::ClassificationProposal;
using domain::MutationAction;

ClassificationNormalizer::ClassificationNormalizer(const domain::Lexicon& lexicon)
    : m_lexicon(lexicon), m_distiller(lexicon) {}

bool ClassificationNormalizer::isDeleteIntent(const std::string& noteText) const {
    std::string lowered = text::ToLower(noteText);
    for (const auto& keyword : m_lexicon.deleteKeywords) {
        if (text::FindWholeWord(lowered, keyword) != std::string::npos) return true;
    }
    return false;
}

std::optional<std::string> ClassificationNormalizer::guessCategory(const std::string& noteText) const {
    std::string lowered = text::ToLower(noteText);
    std::optional<std::string> best;
    size_t bestLength = 0;

    for (const auto& [category, keywords] : m_lexicon.categoryKeywords) {
        for (const auto& keyword : keywords) {
            if (keyword.size() <= bestLength) continue;
            if (text::FindWholeWord(lowered, keyword) == std::string::npos) continue;
            best = category;
            bestLength = keyword.size();
        }
    }
    return best;
}

std::optional<std::string> ClassificationNormalizer::routineSubgroup(const std::string& noteText) const {
    std::string lowered = text::ToLower(noteText);
    for (const auto& [keyword, subgroup] : m_lexicon.routineActivities) {
        if (text::FindWholeWord(lowered, keyword) != std::string::npos) return subgroup;
    }
    return std::nullopt;
}

const domain::Group* ClassificationNormalizer::findMentionedGroup(const std::string& noteText,
                                                                  const domain::KnowledgeTree& tree) const {
    for (const auto& group : tree.groups()) {
        if (!group.name.empty() && text::ContainsIgnoreCase(noteText, group.name)) return &group;
    }
    return nullptr;
}

CanonicalMutation ClassificationNormalizer::normalize(const ClassificationProposal& proposal,
                                                      const domain::KnowledgeTree& tree,
                                                      const std::string& noteText) const {
    if (!proposal.makesSense) {
        return CanonicalMutation::NoOp(proposal.reason.value_or(m_lexicon.defaultRejectionReason));
    }

    MutationAction action = proposal.action;
    if (action == MutationAction::Add && isDeleteIntent(noteText)) {
        action = MutationAction::Delete;
    }

    CanonicalMutation m;
    m.action = action;
    m.makesSense = true;
    m.reason = proposal.reason;

    if (action == MutationAction::Delete) {
        m.group = proposal.group;
        m.subgroup = proposal.subgroup;
        m.idea = proposal.idea;
        return m;
    }

    if (action == MutationAction::Remind) {
        m.idea = m_distiller.distill(proposal.idea, noteText);
        if (!m.idea) m.idea = text::Trim(noteText);
        if (proposal.remindAt) m.remindAt = domain::LocalDateTime::FromIsoString(*proposal.remindAt);
        return m;
    }

    std::string group = proposal.group.value_or("");
    bool isNewGroup = proposal.isNewGroup;
    std::optional<std::string> subgroup = proposal.subgroup;
    bool isNewSubgroup = proposal.isNewSubgroup;

    if (isNewGroup && !tree.empty()) {
        if (const auto* mentioned = findMentionedGroup(noteText, tree)) {
            group = mentioned->name;
            isNewGroup = false;
        }
    }

    if (!m_lexicon.isMandatoryCategory(group)) {
        if (auto guessed = guessCategory(noteText)) {
            const auto* existing = tree.findGroup(*guessed);
            group = existing ? existing->name : *guessed;
            isNewGroup = existing == nullptr;

            if (text::SameName(*guessed, m_lexicon.routineCategory) && !subgroup) {
                if (auto activity = routineSubgroup(noteText)) {
                    subgroup = activity;
                    isNewSubgroup = true;
                }
            }
        }
    }

    if (!group.empty()) m.group = group;
    m.isNewGroup = isNewGroup;
    m.subgroup = subgroup;
    m.isNewSubgroup = subgroup ? isNewSubgroup : false;
    m.inheritParentIdeas = subgroup ? proposal.inheritParentIdeas : false;

    if (proposal.rename && isNewGroup) m.rename = proposal.rename;

    m.idea = m_distiller.distill(proposal.idea, noteText);
    return m;
}

std::vector<CanonicalMutation> ClassificationNormalizer::normalizeBatch(const std::vector<ClassificationProposal>& proposals,
                                                                        const domain::KnowledgeTree& tree,
                                                                        const std::string& noteText) const {
    if (proposals.empty()) {
        return {CanonicalMutation::NoOp("Empty oracle response")};
    }

    std::vector<CanonicalMutation> batch;
    batch.reserve(proposals.size());
    for (const auto& proposal : proposals) {
        batch.push_back(normalize(proposal, tree, noteText));
    }
    for (size_t i = 1; i < batch.size(); ++i) {
        batch[i].clearCreationFlags();
    }
    return batch;
}

std::vector<ClassificationProposal> ClassificationNormalizer::ProposalsFromJson(const nlohmann::json& value) {
    std::vector<ClassificationProposal> proposals;

    if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_object()) proposals.push_back(ClassificationProposal::FromJson(item));
        }
        return proposals;
    }

    if (!value.is_object()) return proposals;

    // Some models wrap the list: {"results": [ ... ]}.
    if (!value.contains("action") && !value.contains("group") && !value.contains("makes_sense")) {
        for (const char* key : {"results", "ideas", "items", "classifications"}) {
            if (value.contains(key) && value[key].is_array()) return ProposalsFromJson(value[key]);
        }
    }

    proposals.push_back(ClassificationProposal::FromJson(value));
    return proposals;
}

} // namespace ideasorter::application
