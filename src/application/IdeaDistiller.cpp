/**
 * @file IdeaDistiller.cpp
 * @brief Implementation of idea distillation.
 */

#include "application/IdeaDistiller.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <set>
#include <vector>

namespace ideasorter::application {

namespace text = domain::text;

IdeaDistiller::IdeaDistiller(const domain::Lexicon& lexicon) : m_lexicon(lexicon) {}

std::string IdeaDistiller::stripFiller(const std::string& idea) const {
    std::vector<std::string> prefixes = m_lexicon.fillerPrefixes;
    std::stable_sort(prefixes.begin(), prefixes.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    std::string current = text::Trim(idea);
    bool stripped = true;
    while (stripped && !current.empty()) {
        stripped = false;
        std::string lowered = text::ToLower(current);
        for (const auto& prefix : prefixes) {
            if (lowered.compare(0, prefix.size(), prefix) == 0 && text::IsWholeWordAt(lowered, 0, prefix.size())) {
                current = text::Trim(current.substr(prefix.size()));
                stripped = true;
                break;
            }
        }
    }
    return current;
}

bool IdeaDistiller::isCreationCommand(const std::string& idea) const {
    std::string lowered = text::ToLower(idea);
    auto words = text::Tokenize(lowered);
    if (words.empty()) return false;

    const auto& verbs = m_lexicon.creationVerbs;
    if (std::find(verbs.begin(), verbs.end(), words.front()) != verbs.end()) return true;

    for (const auto& keyword : m_lexicon.creationKeywords) {
        if (text::FindWholeWord(lowered, keyword) != std::string::npos) return true;
    }

    size_t limit = std::min<size_t>(words.size(), 4);
    const auto& structural = m_lexicon.structuralWords;
    for (size_t i = 0; i < limit; ++i) {
        if (std::find(structural.begin(), structural.end(), words[i]) != structural.end()) return true;
    }
    return false;
}

bool IdeaDistiller::isShortList(const std::string& idea) const {
    auto items = text::SplitDelimitedList(idea, m_lexicon.conjunctions);
    if (items.size() < 2) return false;
    return std::all_of(items.begin(), items.end(), [](const std::string& item) {
        size_t words = text::WordCount(item);
        return words >= 1 && words <= 4;
    });
}

std::string IdeaDistiller::firstMeaningfulWords(const std::string& idea) const {
    std::vector<std::string> meaningful;
    for (const auto& token : text::Tokenize(idea)) {
        if (!m_lexicon.isStopWord(token)) meaningful.push_back(token);
        if (meaningful.size() == kMaxMeaningfulTokens) break;
    }
    if (meaningful.empty()) return idea;

    // Rebuild with the spelling used in the idea ("Madrid", not "madrid").
    auto originalWords = text::SplitWords(idea);
    std::vector<std::string> result;
    for (const auto& token : meaningful) {
        std::string chosen = token;
        for (const auto& word : originalWords) {
            std::string bare = text::StripTrailingPunctuation(word);
            if (text::ToLower(bare) == token) {
                chosen = bare;
                break;
            }
        }
        result.push_back(chosen);
    }
    return text::Join(result, " ");
}

std::optional<std::string> IdeaDistiller::distill(const std::optional<std::string>& idea,
                                                  const std::string& noteText) const {
    if (!idea) return std::nullopt;

    std::string trimmed = text::CollapseWhitespace(stripFiller(*idea));
    if (trimmed.empty()) return std::nullopt;

    if (isShortList(trimmed)) {
        if (isCreationCommand(trimmed)) return std::nullopt;
        return trimmed;
    }

    std::string result = trimmed;
    auto words = text::SplitWords(trimmed);

    bool reduced = false;
    if (words.size() > kMaxMeaningfulTokens && !noteText.empty()) {
        std::set<std::string> noteTokens;
        for (const auto& token : text::Tokenize(noteText)) {
            if (!m_lexicon.isStopWord(token)) noteTokens.insert(token);
        }
        std::vector<std::string> ideaTokens;
        for (const auto& token : text::Tokenize(trimmed)) {
            if (!m_lexicon.isStopWord(token)) ideaTokens.push_back(token);
        }
        std::set<std::string> shared;
        for (const auto& token : ideaTokens) {
            if (noteTokens.count(token)) shared.insert(token);
        }
        double ratio = static_cast<double>(shared.size()) / static_cast<double>(std::max<size_t>(ideaTokens.size(), 1));
        if (!noteTokens.empty() && ratio >= kVerbatimOverlapRatio) {
            result = firstMeaningfulWords(trimmed);
            reduced = true;
        }
    }

    if (!reduced && words.size() > kMaxWords) {
        words.resize(kMaxWords);
        result = text::Join(words, " ");
    }

    if (text::NormalizeKey(result) == text::NormalizeKey(noteText)) {
        result = firstMeaningfulWords(result);
    }

    result = text::StripTrailingPunctuation(result);
    if (result.empty() || isCreationCommand(result)) return std::nullopt;
    return result;
}

} // namespace ideasorter::application
