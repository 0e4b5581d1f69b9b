/**
 * @file EnumerationSplitter.cpp
 * @brief Implementation of the enumeration splitter.
 */

#include "application/EnumerationSplitter.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>

namespace ideasorter::application {

namespace text = domain::text;

EnumerationSplitter::EnumerationSplitter(const domain::Lexicon& lexicon) : m_lexicon(lexicon) {}

std::string EnumerationSplitter::stripLeadingStopWords(const std::string& item) const {
    auto words = text::SplitWords(item);
    size_t first = 0;
    while (first + 1 < words.size() && m_lexicon.isStopWord(text::ToLower(words[first]))) ++first;
    return text::Join(std::vector<std::string>(words.begin() + static_cast<std::ptrdiff_t>(first), words.end()), " ");
}

std::optional<std::vector<std::string>> EnumerationSplitter::splitIdea(const std::string& idea) const {
    auto parts = text::SplitDelimitedList(idea, m_lexicon.conjunctions);
    if (parts.size() < 2) return std::nullopt;

    std::vector<std::string> items;
    for (const auto& part : parts) {
        std::string item = text::StripTrailingPunctuation(part);
        size_t words = text::WordCount(item);
        if (words < 1 || words > kMaxListItemWords) return std::nullopt;
        items.push_back(item);
    }
    return items;
}

std::optional<std::vector<std::string>> EnumerationSplitter::trailingEnumeration(const std::string& noteText) const {
    auto parts = text::SplitDelimitedList(text::StripTrailingPunctuation(noteText), m_lexicon.conjunctions);
    if (parts.size() < kMinTrailingItems) return std::nullopt;

    std::vector<std::string> reversed;
    for (size_t i = parts.size(); i-- > 0;) {
        std::string part = text::StripTrailingPunctuation(parts[i]);
        auto words = text::SplitWords(part);
        if (words.empty()) continue;

        if (i == 0 || words.size() > kMaxTrailingItemWords) {
            reversed.push_back(text::StripTrailingPunctuation(words.back()));
            break;
        }
        reversed.push_back(stripLeadingStopWords(part));
    }

    if (reversed.size() < kMinTrailingItems) return std::nullopt;
    std::reverse(reversed.begin(), reversed.end());
    return reversed;
}

std::vector<domain::CanonicalMutation> EnumerationSplitter::expand(const std::vector<domain::CanonicalMutation>& batch,
                                                                   const std::string& noteText) const {
    if (batch.size() != 1) return batch;
    const auto& original = batch.front();
    if (original.action != domain::MutationAction::Add || !original.makesSense || !original.idea) return batch;

    std::optional<std::vector<std::string>> items;
    if (text::SplitDelimitedList(*original.idea, m_lexicon.conjunctions).size() >= 2) {
        items = splitIdea(*original.idea);
    } else {
        items = trailingEnumeration(noteText);
    }
    if (!items) return batch;

    std::vector<domain::CanonicalMutation> expanded;
    expanded.reserve(items->size());
    for (const auto& item : *items) {
        domain::CanonicalMutation m = original;
        m.idea = item;
        if (!expanded.empty()) m.clearCreationFlags();
        expanded.push_back(std::move(m));
    }
    return expanded;
}

} // namespace ideasorter::application
