/**
 * @file ReminderDetector.cpp
 * @brief Implementation of the reminder pre-detector.
 */

#include "application/ReminderDetector.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <regex>
#include <vector>

namespace ideasorter::application {

namespace text = domain::text;

namespace {

/** @brief [begin, end) byte range of a phrase recognized in the note. */
struct Span {
    size_t begin;
    size_t end;
};

struct ClockTime {
    int hour = 0;
    int minute = 0;
    Span span{0, 0};
};

/** @brief Earliest whole-word occurrence of any phrase. */
std::optional<Span> FindFirstPhrase(const std::string& lowered, const std::vector<std::string>& phrases) {
    std::optional<Span> best;
    for (const auto& phrase : phrases) {
        size_t pos = text::FindWholeWord(lowered, phrase);
        if (pos == std::string::npos) continue;
        if (!best || pos < best->begin) best = Span{pos, pos + phrase.size()};
    }
    return best;
}

bool InsideExclusion(const std::string& lowered, size_t pos, const std::vector<std::string>& exclusions) {
    for (const auto& phrase : exclusions) {
        size_t at = lowered.find(phrase);
        while (at != std::string::npos) {
            if (pos >= at && pos < at + phrase.size()) return true;
            at = lowered.find(phrase, at + 1);
        }
    }
    return false;
}

/** @brief Every whole-word occurrence of any phrase. */
std::vector<Span> FindAllPhrases(const std::string& lowered, const std::vector<std::string>& phrases) {
    std::vector<Span> found;
    for (const auto& phrase : phrases) {
        for (size_t pos = text::FindWholeWord(lowered, phrase); pos != std::string::npos;
             pos = text::FindWholeWord(lowered, phrase, pos + phrase.size())) {
            found.push_back(Span{pos, pos + phrase.size()});
        }
    }
    return found;
}

/** @brief First "tomorrow" word that is not part of an expression like "por la mañana". */
std::optional<Span> FindTomorrow(const std::string& lowered, const domain::Lexicon& lexicon) {
    std::optional<Span> best;
    for (const auto& word : lexicon.tomorrowWords) {
        size_t pos = text::FindWholeWord(lowered, word);
        while (pos != std::string::npos && InsideExclusion(lowered, pos, lexicon.tomorrowExclusions)) {
            pos = text::FindWholeWord(lowered, word, pos + word.size());
        }
        if (pos == std::string::npos) continue;
        if (!best || pos < best->begin) best = Span{pos, pos + word.size()};
    }
    return best;
}

/** @brief Extends a time match backwards over "at" / "a las". */
size_t ExtendOverPreposition(const std::string& lowered, size_t start, const domain::Lexicon& lexicon) {
    size_t cursor = start;
    while (cursor > 0 && lowered[cursor - 1] == ' ') --cursor;
    for (const auto& prep : lexicon.timePrepositions) {
        if (cursor < prep.size()) continue;
        size_t candidate = cursor - prep.size();
        if (lowered.compare(candidate, prep.size(), prep) == 0 &&
            text::IsWholeWordAt(lowered, candidate, prep.size())) {
            return candidate;
        }
    }
    return start;
}

/** @brief Applies an am/pm style suffix directly after the time, extending the span. */
void ApplyMeridiem(const std::string& lowered, ClockTime& time, const domain::Lexicon& lexicon) {
    size_t cursor = time.span.end;
    while (cursor < lowered.size() && lowered[cursor] == ' ') ++cursor;

    auto matchesAt = [&](const std::string& suffix) {
        if (lowered.compare(cursor, suffix.size(), suffix) != 0) return false;
        size_t after = cursor + suffix.size();
        // "p.m." ends in punctuation, so only the leading edge needs a boundary check.
        return after >= lowered.size() || !text::IsWordByte(static_cast<unsigned char>(lowered[after])) ||
               !text::IsWordByte(static_cast<unsigned char>(suffix.back()));
    };

    for (const auto& suffix : lexicon.pmSuffixes) {
        if (matchesAt(suffix)) {
            if (time.hour < 12) time.hour += 12;
            time.span.end = cursor + suffix.size();
            return;
        }
    }
    for (const auto& suffix : lexicon.amSuffixes) {
        if (matchesAt(suffix)) {
            if (time.hour == 12) time.hour = 0;
            time.span.end = cursor + suffix.size();
            return;
        }
    }
}

std::optional<ClockTime> FindClockTime(const std::string& lowered, const domain::Lexicon& lexicon) {
    static const std::regex kTimePattern(R"(\b(\d{1,2})(?::(\d{2}))?(?!\d))");

    for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), kTimePattern);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        int hour = std::stoi(m[1].str());
        int minute = m[2].matched ? std::stoi(m[2].str()) : 0;
        if (hour > 23 || minute > 59) continue;

        ClockTime time;
        time.hour = hour;
        time.minute = minute;
        size_t begin = static_cast<size_t>(m.position(0));
        time.span = Span{ExtendOverPreposition(lowered, begin, lexicon), begin + static_cast<size_t>(m.length(0))};
        ApplyMeridiem(lowered, time, lexicon);
        return time;
    }
    return std::nullopt;
}

bool IsConnectorOrPunctuation(const std::string& word, const domain::Lexicon& lexicon) {
    std::string bare = text::ToLower(word);
    bare.erase(std::remove_if(bare.begin(), bare.end(),
                              [](char c) { return c == ',' || c == '.' || c == ';' || c == ':' ||
                                                  c == '!' || c == '?' || c == '-'; }),
               bare.end());
    if (bare.empty()) return true;
    return std::find(lexicon.connectorWords.begin(), lexicon.connectorWords.end(), bare) !=
           lexicon.connectorWords.end();
}

std::string ExtractMessage(const std::string& note, std::vector<Span> spans, const domain::Lexicon& lexicon) {
    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) { return a.begin < b.begin; });

    std::string remaining;
    size_t cursor = 0;
    for (const auto& span : spans) {
        if (span.begin > cursor) remaining += note.substr(cursor, span.begin - cursor);
        remaining += ' ';
        cursor = std::max(cursor, span.end);
    }
    if (cursor < note.size()) remaining += note.substr(cursor);

    auto words = text::SplitWords(remaining);
    size_t first = 0;
    size_t last = words.size();
    while (first < last && IsConnectorOrPunctuation(words[first], lexicon)) ++first;
    while (last > first && IsConnectorOrPunctuation(words[last - 1], lexicon)) --last;

    std::vector<std::string> kept(words.begin() + static_cast<std::ptrdiff_t>(first),
                                  words.begin() + static_cast<std::ptrdiff_t>(last));
    std::string message = text::StripTrailingPunctuation(text::Join(kept, " "));
    while (!message.empty() && (message.front() == ',' || message.front() == ';')) {
        message = text::Trim(message.substr(1));
    }
    return message;
}

} // namespace

ReminderDetector::ReminderDetector(const domain::Lexicon& lexicon) : m_lexicon(lexicon) {}

std::optional<domain::CanonicalMutation> ReminderDetector::detect(const std::string& noteText,
                                                                  const domain::LocalDateTime& now) const {
    const std::string lowered = text::ToLower(noteText);

    auto trigger = FindFirstPhrase(lowered, m_lexicon.reminderTriggers);
    if (!trigger) return std::nullopt;

    std::vector<Span> spans{*trigger};

    std::optional<int> dayOffset;
    if (auto span = FindFirstPhrase(lowered, m_lexicon.dayAfterTomorrowPhrases)) {
        dayOffset = 2;
        spans.push_back(*span);
    } else if (auto span = FindTomorrow(lowered, m_lexicon)) {
        dayOffset = 1;
        spans.push_back(*span);
    } else {
        std::optional<Span> weekdaySpan;
        int weekday = 0;
        for (const auto& [name, index] : m_lexicon.weekdayNames) {
            size_t pos = text::FindWholeWord(lowered, name);
            if (pos == std::string::npos) continue;
            if (!weekdaySpan || pos < weekdaySpan->begin) {
                weekdaySpan = Span{pos, pos + name.size()};
                weekday = index;
            }
        }
        if (weekdaySpan) {
            int delta = (weekday - now.weekday() + 7) % 7;
            dayOffset = delta == 0 ? 7 : delta;
            spans.push_back(*weekdaySpan);
        }
    }

    // "por la mañana" is time-of-day wording, not part of the message.
    for (const auto& span : FindAllPhrases(lowered, m_lexicon.tomorrowExclusions)) {
        spans.push_back(span);
    }

    domain::LocalDateTime fireAt;
    auto clock = FindClockTime(lowered, m_lexicon);
    if (!clock) {
        fireAt = now.plusMinutes(kFallbackDelayMinutes);
    } else {
        spans.push_back(clock->span);
        if (dayOffset) {
            fireAt = now.plusDays(*dayOffset).atTime(clock->hour, clock->minute);
        } else {
            fireAt = now.atTime(clock->hour, clock->minute);
            if (fireAt < now) fireAt = fireAt.plusDays(1);
        }
    }

    std::string message = ExtractMessage(noteText, spans, m_lexicon);
    if (message.empty()) message = text::Trim(noteText);

    domain::CanonicalMutation mutation;
    mutation.action = domain::MutationAction::Remind;
    mutation.makesSense = true;
    mutation.idea = message;
    mutation.remindAt = fireAt;
    return mutation;
}

} // namespace ideasorter::application
