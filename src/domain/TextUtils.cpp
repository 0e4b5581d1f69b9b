/**
 * @file TextUtils.cpp
 * @brief Implementation of the text helpers.
 */

#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ideasorter::domain::text {

std::string ToLower(const std::string& value) {
    std::string out = value;
    for (std::size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (c < 0x80) {
            out[i] = static_cast<char>(std::tolower(c));
            continue;
        }
        // U+00C0..U+00DE (except U+00D7) are uppercase Latin-1 letters: 0xC3 0x80..0x9E
        if (c == 0xC3 && i + 1 < out.size()) {
            unsigned char next = static_cast<unsigned char>(out[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                out[i + 1] = static_cast<char>(next + 0x20);
            }
            ++i;
        }
    }
    return out;
}

std::string Trim(const std::string& value) {
    const char* ws = " \t\r\n\f\v";
    auto start = value.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

std::string CollapseWhitespace(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    bool lastWasSpace = false;
    for (unsigned char c : value) {
        if (std::isspace(c)) {
            if (!lastWasSpace && !out.empty()) {
                out.push_back(' ');
            }
            lastWasSpace = true;
            continue;
        }
        out.push_back(static_cast<char>(c));
        lastWasSpace = false;
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::string NormalizeKey(const std::string& value) {
    return CollapseWhitespace(ToLower(value));
}

bool SameName(const std::string& a, const std::string& b) {
    return NormalizeKey(a) == NormalizeKey(b);
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

std::vector<std::string> SplitWords(const std::string& value) {
    std::vector<std::string> words;
    std::istringstream ss(value);
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }
    return words;
}

std::size_t WordCount(const std::string& value) {
    return SplitWords(value).size();
}

bool IsWordByte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::vector<std::string> Tokenize(const std::string& value) {
    std::vector<std::string> tokens;
    std::string lowered = ToLower(value);
    std::string current;
    for (unsigned char c : lowered) {
        if (IsWordByte(c)) {
            current.push_back(static_cast<char>(c));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

bool IsWholeWordAt(const std::string& text, std::size_t pos, std::size_t len) {
    if (pos > 0 && IsWordByte(static_cast<unsigned char>(text[pos - 1]))) return false;
    std::size_t end = pos + len;
    if (end < text.size() && IsWordByte(static_cast<unsigned char>(text[end]))) return false;
    return true;
}

std::size_t FindWholeWord(const std::string& text, const std::string& needle, std::size_t from) {
    if (needle.empty()) return std::string::npos;
    std::size_t pos = text.find(needle, from);
    while (pos != std::string::npos) {
        if (IsWholeWordAt(text, pos, needle.size())) return pos;
        pos = text.find(needle, pos + 1);
    }
    return std::string::npos;
}

std::vector<std::string> SplitDelimitedList(const std::string& value,
                                            const std::vector<std::string>& conjunctions) {
    std::string lowered = ToLower(value);
    std::string unified = value;
    // Replace conjunctions right to left so earlier offsets stay valid.
    for (const auto& conj : conjunctions) {
        if (conj.empty()) continue;
        std::size_t pos = lowered.rfind(conj);
        while (pos != std::string::npos) {
            unified.replace(pos, conj.size(), ", ");
            lowered.replace(pos, conj.size(), ", ");
            if (pos == 0) break;
            pos = lowered.rfind(conj, pos - 1);
        }
    }

    std::vector<std::string> items;
    std::stringstream ss(unified);
    std::string part;
    while (std::getline(ss, part, ',')) {
        std::string item = CollapseWhitespace(part);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

std::string StripTrailingPunctuation(const std::string& value) {
    std::string out = Trim(value);
    while (!out.empty() && std::string(".!?;:").find(out.back()) != std::string::npos) {
        out.pop_back();
    }
    return Trim(out);
}

bool IsSameIdea(const std::string& a, const std::string& b) {
    std::string ka = NormalizeKey(a);
    std::string kb = NormalizeKey(b);
    if (ka.empty() || kb.empty()) return false;
    if (ka == kb) return true;
    const std::string& shorter = ka.size() < kb.size() ? ka : kb;
    const std::string& longer = ka.size() < kb.size() ? kb : ka;
    if (shorter.size() < kMinContainmentLength) return false;
    return longer.find(shorter) != std::string::npos;
}

std::vector<std::size_t> MatchingIdeas(const std::vector<std::string>& ideas, const std::string& needle) {
    std::vector<std::size_t> exact;
    std::vector<std::size_t> partial;
    const std::string key = NormalizeKey(needle);
    if (key.empty()) return {};

    for (std::size_t i = 0; i < ideas.size(); ++i) {
        if (NormalizeKey(ideas[i]) == key) {
            exact.push_back(i);
        } else if (IsSameIdea(ideas[i], needle)) {
            partial.push_back(i);
        }
    }
    return exact.empty() ? partial : exact;
}

bool ContainsIdea(const std::vector<std::string>& ideas, const std::string& needle) {
    return std::any_of(ideas.begin(), ideas.end(), [&needle](const std::string& idea) {
        return IsSameIdea(idea, needle);
    });
}

} // namespace ideasorter::domain::text
