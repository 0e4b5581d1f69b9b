/**
 * @file ResponseDecoder.cpp
 * @brief Implementation of the JSON repair ladder.
 */

#include "application/ResponseDecoder.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <vector>
#include <cctype>

namespace ideasorter::application {

using json = nlohmann::json;

std::optional<json> ResponseDecoder::TryParse(const std::string& text) {
    if (text.empty()) return std::nullopt;
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) return std::nullopt;
    if (!parsed.is_object() && !parsed.is_array()) return std::nullopt;
    return parsed;
}

std::string ResponseDecoder::SanitizeStrings(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool inString = false;
    bool escaped = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (!inString) {
            if (c == '"') inString = true;
            out.push_back(c);
            continue;
        }
        if (escaped) {
            escaped = false;
            out.push_back(c);
            continue;
        }
        if (c == '\\') {
            escaped = true;
            out.push_back(c);
        } else if (c == '"') {
            inString = false;
            out.push_back(c);
        } else if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            // \r\n collapses to the single space emitted for \n.
        } else if (static_cast<unsigned char>(c) < 0x20) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string ResponseDecoder::CloseIncomplete(const std::string& text) {
    std::vector<char> closers;
    bool inString = false;
    bool escaped = false;

    for (char c : text) {
        if (inString) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') inString = false;
            continue;
        }
        switch (c) {
            case '"': inString = true; break;
            case '{': closers.push_back('}'); break;
            case '[': closers.push_back(']'); break;
            case '}':
            case ']':
                if (!closers.empty() && closers.back() == c) closers.pop_back();
                break;
            default: break;
        }
    }

    std::string out = text;
    if (inString) {
        if (escaped) out.pop_back();
        out.push_back('"');
    }
    if (closers.empty()) return out;

    while (!out.empty() && (std::isspace(static_cast<unsigned char>(out.back())) || out.back() == ',')) {
        out.pop_back();
    }
    if (!out.empty() && out.back() == ':') out += " null";

    for (auto it = closers.rbegin(); it != closers.rend(); ++it) {
        out.push_back(*it);
    }
    return out;
}

std::optional<std::string> ResponseDecoder::ExtractFencedBlock(const std::string& text) {
    const std::string fence = "```";
    size_t open = text.find(fence);
    if (open == std::string::npos) return std::nullopt;

    // Skip the optional language tag ("```json").
    size_t start = text.find('\n', open + fence.size());
    if (start == std::string::npos) return std::nullopt;
    ++start;

    size_t close = text.find(fence, start);
    if (close == std::string::npos) return text.substr(start);
    return text.substr(start, close - start);
}

std::optional<std::string> ResponseDecoder::Slice(const std::string& text, char open, char close) {
    size_t first = text.find(open);
    if (first == std::string::npos) return std::nullopt;
    size_t last = text.rfind(close);
    if (last == std::string::npos || last < first) return text.substr(first);
    return text.substr(first, last - first + 1);
}

std::optional<json> ResponseDecoder::RepairLadder(const std::string& text) {
    std::string trimmed = domain::text::Trim(text);
    if (trimmed.empty()) return std::nullopt;

    if (auto parsed = TryParse(trimmed)) return parsed;

    std::string sanitized = SanitizeStrings(trimmed);
    if (auto parsed = TryParse(sanitized)) return parsed;

    if (auto parsed = TryParse(CloseIncomplete(trimmed))) return parsed;

    return TryParse(CloseIncomplete(sanitized));
}

std::optional<json> ResponseDecoder::TryDecode(const std::string& rawText) {
    if (auto parsed = RepairLadder(rawText)) return parsed;

    if (auto fenced = ExtractFencedBlock(rawText)) {
        if (auto parsed = RepairLadder(*fenced)) return parsed;
    }

    if (auto object = Slice(rawText, '{', '}')) {
        if (auto parsed = RepairLadder(*object)) return parsed;
    }

    if (auto array = Slice(rawText, '[', ']')) {
        if (auto parsed = RepairLadder(*array)) return parsed;
    }

    return std::nullopt;
}

json ResponseDecoder::Decode(const std::string& rawText) {
    if (auto parsed = TryDecode(rawText)) return *parsed;
    throw domain::DecodeError(rawText);
}

} // namespace ideasorter::application
