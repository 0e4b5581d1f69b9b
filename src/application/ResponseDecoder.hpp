/**
 * @file ResponseDecoder.hpp
 * @brief Recovers a JSON value from free-form model output.
 */

#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace ideasorter::application {

/**
 * @class ResponseDecoder
 * @brief Repair ladder for truncated, fenced or prose-wrapped JSON.
 *
 * Repairs are tried from least to most destructive:
 *  1. parse as-is
 *  2. sanitize raw newlines inside strings
 *  3. close unterminated strings, arrays and objects
 *  4. sanitize + close
 * then the same four steps on a fenced code block, on the first '{' .. last '}'
 * slice and on the first '[' .. last ']' slice. Only objects and arrays count
 * as a successful decode.
 */
class ResponseDecoder {
public:
    /**
     * @brief Decodes model output.
     * @throws domain::DecodeError carrying the original text.
     */
    static nlohmann::json Decode(const std::string& rawText);

    /** @brief Same as Decode but returns nullopt instead of throwing. */
    static std::optional<nlohmann::json> TryDecode(const std::string& rawText);

    /** @brief Replaces newlines and control characters inside string literals with spaces. */
    static std::string SanitizeStrings(const std::string& text);

    /**
     * @brief Appends whatever is needed to terminate the text: a closing quote
     * when a string is left open, then the pending '}' / ']' in nesting order.
     * A trailing comma is dropped and a dangling key gets a null value.
     */
    static std::string CloseIncomplete(const std::string& text);

    /** @brief Contents of the first ``` fenced block (to end of text if unterminated). */
    static std::optional<std::string> ExtractFencedBlock(const std::string& text);

private:
    static std::optional<nlohmann::json> TryParse(const std::string& text);
    static std::optional<nlohmann::json> RepairLadder(const std::string& text);
    static std::optional<std::string> Slice(const std::string& text, char open, char close);
};

} // namespace ideasorter::application
