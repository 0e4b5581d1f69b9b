/**
 * @file TextUtils.hpp
 * @brief String helpers shared by the classification engine.
 *
 * Lowercasing is byte-length preserving (ASCII plus the Latin-1 block of
 * UTF-8), so offsets found in a lowered copy are valid in the original text.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace ideasorter::domain::text {

/** @brief Lowercases ASCII and two-byte Latin-1 UTF-8 letters (Á -> á, Ñ -> ñ). */
std::string ToLower(const std::string& value);

/** @brief Removes leading and trailing whitespace. */
std::string Trim(const std::string& value);

/** @brief Replaces every whitespace run with a single space and trims. */
std::string CollapseWhitespace(const std::string& value);

/** @brief Lowercase + collapsed whitespace; the comparison key for names and ideas. */
std::string NormalizeKey(const std::string& value);

/** @brief Case-insensitive equality of two names (after NormalizeKey). */
bool SameName(const std::string& a, const std::string& b);

/** @brief Case-insensitive substring test. */
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

/** @brief Splits on whitespace. */
std::vector<std::string> SplitWords(const std::string& value);

/** @brief Number of whitespace separated words. */
std::size_t WordCount(const std::string& value);

/**
 * @brief Lowercased word tokens (letters, digits and non-ASCII bytes).
 * Punctuation separates tokens.
 */
std::vector<std::string> Tokenize(const std::string& value);

/** @brief Joins parts with a separator. */
std::string Join(const std::vector<std::string>& parts, const std::string& separator);

/** @brief True when the byte is part of a word (alnum, underscore or UTF-8 payload). */
bool IsWordByte(unsigned char c);

/** @brief True when [pos, pos+len) in text is delimited by non-word bytes. */
bool IsWholeWordAt(const std::string& text, std::size_t pos, std::size_t len);

/** @brief Finds the first whole-word occurrence of needle at or after from. */
std::size_t FindWholeWord(const std::string& text, const std::string& needle, std::size_t from = 0);

/**
 * @brief Splits a delimited list ("pan, queso y leche") into trimmed items.
 * Each conjunction (with surrounding spaces, e.g. " y ") is treated as a comma.
 * Empty items are dropped.
 */
std::vector<std::string> SplitDelimitedList(const std::string& value,
                                            const std::vector<std::string>& conjunctions);

/** @brief Strips trailing sentence punctuation (. ! ? ; :) and whitespace. */
std::string StripTrailingPunctuation(const std::string& value);

/**
 * @brief Fuzzy idea equality.
 * Equal after NormalizeKey, or the shorter key (at least kMinContainmentLength
 * bytes) is a substring of the longer one.
 */
bool IsSameIdea(const std::string& a, const std::string& b);

/** @brief Minimum key length for containment to count as a fuzzy match. */
constexpr std::size_t kMinContainmentLength = 3;

/**
 * @brief Indices of ideas matching needle.
 * If any entry is exactly equal (normalized), only exact entries are returned;
 * otherwise every containment match, in insertion order.
 */
std::vector<std::size_t> MatchingIdeas(const std::vector<std::string>& ideas, const std::string& needle);

/** @brief True when any entry fuzzy-matches needle. */
bool ContainsIdea(const std::vector<std::string>& ideas, const std::string& needle);

} // namespace ideasorter::domain::text
