/**
 * @file Errors.hpp
 * @brief Exceptions for failures that must cross a component boundary.
 *
 * Unclassifiable notes and reconciliation conflicts are regular outcomes and
 * are never thrown.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace ideasorter::domain {

/**
 * @class DecodeError
 * @brief Oracle output could not be parsed after every repair strategy.
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& rawText)
        : std::runtime_error("No valid JSON found in oracle response"), m_rawText(rawText) {}

    /** @brief The untouched oracle output, for diagnostics. */
    const std::string& rawText() const { return m_rawText; }

private:
    std::string m_rawText;
};

/**
 * @class OracleUnavailableError
 * @brief Transport failure or timeout while talking to the oracle.
 */
class OracleUnavailableError : public std::runtime_error {
public:
    explicit OracleUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class PersistenceError
 * @brief A store could not durably write its new state.
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace ideasorter::domain
