/**
 * @file AtomicFile.hpp
 * @brief Synchronous temp-file + rename writes for the JSON stores.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ideasorter::infrastructure {

class AtomicFile {
public:
    /**
     * @brief Writes content next to path as <name>.<stamp>.tmp, then renames it over path.
     *
     * Readers see either the old file or the new one, never a partial write.
     * @throws domain::PersistenceError when any step fails; the old file is untouched.
     */
    static void Write(const std::filesystem::path& path, const std::string& content);

    /**
     * @brief Reads a JSON document.
     * @return nullopt when the file does not exist.
     * @throws domain::PersistenceError when the file exists but cannot be parsed.
     */
    static std::optional<nlohmann::json> ReadJson(const std::filesystem::path& path);
};

} // namespace ideasorter::infrastructure
