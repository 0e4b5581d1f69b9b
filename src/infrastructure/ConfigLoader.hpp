/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Every key has a default, so a missing or broken file still yields a usable
 * configuration. OLLAMA_HOST / OLLAMA_PORT / OLLAMA_MODEL override the file.
 */

#pragma once

#include <string>
#include <filesystem>

namespace ideasorter::infrastructure {

/**
 * @struct OllamaSettings
 * @brief Connection and sampling settings for the oracle.
 */
struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "llama3.1:8b";
    int timeoutSeconds = 240;
    bool useTools = false;   ///< Classify through /api/chat tool calls instead of /api/generate.
    double temperature = 0.1;
};

/**
 * @struct AppConfig
 * @brief Application-wide settings.
 */
struct AppConfig {
    OllamaSettings ollama;
    std::string locale = "es";
    std::string dataDir;          ///< Defaults to PathUtils::GetAppDataDir().
    int reminderPollSeconds = 30;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json, falling back to defaults for anything missing.
     * @param configPath Path to settings.json (may not exist).
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /**
     * @brief Saves the configuration, preserving unknown keys already in the file.
     */
    static void Save(const std::filesystem::path& configPath, const AppConfig& config);

    /** @brief Applies OLLAMA_HOST, OLLAMA_PORT and OLLAMA_MODEL when set. */
    static void ApplyEnvironment(AppConfig& config);

    /** @brief $XDG_CONFIG_HOME/IdeaSorter/settings.json. */
    static std::filesystem::path DefaultConfigPath();
};

} // namespace ideasorter::infrastructure
