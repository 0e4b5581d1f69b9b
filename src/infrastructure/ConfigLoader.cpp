/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace ideasorter::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j[key].get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

fs::path ConfigLoader::DefaultConfigPath() {
    return PathUtils::GetConfigHome() / "IdeaSorter" / "settings.json";
}

AppConfig ConfigLoader::Load(const fs::path& configPath) {
    AppConfig config;

    if (fs::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            json j;
            f >> j;

            if (j.contains("ollama") && j["ollama"].is_object()) {
                const auto& o = j["ollama"];
                ReadKey(o, "host", config.ollama.host);
                ReadKey(o, "port", config.ollama.port);
                ReadKey(o, "model", config.ollama.model);
                ReadKey(o, "timeout_seconds", config.ollama.timeoutSeconds);
                ReadKey(o, "use_tools", config.ollama.useTools);
                ReadKey(o, "temperature", config.ollama.temperature);
            }
            ReadKey(j, "locale", config.locale);
            ReadKey(j, "data_dir", config.dataDir);
            ReadKey(j, "reminder_poll_seconds", config.reminderPollSeconds);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what()
                      << ". Using defaults." << std::endl;
        }
    }

    if (config.dataDir.empty()) {
        config.dataDir = PathUtils::GetAppDataDir().string();
    }
    if (config.reminderPollSeconds <= 0) config.reminderPollSeconds = 30;

    ApplyEnvironment(config);
    return config;
}

void ConfigLoader::ApplyEnvironment(AppConfig& config) {
    if (const char* host = std::getenv("OLLAMA_HOST"); host && *host) {
        config.ollama.host = host;
    }
    if (const char* port = std::getenv("OLLAMA_PORT"); port && *port) {
        try {
            config.ollama.port = std::stoi(port);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Invalid OLLAMA_PORT '" << port << "': " << e.what() << std::endl;
        }
    }
    if (const char* model = std::getenv("OLLAMA_MODEL"); model && *model) {
        config.ollama.model = model;
    }
}

void ConfigLoader::Save(const fs::path& configPath, const AppConfig& config) {
    json j = json::object();

    // Load the existing file first so unknown keys survive.
    if (fs::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings unreadable, rewriting: " << e.what() << std::endl;
            j = json::object();
        }
    }
    if (!j.is_object()) j = json::object();
    if (!j.contains("ollama") || !j["ollama"].is_object()) j["ollama"] = json::object();

    j["ollama"]["host"] = config.ollama.host;
    j["ollama"]["port"] = config.ollama.port;
    j["ollama"]["model"] = config.ollama.model;
    j["ollama"]["timeout_seconds"] = config.ollama.timeoutSeconds;
    j["ollama"]["use_tools"] = config.ollama.useTools;
    j["ollama"]["temperature"] = config.ollama.temperature;
    j["locale"] = config.locale;
    j["data_dir"] = config.dataDir;
    j["reminder_poll_seconds"] = config.reminderPollSeconds;

    try {
        if (configPath.has_parent_path()) fs::create_directories(configPath.parent_path());
        std::ofstream f(configPath);
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << ": " << e.what() << std::endl;
    }
}

} // namespace ideasorter::infrastructure
