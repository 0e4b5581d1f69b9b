#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"

using namespace ideasorter::infrastructure;
namespace fs = std::filesystem;

int main() {
    std::cout << "=== ConfigLoader Test ===" << std::endl;
    unsetenv("OLLAMA_HOST");
    unsetenv("OLLAMA_PORT");
    unsetenv("OLLAMA_MODEL");

    fs::path root = "test_config_root";
    fs::remove_all(root);
    fs::create_directories(root);
    fs::path file = root / "settings.json";

    std::cout << "[Test] Partial file keeps defaults for missing keys..." << std::endl;
    {
        std::ofstream out(file);
        out << R"({"ollama": {"model": "qwen2.5:7b", "port": "not a number"}, "locale": "en",
                  "data_dir": "/tmp/ideasorter-data", "theme": "dark"})";
    }
    AppConfig config = ConfigLoader::Load(file);
    assert(config.ollama.model == "qwen2.5:7b");
    assert(config.ollama.port == 11434);
    assert(config.ollama.host == "localhost");
    assert(!config.ollama.useTools);
    assert(config.locale == "en");
    assert(config.dataDir == "/tmp/ideasorter-data");
    assert(config.reminderPollSeconds == 30);
    std::cout << "[PASS] Defaults" << std::endl;

    std::cout << "[Test] Save keeps unknown keys..." << std::endl;
    config.ollama.useTools = true;
    ConfigLoader::Save(file, config);
    {
        std::ifstream in(file);
        nlohmann::json saved;
        in >> saved;
        assert(saved["theme"] == "dark");
        assert(saved["ollama"]["use_tools"] == true);
    }
    assert(ConfigLoader::Load(file).ollama.useTools);
    std::cout << "[PASS] Save" << std::endl;

    std::cout << "[Test] Environment overrides the file..." << std::endl;
    setenv("OLLAMA_MODEL", "mistral", 1);
    setenv("OLLAMA_PORT", "12000", 1);
    AppConfig overridden = ConfigLoader::Load(file);
    assert(overridden.ollama.model == "mistral");
    assert(overridden.ollama.port == 12000);
    setenv("OLLAMA_PORT", "abc", 1);
    assert(ConfigLoader::Load(file).ollama.port == 11434);
    unsetenv("OLLAMA_MODEL");
    unsetenv("OLLAMA_PORT");
    std::cout << "[PASS] Environment" << std::endl;

    std::cout << "[Test] Broken file falls back to defaults..." << std::endl;
    {
        std::ofstream out(file);
        out << "{ not json";
    }
    AppConfig broken = ConfigLoader::Load(file);
    assert(broken.ollama.model == "llama3.1:8b");
    assert(broken.locale == "es");
    assert(!broken.dataDir.empty());
    std::cout << "[PASS] Broken file" << std::endl;

    std::cout << "[Test] Cleaning up..." << std::endl;
    fs::remove_all(root);
    std::cout << "=== All ConfigLoader tests passed ===" << std::endl;
    return 0;
}
