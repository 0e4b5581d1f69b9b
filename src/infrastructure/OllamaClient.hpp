/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace ideasorter::infrastructure {

/**
 * @struct ToolCall
 * @brief One function call emitted by the model through /api/chat.
 */
struct ToolCall {
    std::string name;
    nlohmann::json arguments; ///< Always an object (string arguments are parsed).
};

/**
 * @struct ChatReply
 * @brief Assistant message returned by /api/chat.
 */
struct ChatReply {
    std::string content;
    std::vector<ToolCall> toolCalls;
};

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int timeoutSeconds = 240);

    /**
     * @brief Sends a POST request to /api/generate.
     * @return The generated text, or nullopt on transport/HTTP/parse failure.
     */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        double temperature,
                                        bool forceJson = false);

    /**
     * @brief Sends a POST request to /api/chat with optional tool definitions.
     * @return The assistant reply, or nullopt on failure.
     */
    std::optional<ChatReply> chat(const std::string& model,
                                  const nlohmann::json& messages,
                                  const nlohmann::json& tools,
                                  double temperature);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    /** @brief True when /api/tags answers 200. */
    bool isRunning();

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
    int m_timeoutSeconds;
};

} // namespace ideasorter::infrastructure
