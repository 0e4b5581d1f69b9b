#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace ideasorter::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kTagsTimeoutSeconds = 5;
constexpr int kDeterministicSeed = 42;

void LogFailure(const char* endpoint, const httplib::Result& res) {
    if (res) {
        std::cerr << "[OllamaClient] " << endpoint << " HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[OllamaClient] " << endpoint << " connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
}
}

OllamaClient::OllamaClient(const std::string& host, int port, int timeoutSeconds)
    : m_host(host), m_port(port), m_timeoutSeconds(timeoutSeconds) {}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& system,
                                                  const std::string& prompt,
                                                  double temperature,
                                                  bool forceJson) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_timeoutSeconds);

    json requestData = {
        {"model", model},
        {"system", system},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", temperature},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("response") && body["response"].is_string()) {
                return body["response"].get<std::string>();
            }
            std::cerr << "[OllamaClient] Response without 'response' field" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        LogFailure("/api/generate", res);
    }
    return std::nullopt;
}

std::optional<ChatReply> OllamaClient::chat(const std::string& model,
                                            const json& messages,
                                            const json& tools,
                                            double temperature) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_timeoutSeconds);

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", temperature},
            {"seed", kDeterministicSeed}
        }}
    };
    if (tools.is_array() && !tools.empty()) {
        requestData["tools"] = tools;
    }

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res || res->status != 200) {
        LogFailure("/api/chat", res);
        return std::nullopt;
    }

    try {
        auto body = json::parse(res->body);
        if (!body.contains("message") || !body["message"].is_object()) {
            std::cerr << "[OllamaClient] Chat response without 'message'" << std::endl;
            return std::nullopt;
        }
        const auto& message = body["message"];

        ChatReply reply;
        if (message.contains("content") && message["content"].is_string()) {
            reply.content = message["content"].get<std::string>();
        }
        if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
            for (const auto& call : message["tool_calls"]) {
                if (!call.contains("function") || !call["function"].is_object()) continue;
                const auto& fn = call["function"];

                ToolCall toolCall;
                toolCall.name = fn.value("name", "");
                json args = fn.contains("arguments") ? fn["arguments"] : json::object();
                if (args.is_string()) {
                    args = json::parse(args.get<std::string>(), nullptr, false);
                }
                toolCall.arguments = args.is_object() ? args : json::object();
                reply.toolCalls.push_back(std::move(toolCall));
            }
        }
        return reply;
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kTagsTimeoutSeconds);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name") && item["name"].is_string()) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Error parsing model list: " << e.what() << std::endl;
        }
    } else {
        LogFailure("/api/tags", res);
    }
    return models;
}

bool OllamaClient::isRunning() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kTagsTimeoutSeconds);
    cli.set_read_timeout(kTagsTimeoutSeconds);
    auto res = cli.Get("/api/tags");
    return res && res->status == 200;
}

} // namespace ideasorter::infrastructure
