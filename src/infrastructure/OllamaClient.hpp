/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API (embedding endpoints).
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace glycemicguard::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /** @brief Sends a POST request to /api/embed with a single input. */
    std::vector<float> getEmbedding(const std::string& model, const std::string& text);

    /**
     * @brief Sends a POST request to /api/embed with an input array.
     * @return One vector per input, or empty if the request failed or the reply was short.
     */
    std::vector<std::vector<float>> getEmbeddings(const std::string& model,
                                                  const std::vector<std::string>& texts);

    /** @brief Fetches available models from /api/tags. Empty if the server is unreachable. */
    std::vector<std::string> getAvailableModels();

    /** @brief Extracts the "embeddings" array from an /api/embed reply body. */
    static std::vector<std::vector<float>> ParseEmbedResponse(const nlohmann::json& body);

private:
    std::string m_host;
    int m_port;
};

} // namespace glycemicguard::infrastructure
