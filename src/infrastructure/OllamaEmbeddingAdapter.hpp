/**
 * @file OllamaEmbeddingAdapter.hpp
 * @brief Adapter exposing a local Ollama embedding model as an EmbeddingService.
 */

#pragma once
#include "domain/EmbeddingService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace glycemicguard::infrastructure {

/**
 * @class OllamaEmbeddingAdapter
 * @brief Implements EmbeddingService using the Ollama REST API.
 */
class OllamaEmbeddingAdapter : public domain::EmbeddingService {
public:
    /**
     * @brief Connects and checks that the model is installed.
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Embedding model name, with or without a ":tag" suffix.
     * @param batchSize Maximum inputs per /api/embed request.
     */
    OllamaEmbeddingAdapter(const std::string& host, int port, const std::string& model, size_t batchSize = 32);

    /** @see domain::EmbeddingService::isAvailable */
    bool isAvailable() const override { return m_available; }

    /** @see domain::EmbeddingService::embed */
    std::vector<float> embed(const std::string& text) override;

    /** @see domain::EmbeddingService::embedBatch */
    std::vector<std::vector<float>> embedBatch(const std::vector<std::string>& texts) override;

    const std::string& model() const { return m_model; }

private:
    void detectModel();

    OllamaClient m_client;
    std::string m_model; ///< Resolved to the installed "name:tag" once detected.
    size_t m_batchSize;
    bool m_available = false;
};

} // namespace glycemicguard::infrastructure
