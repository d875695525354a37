/**
 * @file OllamaEmbeddingAdapter.cpp
 * @brief Implementation of the OllamaEmbeddingAdapter class.
 */
#include "infrastructure/OllamaEmbeddingAdapter.hpp"
#include <algorithm>
#include <iostream>

namespace glycemicguard::infrastructure {

OllamaEmbeddingAdapter::OllamaEmbeddingAdapter(const std::string& host, int port,
                                               const std::string& model, size_t batchSize)
    : m_client(host, port), m_model(model), m_batchSize(std::max<size_t>(1, batchSize)) {
    detectModel();
}

void OllamaEmbeddingAdapter::detectModel() {
    auto models = m_client.getAvailableModels();
    if (models.empty()) {
        std::cerr << "[OllamaEmbeddingAdapter] No models listed. Is Ollama running?" << std::endl;
        return;
    }

    // "all-minilm" matches an installed "all-minilm:latest".
    for (const auto& installed : models) {
        if (installed == m_model || installed.rfind(m_model + ":", 0) == 0) {
            m_model = installed;
            m_available = true;
            std::cout << "[OllamaEmbeddingAdapter] Using embedding model: " << m_model << std::endl;
            return;
        }
    }
    std::cerr << "[OllamaEmbeddingAdapter] Model '" << m_model << "' is not installed." << std::endl;
}

std::vector<float> OllamaEmbeddingAdapter::embed(const std::string& text) {
    if (!m_available) return {};
    return m_client.getEmbedding(m_model, text);
}

std::vector<std::vector<float>> OllamaEmbeddingAdapter::embedBatch(const std::vector<std::string>& texts) {
    if (!m_available) return {};

    std::vector<std::vector<float>> all;
    all.reserve(texts.size());
    for (size_t start = 0; start < texts.size(); start += m_batchSize) {
        size_t end = std::min(texts.size(), start + m_batchSize);
        std::vector<std::string> chunk(texts.begin() + start, texts.begin() + end);
        auto vectors = m_client.getEmbeddings(m_model, chunk);
        if (vectors.size() != chunk.size()) {
            std::cerr << "[OllamaEmbeddingAdapter] Batch starting at " << start << " failed." << std::endl;
            return {};
        }
        for (auto& v : vectors) {
            all.push_back(std::move(v));
        }
    }
    return all;
}

} // namespace glycemicguard::infrastructure
