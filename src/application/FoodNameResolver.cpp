/**
 * @file FoodNameResolver.cpp
 * @brief Implementation of FoodNameResolver.
 */

#include "application/FoodNameResolver.hpp"
#include "domain/FoodName.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

namespace glycemicguard::application {

namespace {

std::vector<domain::FoodCandidate> Page(std::vector<domain::FoodCandidate> ranked, size_t topK, size_t offset) {
    if (offset >= ranked.size()) return {};
    size_t end = offset + std::min(topK, ranked.size() - offset);
    return std::vector<domain::FoodCandidate>(ranked.begin() + offset, ranked.begin() + end);
}

} // namespace

FoodNameResolver::FoodNameResolver(std::vector<std::string> corpus,
                                   std::shared_ptr<domain::EmbeddingService> embedder)
    : m_embedder(std::move(embedder)) {
    m_corpus.reserve(corpus.size());
    for (const auto& name : corpus) {
        std::string key = domain::NormalizeFoodName(name);
        if (!key.empty() && m_names.insert(key).second) {
            m_corpus.push_back(std::move(key));
        }
    }
    buildEmbeddingIndex();
}

void FoodNameResolver::buildEmbeddingIndex() {
    if (!m_embedder) {
        std::cerr << "[FoodNameResolver] No embedding provider; using substring matching." << std::endl;
        return;
    }
    if (!m_embedder->isAvailable()) {
        std::cerr << "[FoodNameResolver] Embedding provider unavailable; using substring matching." << std::endl;
        return;
    }
    if (m_corpus.empty()) {
        m_useEmbeddings = true;
        return;
    }

    std::cout << "[FoodNameResolver] Pre-computing embeddings for " << m_corpus.size() << " foods..." << std::endl;
    auto vectors = m_embedder->embedBatch(m_corpus);
    if (vectors.size() != m_corpus.size() || vectors.front().empty()) {
        std::cerr << "[FoodNameResolver] Corpus embedding failed; using substring matching." << std::endl;
        return;
    }

    const size_t dimension = vectors.front().size();
    std::vector<float> unitVectors;
    unitVectors.reserve(m_corpus.size() * dimension);
    for (auto& v : vectors) {
        if (v.size() != dimension) {
            std::cerr << "[FoodNameResolver] Inconsistent embedding dimensions; using substring matching." << std::endl;
            return;
        }
        NormalizeL2(v);
        unitVectors.insert(unitVectors.end(), v.begin(), v.end());
    }

    m_unitVectors = std::move(unitVectors);
    m_dimension = dimension;
    m_useEmbeddings = true;
    std::cout << "[FoodNameResolver] Embeddings computed (dimension " << m_dimension << ")." << std::endl;
}

std::optional<std::string> FoodNameResolver::resolveExact(const std::string& query) const {
    std::string key = domain::NormalizeFoodName(query);
    if (!key.empty() && m_names.count(key)) {
        return key;
    }
    return std::nullopt;
}

std::vector<domain::FoodCandidate> FoodNameResolver::findCandidates(const std::string& query,
                                                                    size_t topK,
                                                                    size_t offset) const {
    std::string normalized = domain::NormalizeFoodName(query);
    if (normalized.empty() || topK == 0 || offset >= m_corpus.size()) {
        return {};
    }
    if (m_useEmbeddings) {
        return findByEmbedding(normalized, topK, offset);
    }
    return findBySubstring(normalized, topK, offset);
}

std::vector<domain::FoodCandidate> FoodNameResolver::findByEmbedding(const std::string& normalizedQuery,
                                                                     size_t topK, size_t offset) const {
    auto queryVec = m_embedder->embed(normalizedQuery);
    if (queryVec.size() != m_dimension) {
        std::cerr << "[FoodNameResolver] Query embedding failed; substring matching for '"
                  << normalizedQuery << "'." << std::endl;
        return findBySubstring(normalizedQuery, topK, offset);
    }
    NormalizeL2(queryVec);

    const size_t n = m_corpus.size();
    std::vector<float> similarity(n, 0.0f);
    for (size_t i = 0; i < n; ++i) {
        const float* row = m_unitVectors.data() + i * m_dimension;
        similarity[i] = std::inner_product(queryVec.begin(), queryVec.end(), row, 0.0f);
    }

    // Corpus order breaks ties so that consecutive pages never overlap.
    auto closer = [&similarity](size_t a, size_t b) {
        if (similarity[a] != similarity[b]) return similarity[a] > similarity[b];
        return a < b;
    };

    const size_t wanted = offset + std::min(topK, n - offset);
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    if (wanted < n) {
        std::nth_element(order.begin(), order.begin() + wanted, order.end(), closer);
        order.resize(wanted);
    }
    std::sort(order.begin(), order.end(), closer);

    std::vector<domain::FoodCandidate> page;
    page.reserve(wanted - offset);
    for (size_t i = offset; i < wanted; ++i) {
        size_t idx = order[i];
        page.push_back({m_corpus[idx], std::clamp(similarity[idx], 0.0f, 1.0f)});
    }
    return page;
}

std::vector<domain::FoodCandidate> FoodNameResolver::findBySubstring(const std::string& normalizedQuery,
                                                                     size_t topK, size_t offset) const {
    std::vector<domain::FoodCandidate> matches;
    for (const auto& name : m_corpus) {
        if (name.find(normalizedQuery) != std::string::npos) {
            float score = static_cast<float>(normalizedQuery.size()) / static_cast<float>(name.size());
            matches.push_back({name, score});
        }
    }
    std::stable_sort(matches.begin(), matches.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });
    return Page(std::move(matches), topK, offset);
}

void FoodNameResolver::NormalizeL2(std::vector<float>& v) {
    float sumSq = 0.0f;
    for (float x : v) sumSq += x * x;
    float norm = std::sqrt(sumSq);
    if (norm > 0.0f) {
        for (float& x : v) x /= norm;
    }
}

} // namespace glycemicguard::application
