/**
 * @file FoodNameResolver.hpp
 * @brief Resolves free-text food queries to canonical names.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "domain/EmbeddingService.hpp"
#include "domain/FoodCandidate.hpp"

namespace glycemicguard::application {

/**
 * @class FoodNameResolver
 * @brief Exact-match shortcut, then ranked nearest-neighbour candidates with pagination.
 *
 * The corpus is embedded once at construction. Without a usable embedding provider
 * the resolver falls back to substring matching; the mode is fixed for its lifetime.
 * All query methods are const and safe to call concurrently.
 */
class FoodNameResolver {
public:
    /**
     * @brief Builds the resolver. Blocks while the corpus is embedded.
     * @param corpus Canonical names, typically KnowledgeStore::listNames().
     * @param embedder Embedding provider; may be null.
     */
    FoodNameResolver(std::vector<std::string> corpus, std::shared_ptr<domain::EmbeddingService> embedder);

    /** @brief Returns the canonical name if the normalized query is one. Never searches. */
    std::optional<std::string> resolveExact(const std::string& query) const;

    /**
     * @brief Ranks corpus names against the query, best first.
     * @param query Free text; normalized before use.
     * @param topK Page size.
     * @param offset Number of leading results to skip. Repeating with offset += topK gives the next page.
     * @return At most topK candidates. Empty when nothing is similar.
     */
    std::vector<domain::FoodCandidate> findCandidates(const std::string& query,
                                                      size_t topK = 5,
                                                      size_t offset = 0) const;

    /** @brief True when ranking uses embeddings; false in substring fallback mode. */
    bool usesEmbeddings() const { return m_useEmbeddings; }

    size_t corpusSize() const { return m_corpus.size(); }

private:
    void buildEmbeddingIndex();
    std::vector<domain::FoodCandidate> findByEmbedding(const std::string& normalizedQuery,
                                                       size_t topK, size_t offset) const;
    std::vector<domain::FoodCandidate> findBySubstring(const std::string& normalizedQuery,
                                                       size_t topK, size_t offset) const;
    static void NormalizeL2(std::vector<float>& v);

    std::vector<std::string> m_corpus;
    std::unordered_set<std::string> m_names;
    std::shared_ptr<domain::EmbeddingService> m_embedder;
    std::vector<float> m_unitVectors; ///< Row-major, one unit-length row per corpus name.
    size_t m_dimension = 0;
    bool m_useEmbeddings = false;
};

} // namespace glycemicguard::application
