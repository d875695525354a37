/**
 * @file EmbeddingService.hpp
 * @brief Interface for text embedding providers.
 */

#pragma once
#include <string>
#include <vector>

namespace glycemicguard::domain {

/**
 * @class EmbeddingService
 * @brief Maps strings to fixed-length numeric vectors using a pretrained model.
 */
class EmbeddingService {
public:
    virtual ~EmbeddingService() = default;

    /** @brief Whether the provider can currently serve requests. */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Generates a semantic embedding vector for the given text.
     * @return The vector, or an empty vector on failure.
     */
    virtual std::vector<float> embed(const std::string& text) = 0;

    /**
     * @brief Embeds many texts in as few requests as possible.
     * @return One vector per input in input order, or an empty result on failure.
     */
    virtual std::vector<std::vector<float>> embedBatch(const std::vector<std::string>& texts) = 0;
};

} // namespace glycemicguard::domain
