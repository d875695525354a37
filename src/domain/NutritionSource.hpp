/**
 * @file NutritionSource.hpp
 * @brief Interface for read-only sources of nutrition rows.
 */

#pragma once
#include <vector>
#include "domain/FoodRecord.hpp"

namespace glycemicguard::domain {

/**
 * @class NutritionSource
 * @brief Abstract provider of raw food rows, in source order.
 *
 * Implementations return names exactly as stored; normalization is the store's job.
 */
class NutritionSource {
public:
    virtual ~NutritionSource() = default;

    /**
     * @brief Reads every row.
     * @throws NutritionError (SourceUnavailable) if the source cannot be opened.
     */
    virtual std::vector<FoodRecord> readAll() = 0;
};

} // namespace glycemicguard::domain
