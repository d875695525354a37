/**
 * @file FoodRecord.hpp
 * @brief Domain value objects for per-100g nutrition data and per-serving features.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace glycemicguard::domain {

/**
 * @struct FoodRecord
 * @brief One canonical food as read from the knowledge source. Every numeric field is per 100 g.
 *
 * Fields are optional because the source tolerates partially populated rows;
 * completeness is only checked when features are derived.
 */
struct FoodRecord {
    std::string canonicalName; ///< Normalized name, unique key in the store.
    std::optional<double> glycemicIndex; ///< Serving-invariant GI.
    std::optional<double> carbohydratesPer100g;
    std::optional<double> fiberPer100g;
    std::optional<double> proteinPer100g;
    std::optional<double> fatPer100g;
    std::optional<std::string> processingLevel; ///< e.g. "whole", "processed". Kept verbatim.
    std::optional<double> baseServingGrams; ///< Mass of "1 serving". Always positive when present.

    /** @brief Names of the required fields that are absent, in schema order. */
    std::vector<std::string> missingFields() const {
        std::vector<std::string> missing;
        if (!glycemicIndex) missing.emplace_back("glycemic_index");
        if (!carbohydratesPer100g) missing.emplace_back("carbohydrates");
        if (!fiberPer100g) missing.emplace_back("fiber");
        if (!proteinPer100g) missing.emplace_back("protein");
        if (!fatPer100g) missing.emplace_back("fat");
        if (!processingLevel) missing.emplace_back("processing_level");
        if (!baseServingGrams) missing.emplace_back("serving_size_grams");
        return missing;
    }

    /** @brief True when every field needed for feature derivation is present. */
    bool isComplete() const { return missingFields().empty(); }
};

/**
 * @struct NutritionFeatures
 * @brief Nutrition values for one food at one resolved serving mass.
 */
struct NutritionFeatures {
    double glycemicIndex = 0.0; ///< Copied from the record; not scaled.
    double glycemicLoad = 0.0;  ///< GI x scaled carbohydrates / 100.
    double carbohydrates = 0.0;
    double fiber = 0.0;
    double protein = 0.0;
    double fat = 0.0;
    std::string processingLevel;
    double servingSizeGrams = 0.0; ///< Absolute mass this query resolved to.
};

} // namespace glycemicguard::domain
