/**
 * @file CsvNutritionSource.hpp
 * @brief NutritionSource backed by a CSV file.
 */

#pragma once
#include "domain/NutritionSource.hpp"
#include <optional>
#include <string>
#include <vector>

namespace glycemicguard::infrastructure {

/**
 * @class CsvNutritionSource
 * @brief Reads rows with the columns
 *        name, glycemic_index, carbohydrates, fiber, protein, fat, processing_level, serving_size_grams.
 *
 * Columns are matched by header name. Empty numeric cells become absent; malformed or
 * negative ones are logged and also become absent. Quoted fields are supported.
 */
class CsvNutritionSource : public domain::NutritionSource {
public:
    explicit CsvNutritionSource(const std::string& path);

    /** @see domain::NutritionSource::readAll */
    std::vector<domain::FoodRecord> readAll() override;

    /** @brief Splits one CSV line, honouring double quotes. Fields are trimmed. */
    static std::vector<std::string> SplitLine(const std::string& line);

    /**
     * @brief Parses a non-negative finite number.
     * @return nullopt for empty, malformed, negative or non-finite text.
     */
    static std::optional<double> ParseNumber(const std::string& text);

private:
    std::string m_path;
};

} // namespace glycemicguard::infrastructure
