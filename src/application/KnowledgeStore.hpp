/**
 * @file KnowledgeStore.hpp
 * @brief Authoritative per-100g nutrition table with per-serving feature derivation.
 */

#pragma once

#include "domain/FoodRecord.hpp"
#include "domain/NutritionSource.hpp"
#include <map>
#include <string>
#include <vector>

namespace glycemicguard::application {

/**
 * @class KnowledgeStore
 * @brief Maps normalized food names to records and derives NutritionFeatures for a serving.
 *
 * Populated once by load(); read-only afterwards, so concurrent const calls are safe.
 */
class KnowledgeStore {
public:
    KnowledgeStore() = default;

    /** @brief Constructs and loads in one step. @see load */
    explicit KnowledgeStore(domain::NutritionSource& source);

    /**
     * @brief Reads every row from the source, keyed by normalized name.
     *
     * Rows with an empty normalized name are skipped. A repeated name replaces the
     * earlier row (last wins) and is reported by duplicateNames().
     * @throws NutritionError (SourceUnavailable) if the source cannot be opened.
     */
    void load(domain::NutritionSource& source);

    /** @brief All canonical keys, in ascending order. */
    std::vector<std::string> listNames() const;

    /** @brief Whether the normalized form of name is a key. */
    bool contains(const std::string& name) const;

    /** @brief Copy of the whole table. Changes to the copy never reach the store. */
    std::map<std::string, domain::FoodRecord> getAllRecords() const;

    /** @brief Names that appeared more than once in the source, ascending. */
    const std::vector<std::string>& duplicateNames() const { return m_duplicates; }

    size_t size() const { return m_records.size(); }

    /**
     * @brief Derives nutrition features for a food at a serving size.
     * @param foodName Free-text name; normalized before lookup.
     * @param serving Serving expression, e.g. "100g", "2 servings".
     * @throws NutritionError NotFound, MissingData or InvalidServingFormat, checked in that order.
     */
    domain::NutritionFeatures getFeatures(const std::string& foodName,
                                          const std::string& serving = "100g") const;

private:
    std::map<std::string, domain::FoodRecord> m_records;
    std::vector<std::string> m_duplicates;
};

} // namespace glycemicguard::application
