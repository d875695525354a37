/**
 * @file KnowledgeStore.cpp
 * @brief Implementation of the KnowledgeStore class.
 */

#include "application/KnowledgeStore.hpp"
#include "domain/FoodName.hpp"
#include "domain/NutritionError.hpp"
#include "domain/ServingSize.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace glycemicguard::application {

KnowledgeStore::KnowledgeStore(domain::NutritionSource& source) {
    load(source);
}

void KnowledgeStore::load(domain::NutritionSource& source) {
    auto rows = source.readAll();

    std::map<std::string, domain::FoodRecord> records;
    std::set<std::string> duplicates;
    size_t skipped = 0;

    for (auto& row : rows) {
        std::string key = domain::NormalizeFoodName(row.canonicalName);
        if (key.empty()) {
            ++skipped;
            continue;
        }
        row.canonicalName = key;
        auto [it, inserted] = records.insert_or_assign(key, std::move(row));
        if (!inserted) {
            if (duplicates.insert(key).second) {
                std::cerr << "[KnowledgeStore] Duplicate food name '" << key
                          << "'; later row overrides earlier." << std::endl;
            }
        }
    }

    m_records = std::move(records);
    m_duplicates.assign(duplicates.begin(), duplicates.end());

    std::cout << "[KnowledgeStore] Loaded " << m_records.size() << " foods";
    if (!m_duplicates.empty()) std::cout << ", " << m_duplicates.size() << " duplicate names";
    if (skipped > 0) std::cout << ", " << skipped << " unnamed rows skipped";
    std::cout << "." << std::endl;
}

std::vector<std::string> KnowledgeStore::listNames() const {
    std::vector<std::string> names;
    names.reserve(m_records.size());
    for (const auto& [name, record] : m_records) {
        names.push_back(name);
    }
    return names;
}

bool KnowledgeStore::contains(const std::string& name) const {
    return m_records.count(domain::NormalizeFoodName(name)) > 0;
}

std::map<std::string, domain::FoodRecord> KnowledgeStore::getAllRecords() const {
    return m_records;
}

domain::NutritionFeatures KnowledgeStore::getFeatures(const std::string& foodName,
                                                      const std::string& serving) const {
    auto it = m_records.find(domain::NormalizeFoodName(foodName));
    if (it == m_records.end()) {
        throw domain::NutritionError::NotFound(foodName);
    }

    const domain::FoodRecord& record = it->second;
    auto missing = record.missingFields();
    if (!missing.empty()) {
        throw domain::NutritionError::MissingData(record.canonicalName, std::move(missing));
    }

    const double grams = domain::ServingSize::Parse(serving).toGrams(*record.baseServingGrams);
    const double scale = grams / 100.0;

    domain::NutritionFeatures features;
    features.glycemicIndex = *record.glycemicIndex;
    features.carbohydrates = *record.carbohydratesPer100g * scale;
    features.fiber = *record.fiberPer100g * scale;
    features.protein = *record.proteinPer100g * scale;
    features.fat = *record.fatPer100g * scale;
    features.glycemicLoad = (features.glycemicIndex * features.carbohydrates) / 100.0;
    features.processingLevel = *record.processingLevel;
    features.servingSizeGrams = grams;

    // A finite mass can still overflow once multiplied through.
    if (!std::isfinite(features.carbohydrates) || !std::isfinite(features.fiber) ||
        !std::isfinite(features.protein) || !std::isfinite(features.fat) ||
        !std::isfinite(features.glycemicLoad)) {
        throw domain::NutritionError::InvalidServingFormat(serving, "serving size out of range");
    }
    return features;
}

} // namespace glycemicguard::application
