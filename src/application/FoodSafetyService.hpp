/**
 * @file FoodSafetyService.hpp
 * @brief Application service combining feature lookup and safety rules.
 */

#pragma once
#include <string>
#include "application/KnowledgeStore.hpp"
#include "domain/SafetyRuleEngine.hpp"

namespace glycemicguard::application {

/**
 * @struct FoodAssessment
 * @brief Features of one food at one serving plus the verdict derived from them.
 */
struct FoodAssessment {
    std::string foodName;
    domain::NutritionFeatures features;
    domain::SafetyVerdict verdict;
};

/**
 * @class FoodSafetyService
 * @brief Evaluates blood-sugar safety of a single food.
 *
 * Holds a reference to the store; the store must outlive the service.
 */
class FoodSafetyService {
public:
    FoodSafetyService(const KnowledgeStore& store, domain::SafetyRuleEngine engine = domain::SafetyRuleEngine());
    FoodSafetyService(KnowledgeStore&&, domain::SafetyRuleEngine = domain::SafetyRuleEngine()) = delete;

    /**
     * @brief Looks up features and classifies them.
     * @throws NutritionError from the knowledge store, unchanged.
     */
    FoodAssessment evaluateFood(const std::string& foodName, const std::string& serving = "100g") const;

    const domain::SafetyRuleEngine& engine() const { return m_engine; }

private:
    const KnowledgeStore& m_store;
    domain::SafetyRuleEngine m_engine;
};

} // namespace glycemicguard::application
