#include "application/FoodSafetyService.hpp"
#include "domain/FoodName.hpp"

namespace glycemicguard::application {

FoodSafetyService::FoodSafetyService(const KnowledgeStore& store, domain::SafetyRuleEngine engine)
    : m_store(store), m_engine(engine) {}

FoodAssessment FoodSafetyService::evaluateFood(const std::string& foodName, const std::string& serving) const {
    FoodAssessment assessment;
    assessment.features = m_store.getFeatures(foodName, serving);
    assessment.foodName = domain::NormalizeFoodName(foodName);
    assessment.verdict = m_engine.evaluate(assessment.features);
    return assessment;
}

} // namespace glycemicguard::application
