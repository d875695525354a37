/**
 * @file SafetyRuleEngine.hpp
 * @brief Propositional threshold rules over glycemic load and glycemic index.
 */

#pragma once
#include "domain/FoodRecord.hpp"
#include "domain/SafetyVerdict.hpp"

namespace glycemicguard::domain {

/**
 * @class SafetyRuleEngine
 * @brief Classifies NutritionFeatures as safe, caution or unsafe.
 *
 * Each axis is categorized independently, then the more severe category wins.
 * Stateless apart from its thresholds; safe to share across threads.
 */
class SafetyRuleEngine {
public:
    /**
     * @brief Builds an engine with the given thresholds.
     * @throws std::invalid_argument if a threshold is negative or non-finite,
     *         or a safe threshold exceeds its caution threshold.
     */
    explicit SafetyRuleEngine(SafetyThresholds thresholds = {});

    /**
     * @brief Places a value in a band. Values exactly on a threshold fall in the lower band.
     * @return Safe if value <= safeThreshold, Caution if value <= cautionThreshold, else Unsafe.
     */
    static SafetyLabel Categorize(double value, double safeThreshold, double cautionThreshold);

    /** @brief Combines both axis categories by severity and explains each one. */
    SafetyVerdict evaluate(const NutritionFeatures& features) const;

    const SafetyThresholds& thresholds() const { return m_thresholds; }

private:
    SafetyThresholds m_thresholds;
};

} // namespace glycemicguard::domain
