/**
 * @file SafetyRuleEngine.cpp
 * @brief Implementation of the SafetyRuleEngine class.
 */

#include "domain/SafetyRuleEngine.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace glycemicguard::domain {

namespace {

void ValidateAxis(const char* axis, double safe, double caution) {
    if (!std::isfinite(safe) || !std::isfinite(caution) || safe < 0.0 || caution < 0.0) {
        throw std::invalid_argument(std::string("SafetyRuleEngine: ") + axis +
                                    " thresholds must be finite and non-negative.");
    }
    if (safe > caution) {
        throw std::invalid_argument(std::string("SafetyRuleEngine: ") + axis +
                                    " safe threshold cannot exceed caution threshold.");
    }
}

// One sentence per axis: value, band and both thresholds.
std::string DescribeAxis(const char* axis, double value, SafetyLabel band, double safe, double caution) {
    std::ostringstream ss;
    ss << axis << " " << value << " falls in the " << ToString(band) << " band (safe <= " << safe
       << ", caution <= " << caution;
    if (band == SafetyLabel::Unsafe) {
        ss << ", unsafe above " << caution;
    }
    ss << ").";
    return ss.str();
}

} // namespace

SafetyRuleEngine::SafetyRuleEngine(SafetyThresholds thresholds)
    : m_thresholds(thresholds) {
    ValidateAxis("glycemic load", m_thresholds.safeGl, m_thresholds.cautionGl);
    ValidateAxis("glycemic index", m_thresholds.safeGi, m_thresholds.cautionGi);
}

SafetyLabel SafetyRuleEngine::Categorize(double value, double safeThreshold, double cautionThreshold) {
    if (value <= safeThreshold) return SafetyLabel::Safe;
    if (value <= cautionThreshold) return SafetyLabel::Caution;
    return SafetyLabel::Unsafe;
}

SafetyVerdict SafetyRuleEngine::evaluate(const NutritionFeatures& features) const {
    SafetyVerdict verdict;
    verdict.glycemicLoadCategory =
        Categorize(features.glycemicLoad, m_thresholds.safeGl, m_thresholds.cautionGl);
    verdict.glycemicIndexCategory =
        Categorize(features.glycemicIndex, m_thresholds.safeGi, m_thresholds.cautionGi);

    // Unsafe > Caution > Safe; the enum is declared in that order.
    verdict.label = std::max(verdict.glycemicLoadCategory, verdict.glycemicIndexCategory);

    verdict.explanation =
        DescribeAxis("Glycemic load", features.glycemicLoad, verdict.glycemicLoadCategory,
                     m_thresholds.safeGl, m_thresholds.cautionGl) +
        " " +
        DescribeAxis("Glycemic index", features.glycemicIndex, verdict.glycemicIndexCategory,
                     m_thresholds.safeGi, m_thresholds.cautionGi);
    return verdict;
}

} // namespace glycemicguard::domain
