/**
 * @file SafetyVerdict.hpp
 * @brief Domain value objects for blood-glucose safety classification.
 */

#pragma once
#include <string>

namespace glycemicguard::domain {

/**
 * @enum SafetyLabel
 * @brief Tri-state classification. Declaration order is severity order.
 */
enum class SafetyLabel {
    Safe,
    Caution,
    Unsafe
};

inline std::string ToString(SafetyLabel label) {
    switch (label) {
        case SafetyLabel::Safe: return "safe";
        case SafetyLabel::Caution: return "caution";
        case SafetyLabel::Unsafe: return "unsafe";
    }
    return "unsafe";
}

/**
 * @struct SafetyThresholds
 * @brief Upper bounds (inclusive) of the safe and caution bands on each axis.
 */
struct SafetyThresholds {
    double safeGl = 10.0;
    double cautionGl = 20.0;
    double safeGi = 55.0;
    double cautionGi = 70.0;
};

/**
 * @struct SafetyVerdict
 * @brief Final label plus an explanation covering both axes.
 */
struct SafetyVerdict {
    SafetyLabel label = SafetyLabel::Safe;
    SafetyLabel glycemicLoadCategory = SafetyLabel::Safe;
    SafetyLabel glycemicIndexCategory = SafetyLabel::Safe;
    std::string explanation;
};

} // namespace glycemicguard::domain
