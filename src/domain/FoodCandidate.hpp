/**
 * @file FoodCandidate.hpp
 * @brief A ranked match produced by name resolution.
 */

#pragma once
#include <string>

namespace glycemicguard::domain {

/**
 * @struct FoodCandidate
 * @brief A canonical name proposed for an ambiguous query.
 */
struct FoodCandidate {
    std::string name; ///< Canonical key in the knowledge store.
    float score;      ///< 0.0 to 1.0, higher is closer.
};

} // namespace glycemicguard::domain
