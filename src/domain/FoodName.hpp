/**
 * @file FoodName.hpp
 * @brief Canonical food-name normalization shared by loading and querying.
 */

#pragma once
#include <string>

namespace glycemicguard::domain {

/**
 * @brief Lowercases, trims and collapses internal whitespace runs to one space.
 *
 * Idempotent. Empty or all-blank input yields the empty string.
 */
std::string NormalizeFoodName(const std::string& name);

} // namespace glycemicguard::domain
