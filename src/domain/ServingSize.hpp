/**
 * @file ServingSize.hpp
 * @brief Parser for user serving-size expressions ("150g", "150 g", "1 serving", "2.5 servings").
 */

#pragma once
#include <string>
#include <utility>

namespace glycemicguard::domain {

/**
 * @class ServingSize
 * @brief A parsed serving expression: a non-negative quantity in grams or in servings.
 */
class ServingSize {
public:
    enum class Unit { Grams, Servings };

    /**
     * @brief Parses an expression. Case-insensitive, surrounding whitespace ignored.
     * @throws NutritionError (InvalidServingFormat) on empty input, missing or negative
     *         number, or any shape outside the grammar.
     */
    static ServingSize Parse(const std::string& expression);

    /**
     * @brief Converts to an absolute mass.
     * @param baseServingGrams Mass of one serving for the food in question.
     * @throws NutritionError (InvalidServingFormat) if the mass is not a finite number.
     */
    double toGrams(double baseServingGrams) const;

    double quantity() const { return m_quantity; }
    Unit unit() const { return m_unit; }

private:
    ServingSize(std::string expression, double quantity, Unit unit)
        : m_expression(std::move(expression)), m_quantity(quantity), m_unit(unit) {}

    std::string m_expression;
    double m_quantity;
    Unit m_unit;
};

} // namespace glycemicguard::domain
