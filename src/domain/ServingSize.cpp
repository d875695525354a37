/**
 * @file ServingSize.cpp
 * @brief Implementation of the serving-size grammar.
 */

#include "domain/ServingSize.hpp"
#include "domain/NutritionError.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace glycemicguard::domain {

namespace {

std::string Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (first < last) ? std::string(first, last) : std::string();
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Accepts plain decimal notation only: rejects hex, inf and nan, which stod would take.
double ParseQuantity(const std::string& text, const std::string& expression) {
    if (text.empty()) {
        throw NutritionError::InvalidServingFormat(expression, "missing number");
    }
    bool sawDigit = false;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isdigit(c)) {
            sawDigit = true;
        } else if (ch != '.' && ch != '-' && ch != '+' && ch != 'e') {
            throw NutritionError::InvalidServingFormat(expression, "'" + text + "' is not a number");
        }
    }
    if (!sawDigit) {
        throw NutritionError::InvalidServingFormat(expression, "'" + text + "' is not a number");
    }

    double value = 0.0;
    size_t consumed = 0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::invalid_argument&) {
        throw NutritionError::InvalidServingFormat(expression, "'" + text + "' is not a number");
    } catch (const std::out_of_range&) {
        throw NutritionError::InvalidServingFormat(expression, "'" + text + "' is out of range");
    }
    if (consumed != text.size()) {
        throw NutritionError::InvalidServingFormat(expression, "'" + text + "' is not a number");
    }
    if (!std::isfinite(value)) {
        throw NutritionError::InvalidServingFormat(expression, "'" + text + "' is out of range");
    }
    if (value < 0.0) {
        throw NutritionError::InvalidServingFormat(expression, "serving size cannot be negative");
    }
    return value;
}

} // namespace

ServingSize ServingSize::Parse(const std::string& expression) {
    const std::string text = ToLower(Trim(expression));
    if (text.empty()) {
        throw NutritionError::InvalidServingFormat(expression, "empty serving size");
    }

    // Must run before the gram check: "serving" itself ends in 'g'.
    const auto servingPos = text.find("serving");
    if (servingPos != std::string::npos) {
        const std::string unit = text.substr(servingPos);
        if (unit != "serving" && unit != "servings") {
            throw NutritionError::InvalidServingFormat(expression, "expected 'serving' or 'servings'");
        }
        return ServingSize(expression, ParseQuantity(Trim(text.substr(0, servingPos)), expression), Unit::Servings);
    }

    if (EndsWith(text, "g")) {
        return ServingSize(expression, ParseQuantity(Trim(text.substr(0, text.size() - 1)), expression), Unit::Grams);
    }

    throw NutritionError::InvalidServingFormat(
        expression, "expected '<number>g', '<number> g', '<number> serving' or '<number> servings'");
}

double ServingSize::toGrams(double baseServingGrams) const {
    const double grams = m_unit == Unit::Grams ? m_quantity : m_quantity * baseServingGrams;
    if (!std::isfinite(grams)) {
        throw NutritionError::InvalidServingFormat(m_expression, "serving size out of range");
    }
    return grams;
}

} // namespace glycemicguard::domain
