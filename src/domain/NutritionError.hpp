/**
 * @file NutritionError.hpp
 * @brief Error type raised by the knowledge store and serving-size parser.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace glycemicguard::domain {

/**
 * @enum ErrorKind
 * @brief Discriminant for NutritionError. Call sites switch on it.
 */
enum class ErrorKind {
    SourceUnavailable,   ///< Knowledge source could not be opened. Fatal at startup.
    NotFound,            ///< Normalized name has no record.
    MissingData,         ///< Record lacks a field needed for derivation.
    InvalidServingFormat ///< Serving expression unparseable, negative or out of range.
};

/** @brief Stable lowercase name of an error kind, used in messages and logs. */
inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceUnavailable: return "source_unavailable";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::MissingData: return "missing_data";
        case ErrorKind::InvalidServingFormat: return "invalid_serving_format";
    }
    return "unknown";
}

/**
 * @class NutritionError
 * @brief A tagged error: kind plus the offending subject (food name, path or serving text).
 */
class NutritionError : public std::runtime_error {
public:
    NutritionError(ErrorKind kind, std::string subject, const std::string& message,
                   std::vector<std::string> missingFields = {})
        : std::runtime_error(message),
          m_kind(kind),
          m_subject(std::move(subject)),
          m_missingFields(std::move(missingFields)) {}

    static NutritionError SourceUnavailable(const std::string& path) {
        return NutritionError(ErrorKind::SourceUnavailable, path,
                              "Knowledge source could not be opened: " + path);
    }

    static NutritionError NotFound(const std::string& foodName) {
        return NutritionError(ErrorKind::NotFound, foodName,
                              "Food '" + foodName + "' not found in knowledge base.");
    }

    static NutritionError MissingData(const std::string& foodName, std::vector<std::string> fields) {
        std::string message = "Food '" + foodName + "' is missing required data: ";
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) message += ", ";
            message += fields[i];
        }
        return NutritionError(ErrorKind::MissingData, foodName, message, std::move(fields));
    }

    static NutritionError InvalidServingFormat(const std::string& serving, const std::string& reason) {
        return NutritionError(ErrorKind::InvalidServingFormat, serving,
                              "Invalid serving size '" + serving + "': " + reason);
    }

    ErrorKind kind() const noexcept { return m_kind; }
    const std::string& subject() const noexcept { return m_subject; }

    /** @brief Absent field names. Only populated for ErrorKind::MissingData. */
    const std::vector<std::string>& missingFields() const noexcept { return m_missingFields; }

private:
    ErrorKind m_kind;
    std::string m_subject;
    std::vector<std::string> m_missingFields;
};

} // namespace glycemicguard::domain
