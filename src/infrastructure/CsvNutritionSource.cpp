/**
 * @file CsvNutritionSource.cpp
 * @brief Implementation of CsvNutritionSource.
 */

#include "infrastructure/CsvNutritionSource.hpp"
#include "domain/NutritionError.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>

namespace glycemicguard::infrastructure {

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

constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

} // namespace

CsvNutritionSource::CsvNutritionSource(const std::string& path) : m_path(path) {}

std::vector<std::string> CsvNutritionSource::SplitLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                current.push_back(ch);
            }
        } else if (ch == '"') {
            inQuotes = true;
        } else if (ch == ',') {
            fields.push_back(Trim(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    fields.push_back(Trim(current));
    return fields;
}

std::optional<double> CsvNutritionSource::ParseNumber(const std::string& text) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        double value = std::stod(trimmed, &consumed);
        if (consumed != trimmed.size() || !std::isfinite(value) || value < 0.0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::vector<domain::FoodRecord> CsvNutritionSource::readAll() {
    std::ifstream f(m_path);
    if (!f.is_open()) {
        throw domain::NutritionError::SourceUnavailable(m_path);
    }

    std::vector<domain::FoodRecord> rows;
    std::map<std::string, size_t> columns;
    bool haveHeader = false;
    size_t lineNumber = 0;
    size_t malformedCells = 0;
    std::string line;

    while (std::getline(f, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (lineNumber == 1 && line.rfind(kUtf8Bom, 0) == 0) line.erase(0, 3);
        if (Trim(line).empty()) continue;

        auto fields = SplitLine(line);
        if (!haveHeader) {
            for (size_t i = 0; i < fields.size(); ++i) {
                columns[ToLower(fields[i])] = i;
            }
            haveHeader = true;
            if (!columns.count("name")) {
                std::cerr << "[CsvNutritionSource] Header has no 'name' column: " << m_path << std::endl;
                return rows;
            }
            continue;
        }

        auto cell = [&](const char* column) -> std::string {
            auto it = columns.find(column);
            if (it == columns.end() || it->second >= fields.size()) return {};
            return fields[it->second];
        };

        auto number = [&](const char* column) -> std::optional<double> {
            const std::string raw = cell(column);
            if (raw.empty()) return std::nullopt;
            auto value = ParseNumber(raw);
            if (!value) {
                ++malformedCells;
                std::cerr << "[CsvNutritionSource] Line " << lineNumber << ": malformed " << column
                          << " '" << raw << "', recorded as absent." << std::endl;
            }
            return value;
        };

        domain::FoodRecord record;
        record.canonicalName = cell("name");
        record.glycemicIndex = number("glycemic_index");
        record.carbohydratesPer100g = number("carbohydrates");
        record.fiberPer100g = number("fiber");
        record.proteinPer100g = number("protein");
        record.fatPer100g = number("fat");
        std::string level = cell("processing_level");
        if (!level.empty()) record.processingLevel = level;
        record.baseServingGrams = number("serving_size_grams");
        if (record.baseServingGrams && *record.baseServingGrams <= 0.0) {
            ++malformedCells;
            std::cerr << "[CsvNutritionSource] Line " << lineNumber
                      << ": serving_size_grams must be positive, recorded as absent." << std::endl;
            record.baseServingGrams.reset();
        }
        rows.push_back(std::move(record));
    }

    std::cout << "[CsvNutritionSource] Read " << rows.size() << " rows from " << m_path;
    if (malformedCells > 0) {
        std::cout << " (" << malformedCells << " malformed cells recorded as absent)";
    }
    std::cout << std::endl;
    return rows;
}

} // namespace glycemicguard::infrastructure
