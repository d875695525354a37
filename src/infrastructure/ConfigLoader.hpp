/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access the data path, safety thresholds and embedding
 * server settings without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/SafetyVerdict.hpp"

namespace glycemicguard::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective settings. Defaults apply to every key absent from the file.
 */
struct AppConfig {
    std::string dataPath = "data/nutrition_data.csv";
    domain::SafetyThresholds thresholds;
    bool useEmbeddings = true;
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string embeddingModel = "all-minilm";
    int embeddingBatchSize = 32;
    int pageSize = 5;
    std::string defaultServing = "100g";
};

class ConfigLoader {
public:
    /** @brief $XDG_CONFIG_HOME/GlycemicGuard/settings.json, or the ~/.config equivalent. */
    static std::filesystem::path DefaultConfigPath();

    /**
     * @brief Reads settings from a file.
     * @param configPath Path to settings.json.
     * @return Defaults if the file is missing or unparseable; otherwise defaults overlaid with the file.
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /** @brief Overlays the keys present in j onto config. Keys of the wrong type are logged and skipped. */
    static void Apply(const nlohmann::json& j, AppConfig& config);
};

} // namespace glycemicguard::infrastructure
