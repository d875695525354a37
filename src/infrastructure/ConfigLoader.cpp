/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <iostream>

namespace glycemicguard::infrastructure {

namespace {

// Assigns j[key] to out when present and of the right type.
template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

std::filesystem::path ConfigLoader::DefaultConfigPath() {
    return PathUtils::GetConfigHome() / "GlycemicGuard" / "settings.json";
}

void ConfigLoader::Apply(const nlohmann::json& j, AppConfig& config) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings root is not an object; using defaults." << std::endl;
        return;
    }

    ReadKey(j, "data_path", config.dataPath);
    ReadKey(j, "use_embeddings", config.useEmbeddings);
    ReadKey(j, "ollama_host", config.ollamaHost);
    ReadKey(j, "ollama_port", config.ollamaPort);
    ReadKey(j, "embedding_model", config.embeddingModel);
    ReadKey(j, "embedding_batch_size", config.embeddingBatchSize);
    ReadKey(j, "page_size", config.pageSize);
    ReadKey(j, "default_serving", config.defaultServing);

    if (j.contains("thresholds")) {
        const auto& t = j["thresholds"];
        if (t.is_object()) {
            ReadKey(t, "safe_gl", config.thresholds.safeGl);
            ReadKey(t, "caution_gl", config.thresholds.cautionGl);
            ReadKey(t, "safe_gi", config.thresholds.safeGi);
            ReadKey(t, "caution_gi", config.thresholds.cautionGi);
        } else {
            std::cerr << "[ConfigLoader] Ignoring 'thresholds': not an object." << std::endl;
        }
    }
}

AppConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    AppConfig config;
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        Apply(j, config);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath.string() << ": " << e.what() << std::endl;
        return AppConfig{};
    }

    return config;
}

} // namespace glycemicguard::infrastructure
