/**
 * @file GlycemicGuardApp.cpp
 * @brief Implementation of the GlycemicGuardApp class.
 */
#include "app/GlycemicGuardApp.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>

#include "application/FoodNameResolver.hpp"
#include "application/FoodSafetyService.hpp"
#include "application/KnowledgeStore.hpp"
#include "domain/NutritionError.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/CsvNutritionSource.hpp"
#include "infrastructure/OllamaEmbeddingAdapter.hpp"
#include "infrastructure/PathUtils.hpp"

namespace glycemicguard::app {

namespace {

size_t ParseCount(const std::string& flag, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(flag + " value is too large: " + value);
    }
}

void PrintAssessment(const application::FoodAssessment& a) {
    std::string label = domain::ToString(a.verdict.label);
    for (auto& c : label) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    const auto& f = a.features;
    std::cout << std::string(50, '=') << "\n"
              << "FOOD SAFETY ANALYSIS: " << a.foodName << "\n"
              << std::string(50, '=') << "\n"
              << "Safety: " << label << "\n"
              << "Explanation: " << a.verdict.explanation << "\n\n"
              << std::fixed << std::setprecision(1)
              << "Glycemic Index (GI): " << f.glycemicIndex << "\n"
              << "Glycemic Load (GL): " << f.glycemicLoad << "\n"
              << "Serving Size: " << f.servingSizeGrams << "g\n\n"
              << "Macronutrients (per serving):\n"
              << "  Carbohydrates: " << f.carbohydrates << "g\n"
              << "  Fiber: " << f.fiber << "g\n"
              << "  Protein: " << f.protein << "g\n"
              << "  Fat: " << f.fat << "g\n"
              << "  Processing Level: " << f.processingLevel << "\n"
              << std::string(50, '=') << std::endl;
}

} // namespace

std::string GlycemicGuardApp::Usage() {
    return "Usage: glycemicguard [--config PATH] [--data PATH] [--no-embeddings]\n"
           "                     [--serving EXPR] [--top N] [--offset N] <food name...>\n"
           "\n"
           "Serving expressions: 150g, 150 g, 1 serving, 2.5 servings (default 100g).\n"
           "Exit codes: 0 assessed, 2 ambiguous (candidates listed), 3 no similar food,\n"
           "            1 usage or startup error, 4 lookup error.\n";
}

std::optional<size_t> GlycemicGuardApp::NextPageOffset(size_t offset, size_t topK, size_t returned,
                                                      size_t corpusSize) {
    if (topK == 0 || returned < topK || topK > std::numeric_limits<size_t>::max() - offset) {
        return std::nullopt;
    }
    const size_t next = offset + topK;
    if (next >= corpusSize) {
        return std::nullopt;
    }
    return next;
}

CommandLine GlycemicGuardApp::ParseArguments(const std::vector<std::string>& args) {
    CommandLine cmd;
    std::vector<std::string> words;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            cmd.showHelp = true;
        } else if (arg == "--config") {
            cmd.configPath = value();
        } else if (arg == "--data") {
            cmd.dataPath = value();
        } else if (arg == "--serving") {
            cmd.serving = value();
        } else if (arg == "--top") {
            cmd.topK = ParseCount(arg, value());
        } else if (arg == "--offset") {
            cmd.offset = ParseCount(arg, value());
        } else if (arg == "--no-embeddings") {
            cmd.noEmbeddings = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            words.push_back(arg);
        }
    }

    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) cmd.query += ' ';
        cmd.query += words[i];
    }
    return cmd;
}

int GlycemicGuardApp::Run(int argc, char** argv) {
    CommandLine cmd;
    try {
        cmd = ParseArguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << Usage();
        return kUsageOrStartup;
    }
    if (cmd.showHelp) {
        std::cout << Usage();
        return kOk;
    }
    if (cmd.query.empty()) {
        std::cerr << Usage();
        return kUsageOrStartup;
    }

    auto configPath = cmd.configPath ? std::filesystem::path(*cmd.configPath)
                                     : infrastructure::ConfigLoader::DefaultConfigPath();
    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(configPath);
    if (cmd.dataPath) config.dataPath = *cmd.dataPath;
    if (cmd.noEmbeddings) config.useEmbeddings = false;

    application::KnowledgeStore store;
    std::unique_ptr<application::FoodSafetyService> safety;
    try {
        infrastructure::CsvNutritionSource source(
            infrastructure::PathUtils::ResolveDataFile(config.dataPath).string());
        store.load(source);
        safety = std::make_unique<application::FoodSafetyService>(
            store, domain::SafetyRuleEngine(config.thresholds));
    } catch (const domain::NutritionError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kUsageOrStartup;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << std::endl;
        return kUsageOrStartup;
    }

    std::shared_ptr<domain::EmbeddingService> embedder;
    if (config.useEmbeddings) {
        embedder = std::make_shared<infrastructure::OllamaEmbeddingAdapter>(
            config.ollamaHost, config.ollamaPort, config.embeddingModel,
            static_cast<size_t>(std::max(1, config.embeddingBatchSize)));
    }
    application::FoodNameResolver resolver(store.listNames(), embedder);

    auto exact = resolver.resolveExact(cmd.query);
    if (!exact) {
        size_t topK = cmd.topK.value_or(static_cast<size_t>(std::max(1, config.pageSize)));
        auto candidates = resolver.findCandidates(cmd.query, topK, cmd.offset);
        if (candidates.empty()) {
            std::cout << "No similar foods found for '" << cmd.query << "'." << std::endl;
            return kNoCandidates;
        }
        std::cout << "No exact match for '" << cmd.query << "'. Similar foods:" << std::endl;
        for (size_t i = 0; i < candidates.size(); ++i) {
            std::cout << "  " << (cmd.offset + i + 1) << ". " << candidates[i].name
                      << " (similarity: " << std::fixed << std::setprecision(2)
                      << candidates[i].score << ")" << std::endl;
        }
        if (auto next = NextPageOffset(cmd.offset, topK, candidates.size(), resolver.corpusSize())) {
            std::cout << "Use --offset " << *next << " for more." << std::endl;
        }
        return kAmbiguous;
    }

    try {
        auto assessment = safety->evaluateFood(*exact, cmd.serving.value_or(config.defaultServing));
        PrintAssessment(assessment);
    } catch (const domain::NutritionError& e) {
        switch (e.kind()) {
            case domain::ErrorKind::InvalidServingFormat:
                std::cerr << "Error: " << e.what() << "\n" << Usage();
                break;
            case domain::ErrorKind::MissingData:
            case domain::ErrorKind::NotFound:
            case domain::ErrorKind::SourceUnavailable:
                std::cerr << "Error: " << e.what() << std::endl;
                break;
        }
        return kLookupFailed;
    }
    return kOk;
}

} // namespace glycemicguard::app
