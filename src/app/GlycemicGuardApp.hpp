/**
 * @file GlycemicGuardApp.hpp
 * @brief Command-line entry point: resolve a food name and report its safety.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace glycemicguard::app {

/**
 * @struct CommandLine
 * @brief Parsed arguments. Unset optionals fall back to configuration.
 */
struct CommandLine {
    std::optional<std::string> configPath;
    std::optional<std::string> dataPath;
    std::optional<std::string> serving;
    std::optional<size_t> topK;
    size_t offset = 0;
    bool noEmbeddings = false;
    bool showHelp = false;
    std::string query; ///< Positional words joined by single spaces.
};

/**
 * @class GlycemicGuardApp
 * @brief Wires configuration, knowledge store, resolver and safety service for one lookup.
 */
class GlycemicGuardApp {
public:
    /** @brief Exit codes returned by Run. */
    enum ExitCode {
        kOk = 0,
        kUsageOrStartup = 1,
        kAmbiguous = 2,
        kNoCandidates = 3,
        kLookupFailed = 4
    };

    /**
     * @brief Runs one lookup.
     * @return One of ExitCode.
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses argv (excluding argv[0]).
     * @throws std::invalid_argument on unknown flags or bad values.
     */
    static CommandLine ParseArguments(const std::vector<std::string>& args);

    static std::string Usage();

    /**
     * @brief Offset of the next candidate page, if one can exist.
     * @param returned Number of candidates the current page actually held.
     * @return nullopt when the page came back short, the corpus is exhausted, or the
     *         offset would overflow.
     */
    static std::optional<size_t> NextPageOffset(size_t offset, size_t topK, size_t returned, size_t corpusSize);
};

} // namespace glycemicguard::app
