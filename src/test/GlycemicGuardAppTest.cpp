#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/GlycemicGuardApp.hpp"

using glycemicguard::app::CommandLine;
using glycemicguard::app::GlycemicGuardApp;

namespace {

bool Rejects(const std::vector<std::string>& args) {
    try {
        GlycemicGuardApp::ParseArguments(args);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestNextPageOffset() {
    // Full page with more corpus left.
    assert(GlycemicGuardApp::NextPageOffset(0, 5, 5, 20) == size_t{5});
    assert(GlycemicGuardApp::NextPageOffset(5, 5, 5, 20) == size_t{10});

    // Short page: substring mode ran out of matches even though the corpus is larger.
    assert(!GlycemicGuardApp::NextPageOffset(0, 5, 3, 20));
    assert(!GlycemicGuardApp::NextPageOffset(0, 5, 0, 20));

    // Full page that ends exactly at the corpus end.
    assert(!GlycemicGuardApp::NextPageOffset(15, 5, 5, 20));

    // Huge --top does not wrap around.
    const size_t max = std::numeric_limits<size_t>::max();
    assert(!GlycemicGuardApp::NextPageOffset(10, max, max, 20));
    assert(!GlycemicGuardApp::NextPageOffset(max, 1, 1, 20));
    assert(!GlycemicGuardApp::NextPageOffset(0, 0, 0, 20));
    std::cout << "[PASS] Next page offset." << std::endl;
}

void TestParseArguments() {
    CommandLine cmd = GlycemicGuardApp::ParseArguments(
        {"--serving", "2 servings", "Brown", "rice", "--top", "3", "--offset", "6", "boiled",
         "--no-embeddings", "--data", "foods.csv", "--config", "cfg.json"});
    assert(cmd.query == "Brown rice boiled");
    assert(cmd.serving == std::string("2 servings"));
    assert(cmd.topK == size_t{3});
    assert(cmd.offset == 6);
    assert(cmd.noEmbeddings);
    assert(cmd.dataPath == std::string("foods.csv"));
    assert(cmd.configPath == std::string("cfg.json"));
    assert(!cmd.showHelp);

    CommandLine bare = GlycemicGuardApp::ParseArguments({"apple"});
    assert(bare.query == "apple");
    assert(!bare.serving && !bare.topK && !bare.dataPath && !bare.configPath);
    assert(bare.offset == 0);

    assert(GlycemicGuardApp::ParseArguments({"-h"}).showHelp);
    assert(GlycemicGuardApp::ParseArguments({}).query.empty());

    assert(Rejects({"--top"}));
    assert(Rejects({"--top", "-1", "apple"}));
    assert(Rejects({"--offset", "abc", "apple"}));
    assert(Rejects({"--top", "99999999999999999999999999", "apple"}));
    assert(Rejects({"--verbose", "apple"}));
    std::cout << "[PASS] Argument parsing." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting GlycemicGuardApp test..." << std::endl;
    TestNextPageOffset();
    TestParseArguments();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
