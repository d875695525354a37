#include <algorithm>
#include <cassert>
#include <cctype>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "application/FoodNameResolver.hpp"
#include "domain/EmbeddingService.hpp"

using namespace glycemicguard;
using application::FoodNameResolver;
using domain::FoodCandidate;

namespace {

// Deterministic embedding: letter counts a-z plus a space count. Counts calls so tests can
// check that construction embeds once and exact matches never reach the provider.
class MockEmbeddingService : public domain::EmbeddingService {
public:
    bool available = true;
    bool failBatch = false;
    bool failQueries = false;
    int embedCalls = 0;
    int batchCalls = 0;

    bool isAvailable() const override { return available; }

    std::vector<float> embed(const std::string& text) override {
        ++embedCalls;
        if (failQueries) return {};
        return Vectorize(text);
    }

    std::vector<std::vector<float>> embedBatch(const std::vector<std::string>& texts) override {
        ++batchCalls;
        if (failBatch) return {};
        std::vector<std::vector<float>> out;
        for (const auto& t : texts) out.push_back(Vectorize(t));
        return out;
    }

    static std::vector<float> Vectorize(const std::string& text) {
        std::vector<float> v(27, 0.0f);
        for (char ch : text) {
            unsigned char c = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(ch)));
            if (c >= 'a' && c <= 'z') v[c - 'a'] += 1.0f;
            else if (c == ' ') v[26] += 1.0f;
        }
        return v;
    }
};

const std::vector<std::string> kCorpus = {
    "apple raw", "apple juice", "pineapple", "banana raw", "brown rice boiled",
    "white rice boiled", "arborio rice boiled", "cabbage cruciferous boiled", "carrots boiled",
    "chickpeas boiled", "lentils red boiled", "sweet potato boiled", "watermelon raw",
    "white bread", "whole milk"};

std::vector<std::string> Names(const std::vector<FoodCandidate>& candidates) {
    std::vector<std::string> names;
    for (const auto& c : candidates) names.push_back(c.name);
    return names;
}

bool Descending(const std::vector<FoodCandidate>& candidates) {
    return std::is_sorted(candidates.begin(), candidates.end(),
                          [](const auto& a, const auto& b) { return a.score > b.score; });
}

void TestExactMatchShortCircuits() {
    auto mock = std::make_shared<MockEmbeddingService>();
    FoodNameResolver resolver(kCorpus, mock);
    assert(resolver.usesEmbeddings());
    assert(mock->batchCalls == 1);
    assert(mock->embedCalls == 0);

    assert(resolver.resolveExact("  WHITE   Bread ") == std::string("white bread"));
    assert(resolver.resolveExact("apple raw") == std::string("apple raw"));
    assert(!resolver.resolveExact("apple"));
    assert(!resolver.resolveExact(""));
    assert(mock->embedCalls == 0);
    assert(mock->batchCalls == 1);
    std::cout << "[PASS] Exact match bypasses similarity search." << std::endl;
}

void TestEmbeddingPagination() {
    auto mock = std::make_shared<MockEmbeddingService>();
    FoodNameResolver resolver(kCorpus, mock);

    const std::string query = "boiled rice";
    auto first = resolver.findCandidates(query, 5, 0);
    auto second = resolver.findCandidates(query, 5, 5);
    auto topTen = resolver.findCandidates(query, 10, 0);

    assert(first.size() == 5);
    assert(second.size() == 5);
    assert(topTen.size() == 10);
    assert(Descending(first) && Descending(second) && Descending(topTen));

    // Disjoint pages that together are exactly the top ten.
    auto a = Names(first);
    auto b = Names(second);
    std::set<std::string> unionSet(a.begin(), a.end());
    unionSet.insert(b.begin(), b.end());
    assert(unionSet.size() == 10);

    std::vector<std::string> joined = a;
    joined.insert(joined.end(), b.begin(), b.end());
    assert(joined == Names(topTen));
    assert(first.back().score >= second.front().score);

    for (const auto& c : topTen) {
        assert(c.score >= 0.0f && c.score <= 1.0f);
    }

    // Rice dishes rank above unrelated foods.
    auto riceFirst = Names(resolver.findCandidates("rice boiled", 3, 0));
    for (const auto& name : riceFirst) {
        assert(name.find("rice") != std::string::npos);
    }

    // Pages do not re-embed the corpus; each query embeds only itself.
    assert(mock->batchCalls == 1);
    assert(mock->embedCalls == 4);
    std::cout << "[PASS] Embedding pagination." << std::endl;
}

// 20 foods x 10 preparations, all distinct.
std::vector<std::string> LargeCorpus() {
    const std::vector<std::string> foods = {
        "apple", "banana", "barley", "beans", "beetroot", "bread", "broccoli", "carrot",
        "cherries", "chickpeas", "corn", "lentils", "mango", "oats", "pasta", "peas",
        "potato", "quinoa", "rice", "yam"};
    const std::vector<std::string> methods = {
        "raw", "boiled", "baked", "steamed", "fried", "roasted", "dried", "canned",
        "mashed", "grilled"};
    std::vector<std::string> corpus;
    for (const auto& food : foods) {
        for (const auto& method : methods) corpus.push_back(food + " " + method);
    }
    return corpus;
}

double Cosine(const std::vector<float>& a, const std::vector<float>& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    return (na == 0.0 || nb == 0.0) ? 0.0 : dot / (std::sqrt(na) * std::sqrt(nb));
}

void TestSelectionMatchesFullSort() {
    const auto corpus = LargeCorpus();
    assert(corpus.size() == 200);
    auto mock = std::make_shared<MockEmbeddingService>();
    FoodNameResolver resolver(corpus, mock);
    assert(resolver.corpusSize() == 200);

    for (const std::string query : {"boiled rice", "sweet baked potato", "fried"}) {
        const auto queryVec = MockEmbeddingService::Vectorize(query);
        std::vector<double> ranked;
        std::vector<std::pair<std::string, double>> byName;
        for (const auto& name : corpus) {
            double sim = Cosine(queryVec, MockEmbeddingService::Vectorize(name));
            ranked.push_back(sim);
            byName.emplace_back(name, sim);
        }
        std::sort(ranked.begin(), ranked.end(), std::greater<double>());

        for (size_t topK : {1, 3, 7, 10}) {
            for (size_t offset : {0, 5, 13, 190, 199}) {
                auto page = resolver.findCandidates(query, topK, offset);
                assert(page.size() == std::min(topK, corpus.size() - offset));
                std::set<std::string> seen;
                for (size_t i = 0; i < page.size(); ++i) {
                    // Rank position holds the right similarity...
                    assert(std::fabs(page[i].score - ranked[offset + i]) < 1e-5);
                    // ...and the returned name really has that similarity.
                    auto it = std::find_if(byName.begin(), byName.end(),
                                           [&](const auto& p) { return p.first == page[i].name; });
                    assert(it != byName.end());
                    assert(std::fabs(page[i].score - it->second) < 1e-5);
                    assert(seen.insert(page[i].name).second);
                }
            }
        }
    }
    assert(mock->batchCalls == 1);
    std::cout << "[PASS] Paged selection matches a full sort." << std::endl;
}

void TestEmbeddingEdges() {
    auto mock = std::make_shared<MockEmbeddingService>();
    FoodNameResolver resolver(kCorpus, mock);

    // Asking past the end truncates or empties the page.
    auto tail = resolver.findCandidates("raw", 5, kCorpus.size() - 2);
    assert(tail.size() == 2);
    assert(resolver.findCandidates("raw", 5, kCorpus.size()).empty());
    assert(resolver.findCandidates("raw", 0, 0).empty());
    assert(resolver.findCandidates("   ", 5, 0).empty());

    auto all = resolver.findCandidates("raw", 100, 0);
    assert(all.size() == kCorpus.size());

    // Identical query strings give identical rankings.
    assert(Names(resolver.findCandidates("Boiled", 7, 0)) == Names(resolver.findCandidates("  boiled ", 7, 0)));
    std::cout << "[PASS] Embedding edge cases." << std::endl;
}

void TestSubstringFallback() {
    FoodNameResolver resolver(kCorpus, nullptr);
    assert(!resolver.usesEmbeddings());

    auto matches = resolver.findCandidates("APPLE", 5, 0);
    // "apple raw" and "pineapple" both score 5/9; "apple juice" scores 5/11; bananas excluded.
    assert(matches.size() == 3);
    assert(matches[0].name == "apple raw");
    assert(matches[1].name == "pineapple");
    assert(matches[2].name == "apple juice");
    assert(matches[0].score == 5.0f / 9.0f);
    assert(matches[2].score == 5.0f / 11.0f);
    assert(Descending(matches));

    auto page2 = resolver.findCandidates("apple", 2, 2);
    assert(page2.size() == 1 && page2[0].name == "apple juice");

    assert(resolver.findCandidates("pizza", 5, 0).empty());
    assert(resolver.resolveExact("Pineapple") == std::string("pineapple"));

    auto boiled = resolver.findCandidates("boiled", 50, 0);
    for (const auto& c : boiled) {
        assert(c.name.find("boiled") != std::string::npos);
        assert(c.score > 0.0f && c.score <= 1.0f);
    }
    std::cout << "[PASS] Substring fallback." << std::endl;
}

void TestDegradedProviders() {
    auto offline = std::make_shared<MockEmbeddingService>();
    offline->available = false;
    FoodNameResolver r1(kCorpus, offline);
    assert(!r1.usesEmbeddings());
    assert(offline->batchCalls == 0);
    assert(r1.findCandidates("apple", 5, 0).size() == 3);
    assert(offline->embedCalls == 0);

    auto brokenBatch = std::make_shared<MockEmbeddingService>();
    brokenBatch->failBatch = true;
    FoodNameResolver r2(kCorpus, brokenBatch);
    assert(!r2.usesEmbeddings());
    assert(r2.findCandidates("apple", 5, 0).size() == 3);

    // A query that cannot be embedded is answered by substring matching.
    auto flaky = std::make_shared<MockEmbeddingService>();
    FoodNameResolver r3(kCorpus, flaky);
    assert(r3.usesEmbeddings());
    flaky->failQueries = true;
    auto fallback = r3.findCandidates("apple", 5, 0);
    assert(fallback.size() == 3);
    assert(fallback[0].name == "apple raw");
    assert(r3.usesEmbeddings());
    std::cout << "[PASS] Degraded embedding providers." << std::endl;
}

void TestCorpusNormalization() {
    FoodNameResolver resolver({"  Apple Raw ", "apple raw", "", "Banana"}, nullptr);
    assert(resolver.corpusSize() == 2);
    assert(resolver.resolveExact("APPLE RAW") == std::string("apple raw"));
    assert(resolver.resolveExact("banana") == std::string("banana"));

    FoodNameResolver empty({}, std::make_shared<MockEmbeddingService>());
    assert(empty.findCandidates("anything", 5, 0).empty());
    assert(!empty.resolveExact("anything"));
    std::cout << "[PASS] Corpus normalization." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting FoodNameResolver test..." << std::endl;
    TestExactMatchShortCircuits();
    TestEmbeddingPagination();
    TestSelectionMatchesFullSort();
    TestEmbeddingEdges();
    TestSubstringFallback();
    TestDegradedProviders();
    TestCorpusNormalization();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
