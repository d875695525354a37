#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace glycemicguard::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kEmbedReadTimeoutSec = 180;
constexpr int kTagsReadTimeoutSec = 5;
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::vector<std::vector<float>> OllamaClient::ParseEmbedResponse(const json& body) {
    std::vector<std::vector<float>> vectors;
    if (!body.contains("embeddings") || !body["embeddings"].is_array()) {
        return vectors;
    }
    for (const auto& item : body["embeddings"]) {
        vectors.push_back(item.get<std::vector<float>>());
    }
    return vectors;
}

std::vector<std::vector<float>> OllamaClient::getEmbeddings(const std::string& model,
                                                            const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kEmbedReadTimeoutSec);

    json requestData = {
        {"model", model},
        {"input", texts}
    };

    auto res = cli.Post("/api/embed", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto vectors = ParseEmbedResponse(json::parse(res->body));
            if (vectors.size() == texts.size()) {
                return vectors;
            }
            std::cerr << "[OllamaClient] Expected " << texts.size() << " embeddings, got "
                      << vectors.size() << std::endl;
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] Embed JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        if (res) {
            std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        } else {
            std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        }
    }
    return {};
}

std::vector<float> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    auto vectors = getEmbeddings(model, {text});
    if (vectors.size() != 1) return {};
    return std::move(vectors.front());
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kTagsReadTimeoutSec);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] Tags JSON Parse Error: " << e.what() << std::endl;
        }
    } else if (!res) {
        std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return models;
}

} // namespace glycemicguard::infrastructure
