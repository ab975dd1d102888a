#include "embedder.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <atomic>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace reposcope::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint, long timeout_ms)
            : m_model(model), m_endpoint(endpoint), m_timeout_ms(timeout_ms) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~OllamaEmbedder() {
            curl_global_cleanup();
        }

        std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override {
            if (texts.empty()) return {};

            CURL* curl = curl_easy_init();
            if (!curl) throw std::runtime_error("curl_easy_init failed");

            json body = {
                {"model", m_model},
                {"input", texts}
            };
            std::string json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");

            std::string response_string;
            long status = 0;
            curl_easy_setopt(curl, CURLOPT_URL, m_endpoint.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_str.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, m_timeout_ms);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            CURLcode res = curl_easy_perform(curl);
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                throw std::runtime_error(std::string("[OllamaEmbedder] request failed: ") + curl_easy_strerror(res));
            }
            if (status != 200) {
                throw std::runtime_error("[OllamaEmbedder] HTTP " + std::to_string(status) + ": " + response_string.substr(0, 200));
            }

            auto resp_json = json::parse(response_string);
            if (!resp_json.contains("embeddings")) {
                throw std::runtime_error("[OllamaEmbedder] response has no embeddings");
            }
            auto embeddings = resp_json["embeddings"].get<std::vector<std::vector<float>>>();
            if (!embeddings.empty()) m_dimension = embeddings.front().size();
            return embeddings;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_model;
        std::string m_endpoint;
        long m_timeout_ms;
        std::atomic<size_t> m_dimension{0};

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint, long timeout_ms) {
        return std::make_unique<OllamaEmbedder>(model, endpoint, timeout_ms);
    }

}
