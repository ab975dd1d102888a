#include "embedder.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <atomic>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace reposcope::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model, const std::string& endpoint, long timeout_ms)
            : m_api_key(api_key), m_model(model), m_endpoint(endpoint), m_timeout_ms(timeout_ms) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~OpenAIEmbedder() {
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
            std::string auth_header = "Authorization: Bearer " + m_api_key;
            headers = curl_slist_append(headers, auth_header.c_str());

            std::string response_string;
            curl_easy_setopt(curl, CURLOPT_URL, m_endpoint.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_str.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, m_timeout_ms);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            CURLcode res = curl_easy_perform(curl);
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                throw std::runtime_error(std::string("[OpenAIEmbedder] request failed: ") + curl_easy_strerror(res));
            }

            auto resp_json = json::parse(response_string);
            if (resp_json.contains("error")) {
                throw std::runtime_error("[OpenAIEmbedder] API Error: " + resp_json["error"].dump());
            }
            if (!resp_json.contains("data") || !resp_json["data"].is_array()) {
                throw std::runtime_error("[OpenAIEmbedder] response has no data");
            }

            // Entries carry their input position; do not rely on array order.
            std::vector<std::vector<float>> embeddings(texts.size());
            for (const auto& item : resp_json["data"]) {
                size_t index = item.value("index", size_t{0});
                if (index >= embeddings.size()) {
                    throw std::runtime_error("[OpenAIEmbedder] embedding index out of range");
                }
                embeddings[index] = item["embedding"].get<std::vector<float>>();
            }
            if (!embeddings.empty()) m_dimension = embeddings.front().size();
            return embeddings;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_api_key;
        std::string m_model;
        std::string m_endpoint;
        long m_timeout_ms;
        std::atomic<size_t> m_dimension{0};

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model,
                                                     const std::string& endpoint, long timeout_ms) {
        return std::make_unique<OpenAIEmbedder>(api_key, model, endpoint, timeout_ms);
    }

}
