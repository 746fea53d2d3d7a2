#include "embedding_provider.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace code_context {

using json = nlohmann::json;

namespace {

// Retries only quota (429) and overload (503) replies; transport errors return immediately.
template <typename Func>
cpr::Response perform_request_with_retry(Func request_factory, int max_attempts, std::chrono::milliseconds backoff) {
    cpr::Response r;
    for (int i = 0; i < max_attempts; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && i + 1 < max_attempts) {
            spdlog::warn("Embedding API {} ({}), retrying (attempt {}/{})",
                         r.status_code, r.status_code == 429 ? "quota" : "overload", i + 1, max_attempts);
            std::this_thread::sleep_for(backoff * (i + 1));
            continue;
        }
        break;
    }
    return r;
}

} // namespace

GeminiEmbeddingProvider::GeminiEmbeddingProvider(std::string api_key, GeminiOptions options)
    : api_key_(std::move(api_key)), options_(std::move(options)) {
    if (api_key_.empty()) {
        throw ProviderError("embedding API key must not be empty");
    }
    if (options_.max_attempts < 1) options_.max_attempts = 1;
}

std::string GeminiEmbeddingProvider::get_endpoint_url() const {
    return options_.base_url + options_.model + ":embedContent?key=" + api_key_;
}

std::vector<float> GeminiEmbeddingProvider::embed(const std::string& text) {
    if (text.empty()) {
        throw ProviderError("cannot embed empty text");
    }

    const std::string payload = json{
        {"model", "models/" + options_.model},
        {"content", {{"parts", {{{"text", text}}}}}}
    }.dump(-1, ' ', false, json::error_handler_t::replace);

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{get_endpoint_url()},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{options_.timeout});
    }, options_.max_attempts, options_.retry_backoff);

    if (r.error) {
        throw ProviderError("embedding request failed: " + r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::debug("Embedding API error body: {}", r.text);
        throw ProviderError("embedding request failed with status " + std::to_string(r.status_code));
    }

    std::vector<float> embedding;
    try {
        auto response_json = json::parse(r.text);
        embedding = response_json.at("embedding").at("values").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw ProviderError(std::string("failed to parse embedding response: ") + e.what());
    }

    if (embedding.empty()) {
        throw ProviderError("embedding response contained no values");
    }
    return embedding;
}

EmbeddingProviderFactory make_gemini_provider_factory(GeminiOptions options) {
    return [options](const std::string& credential) -> std::unique_ptr<EmbeddingProvider> {
        return std::make_unique<GeminiEmbeddingProvider>(credential, options);
    };
}

} // namespace code_context
