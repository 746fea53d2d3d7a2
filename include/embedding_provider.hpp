#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace code_context {

// Upstream embedding failure: bad credential, quota, timeout or malformed reply.
class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Converts text into a fixed-length vector.
 *
 * Implementations throw ProviderError on failure and never return an empty
 * vector. Session-level embedding may call embed() from several threads.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

// Builds a provider bound to one caller-supplied credential.
using EmbeddingProviderFactory =
    std::function<std::unique_ptr<EmbeddingProvider>(const std::string& credential)>;

struct GeminiOptions {
    std::string model = "text-embedding-004";
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/";
    std::chrono::milliseconds timeout{10000};
    int max_attempts = 3;
    std::chrono::milliseconds retry_backoff{2000};
};

class GeminiEmbeddingProvider : public EmbeddingProvider {
public:
    GeminiEmbeddingProvider(std::string api_key, GeminiOptions options = {});

    std::vector<float> embed(const std::string& text) override;

private:
    std::string get_endpoint_url() const;

    std::string api_key_;
    GeminiOptions options_;
};

EmbeddingProviderFactory make_gemini_provider_factory(GeminiOptions options);

} // namespace code_context
