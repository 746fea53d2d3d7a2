#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "context_assembler.hpp"
#include "embedding_indexer.hpp"
#include "embedding_provider.hpp"

namespace code_context {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Credentials never live here; callers pass them per request.
struct EngineConfig {
    std::string store_dir = "codectx_store";
    std::string log_level = "info";
    GeminiOptions embedding;
    IndexerOptions indexer;
    AssemblerOptions assembler;

    // Throws ConfigError when the file is missing or malformed.
    static EngineConfig load(const std::filesystem::path& path);

    // First existing file from the standard search paths, or defaults.
    static EngineConfig discover();

    static EngineConfig from_json(const nlohmann::json& j);

    static const std::vector<std::filesystem::path>& search_paths();
};

} // namespace code_context
