#include "config.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_context {

namespace fs = std::filesystem;
using json = nlohmann::json;

const std::vector<fs::path>& EngineConfig::search_paths() {
    static const std::vector<fs::path> paths = {
        "codectx.json",          // current working directory
        "../codectx.json",       // parent, when run from build/
        "config/codectx.json"
    };
    return paths;
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig cfg;
    if (!j.is_object()) throw ConfigError("configuration root must be an object");

    try {
        cfg.store_dir = j.value("store_dir", cfg.store_dir);
        cfg.log_level = j.value("log_level", cfg.log_level);

        if (j.contains("embedding")) {
            const auto& e = j.at("embedding");
            cfg.embedding.model = e.value("model", cfg.embedding.model);
            cfg.embedding.base_url = e.value("base_url", cfg.embedding.base_url);
            cfg.embedding.timeout = std::chrono::milliseconds(e.value("timeout_ms", static_cast<long long>(cfg.embedding.timeout.count())));
            cfg.embedding.max_attempts = e.value("max_attempts", cfg.embedding.max_attempts);
        }

        if (j.contains("indexer")) {
            const auto& i = j.at("indexer");
            cfg.indexer.max_parallel_files = i.value("max_parallel_files", cfg.indexer.max_parallel_files);
        }

        if (j.contains("assembler")) {
            const auto& a = j.at("assembler");
            auto& o = cfg.assembler;
            o.match_limit = a.value("match_limit", o.match_limit);
            o.prompt_match_limit = a.value("prompt_match_limit", o.prompt_match_limit);
            o.context_file_limit = a.value("context_file_limit", o.context_file_limit);
            o.preview_file_limit = a.value("preview_file_limit", o.preview_file_limit);
            o.preview_char_budget = a.value("preview_char_budget", o.preview_char_budget);
            o.claim_unassigned_files = a.value("claim_unassigned_files", o.claim_unassigned_files);
            if (a.contains("main_file_markers")) {
                o.main_file_markers = a.at("main_file_markers").get<std::vector<std::string>>();
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    if (cfg.embedding.timeout.count() <= 0) throw ConfigError("embedding.timeout_ms must be positive");
    if (cfg.embedding.max_attempts < 1) throw ConfigError("embedding.max_attempts must be at least 1");
    // from_str maps unrecognised names to off.
    if (spdlog::level::from_str(cfg.log_level) == spdlog::level::off && cfg.log_level != "off") {
        throw ConfigError("unknown log_level: " + cfg.log_level);
    }
    return cfg;
}

EngineConfig EngineConfig::load(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("cannot open configuration file " + path.string());
    }
    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        throw ConfigError("malformed configuration file " + path.string() + ": " + e.what());
    }
    auto cfg = from_json(j);
    spdlog::info("Loaded configuration from {}", path.string());
    return cfg;
}

EngineConfig EngineConfig::discover() {
    for (const auto& path : search_paths()) {
        if (fs::exists(path)) return load(path);
    }
    spdlog::debug("No codectx.json found; using defaults");
    return EngineConfig{};
}

} // namespace code_context
