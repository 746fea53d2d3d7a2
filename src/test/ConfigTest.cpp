#include "TestSupport.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

#include "config.hpp"

using namespace code_context;
using code_context::testing::run;

namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string& name, const std::string& text) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path path = fs::temp_directory_path() / ("codectx_" + name + "_" + std::to_string(stamp) + ".json");
    std::ofstream out(path);
    out << text;
    return path;
}

template <typename Fn>
bool throws_config_error(Fn&& fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    run("defaults match the documented values", [] {
        EngineConfig cfg;
        assert(cfg.store_dir == "codectx_store");
        assert(cfg.log_level == "info");
        assert(cfg.embedding.model == "text-embedding-004");
        assert(cfg.embedding.timeout.count() == 10000);
        assert(cfg.indexer.max_parallel_files == 4);
        assert(cfg.assembler.match_limit == 10);
        assert(cfg.assembler.prompt_match_limit == 5);
        assert(cfg.assembler.preview_file_limit == 3);
        assert(cfg.assembler.preview_char_budget == 2000);
        assert(cfg.assembler.claim_unassigned_files);
    });

    run("file values override defaults", [] {
        auto path = write_temp("full", R"({
            "store_dir": "/var/lib/codectx",
            "log_level": "debug",
            "embedding": {"model": "embedding-001", "timeout_ms": 2500, "max_attempts": 1},
            "indexer": {"max_parallel_files": 8},
            "assembler": {
                "prompt_match_limit": 3,
                "preview_char_budget": 500,
                "claim_unassigned_files": false,
                "main_file_markers": ["server"]
            }
        })");
        auto cfg = EngineConfig::load(path);
        fs::remove(path);

        assert(cfg.store_dir == "/var/lib/codectx");
        assert(cfg.log_level == "debug");
        assert(cfg.embedding.model == "embedding-001");
        assert(cfg.embedding.timeout.count() == 2500);
        assert(cfg.embedding.max_attempts == 1);
        assert(cfg.indexer.max_parallel_files == 8);
        assert(cfg.assembler.prompt_match_limit == 3);
        assert(cfg.assembler.preview_char_budget == 500);
        assert(!cfg.assembler.claim_unassigned_files);
        assert((cfg.assembler.main_file_markers == std::vector<std::string>{"server"}));
        // Untouched keys keep their defaults.
        assert(cfg.assembler.match_limit == 10);
    });

    run("malformed or missing files raise ConfigError", [] {
        auto path = write_temp("broken", "{ \"store_dir\": ");
        assert(throws_config_error([&] { EngineConfig::load(path); }));
        fs::remove(path);

        assert(throws_config_error([] { EngineConfig::load("/nonexistent/codectx.json"); }));
    });

    run("invalid values raise ConfigError", [] {
        using json = nlohmann::json;
        assert(throws_config_error([] { EngineConfig::from_json(json::array()); }));
        assert(throws_config_error([] { EngineConfig::from_json(json{{"embedding", {{"timeout_ms", 0}}}}); }));
        assert(throws_config_error([] { EngineConfig::from_json(json{{"embedding", {{"max_attempts", 0}}}}); }));
        assert(throws_config_error([] { EngineConfig::from_json(json{{"store_dir", 42}}); }));
    });

    run("unknown log levels are rejected instead of silencing output", [] {
        using json = nlohmann::json;
        assert(throws_config_error([] { EngineConfig::from_json(json{{"log_level", "verbose"}}); }));
        assert(throws_config_error([] { EngineConfig::from_json(json{{"log_level", ""}}); }));
        assert(EngineConfig::from_json(json{{"log_level", "warn"}}).log_level == "warn");
        assert(EngineConfig::from_json(json{{"log_level", "off"}}).log_level == "off");
    });

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
