#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include "code_chunker.hpp"
#include "config.hpp"
#include "context_assembler.hpp"
#include "embedding_indexer.hpp"
#include "embedding_provider.hpp"
#include "file_store.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace code_context;

namespace {

std::string read_text_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw std::runtime_error("cannot read " + path.string());
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

// Stable per-session id so re-ingesting a path overwrites its record.
std::string make_file_id(const std::string& session_id, const std::string& name) {
    return session_id + "__" + name;
}

std::unique_ptr<EmbeddingProvider> require_provider(const EmbeddingProviderFactory& factory, const std::string& api_key) {
    if (api_key.empty()) {
        throw std::runtime_error("an API key is required (--api-key or GEMINI_API_KEY)");
    }
    return factory(api_key);
}

int run_ingest(FileStore& store, const std::string& session_id, const std::vector<std::string>& paths) {
    int saved = 0;
    for (const auto& raw : paths) {
        const std::string name = fs::path(raw).generic_string();
        if (!CodeChunker::should_process_file(name)) {
            spdlog::info("Skipping excluded path {}", name);
            continue;
        }
        auto file = make_source_file(make_file_id(session_id, name), name, read_text_file(raw),
                                     session_id.empty() ? std::nullopt : std::optional<std::string>(session_id));
        store.save_file(file);
        spdlog::info("Stored {} ({}, {} fragments)", name, file.language, file.fragments.size());
        ++saved;
    }
    std::cout << json{{"stored", saved}}.dump() << std::endl;
    return 0;
}

int run_chunk(const std::string& path) {
    const std::string language = CodeChunker::detect_language(path);
    const std::string content = read_text_file(path);

    json fragments = json::array();
    for (const auto& fragment : CodeChunker::chunk(content, language)) {
        fragments.push_back(fragment.to_json());
    }
    std::cout << json{
        {"file", path},
        {"language", language},
        {"chunks", fragments},
        {"dependencies", CodeChunker::extract_dependencies(content, language)},
        {"exports", CodeChunker::extract_exports(content, language)}
    }.dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("codectx"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CLI::App app{"codectx: retrieves project code context for assistant prompts"};
    app.require_subcommand(1);

    std::string config_path;
    std::string store_dir;
    std::string api_key;
    app.add_option("--config", config_path, "Path to codectx.json");
    app.add_option("--store", store_dir, "File store directory (overrides config)");
    app.add_option("--api-key", api_key, "Embedding API key")->envname("GEMINI_API_KEY");

    std::string session_id;
    std::vector<std::string> ingest_paths;
    auto* ingest = app.add_subcommand("ingest", "Chunk files and store them for a session");
    ingest->add_option("--session", session_id, "Owning session (omit to leave unassigned)");
    ingest->add_option("files", ingest_paths, "Source files")->required()->check(CLI::ExistingFile);

    std::string chunk_path;
    auto* chunk = app.add_subcommand("chunk", "Print the fragments of one file");
    chunk->add_option("file", chunk_path, "Source file")->required()->check(CLI::ExistingFile);

    std::string file_id;
    auto* embed = app.add_subcommand("embed", "Generate fragment embeddings");
    auto* embed_session = embed->add_option("--session", session_id, "Embed every file of a session");
    auto* embed_file = embed->add_option("--file", file_id, "Embed a single file by id");
    embed_session->excludes(embed_file);
    embed->require_option(1);

    std::string query;
    size_t limit = 5;
    auto* search = app.add_subcommand("search", "Semantic search within a session");
    search->add_option("--session", session_id, "Session id")->required();
    search->add_option("--limit", limit, "Maximum matches")->check(CLI::PositiveNumber);
    search->add_option("query", query, "Natural-language query")->required();

    bool as_json = false;
    auto* prompt = app.add_subcommand("prompt", "Build the context-augmented prompt");
    prompt->add_option("--session", session_id, "Session id")->required();
    prompt->add_flag("--json", as_json, "Print the assembled context instead of the prompt");
    prompt->add_option("query", query, "Natural-language query")->required();

    CLI11_PARSE(app, argc, argv);

    try {
        EngineConfig config = config_path.empty() ? EngineConfig::discover() : EngineConfig::load(config_path);
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        if (!store_dir.empty()) config.store_dir = store_dir;

        auto store = std::make_shared<JsonFileStore>(config.store_dir);
        auto factory = make_gemini_provider_factory(config.embedding);

        if (*ingest) return run_ingest(*store, session_id, ingest_paths);
        if (*chunk) return run_chunk(chunk_path);

        if (*embed) {
            auto provider = require_provider(factory, api_key);
            EmbeddingIndexer indexer(store, config.indexer);
            if (!file_id.empty()) {
                size_t count = indexer.generate_embeddings_for_file(file_id, *provider);
                std::cout << json{{"file", file_id}, {"embeddings", count}}.dump() << std::endl;
            } else {
                auto report = indexer.generate_embeddings_for_session(session_id, *provider);
                std::cout << report.to_json().dump(2) << std::endl;
            }
            return 0;
        }

        ContextAssembler assembler(store, config.assembler);

        if (*search) {
            auto provider = require_provider(factory, api_key);
            auto report = assembler.search(query, session_id, *provider, limit);
            std::cout << report.to_json().dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            return 0;
        }

        if (*prompt) {
            // Ranking is optional: without a key the prompt falls back to file previews.
            std::unique_ptr<EmbeddingProvider> provider;
            if (!api_key.empty()) provider = factory(api_key);

            auto context = assembler.build_context(query, session_id, provider.get());
            if (as_json) {
                std::cout << context.to_json().dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            } else {
                std::cout << assembler.build_prompt(query, context) << std::endl;
            }
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
