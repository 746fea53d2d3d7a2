#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "embedding_provider.hpp"
#include "file_store.hpp"
#include "similarity_ranker.hpp"

namespace code_context {

struct AssemblerOptions {
    size_t match_limit = 10;         // fragments ranked per query
    size_t prompt_match_limit = 5;   // fragments rendered into the prompt
    size_t context_file_limit = 5;   // file previews kept in the context
    size_t preview_file_limit = 3;   // file previews rendered into the prompt
    size_t preview_char_budget = 2000;
    // Compatibility fallback for uploads that raced session creation.
    bool claim_unassigned_files = true;
    std::vector<std::string> main_file_markers{"index", "main", "app"};
};

struct ProjectSummary {
    size_t total_files = 0;
    std::vector<std::string> languages;
    size_t total_lines = 0;
    std::vector<std::string> main_files;

    nlohmann::json to_json() const;
};

struct ContextMatch {
    std::string file_name;
    std::string language;
    std::string content;
    FragmentKind kind = FragmentKind::Other;
    int start_line = 1;
    int end_line = 1;
    double similarity = 0.0; // rounded to two decimals

    std::string line_range() const;
};

struct FilePreview {
    std::string name;
    std::string language;
    std::string content;
    size_t fragment_count = 0;
    bool truncated = false;
};

// Built per query and discarded once the prompt is rendered.
struct AssembledContext {
    std::string query;
    ProjectSummary summary;
    std::vector<ContextMatch> matches;
    std::vector<FilePreview> previews;

    bool empty() const { return summary.total_files == 0; }

    nlohmann::json to_json() const;
};

/**
 * @brief Turns a session's files into bounded prompt context for one query.
 *
 * Embedding and ranking failures only cost the ranked section; the prompt
 * falls back to file previews. File-store failures propagate.
 */
class ContextAssembler {
public:
    static constexpr const char* kTruncationMarker = "...\n[Content truncated]";

    explicit ContextAssembler(std::shared_ptr<FileStore> store, AssemblerOptions options = {});

    // provider may be null, in which case no ranking is attempted.
    AssembledContext build_context(const std::string& query, const std::string& session_id,
                                   EmbeddingProvider* provider);

    std::string build_prompt(const std::string& query, const AssembledContext& context) const;

    // Unlike build_context, provider failures propagate to the caller here.
    SearchReport search(const std::string& query, const std::string& session_id,
                        EmbeddingProvider& provider, size_t limit);

    const AssemblerOptions& options() const { return options_; }

    static std::string truncate_content(const std::string& content, size_t budget, bool* truncated = nullptr);

private:
    std::vector<SourceFilePtr> resolve_session_files(const std::string& session_id);
    ProjectSummary summarize(const std::vector<SourceFilePtr>& files) const;
    std::vector<ContextMatch> rank_fragments(const std::string& query,
                                             const std::vector<SourceFilePtr>& files,
                                             EmbeddingProvider& provider) const;

    std::shared_ptr<FileStore> store_;
    AssemblerOptions options_;
};

} // namespace code_context
