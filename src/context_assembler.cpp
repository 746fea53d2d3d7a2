#include "context_assembler.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include "text_utils.hpp"

namespace code_context {

using json = nlohmann::json;

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += separator;
        out += items[i];
    }
    return out;
}

double round_to_hundredths(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

json ProjectSummary::to_json() const {
    return json{
        {"totalFiles", total_files},
        {"languages", languages},
        {"totalLines", total_lines},
        {"mainFiles", main_files}
    };
}

std::string ContextMatch::line_range() const {
    return std::to_string(start_line) + "-" + std::to_string(end_line);
}

json AssembledContext::to_json() const {
    json chunks = json::array();
    for (const auto& m : matches) {
        chunks.push_back({
            {"fileName", sanitize_utf8(m.file_name)},
            {"content", sanitize_utf8(m.content)},
            {"type", to_string(m.kind)},
            {"lines", m.line_range()},
            {"similarity", m.similarity}
        });
    }
    json files = json::array();
    for (const auto& p : previews) {
        files.push_back({
            {"name", sanitize_utf8(p.name)},
            {"language", p.language},
            {"content", sanitize_utf8(p.content)},
            {"chunks", p.fragment_count}
        });
    }
    return json{
        {"query", query},
        {"projectSummary", summary.to_json()},
        {"relevantChunks", chunks},
        {"relevantFiles", files}
    };
}

ContextAssembler::ContextAssembler(std::shared_ptr<FileStore> store, AssemblerOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
    if (!store_) throw std::invalid_argument("ContextAssembler requires a file store");
}

std::string ContextAssembler::truncate_content(const std::string& content, size_t budget, bool* truncated) {
    if (utf8_length(content) <= budget) {
        if (truncated) *truncated = false;
        return content;
    }
    if (truncated) *truncated = true;
    return utf8_prefix(content, budget) + kTruncationMarker;
}

std::vector<SourceFilePtr> ContextAssembler::resolve_session_files(const std::string& session_id) {
    if (session_id.empty()) {
        spdlog::warn("No session id supplied; building context without project files");
        return {};
    }

    auto files = store_->list_files_for_session(session_id);
    spdlog::info("Found {} files for session {}", files.size(), session_id);
    if (!files.empty() || !options_.claim_unassigned_files) return files;

    auto unassigned = store_->list_files_without_session();
    if (unassigned.empty()) return files;

    std::vector<std::string> ids;
    ids.reserve(unassigned.size());
    for (const auto& file : unassigned) ids.push_back(file->id);

    store_->reassign_files_to_session(ids, session_id);
    files = store_->list_files_for_session(session_id);
    spdlog::info("Assigned {} unassigned files to session {}", ids.size(), session_id);
    return files;
}

ProjectSummary ContextAssembler::summarize(const std::vector<SourceFilePtr>& files) const {
    ProjectSummary summary;
    summary.total_files = files.size();
    for (const auto& file : files) {
        if (std::find(summary.languages.begin(), summary.languages.end(), file->language) == summary.languages.end()) {
            summary.languages.push_back(file->language);
        }
        summary.total_lines += file->line_count();

        const std::string lowered = to_lower(file->name);
        bool is_main = std::any_of(options_.main_file_markers.begin(), options_.main_file_markers.end(),
                                   [&](const std::string& marker) { return lowered.find(to_lower(marker)) != std::string::npos; });
        if (is_main) summary.main_files.push_back(file->name);
    }
    return summary;
}

std::vector<ContextMatch> ContextAssembler::rank_fragments(const std::string& query,
                                                           const std::vector<SourceFilePtr>& files,
                                                           EmbeddingProvider& provider) const {
    auto query_vector = provider.embed(query);
    auto ranked = SimilarityRanker::find_similar(query_vector, files, options_.match_limit);

    std::vector<ContextMatch> matches;
    matches.reserve(ranked.size());
    for (const auto& r : ranked) {
        const Fragment& fragment = r.fragment();
        ContextMatch match;
        match.file_name = r.file->name;
        match.language = r.file->language;
        match.content = truncate_content(fragment.content, options_.preview_char_budget);
        match.kind = fragment.kind;
        match.start_line = fragment.start_line;
        match.end_line = fragment.end_line;
        match.similarity = round_to_hundredths(r.similarity);
        matches.push_back(std::move(match));
    }

    if (!matches.empty()) {
        spdlog::info("Top match for query: {} lines {} (similarity {:.2f})",
                     matches.front().file_name, matches.front().line_range(), matches.front().similarity);
    }
    return matches;
}

AssembledContext ContextAssembler::build_context(const std::string& query, const std::string& session_id,
                                                 EmbeddingProvider* provider) {
    AssembledContext context;
    context.query = query;

    auto files = resolve_session_files(session_id);
    if (files.empty()) {
        spdlog::warn("No files found for session {}; returning empty context", session_id);
        return context;
    }

    if (provider) {
        try {
            context.matches = rank_fragments(query, files, *provider);
            spdlog::info("Found {} relevant fragments for query", context.matches.size());
        } catch (const std::exception& e) {
            spdlog::warn("Query embedding failed, continuing without ranked context: {}", e.what());
            context.matches.clear();
        }
    } else {
        spdlog::warn("No embedding provider supplied; skipping semantic ranking");
    }

    context.summary = summarize(files);

    const size_t preview_count = std::min(options_.context_file_limit, files.size());
    for (size_t i = 0; i < preview_count; ++i) {
        const auto& file = files[i];
        FilePreview preview;
        preview.name = file->name;
        preview.language = file->language;
        preview.content = truncate_content(file->content, options_.preview_char_budget, &preview.truncated);
        preview.fragment_count = file->fragments.size();
        context.previews.push_back(std::move(preview));
    }

    return context;
}

std::string ContextAssembler::build_prompt(const std::string& query, const AssembledContext& context) const {
    if (context.empty()) return query;

    const ProjectSummary& s = context.summary;
    std::string prompt =
        "You are an AI assistant helping with code analysis and development. "
        "Here's the context of the project:\n\n";

    prompt += "## Project Overview\n";
    prompt += fmt::format("- Total files: {}\n", s.total_files);
    prompt += fmt::format("- Languages: {}\n", join(s.languages, ", "));
    prompt += fmt::format("- Total lines of code: {}\n", s.total_lines);
    if (!s.main_files.empty()) {
        prompt += fmt::format("- Main files: {}\n", join(s.main_files, ", "));
    }
    prompt += "\n";

    if (!context.matches.empty()) {
        prompt += "## Most Relevant Code Sections\n";
        const size_t count = std::min(options_.prompt_match_limit, context.matches.size());
        for (size_t i = 0; i < count; ++i) {
            const ContextMatch& m = context.matches[i];
            prompt += fmt::format("### {}. {} ({}, lines {}) - Similarity: {:.2f}\n```{}\n{}\n```\n\n",
                                  i + 1, m.file_name, to_string(m.kind), m.line_range(), m.similarity,
                                  m.language, m.content);
        }
    } else if (!context.previews.empty()) {
        prompt += "## Project Files\n";
        const size_t count = std::min(options_.preview_file_limit, context.previews.size());
        for (size_t i = 0; i < count; ++i) {
            const FilePreview& p = context.previews[i];
            prompt += fmt::format("### {}. {} ({})\n```{}\n{}\n```\n\n",
                                  i + 1, p.name, p.language, p.language, p.content);
        }
    }

    prompt += "## User Question\n";
    prompt += query;
    prompt += "\n\nPlease provide a helpful response based on the code context above. "
              "Reference specific files, functions, or code sections when relevant.";
    return prompt;
}

SearchReport ContextAssembler::search(const std::string& query, const std::string& session_id,
                                      EmbeddingProvider& provider, size_t limit) {
    SearchReport report;
    report.query = query;

    auto files = store_->list_files_for_session(session_id);
    if (files.empty()) {
        spdlog::info("Semantic search in session {} skipped: no files", session_id);
        return report;
    }

    auto query_vector = provider.embed(query);
    report.results = SimilarityRanker::find_similar(query_vector, files, limit);
    spdlog::info("Semantic search in session {} returned {} matches", session_id, report.results.size());
    return report;
}

} // namespace code_context
