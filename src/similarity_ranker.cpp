#include "similarity_ranker.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include "text_utils.hpp"

namespace code_context {

using json = nlohmann::json;

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;

    // Rounding can push parallel vectors a hair past 1.
    return std::clamp(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)), -1.0, 1.0);
}

json RankedMatch::to_json() const {
    const Fragment& chunk = fragment();
    return json{
        {"file", {
            {"id", file->id},
            {"name", sanitize_utf8(file->name)},
            {"language", file->language}
        }},
        {"chunk", {
            {"id", chunk.id},
            {"content", sanitize_utf8(chunk.content)},
            {"startLine", chunk.start_line},
            {"endLine", chunk.end_line},
            {"type", to_string(chunk.kind)}
        }},
        {"similarity", similarity}
    };
}

std::vector<RankedMatch> SimilarityRanker::find_similar(const std::vector<float>& query_vector,
                                                        const std::vector<SourceFilePtr>& files,
                                                        size_t limit) {
    std::vector<RankedMatch> scored;
    for (const auto& file : files) {
        if (!file) continue;
        for (size_t i = 0; i < file->fragments.size(); ++i) {
            const Fragment& fragment = file->fragments[i];
            if (!fragment.has_embedding()) continue;
            scored.push_back({file, i, cosine_similarity(query_vector, *fragment.embedding)});
        }
    }

    spdlog::debug("Scored {} embedded fragments across {} files", scored.size(), files.size());

    std::stable_sort(scored.begin(), scored.end(), [](const RankedMatch& a, const RankedMatch& b) {
        return a.similarity > b.similarity;
    });
    if (scored.size() > limit) scored.resize(limit);
    return scored;
}

json SearchReport::to_json() const {
    json list = json::array();
    for (const auto& match : results) list.push_back(match.to_json());
    return json{
        {"success", true},
        {"query", query},
        {"results", list}
    };
}

} // namespace code_context
