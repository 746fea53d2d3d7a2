#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "source_file.hpp"

namespace code_context {

// Cosine similarity in [-1, 1]. Zero-magnitude or different-length input yields exactly 0.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

struct RankedMatch {
    std::shared_ptr<const SourceFile> file;
    size_t fragment_index = 0;
    double similarity = 0.0;

    const Fragment& fragment() const { return file->fragments.at(fragment_index); }

    nlohmann::json to_json() const;
};

class SimilarityRanker {
public:
    /**
     * @brief Exhaustive top-k over every embedded fragment of the given files.
     *
     * Fragments without a vector are skipped, not scored as 0. Results are sorted
     * by descending similarity; equal scores keep file order, then fragment order.
     * Returns at most `limit` matches.
     */
    static std::vector<RankedMatch> find_similar(const std::vector<float>& query_vector,
                                                 const std::vector<SourceFilePtr>& files,
                                                 size_t limit);
};

// Semantic-search result handed to the transport layer as-is.
struct SearchReport {
    std::string query;
    std::vector<RankedMatch> results;

    nlohmann::json to_json() const;
};

} // namespace code_context
