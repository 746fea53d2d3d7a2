#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "embedding_provider.hpp"
#include "file_store.hpp"

namespace code_context {

struct IndexerOptions {
    size_t max_parallel_files = 4;
};

struct SessionEmbeddingReport {
    std::string session_id;
    size_t files_total = 0;
    size_t files_failed = 0;
    size_t fragments_embedded = 0;
    std::vector<std::string> failures; // "<file name>: <reason>"

    nlohmann::json to_json() const;
};

/**
 * @brief Attaches fragment vectors to stored files.
 *
 * Fragment failures leave that fragment without a vector; file failures are
 * reported and never stop the rest of a session. Work on one file id is
 * serialized, different files may be embedded concurrently. Vectors are merged
 * into the stored record through FileStore::update_file, so writes made by
 * others while the provider runs are kept.
 */
class EmbeddingIndexer {
public:
    explicit EmbeddingIndexer(std::shared_ptr<FileStore> store, IndexerOptions options = {});

    // Recomputes every fragment vector, saves the file and returns the embedded count.
    size_t generate_embeddings_for_file(SourceFile& file, EmbeddingProvider& provider);

    // Loads the record first; throws StoreError when the id is unknown.
    size_t generate_embeddings_for_file(const std::string& file_id, EmbeddingProvider& provider);

    SessionEmbeddingReport generate_embeddings_for_session(const std::string& session_id, EmbeddingProvider& provider);

    // Per-file locks currently held or awaited; entries go away with their last holder.
    size_t tracked_file_locks() const;

private:
    struct FileLockEntry {
        std::mutex mutex;
        size_t users = 0;
    };
    class FileLease;

    size_t embed_and_save(SourceFile& file, EmbeddingProvider& provider);

    std::shared_ptr<FileStore> store_;
    IndexerOptions options_;
    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, FileLockEntry> file_locks_;
};

} // namespace code_context
