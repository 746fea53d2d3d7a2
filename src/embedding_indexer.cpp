#include "embedding_indexer.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <spdlog/spdlog.h>
#include "best_effort.hpp"
#include "ThreadPool.hpp"

namespace code_context {

using json = nlohmann::json;

json SessionEmbeddingReport::to_json() const {
    return json{
        {"session_id", session_id},
        {"files_total", files_total},
        {"files_failed", files_failed},
        {"fragments_embedded", fragments_embedded},
        {"failures", failures}
    };
}

EmbeddingIndexer::EmbeddingIndexer(std::shared_ptr<FileStore> store, IndexerOptions options)
    : store_(std::move(store)), options_(options) {
    if (!store_) throw std::invalid_argument("EmbeddingIndexer requires a file store");
}

class EmbeddingIndexer::FileLease {
public:
    FileLease(EmbeddingIndexer& owner, const std::string& file_id) : owner_(owner), file_id_(file_id) {
        FileLockEntry* entry;
        {
            std::lock_guard<std::mutex> lock(owner_.registry_mutex_);
            entry = &owner_.file_locks_[file_id_];
            ++entry->users;
        }
        lock_ = std::unique_lock<std::mutex>(entry->mutex);
    }

    ~FileLease() {
        lock_.unlock();
        std::lock_guard<std::mutex> lock(owner_.registry_mutex_);
        auto it = owner_.file_locks_.find(file_id_);
        if (it != owner_.file_locks_.end() && --it->second.users == 0) owner_.file_locks_.erase(it);
    }

    FileLease(const FileLease&) = delete;
    FileLease& operator=(const FileLease&) = delete;

private:
    EmbeddingIndexer& owner_;
    std::string file_id_;
    std::unique_lock<std::mutex> lock_;
};

namespace {

// Copies vectors onto the fragments that still match what was embedded.
void merge_vectors(const SourceFile& embedded, SourceFile& current) {
    for (auto& fragment : current.fragments) {
        auto it = std::find_if(embedded.fragments.begin(), embedded.fragments.end(),
                               [&](const Fragment& e) { return e.id == fragment.id; });
        if (it != embedded.fragments.end() && it->content == fragment.content) {
            fragment.embedding = it->embedding;
        }
    }
}

} // namespace

size_t EmbeddingIndexer::tracked_file_locks() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return file_locks_.size();
}

size_t EmbeddingIndexer::embed_and_save(SourceFile& file, EmbeddingProvider& provider) {
    auto outcome = map_best_effort(file.fragments, [&](const Fragment& fragment) {
        auto vector = provider.embed(fragment.content);
        if (vector.empty()) throw ProviderError("provider returned an empty vector");
        return vector;
    });

    for (auto& fragment : file.fragments) fragment.embedding.reset();
    for (auto& success : outcome.successes) {
        file.fragments[success.index].embedding = std::move(success.value);
    }
    for (const auto& failure : outcome.failures) {
        spdlog::warn("Skipping fragment {} of {}: {}",
                     file.fragments[failure.index].id, file.name, failure.error);
    }

    auto merged = store_->update_file(file.id, [&file](SourceFile& current) { merge_vectors(file, current); });
    if (!merged) store_->save_file(file);

    spdlog::info("Embedded {}/{} fragments for {}",
                 outcome.successes.size(), file.fragments.size(), file.name);
    return outcome.successes.size();
}

size_t EmbeddingIndexer::generate_embeddings_for_file(SourceFile& file, EmbeddingProvider& provider) {
    FileLease lease(*this, file.id);
    return embed_and_save(file, provider);
}

size_t EmbeddingIndexer::generate_embeddings_for_file(const std::string& file_id, EmbeddingProvider& provider) {
    FileLease lease(*this, file_id);
    auto file = store_->find_file(file_id);
    if (!file) throw StoreError("file not found: " + file_id);
    return embed_and_save(*file, provider);
}

SessionEmbeddingReport EmbeddingIndexer::generate_embeddings_for_session(const std::string& session_id,
                                                                         EmbeddingProvider& provider) {
    auto start = std::chrono::steady_clock::now();

    SessionEmbeddingReport report;
    report.session_id = session_id;

    auto files = store_->list_files_for_session(session_id);
    report.files_total = files.size();
    spdlog::info("Generating embeddings for {} files in session {}", files.size(), session_id);
    if (files.empty()) return report;

    std::vector<std::future<size_t>> pending;
    {
        ThreadPool pool(std::min(std::max<size_t>(options_.max_parallel_files, 1), files.size()));
        pending.reserve(files.size());
        for (const auto& file : files) {
            pending.push_back(pool.enqueue([this, file, &provider]() {
                return generate_embeddings_for_file(*file, provider);
            }));
        }

        auto outcome = map_best_effort(pending, [](std::future<size_t>& f) { return f.get(); });

        for (const auto& success : outcome.successes) report.fragments_embedded += success.value;
        for (const auto& failure : outcome.failures) {
            const auto& name = files[failure.index]->name;
            spdlog::warn("Failed to generate embeddings for file {}: {}", name, failure.error);
            report.failures.push_back(name + ": " + failure.error);
        }
        report.files_failed = outcome.failures.size();
    }

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("Completed embedding generation for session {} ({} fragments, {} failed files, {:.2f} ms)",
                 session_id, report.fragments_embedded, report.files_failed, duration);
    return report;
}

} // namespace code_context
