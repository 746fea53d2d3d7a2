#pragma once
#include <filesystem>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "source_file.hpp"

namespace code_context {

// File-store I/O failure. Unlike provider failures, these propagate to the caller.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Persistence boundary for uploaded files and their fragment vectors.
 *
 * Listings return independent copies ordered newest upload first.
 */
class FileStore {
public:
    virtual ~FileStore() = default;

    virtual std::vector<SourceFilePtr> list_files_for_session(const std::string& session_id) = 0;
    virtual std::vector<SourceFilePtr> list_files_without_session() = 0;
    virtual void reassign_files_to_session(const std::vector<std::string>& file_ids, const std::string& session_id) = 0;

    // Overwrites the whole record, fragment list included.
    virtual void save_file(const SourceFile& file) = 0;

    // nullptr when no record has this id.
    virtual SourceFilePtr find_file(const std::string& file_id) = 0;

    /**
     * @brief Atomic read-modify-write of one record.
     *
     * Loads the current record, applies mutate and saves it before any other
     * write to the store can interleave. mutate must not change the id.
     * Returns the saved record, or nullptr when no record has this id.
     */
    virtual SourceFilePtr update_file(const std::string& file_id,
                                      const std::function<void(SourceFile&)>& mutate) = 0;
};

// One JSON document per file under a root directory. Thread-safe within one instance.
class JsonFileStore : public FileStore {
public:
    explicit JsonFileStore(std::filesystem::path root);

    std::vector<SourceFilePtr> list_files_for_session(const std::string& session_id) override;
    std::vector<SourceFilePtr> list_files_without_session() override;
    void reassign_files_to_session(const std::vector<std::string>& file_ids, const std::string& session_id) override;
    void save_file(const SourceFile& file) override;
    SourceFilePtr find_file(const std::string& file_id) override;
    SourceFilePtr update_file(const std::string& file_id,
                              const std::function<void(SourceFile&)>& mutate) override;

    // Reversible file name for an id: bytes outside [A-Za-z0-9._-] are percent-encoded.
    static std::string encode_record_name(const std::string& file_id);

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path record_path(const std::string& file_id) const;
    std::vector<SourceFilePtr> load_all() const;
    SourceFilePtr read_record(const std::filesystem::path& path) const;
    void write_record(const SourceFile& file) const;

    std::filesystem::path root_;
    std::mutex mutex_;
};

} // namespace code_context
