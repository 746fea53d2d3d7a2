#include "file_store.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace code_context {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void sort_newest_first(std::vector<SourceFilePtr>& files) {
    std::stable_sort(files.begin(), files.end(), [](const SourceFilePtr& a, const SourceFilePtr& b) {
        return a->uploaded_at > b->uploaded_at;
    });
}

} // namespace

JsonFileStore::JsonFileStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StoreError("cannot create store directory " + root_.string() + ": " + ec.message());
    }
}

std::string JsonFileStore::encode_record_name(const std::string& file_id) {
    static const char* hex = "0123456789ABCDEF";
    std::string name;
    name.reserve(file_id.size());
    for (unsigned char c : file_id) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            name += static_cast<char>(c);
        } else {
            name += '%';
            name += hex[c >> 4];
            name += hex[c & 0x0F];
        }
    }
    return name;
}

fs::path JsonFileStore::record_path(const std::string& file_id) const {
    return root_ / (encode_record_name(file_id) + ".json");
}

SourceFilePtr JsonFileStore::read_record(const fs::path& path) const {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw StoreError("cannot open record " + path.string());
    }
    try {
        return std::make_shared<SourceFile>(SourceFile::from_json(json::parse(f)));
    } catch (const json::exception& e) {
        throw StoreError("corrupt record " + path.string() + ": " + e.what());
    }
}

std::vector<SourceFilePtr> JsonFileStore::load_all() const {
    std::vector<SourceFilePtr> files;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        throw StoreError("cannot list store directory " + root_.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        files.push_back(read_record(entry.path()));
    }
    sort_newest_first(files);
    return files;
}

void JsonFileStore::write_record(const SourceFile& file) const {
    const fs::path target = record_path(file.id);
    const fs::path staging = target.string() + ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out.is_open()) {
            throw StoreError("cannot write record " + staging.string());
        }
        try {
            out << file.to_json().dump(2, ' ', false, json::error_handler_t::replace);
        } catch (const json::exception& e) {
            throw StoreError("cannot serialize record " + file.id + ": " + e.what());
        }
        if (!out.good()) {
            throw StoreError("short write on " + staging.string());
        }
    }
    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        throw StoreError("cannot commit record " + target.string() + ": " + ec.message());
    }
}

std::vector<SourceFilePtr> JsonFileStore::list_files_for_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto files = load_all();
    files.erase(std::remove_if(files.begin(), files.end(),
                               [&](const SourceFilePtr& f) { return !f->belongs_to(session_id); }),
                files.end());
    return files;
}

std::vector<SourceFilePtr> JsonFileStore::list_files_without_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto files = load_all();
    files.erase(std::remove_if(files.begin(), files.end(),
                               [](const SourceFilePtr& f) { return f->has_session(); }),
                files.end());
    return files;
}

void JsonFileStore::reassign_files_to_session(const std::vector<std::string>& file_ids, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& file_id : file_ids) {
        const fs::path path = record_path(file_id);
        if (!fs::exists(path)) {
            spdlog::warn("Cannot reassign missing file {} to session {}", file_id, session_id);
            continue;
        }
        auto file = read_record(path);
        file->session_id = session_id;
        write_record(*file);
    }
}

void JsonFileStore::save_file(const SourceFile& file) {
    if (file.id.empty()) {
        throw StoreError("cannot save a file without an id");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    write_record(file);
}

SourceFilePtr JsonFileStore::find_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const fs::path path = record_path(file_id);
    if (!fs::exists(path)) return nullptr;
    auto file = read_record(path);
    return file->id == file_id ? file : nullptr;
}

SourceFilePtr JsonFileStore::update_file(const std::string& file_id,
                                         const std::function<void(SourceFile&)>& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    const fs::path path = record_path(file_id);
    if (!fs::exists(path)) return nullptr;
    auto file = read_record(path);
    if (file->id != file_id) return nullptr;

    mutate(*file);
    if (file->id != file_id) {
        throw StoreError("update of " + file_id + " changed the record id");
    }
    write_record(*file);
    return file;
}

} // namespace code_context
