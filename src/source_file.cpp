#include "source_file.hpp"
#include <algorithm>
#include "text_utils.hpp"

namespace code_context {

using json = nlohmann::json;

std::string to_string(FragmentKind kind) {
    switch (kind) {
        case FragmentKind::Function: return "function";
        case FragmentKind::Class: return "class";
        case FragmentKind::Interface: return "interface";
        case FragmentKind::Block: return "block";
        case FragmentKind::Other: return "other";
    }
    return "other";
}

FragmentKind fragment_kind_from_string(const std::string& value) {
    if (value == "function") return FragmentKind::Function;
    if (value == "class") return FragmentKind::Class;
    if (value == "interface") return FragmentKind::Interface;
    if (value == "block") return FragmentKind::Block;
    return FragmentKind::Other;
}

json Fragment::to_json() const {
    json j{
        {"id", id},
        {"content", sanitize_utf8(content)},
        {"start_line", start_line},
        {"end_line", end_line},
        {"type", to_string(kind)}
    };
    if (has_embedding()) j["embedding"] = *embedding;
    return j;
}

Fragment Fragment::from_json(const json& j) {
    Fragment fragment;
    fragment.id = j.value("id", "");
    fragment.content = j.value("content", "");
    fragment.start_line = j.value("start_line", 1);
    fragment.end_line = j.value("end_line", fragment.start_line);
    fragment.kind = fragment_kind_from_string(j.value("type", "other"));
    if (j.contains("embedding") && j["embedding"].is_array() && !j["embedding"].empty()) {
        fragment.embedding = j["embedding"].get<std::vector<float>>();
    }
    return fragment;
}

size_t SourceFile::line_count() const {
    return static_cast<size_t>(std::count(content.begin(), content.end(), '\n')) + 1;
}

size_t SourceFile::embedded_fragment_count() const {
    return static_cast<size_t>(std::count_if(fragments.begin(), fragments.end(),
                                             [](const Fragment& f) { return f.has_embedding(); }));
}

json SourceFile::to_json() const {
    json chunks = json::array();
    for (const auto& fragment : fragments) chunks.push_back(fragment.to_json());

    return json{
        {"id", id},
        {"session_id", session_id ? json(*session_id) : json(nullptr)},
        {"name", sanitize_utf8(name)},
        {"language", language},
        {"content", sanitize_utf8(content)},
        {"size", size},
        {"chunks", chunks},
        {"dependencies", dependencies},
        {"exports", exports},
        {"uploaded_at", uploaded_at}
    };
}

SourceFile SourceFile::from_json(const json& j) {
    SourceFile file;
    auto safe_get = [&](const std::string& key) { return j.value(key, ""); };
    file.id = safe_get("id");
    if (j.contains("session_id") && j["session_id"].is_string()) {
        file.session_id = j["session_id"].get<std::string>();
    }
    file.name = safe_get("name");
    file.language = j.value("language", "text");
    file.content = safe_get("content");
    file.size = j.value("size", static_cast<std::uintmax_t>(file.content.size()));
    if (j.contains("chunks")) {
        for (const auto& j_chunk : j["chunks"]) file.fragments.push_back(Fragment::from_json(j_chunk));
    }
    if (j.contains("dependencies")) file.dependencies = j["dependencies"].get<std::vector<std::string>>();
    if (j.contains("exports")) file.exports = j["exports"].get<std::vector<std::string>>();
    file.uploaded_at = j.value("uploaded_at", static_cast<std::int64_t>(0));
    return file;
}

} // namespace code_context
