#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_context {

enum class FragmentKind { Function, Class, Interface, Block, Other };

std::string to_string(FragmentKind kind);
// Unknown tags map to FragmentKind::Other.
FragmentKind fragment_kind_from_string(const std::string& value);

// A structurally meaningful slice of a source file (a "chunk").
struct Fragment {
    std::string id;
    std::string content;
    int start_line = 1; // 1-based, inclusive
    int end_line = 1;   // 1-based, inclusive
    FragmentKind kind = FragmentKind::Other;
    std::optional<std::vector<float>> embedding;

    bool has_embedding() const { return embedding.has_value() && !embedding->empty(); }

    nlohmann::json to_json() const;
    static Fragment from_json(const nlohmann::json& j);
};

struct SourceFile {
    std::string id;
    std::optional<std::string> session_id;
    std::string name;
    std::string language;
    std::string content;
    std::uintmax_t size = 0;
    std::vector<Fragment> fragments;
    std::vector<std::string> dependencies;
    std::vector<std::string> exports;
    std::int64_t uploaded_at = 0; // unix epoch, milliseconds

    size_t line_count() const;
    size_t embedded_fragment_count() const;

    // Absent and empty session ids both count as "no session".
    bool has_session() const { return session_id.has_value() && !session_id->empty(); }
    bool belongs_to(const std::string& session) const { return has_session() && *session_id == session; }

    nlohmann::json to_json() const;
    static SourceFile from_json(const nlohmann::json& j);
};

using SourceFilePtr = std::shared_ptr<SourceFile>;

} // namespace code_context
