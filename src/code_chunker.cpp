#include "code_chunker.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "text_utils.hpp"

namespace code_context {

namespace fs = std::filesystem;

namespace {

std::regex make_regex(const char* pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

void append_unique(std::vector<std::string>& out, const std::string& value) {
    if (value.empty()) return;
    if (std::find(out.begin(), out.end(), value) == out.end()) out.push_back(value);
}

// std::regex recursion depth grows with input length. Patterns are anchored at
// the line start and capture short names, so only a line's head is matched.
constexpr size_t kMaxMatchedLineLength = 1024;

std::string matchable_head(const std::string& line) {
    return line.size() > kMaxMatchedLineLength ? line.substr(0, kMaxMatchedLineLength) : line;
}

void collect(const std::vector<ExtractPattern>& patterns, const std::string& line, std::vector<std::string>& out) {
    const std::string head = matchable_head(line);
    std::smatch match;
    for (const auto& pattern : patterns) {
        if (std::regex_search(head, match, pattern.regex)) {
            std::string value = match[pattern.group].str();
            append_unique(out, value.empty() ? pattern.fallback : value);
        }
    }
}

LanguageFamily family_of(const std::string& language) {
    std::string tag = to_lower(language);
    if (tag == "typescript" || tag == "javascript") return LanguageFamily::Script;
    if (tag == "python") return LanguageFamily::Python;
    if (tag == "java") return LanguageFamily::Java;
    if (tag == "cpp" || tag == "c") return LanguageFamily::CFamily;
    return LanguageFamily::Generic;
}

} // namespace

LanguageProfile::LanguageProfile(LanguageFamily family,
                                 std::vector<BoundaryPattern> boundaries,
                                 std::vector<ExtractPattern> dependencies,
                                 std::vector<ExtractPattern> exports)
    : family_(family),
      boundaries_(std::move(boundaries)),
      dependencies_(std::move(dependencies)),
      exports_(std::move(exports)) {}

const LanguageProfile& LanguageProfile::for_language(const std::string& language) {
    static const LanguageProfile script(
        LanguageFamily::Script,
        {
            {make_regex(R"(^(export\s+)?(async\s+)?function\s+(\w+))"), FragmentKind::Function},
            {make_regex(R"(^(export\s+)?(abstract\s+)?class\s+(\w+))"), FragmentKind::Class},
            {make_regex(R"(^(export\s+)?interface\s+(\w+))"), FragmentKind::Interface},
            {make_regex(R"(^(export\s+)?type\s+(\w+))"), FragmentKind::Interface},
            {make_regex(R"(^const\s+(\w+)\s*=\s*(async\s+)?\()"), FragmentKind::Function},
        },
        {
            {make_regex(R"(^import.*from\s+['"]([^'"]+)['"])"), 1, ""},
            {make_regex(R"(require\(['"]([^'"]+)['"]\))"), 1, ""},
        },
        {
            {make_regex(R"(^export\s+(function|class|interface|type|const|let|var)\s+([^\s(]+))"), 2, ""},
            {make_regex(R"(^export\s+default\s+(function\s+)?([^\s(]+))"), 2, "default"},
        });

    static const LanguageProfile python(
        LanguageFamily::Python,
        {
            {make_regex(R"(^(async\s+)?def\s+(\w+))"), FragmentKind::Function},
            {make_regex(R"(^class\s+(\w+))"), FragmentKind::Class},
        },
        {
            {make_regex(R"(^(import|from)\s+([^\s]+))"), 2, ""},
        },
        {});

    static const LanguageProfile java(
        LanguageFamily::Java,
        {
            {make_regex(R"(^(public|private|protected)?\s*(static\s+)?(\w+\s+)*(\w+)\s*\([^)]*\)\s*\{)"), FragmentKind::Function},
            {make_regex(R"(^(public|private|protected)?\s*(abstract\s+)?class\s+(\w+))"), FragmentKind::Class},
            {make_regex(R"(^(public|private|protected)?\s*interface\s+(\w+))"), FragmentKind::Interface},
        },
        {
            {make_regex(R"(^import\s+([^;]+);)"), 1, ""},
        },
        {});

    static const LanguageProfile c_family(
        LanguageFamily::CFamily,
        {
            {make_regex(R"(^(\w+\s+)*(\w+)\s*\([^)]*\)\s*\{)"), FragmentKind::Function},
            {make_regex(R"(^(class|struct)\s+(\w+))"), FragmentKind::Class},
        },
        {},
        {});

    static const LanguageProfile generic(
        LanguageFamily::Generic,
        {
            {make_regex(R"(^(function|def|fn)\s+(\w+))"), FragmentKind::Function},
            {make_regex(R"(^(class|struct|type)\s+(\w+))"), FragmentKind::Class},
        },
        {},
        {});

    switch (family_of(language)) {
        case LanguageFamily::Script: return script;
        case LanguageFamily::Python: return python;
        case LanguageFamily::Java: return java;
        case LanguageFamily::CFamily: return c_family;
        case LanguageFamily::Generic: return generic;
    }
    return generic;
}

std::optional<FragmentKind> LanguageProfile::match_boundary(const std::string& line) const {
    const std::string head = matchable_head(line);
    for (const auto& pattern : boundaries_) {
        if (std::regex_search(head, pattern.regex)) return pattern.kind;
    }
    return std::nullopt;
}

void LanguageProfile::collect_dependencies(const std::string& line, std::vector<std::string>& out) const {
    collect(dependencies_, line, out);
}

void LanguageProfile::collect_exports(const std::string& line, std::vector<std::string>& out) const {
    collect(exports_, line, out);
}

std::vector<Fragment> CodeChunker::chunk(const std::string& content, const std::string& language) {
    const LanguageProfile& profile = LanguageProfile::for_language(language);
    const auto lines = split_lines(content);

    std::vector<Fragment> fragments;
    std::optional<Fragment> open;
    int next_id = 1;

    auto start_fragment = [&](int line_number, FragmentKind kind) {
        Fragment fragment;
        fragment.id = "chunk_" + std::to_string(next_id++);
        fragment.start_line = line_number;
        fragment.end_line = line_number;
        fragment.kind = kind;
        open = std::move(fragment);
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const int line_number = static_cast<int>(i) + 1;
        const std::string& line = lines[i];

        if (auto kind = profile.match_boundary(trim(line))) {
            if (open) {
                open->end_line = line_number - 1;
                fragments.push_back(std::move(*open));
            }
            start_fragment(line_number, *kind);
        } else if (!open) {
            start_fragment(line_number, FragmentKind::Other);
        }

        if (line_number > open->start_line) open->content += '\n';
        open->content += line;
        open->end_line = line_number;
    }

    if (open) fragments.push_back(std::move(*open));

    spdlog::debug("Chunked {} lines ({}) into {} fragments", lines.size(), language, fragments.size());
    return fragments;
}

std::vector<std::string> CodeChunker::extract_dependencies(const std::string& content, const std::string& language) {
    const LanguageProfile& profile = LanguageProfile::for_language(language);
    std::vector<std::string> dependencies;
    for (const auto& line : split_lines(content)) {
        profile.collect_dependencies(trim(line), dependencies);
    }
    return dependencies;
}

std::vector<std::string> CodeChunker::extract_exports(const std::string& content, const std::string& language) {
    const LanguageProfile& profile = LanguageProfile::for_language(language);
    std::vector<std::string> exports;
    for (const auto& line : split_lines(content)) {
        profile.collect_exports(trim(line), exports);
    }
    return exports;
}

std::string CodeChunker::detect_language(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> language_map = {
        {".ts", "typescript"}, {".tsx", "typescript"},
        {".js", "javascript"}, {".jsx", "javascript"},
        {".py", "python"},
        {".java", "java"},
        {".cpp", "cpp"}, {".hpp", "cpp"},
        {".c", "c"}, {".h", "c"},
        {".go", "go"},
        {".rs", "rust"},
        {".php", "php"},
        {".rb", "ruby"},
        {".cs", "csharp"},
        {".swift", "swift"},
        {".kt", "kotlin"},
        {".scala", "scala"},
        {".html", "html"},
        {".css", "css"},
        {".scss", "scss"},
        {".less", "less"},
        {".json", "json"},
        {".xml", "xml"},
        {".yml", "yaml"}, {".yaml", "yaml"},
        {".md", "markdown"},
        {".txt", "text"},
        {".sh", "bash"},
        {".sql", "sql"}
    };

    std::string ext = to_lower(fs::path(filename).extension().string());
    auto it = language_map.find(ext);
    return it != language_map.end() ? it->second : "text";
}

bool CodeChunker::should_process_file(const std::string& path) {
    static const std::vector<std::string> excluded_fragments = {
        "node_modules", ".git", ".DS_Store", ".env", ".cache",
        "dist", "build", "coverage", ".nyc_output"
    };
    static const std::vector<std::string> excluded_suffixes = {".log", ".tmp"};

    for (const auto& fragment : excluded_fragments) {
        if (path.find(fragment) != std::string::npos) return false;
    }
    for (const auto& suffix : excluded_suffixes) {
        if (path.size() >= suffix.size() &&
            path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return false;
        }
    }
    return true;
}

SourceFile make_source_file(std::string id,
                            std::string name,
                            std::string content,
                            std::optional<std::string> session_id) {
    SourceFile file;
    file.id = std::move(id);
    file.session_id = std::move(session_id);
    file.name = std::move(name);
    file.language = CodeChunker::detect_language(file.name);
    file.content = std::move(content);
    file.size = file.content.size();
    file.fragments = CodeChunker::chunk(file.content, file.language);
    file.dependencies = CodeChunker::extract_dependencies(file.content, file.language);
    file.exports = CodeChunker::extract_exports(file.content, file.language);
    file.uploaded_at = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return file;
}

} // namespace code_context
