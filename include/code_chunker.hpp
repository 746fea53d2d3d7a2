#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "source_file.hpp"

namespace code_context {

enum class LanguageFamily { Script, Python, Java, CFamily, Generic };

struct BoundaryPattern {
    std::regex regex;
    FragmentKind kind;
};

// `group` selects the captured name; `fallback` is used when that group is empty.
struct ExtractPattern {
    std::regex regex;
    int group;
    std::string fallback;
};

/**
 * @brief Pattern set of one language family.
 *
 * Boundary patterns are ordered by priority: when several match a line the
 * first one decides the fragment kind. Profiles are built once and shared.
 */
class LanguageProfile {
public:
    static const LanguageProfile& for_language(const std::string& language);

    LanguageFamily family() const noexcept { return family_; }
    const std::vector<BoundaryPattern>& boundaries() const noexcept { return boundaries_; }

    // Expects a trimmed line; patterns are anchored at its start.
    std::optional<FragmentKind> match_boundary(const std::string& line) const;
    void collect_dependencies(const std::string& line, std::vector<std::string>& out) const;
    void collect_exports(const std::string& line, std::vector<std::string>& out) const;

private:
    LanguageProfile(LanguageFamily family,
                    std::vector<BoundaryPattern> boundaries,
                    std::vector<ExtractPattern> dependencies,
                    std::vector<ExtractPattern> exports);

    LanguageFamily family_;
    std::vector<BoundaryPattern> boundaries_;
    std::vector<ExtractPattern> dependencies_;
    std::vector<ExtractPattern> exports_;
};

class CodeChunker {
public:
    /**
     * @brief Splits content at function/class/interface boundaries.
     *
     * Fragments come back in line order, never overlap and cover every line.
     * Lines before the first boundary form a leading "other" fragment; a file
     * without boundaries becomes one "other" fragment.
     */
    static std::vector<Fragment> chunk(const std::string& content, const std::string& language);

    // Best-effort import scan. Deduplicated, first-seen order.
    static std::vector<std::string> extract_dependencies(const std::string& content, const std::string& language);

    // Best-effort export scan. Deduplicated, first-seen order.
    static std::vector<std::string> extract_exports(const std::string& content, const std::string& language);

    // Maps a file extension to a language tag, "text" when unknown.
    static std::string detect_language(const std::string& filename);

    // False for dependency folders, VCS metadata, build output, logs and temp files.
    static bool should_process_file(const std::string& path);
};

// Builds a complete record for an uploaded file: language, fragments, imports and exports.
SourceFile make_source_file(std::string id,
                            std::string name,
                            std::string content,
                            std::optional<std::string> session_id = std::nullopt);

} // namespace code_context
